#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "models.hpp"

namespace slotbook {

    struct Column {
        std::string header;
        std::string key;
    };

    // One tab of the store file. Rows are positional arrays ordered like `columns`.
    struct Sheet {
        std::string name;
        std::vector<Column> columns;
        std::vector<nlohmann::json> rows;
        nlohmann::json style = nlohmann::json::object();
    };

    struct Workbook {
        std::vector<Sheet> sheets;

        Sheet* sheet(const std::string& name);
        const Sheet* sheet(const std::string& name) const;
        Sheet& addSheet(std::string name, std::vector<Column> columns);
    };

    inline constexpr const char* kSubmissionsSheet = "Submissions";
    inline constexpr const char* kSummarySheet = "Summary";
    inline constexpr const char* kTotalMetric = "Total Submissions";
    inline constexpr const char* kLastUpdatedMetric = "Last Updated";

    const std::vector<Column>& submissionColumns();
    nlohmann::json headerStyle();

    // Fresh store layout: header-only Submissions sheet plus Summary with total 0.
    Workbook makeStoreWorkbook();
    // Archive/export layout: one sheet of submission rows under the given title.
    Workbook makeSubmissionWorkbook(const std::string& title, const std::vector<Submission>& rows);

    nlohmann::json toRow(const Submission& s);
    // throws StoreIOError on a malformed row
    Submission fromRow(const nlohmann::json& row);

    std::vector<Submission> readSubmissions(const Workbook& wb);

    std::optional<nlohmann::json> summaryValue(const Workbook& wb, const std::string& metric);
    void setSummaryValue(Workbook& wb, const std::string& metric, nlohmann::json value);

    void to_json(nlohmann::json& j, const Workbook& wb);
    void from_json(const nlohmann::json& j, Workbook& wb);

} // namespace slotbook

#include <slotbook/workbook.hpp>
#include <slotbook/errors.hpp>

namespace slotbook {

    namespace {

        const char* kFormat = "slotbook-workbook";
        const int kVersion = 1;

        std::string cellString(const nlohmann::json& cell) {
            if (cell.is_null()) {
                return {};
            }
            if (cell.is_string()) {
                return cell.get<std::string>();
            }
            return cell.dump();
        }

    } // namespace

    Sheet* Workbook::sheet(const std::string& name) {
        for (auto& s : sheets) {
            if (s.name == name) {
                return &s;
            }
        }
        return nullptr;
    }

    const Sheet* Workbook::sheet(const std::string& name) const {
        for (auto const& s : sheets) {
            if (s.name == name) {
                return &s;
            }
        }
        return nullptr;
    }

    Sheet& Workbook::addSheet(std::string name, std::vector<Column> columns) {
        Sheet s;
        s.name = std::move(name);
        s.columns = std::move(columns);
        sheets.push_back(std::move(s));
        return sheets.back();
    }

    const std::vector<Column>& submissionColumns() {
        static const std::vector<Column> kColumns = {
            {"ID", "id"},
            {"Submission Date", "submissionDate"},
            {"Booking Date", "bookingDate"},
            {"Name", "name"},
            {"UPI Number", "upiNumber"},
            {"WhatsApp Number", "whatsappNumber"},
            {"Ayambil Shala Name", "ayambilShalaName"},
            {"City", "city"},
            {"Status", "status"},
            {"IP Address", "ipAddress"},
        };
        return kColumns;
    }

    nlohmann::json headerStyle() {
        return {{"header", {{"bold", true}, {"fill", "FFE0E0E0"}, {"align", "center"}}}};
    }

    Workbook makeStoreWorkbook() {
        Workbook wb;
        auto& subs = wb.addSheet(kSubmissionsSheet, submissionColumns());
        subs.style = headerStyle();

        auto& summary = wb.addSheet(kSummarySheet, {{"Metric", "metric"}, {"Value", "value"}});
        summary.style = {{"header", {{"bold", true}}}};
        summary.rows.push_back(nlohmann::json::array({kTotalMetric, 0}));
        summary.rows.push_back(nlohmann::json::array({kLastUpdatedMetric, formatIso(now())}));
        return wb;
    }

    Workbook makeSubmissionWorkbook(const std::string& title, const std::vector<Submission>& rows) {
        Workbook wb;
        auto& sheet = wb.addSheet(title, submissionColumns());
        sheet.style = headerStyle();
        sheet.rows.reserve(rows.size());
        for (auto const& s : rows) {
            sheet.rows.push_back(toRow(s));
        }
        return wb;
    }

    nlohmann::json toRow(const Submission& s) {
        return nlohmann::json::array({s.id,
                                      formatIso(s.submissionDate),
                                      s.bookingDate ? nlohmann::json(s.bookingDate->toString()) : nlohmann::json(nullptr),
                                      s.name,
                                      s.upiNumber,
                                      s.whatsappNumber,
                                      s.ayambilShalaName,
                                      s.city,
                                      toString(s.status),
                                      s.ipAddress});
    }

    Submission fromRow(const nlohmann::json& row) {
        if (!row.is_array() || row.size() < submissionColumns().size()) {
            throw StoreIOError("Malformed submission row: " + row.dump());
        }
        Submission s;
        s.id = cellString(row[0]);
        auto submitted = parseIso(cellString(row[1]));
        if (!submitted) {
            throw StoreIOError("Malformed submission date in row " + s.id);
        }
        s.submissionDate = *submitted;
        auto booking = cellString(row[2]);
        if (!booking.empty()) {
            s.bookingDate = parseDate(booking);
            if (!s.bookingDate) {
                throw StoreIOError("Malformed booking date in row " + s.id);
            }
        }
        s.name = cellString(row[3]);
        s.upiNumber = cellString(row[4]);
        s.whatsappNumber = cellString(row[5]);
        s.ayambilShalaName = cellString(row[6]);
        s.city = cellString(row[7]);
        try {
            s.status = parseStatus(cellString(row[8]));
        } catch (const std::invalid_argument& ex) {
            throw StoreIOError(std::string(ex.what()) + " in row " + s.id);
        }
        s.ipAddress = cellString(row[9]);
        return s;
    }

    std::vector<Submission> readSubmissions(const Workbook& wb) {
        const Sheet* sheet = wb.sheet(kSubmissionsSheet);
        if (!sheet) {
            throw StoreIOError("Store file has no Submissions sheet");
        }
        std::vector<Submission> out;
        out.reserve(sheet->rows.size());
        for (auto const& row : sheet->rows) {
            out.push_back(fromRow(row));
        }
        return out;
    }

    std::optional<nlohmann::json> summaryValue(const Workbook& wb, const std::string& metric) {
        const Sheet* summary = wb.sheet(kSummarySheet);
        if (!summary) {
            return std::nullopt;
        }
        for (auto const& row : summary->rows) {
            if (row.is_array() && row.size() >= 2 && row[0] == metric) {
                return row[1];
            }
        }
        return std::nullopt;
    }

    void setSummaryValue(Workbook& wb, const std::string& metric, nlohmann::json value) {
        Sheet* summary = wb.sheet(kSummarySheet);
        if (!summary) {
            return;
        }
        for (auto& row : summary->rows) {
            if (row.is_array() && row.size() >= 2 && row[0] == metric) {
                row[1] = std::move(value);
                return;
            }
        }
        summary->rows.push_back(nlohmann::json::array({metric, std::move(value)}));
    }

    void to_json(nlohmann::json& j, const Workbook& wb) {
        j = nlohmann::json{{"format", kFormat}, {"version", kVersion}, {"sheets", nlohmann::json::array()}};
        for (auto const& s : wb.sheets) {
            nlohmann::json cols = nlohmann::json::array();
            for (auto const& c : s.columns) {
                cols.push_back({{"header", c.header}, {"key", c.key}});
            }
            j["sheets"].push_back({{"name", s.name}, {"columns", cols}, {"style", s.style}, {"rows", s.rows}});
        }
    }

    void from_json(const nlohmann::json& j, Workbook& wb) {
        if (!j.is_object() || j.value("format", "") != kFormat || !j.contains("sheets") || !j["sheets"].is_array()) {
            throw StoreIOError("Not a slotbook workbook");
        }
        wb.sheets.clear();
        for (auto const& js : j["sheets"]) {
            Sheet s;
            s.name = js.at("name").get<std::string>();
            for (auto const& c : js.at("columns")) {
                s.columns.push_back(Column{c.at("header").get<std::string>(), c.at("key").get<std::string>()});
            }
            s.style = js.value("style", nlohmann::json::object());
            for (auto const& r : js.at("rows")) {
                s.rows.push_back(r);
            }
            wb.sheets.push_back(std::move(s));
        }
    }

} // namespace slotbook

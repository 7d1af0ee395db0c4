#pragma once
#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "timeutil.hpp"

namespace slotbook {

    using json = nlohmann::json;

    enum class SubmissionStatus {
        Pending,
        Reviewed,
        Archived
    };

    const char* toString(SubmissionStatus status);
    // throws std::invalid_argument for anything outside the enum
    SubmissionStatus parseStatus(const std::string& text);

    struct Submission {
        std::string id;
        TimePoint submissionDate;
        std::optional<CalendarDate> bookingDate;
        std::string name;
        std::string upiNumber;
        std::string whatsappNumber;
        std::string ayambilShalaName;
        std::string city;
        SubmissionStatus status = SubmissionStatus::Pending;
        std::string ipAddress;
    };

    // Sanitized payload handed over by the request layer, plus the caller's address.
    struct SubmissionInput {
        std::optional<CalendarDate> bookingDate;
        std::string name;
        std::string upiNumber;
        std::string whatsappNumber;
        std::string ayambilShalaName;
        std::string city;
        std::string ipAddress;
    };

    // Admin partial update. Only fields that are set are written; id, submissionDate
    // and ipAddress are not part of the allowlist.
    struct SubmissionPatch {
        std::optional<SubmissionStatus> status;
        std::optional<CalendarDate> bookingDate;
        std::optional<std::string> name;
        std::optional<std::string> upiNumber;
        std::optional<std::string> whatsappNumber;
        std::optional<std::string> ayambilShalaName;
        std::optional<std::string> city;

        bool empty() const;
    };

    struct SubmissionFilter {
        std::optional<SubmissionStatus> status;
        std::optional<std::string> city;

        bool matches(const Submission& s) const;
    };

    struct Statistics {
        std::size_t total = 0;
        std::size_t today = 0;
        std::size_t pending = 0;
        std::size_t reviewed = 0;
        std::size_t archived = 0;
        double fileSizeMB = 0.0;
    };

    // VRT-<unix-ms>-<8 uppercase hex>
    std::string generateSubmissionId();

    void to_json(json& j, const CalendarDate& d);
    void to_json(json& j, const Submission& s);
    void from_json(const json& j, SubmissionInput& in);
    // Unknown keys are ignored; empty strings count as "not supplied".
    void from_json(const json& j, SubmissionPatch& patch);
    void to_json(json& j, const Statistics& st);

    template <class T>
    struct Page {
        std::vector<T> data;
        std::size_t total = 0;
        std::size_t page = 1;
        std::size_t limit = 50;
        std::size_t pages = 0;
        bool hasNext = false;
        bool hasPrev = false;
    };

    template <class T>
    Page<T> paginate(const std::vector<T>& items, std::size_t page = 1, std::size_t limit = 50) {
        Page<T> out;
        out.page = std::max<std::size_t>(page, 1);
        out.limit = std::max<std::size_t>(limit, 1);
        out.total = items.size();
        out.pages = (items.size() + out.limit - 1) / out.limit;
        std::size_t begin = std::min(items.size(), (out.page - 1) * out.limit);
        std::size_t end = std::min(items.size(), begin + out.limit);
        out.data.assign(items.begin() + begin, items.begin() + end);
        out.hasNext = end < items.size();
        out.hasPrev = out.page > 1;
        return out;
    }

    template <class T>
    void to_json(json& j, const Page<T>& p) {
        j = json{{"data", p.data},
                 {"pagination", {{"total", p.total}, {"page", p.page}, {"limit", p.limit}, {"pages", p.pages}, {"hasNext", p.hasNext}, {"hasPrev", p.hasPrev}}}};
    }

} // namespace slotbook

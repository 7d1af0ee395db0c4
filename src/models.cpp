#include <slotbook/models.hpp>

#include <cstdio>
#include <random>
#include <stdexcept>

namespace slotbook {

    namespace {

        std::optional<CalendarDate> dateField(const json& j, const char* key) {
            if (!j.contains(key) || j.at(key).is_null()) {
                return std::nullopt;
            }
            auto text = j.at(key).get<std::string>();
            if (text.empty()) {
                return std::nullopt;
            }
            auto date = parseDate(text);
            if (!date) {
                throw std::invalid_argument(std::string("Invalid date for ") + key + ": " + text);
            }
            return date;
        }

        void patchString(const json& j, const char* key, std::optional<std::string>& out) {
            if (j.contains(key) && j.at(key).is_string()) {
                auto value = j.at(key).get<std::string>();
                if (!value.empty()) {
                    out = std::move(value);
                }
            }
        }

    } // namespace

    const char* toString(SubmissionStatus status) {
        switch (status) {
            case SubmissionStatus::Pending:
                return "pending";
            case SubmissionStatus::Reviewed:
                return "reviewed";
            case SubmissionStatus::Archived:
                return "archived";
        }
        return "pending";
    }

    SubmissionStatus parseStatus(const std::string& text) {
        if (text == "pending") {
            return SubmissionStatus::Pending;
        }
        if (text == "reviewed") {
            return SubmissionStatus::Reviewed;
        }
        if (text == "archived") {
            return SubmissionStatus::Archived;
        }
        throw std::invalid_argument("Unknown submission status: " + text);
    }

    bool SubmissionPatch::empty() const {
        return !status && !bookingDate && !name && !upiNumber && !whatsappNumber && !ayambilShalaName && !city;
    }

    bool SubmissionFilter::matches(const Submission& s) const {
        if (status && s.status != *status) {
            return false;
        }
        if (city && s.city != *city) {
            return false;
        }
        return true;
    }

    std::string generateSubmissionId() {
        static thread_local std::mt19937 rng{std::random_device{}()};
        char hex[9];
        std::snprintf(hex, sizeof(hex), "%08X", static_cast<unsigned>(rng()));
        return "VRT-" + std::to_string(uniqueMillis()) + "-" + hex;
    }

    void to_json(json& j, const CalendarDate& d) {
        j = d.toString();
    }

    void to_json(json& j, const Submission& s) {
        j = json{{"id", s.id},
                 {"submissionDate", formatIso(s.submissionDate)},
                 {"bookingDate", s.bookingDate ? json(s.bookingDate->toString()) : json(nullptr)},
                 {"name", s.name},
                 {"upiNumber", s.upiNumber},
                 {"whatsappNumber", s.whatsappNumber},
                 {"ayambilShalaName", s.ayambilShalaName},
                 {"city", s.city},
                 {"status", toString(s.status)},
                 {"ipAddress", s.ipAddress}};
    }

    void from_json(const json& j, SubmissionInput& in) {
        in.bookingDate = dateField(j, "bookingDate");
        in.name = j.value("name", "");
        in.upiNumber = j.value("upiNumber", "");
        in.whatsappNumber = j.value("whatsappNumber", "");
        in.ayambilShalaName = j.value("ayambilShalaName", "");
        in.city = j.value("city", "");
        in.ipAddress = j.value("ipAddress", "");
    }

    void from_json(const json& j, SubmissionPatch& patch) {
        if (j.contains("status") && j.at("status").is_string() && !j.at("status").get<std::string>().empty()) {
            patch.status = parseStatus(j.at("status").get<std::string>());
        }
        patch.bookingDate = dateField(j, "bookingDate");
        patchString(j, "name", patch.name);
        patchString(j, "upiNumber", patch.upiNumber);
        patchString(j, "whatsappNumber", patch.whatsappNumber);
        patchString(j, "ayambilShalaName", patch.ayambilShalaName);
        patchString(j, "city", patch.city);
    }

    void to_json(json& j, const Statistics& st) {
        j = json{{"total", st.total},
                 {"today", st.today},
                 {"pending", st.pending},
                 {"reviewed", st.reviewed},
                 {"archived", st.archived},
                 {"fileSizeMB", st.fileSizeMB}};
    }

} // namespace slotbook

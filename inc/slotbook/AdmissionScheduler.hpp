#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "RecordStore.hpp"
#include "timeutil.hpp"

namespace slotbook {

    struct Availability {
        bool available = false;
        std::size_t count = 0;
        std::size_t max = 0;
        std::size_t remaining = 0;
    };

    struct NextAvailable {
        CalendarDate date;
        std::size_t count = 0;
        std::size_t remaining = 0;
    };

    enum class ValidationError {
        None,
        PastDate,
        CapacityExceeded
    };

    struct ValidationResult {
        bool valid = false;
        ValidationError error = ValidationError::None;
        std::string reason;
        std::size_t count = 0;
        std::size_t remaining = 0;
        // filled when the requested day is full
        std::optional<NextAvailable> nextAvailableDate;
    };

    // Per-day capacity. Pure reads over the live store; calling any of these has no side effects.
    class AdmissionScheduler {
    public:
        AdmissionScheduler(std::shared_ptr<const RecordStore> store, std::size_t maxPerDay, int horizonDays = 90);

        std::size_t countForDate(const CalendarDate& date) const;
        Availability isAvailable(const CalendarDate& date) const;
        // First day in [from, from + horizonDays) with room left.
        std::optional<NextAvailable> nextAvailableDate(const CalendarDate& from) const;
        std::optional<NextAvailable> nextAvailableDate(const CalendarDate& from, int horizonDays) const;
        ValidationResult validate(const CalendarDate& date) const;

        std::size_t maxPerDay() const {
            return max_per_day_;
        }

    private:
        Availability availabilityFor(std::size_t count) const;

        std::shared_ptr<const RecordStore> store_;
        std::size_t max_per_day_;
        int horizon_days_;
    };

    void to_json(nlohmann::json& j, const Availability& a);
    void to_json(nlohmann::json& j, const NextAvailable& n);
    void to_json(nlohmann::json& j, const ValidationResult& v);

} // namespace slotbook

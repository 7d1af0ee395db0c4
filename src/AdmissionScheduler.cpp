#include <slotbook/AdmissionScheduler.hpp>

namespace slotbook {

    AdmissionScheduler::AdmissionScheduler(std::shared_ptr<const RecordStore> store, std::size_t maxPerDay, int horizonDays)
        : store_(std::move(store))
        , max_per_day_(maxPerDay)
        , horizon_days_(horizonDays) {
    }

    Availability AdmissionScheduler::availabilityFor(std::size_t count) const {
        Availability a;
        a.count = count;
        a.max = max_per_day_;
        a.available = count < max_per_day_;
        a.remaining = a.available ? max_per_day_ - count : 0;
        return a;
    }

    std::size_t AdmissionScheduler::countForDate(const CalendarDate& date) const {
        return store_->countForDate(date);
    }

    Availability AdmissionScheduler::isAvailable(const CalendarDate& date) const {
        return availabilityFor(countForDate(date));
    }

    std::optional<NextAvailable> AdmissionScheduler::nextAvailableDate(const CalendarDate& from) const {
        return nextAvailableDate(from, horizon_days_);
    }

    std::optional<NextAvailable> AdmissionScheduler::nextAvailableDate(const CalendarDate& from, int horizonDays) const {
        if (horizonDays <= 0) {
            return std::nullopt;
        }
        // one read of the store for the whole window instead of one per day
        auto counts = store_->bookingCountsByDateRange(from, from.addDays(horizonDays - 1));
        for (int i = 0; i < horizonDays; ++i) {
            CalendarDate day = from.addDays(i);
            auto it = counts.find(day.toString());
            auto a = availabilityFor(it == counts.end() ? 0 : it->second);
            if (a.available) {
                return NextAvailable{day, a.count, a.remaining};
            }
        }
        return std::nullopt;
    }

    ValidationResult AdmissionScheduler::validate(const CalendarDate& date) const {
        ValidationResult r;
        if (date < today()) {
            r.error = ValidationError::PastDate;
            r.reason = "Past dates cannot be booked";
            return r;
        }

        auto a = isAvailable(date);
        r.count = a.count;
        r.remaining = a.remaining;
        if (!a.available) {
            r.error = ValidationError::CapacityExceeded;
            r.reason = "This date is fully booked (" + std::to_string(a.count) + "/" + std::to_string(a.max) + " bookings)";
            r.nextAvailableDate = nextAvailableDate(date);
            return r;
        }
        r.valid = true;
        return r;
    }

    void to_json(nlohmann::json& j, const Availability& a) {
        j = nlohmann::json{{"available", a.available}, {"count", a.count}, {"maxBookings", a.max}, {"remaining", a.remaining}};
    }

    void to_json(nlohmann::json& j, const NextAvailable& n) {
        j = nlohmann::json{{"date", n.date.toString()}, {"count", n.count}, {"remaining", n.remaining}};
    }

    void to_json(nlohmann::json& j, const ValidationResult& v) {
        j = nlohmann::json{{"valid", v.valid}};
        if (v.valid) {
            j["count"] = v.count;
            j["remaining"] = v.remaining;
            return;
        }
        j["error"] = v.reason;
        j["code"] = v.error == ValidationError::PastDate ? "past_date" : "capacity_exceeded";
        if (v.error == ValidationError::CapacityExceeded) {
            j["currentCount"] = v.count;
            j["nextAvailableDate"] = v.nextAvailableDate ? nlohmann::json(*v.nextAvailableDate) : nlohmann::json(nullptr);
        }
    }

} // namespace slotbook

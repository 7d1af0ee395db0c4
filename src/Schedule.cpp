#include <slotbook/Schedule.hpp>
#include <slotbook/logging.hpp>

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace slotbook {

    namespace {

        int parseNumber(const std::string& text, const std::string& field) {
            if (text.empty() || text.size() > 4) {
                throw std::invalid_argument("Bad cron field: " + field);
            }
            for (char c : text) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    throw std::invalid_argument("Bad cron field: " + field);
                }
            }
            return std::stoi(text);
        }

        std::vector<std::string> split(const std::string& text, char sep) {
            std::vector<std::string> out;
            std::string part;
            std::istringstream in(text);
            while (std::getline(in, part, sep)) {
                out.push_back(part);
            }
            return out;
        }

        template <std::size_t N>
        bool parseField(const std::string& field, int lo, int hi, std::bitset<N>& out) {
            for (auto const& item : split(field, ',')) {
                auto slash = item.find('/');
                std::string base = item.substr(0, slash);
                int step = 1;
                if (slash != std::string::npos) {
                    step = parseNumber(item.substr(slash + 1), field);
                    if (step < 1) {
                        throw std::invalid_argument("Bad cron step: " + field);
                    }
                }

                int first = lo;
                int last = hi;
                if (base != "*") {
                    auto dash = base.find('-');
                    if (dash != std::string::npos) {
                        first = parseNumber(base.substr(0, dash), field);
                        last = parseNumber(base.substr(dash + 1), field);
                    } else {
                        first = parseNumber(base, field);
                        last = slash != std::string::npos ? hi : first;
                    }
                }
                if (first < lo || last > hi || first > last) {
                    throw std::invalid_argument("Cron value out of range: " + field);
                }
                for (int v = first; v <= last; v += step) {
                    out.set(static_cast<std::size_t>(v));
                }
            }
            if (out.none()) {
                throw std::invalid_argument("Empty cron field: " + field);
            }
            return field.empty() || field[0] != '*';
        }

        void normalize(std::tm& t) {
            t.tm_isdst = -1;
            std::mktime(&t);
        }

    } // namespace

    CronSchedule CronSchedule::parse(const std::string& expression) {
        std::istringstream in(expression);
        std::vector<std::string> fields;
        std::string f;
        while (in >> f) {
            fields.push_back(f);
        }
        if (fields.size() != 5) {
            throw std::invalid_argument("Cron expression needs 5 fields: \"" + expression + "\"");
        }

        CronSchedule s;
        s.expression_ = expression;
        s.description_ = "custom (" + expression + ")";
        parseField(fields[0], 0, 59, s.minutes_);
        parseField(fields[1], 0, 23, s.hours_);
        s.days_restricted_ = parseField(fields[2], 1, 31, s.days_);
        parseField(fields[3], 1, 12, s.months_);

        std::bitset<8> dow;
        s.weekdays_restricted_ = parseField(fields[4], 0, 7, dow);
        for (std::size_t d = 0; d < 7; ++d) {
            s.weekdays_[d] = dow[d];
        }
        if (dow[7]) {
            s.weekdays_.set(0);
        }
        return s;
    }

    CronSchedule CronSchedule::forInterval(const std::string& interval) {
        CronSchedule s;
        if (interval == "hourly") {
            s = parse("0 * * * *");
            s.description_ = "hourly";
        } else if (interval == "daily") {
            s = parse("0 2 * * *");
            s.description_ = "daily at 2:00 AM";
        } else if (interval == "weekly") {
            s = parse("0 2 * * 0");
            s.description_ = "weekly on Sunday at 2:00 AM";
        } else {
            s = parse(interval);
        }
        return s;
    }

    bool CronSchedule::dayMatches(const std::tm& local) const {
        bool dom = days_[static_cast<std::size_t>(local.tm_mday)];
        bool dow = weekdays_[static_cast<std::size_t>(local.tm_wday)];
        if (days_restricted_ && weekdays_restricted_) {
            return dom || dow;
        }
        return dom && dow;
    }

    bool CronSchedule::matches(const std::tm& local) const {
        return minutes_[static_cast<std::size_t>(local.tm_min)] &&
               hours_[static_cast<std::size_t>(local.tm_hour)] &&
               months_[static_cast<std::size_t>(local.tm_mon + 1)] &&
               dayMatches(local);
    }

    TimePoint CronSchedule::nextFireTime(TimePoint after) const {
        std::time_t base = Clock::to_time_t(after);
        std::tm t{};
        localtime_r(&base, &t);
        t.tm_sec = 0;
        t.tm_min += 1;
        normalize(t);

        // Bounded so that expressions that can never match (Feb 30) end in an error.
        for (int guard = 0; guard < 200000; ++guard) {
            if (!months_[static_cast<std::size_t>(t.tm_mon + 1)]) {
                t.tm_mon += 1;
                t.tm_mday = 1;
                t.tm_hour = 0;
                t.tm_min = 0;
                normalize(t);
                continue;
            }
            if (!dayMatches(t)) {
                t.tm_mday += 1;
                t.tm_hour = 0;
                t.tm_min = 0;
                normalize(t);
                continue;
            }
            if (!hours_[static_cast<std::size_t>(t.tm_hour)]) {
                t.tm_hour += 1;
                t.tm_min = 0;
                normalize(t);
                continue;
            }
            if (!minutes_[static_cast<std::size_t>(t.tm_min)]) {
                t.tm_min += 1;
                normalize(t);
                continue;
            }
            std::tm copy = t;
            copy.tm_isdst = -1;
            return Clock::from_time_t(std::mktime(&copy));
        }
        throw std::invalid_argument("Cron expression never fires: " + expression_);
    }

    PeriodicTrigger::PeriodicTrigger(CronSchedule schedule, std::function<void()> callback)
        : PeriodicTrigger([schedule](TimePoint from) { return schedule.nextFireTime(from); },
                          schedule.description(), std::move(callback)) {
    }

    PeriodicTrigger::PeriodicTrigger(NextFire nextFire, std::string description, std::function<void()> callback)
        : next_fire_(std::move(nextFire))
        , description_(std::move(description))
        , callback_(std::move(callback)) {
    }

    PeriodicTrigger::~PeriodicTrigger() {
        stop();
    }

    void PeriodicTrigger::start() {
        std::scoped_lock lk(mutex_);
        if (running_) {
            return;
        }
        stopping_ = false;
        running_ = true;
        worker_ = std::thread([this] { run(); });
    }

    void PeriodicTrigger::stop() {
        {
            std::scoped_lock lk(mutex_);
            if (!running_) {
                return;
            }
            stopping_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
        std::scoped_lock lk(mutex_);
        running_ = false;
    }

    bool PeriodicTrigger::running() const {
        std::scoped_lock lk(mutex_);
        return running_;
    }

    void PeriodicTrigger::run() {
        std::unique_lock lk(mutex_);
        while (!stopping_) {
            TimePoint fireAt;
            try {
                fireAt = next_fire_(now());
            } catch (const std::exception& ex) {
                log::get()->error("Scheduled job ({}) has no next run: {}", description_, ex.what());
                break;
            }
            if (cv_.wait_until(lk, fireAt, [this] { return stopping_; })) {
                break;
            }
            lk.unlock();
            log::get()->info("Running scheduled job ({})", description_);
            try {
                callback_();
            } catch (const std::exception& ex) {
                log::get()->error("Scheduled job failed: {}", ex.what());
            }
            lk.lock();
        }
    }

} // namespace slotbook

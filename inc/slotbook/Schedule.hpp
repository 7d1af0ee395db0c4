#pragma once
#include <bitset>
#include <condition_variable>
#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "timeutil.hpp"

namespace slotbook {

    // Five-field cron expression (minute hour day-of-month month day-of-week),
    // evaluated in local time. Fields accept "*", numbers, "a-b" ranges,
    // "/n" steps and comma lists; day-of-week 7 is Sunday like 0. When both
    // day fields are restricted a day matches if either does.
    class CronSchedule {
    public:
        // throws std::invalid_argument
        static CronSchedule parse(const std::string& expression);

        // "hourly", "daily" (02:00), "weekly" (Sunday 02:00); anything else is parsed as an expression.
        static CronSchedule forInterval(const std::string& interval);

        // First matching minute strictly after `after`.
        TimePoint nextFireTime(TimePoint after) const;

        bool matches(const std::tm& local) const;

        const std::string& expression() const {
            return expression_;
        }

        const std::string& description() const {
            return description_;
        }

    private:
        bool dayMatches(const std::tm& local) const;

        std::string expression_;
        std::string description_;
        std::bitset<60> minutes_;
        std::bitset<24> hours_;
        std::bitset<32> days_;
        std::bitset<13> months_;
        std::bitset<7> weekdays_;
        bool days_restricted_ = false;
        bool weekdays_restricted_ = false;
    };

    // Background thread that sleeps until the schedule's next fire time and runs
    // the callback. A throwing callback is logged and the next run still happens.
    class PeriodicTrigger {
    public:
        using NextFire = std::function<TimePoint(TimePoint)>;

        PeriodicTrigger(CronSchedule schedule, std::function<void()> callback);
        // nextFire maps "now" to the next time the callback should run.
        PeriodicTrigger(NextFire nextFire, std::string description, std::function<void()> callback);
        ~PeriodicTrigger();

        PeriodicTrigger(const PeriodicTrigger&) = delete;
        PeriodicTrigger& operator=(const PeriodicTrigger&) = delete;

        void start();
        void stop();

        bool running() const;

        const std::string& description() const {
            return description_;
        }

    private:
        void run();

        NextFire next_fire_;
        std::string description_;
        std::function<void()> callback_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::thread worker_;
        bool stopping_ = false;
        bool running_ = false;
    };

} // namespace slotbook

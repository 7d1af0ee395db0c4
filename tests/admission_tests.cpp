#include <gtest/gtest.h>

#include <slotbook/AdmissionScheduler.hpp>

#include "test_support.hpp"

using namespace slotbook;
using namespace slotbook::testing;

namespace {

    struct AdmissionFixture {
        TempDir dir;
        StoreConfig config = testConfig(dir.path());
        std::shared_ptr<RecordStore> store = std::make_shared<RecordStore>(config, nullptr);
        AdmissionScheduler scheduler{store, 3, 90};

        AdmissionFixture() {
            store->initialize();
        }

        void fill(const CalendarDate& day, int n) {
            for (int i = 0; i < n; ++i) {
                store->add(makeInput("Guest " + std::to_string(i), day));
            }
        }
    };

} // namespace

TEST(Admission, AvailabilityReportsRemaining) {
    AdmissionFixture f;
    auto day = today().addDays(10);
    f.fill(day, 2);

    auto a = f.scheduler.isAvailable(day);
    EXPECT_TRUE(a.available);
    EXPECT_EQ(a.count, 2u);
    EXPECT_EQ(a.max, 3u);
    EXPECT_EQ(a.remaining, 1u);

    f.fill(day, 1);
    a = f.scheduler.isAvailable(day);
    EXPECT_FALSE(a.available);
    EXPECT_EQ(a.remaining, 0u);
}

TEST(Admission, CountIsByCalendarDay) {
    AdmissionFixture f;
    auto day = today().addDays(7);
    f.fill(day, 2);
    f.fill(day.addDays(1), 1);
    EXPECT_EQ(f.scheduler.countForDate(day), 2u);
    EXPECT_EQ(f.scheduler.countForDate(day.addDays(1)), 1u);
    EXPECT_EQ(f.scheduler.countForDate(day.addDays(-1)), 0u);
}

TEST(Admission, ArchivedStatusFreesCapacity) {
    AdmissionFixture f;
    auto day = today().addDays(3);
    f.fill(day, 3);
    EXPECT_FALSE(f.scheduler.isAvailable(day).available);

    auto one = f.store->list().front();
    SubmissionPatch patch;
    patch.status = SubmissionStatus::Archived;
    f.store->update(one.id, patch);
    EXPECT_TRUE(f.scheduler.isAvailable(day).available);
}

TEST(Admission, NextAvailableSkipsFullDays) {
    AdmissionFixture f;
    auto d = today().addDays(2);
    f.fill(d, 3);
    f.fill(d.addDays(1), 3);
    f.fill(d.addDays(2), 1);

    auto next = f.scheduler.nextAvailableDate(d);
    ASSERT_TRUE(next);
    EXPECT_EQ(next->date, d.addDays(2));
    EXPECT_EQ(next->count, 1u);
    EXPECT_EQ(next->remaining, 2u);

    // never before the start, and everything skipped was full
    EXPECT_FALSE(next->date < d);
    for (auto day = d; day < next->date; day = day.addDays(1)) {
        EXPECT_FALSE(f.scheduler.isAvailable(day).available);
    }
}

TEST(Admission, NextAvailableIsInclusiveOfStart) {
    AdmissionFixture f;
    auto d = today().addDays(1);
    auto next = f.scheduler.nextAvailableDate(d);
    ASSERT_TRUE(next);
    EXPECT_EQ(next->date, d);
    EXPECT_EQ(next->remaining, 3u);
}

TEST(Admission, NextAvailableNoneWhenHorizonFull) {
    AdmissionFixture f;
    auto d = today().addDays(1);
    for (int i = 0; i < 3; ++i) {
        f.fill(d.addDays(i), 3);
    }
    EXPECT_FALSE(f.scheduler.nextAvailableDate(d, 3));
    auto beyond = f.scheduler.nextAvailableDate(d, 4);
    ASSERT_TRUE(beyond);
    EXPECT_EQ(beyond->date, d.addDays(3));
}

TEST(Admission, ValidateRejectsPastDate) {
    AdmissionFixture f;
    auto v = f.scheduler.validate(today().addDays(-1));
    EXPECT_FALSE(v.valid);
    EXPECT_EQ(v.error, ValidationError::PastDate);
    EXPECT_EQ(v.reason, "Past dates cannot be booked");
    EXPECT_FALSE(v.nextAvailableDate);

    EXPECT_TRUE(f.scheduler.validate(today()).valid);
}

TEST(Admission, ValidateFullDaySuggestsNextDay) {
    AdmissionFixture f;
    auto d = today().addDays(5);
    f.fill(d, 3);
    f.fill(d.addDays(1), 3);

    auto v = f.scheduler.validate(d);
    EXPECT_FALSE(v.valid);
    EXPECT_EQ(v.error, ValidationError::CapacityExceeded);
    EXPECT_EQ(v.count, 3u);
    EXPECT_EQ(v.reason, "This date is fully booked (3/3 bookings)");
    ASSERT_TRUE(v.nextAvailableDate);
    EXPECT_EQ(v.nextAvailableDate->date, d.addDays(2));

    auto j = nlohmann::json(v);
    EXPECT_EQ(j["valid"], false);
    EXPECT_EQ(j["code"], "capacity_exceeded");
    EXPECT_EQ(j["nextAvailableDate"]["date"], d.addDays(2).toString());
}

TEST(Admission, ValidateIsSideEffectFree) {
    AdmissionFixture f;
    auto d = today().addDays(5);
    f.fill(d, 3);
    const auto before = readAll(f.config.storePath());
    for (int i = 0; i < 3; ++i) {
        f.scheduler.validate(d);
        f.scheduler.nextAvailableDate(d);
    }
    EXPECT_EQ(readAll(f.config.storePath()), before);
}

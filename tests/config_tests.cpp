#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include <slotbook/config.hpp>
#include <slotbook/errors.hpp>
#include <slotbook/models.hpp>

#include "test_support.hpp"

using namespace slotbook;
using namespace slotbook::testing;

TEST(Config, Defaults) {
    StoreConfig c;
    EXPECT_EQ(c.storePath(), std::filesystem::path("data") / "submissions.json");
    EXPECT_EQ(c.backupPath(), std::filesystem::path("data") / "backups");
    EXPECT_EQ(c.lock.retries, 15);
    EXPECT_EQ(c.lock.minTimeout, std::chrono::milliseconds(100));
    EXPECT_EQ(c.lock.maxTimeout, std::chrono::milliseconds(2000));
    EXPECT_EQ(c.lock.stale, std::chrono::milliseconds(10000));
    EXPECT_EQ(c.thresholds.maxRows, 50000u);
    EXPECT_EQ(c.thresholds.warningRows, 10000u);
    EXPECT_EQ(c.maxBackups, 30u);
    EXPECT_EQ(c.maxBookingsPerDay, 3u);
    EXPECT_EQ(c.searchHorizonDays, 90);
    EXPECT_FALSE(c.autoBackupEnabled);
    EXPECT_FALSE(c.lockReads);
}

TEST(Config, FileOverridesDefaults) {
    TempDir dir;
    auto path = dir.path() / "slotbook.json";
    std::ofstream(path) << R"({
        "dataDir": "/var/lib/slotbook",
        "archiveDir": "/srv/archives",
        "lockReads": true,
        "lock": {"retries": 4, "staleMs": 500},
        "thresholds": {"maxRows": 10},
        "backup": {"maxBackups": 7, "interval": "hourly"},
        "booking": {"maxBookingsPerDay": 5}
    })";

    ::unsetenv("SLOTBOOK_DATA_DIR");
    ::unsetenv("SLOTBOOK_MAX_ROWS");
    auto c = loadConfig(path);
    EXPECT_EQ(c.storePath(), std::filesystem::path("/var/lib/slotbook/submissions.json"));
    EXPECT_EQ(c.archivePath(), std::filesystem::path("/srv/archives"));
    EXPECT_TRUE(c.lockReads);
    EXPECT_EQ(c.lock.retries, 4);
    EXPECT_EQ(c.lock.stale, std::chrono::milliseconds(500));
    EXPECT_EQ(c.lock.minTimeout, std::chrono::milliseconds(100));
    EXPECT_EQ(c.thresholds.maxRows, 10u);
    EXPECT_EQ(c.maxBackups, 7u);
    EXPECT_EQ(c.backupInterval, "hourly");
    EXPECT_EQ(c.maxBookingsPerDay, 5u);
}

TEST(Config, EnvironmentWinsOverFile) {
    TempDir dir;
    auto path = dir.path() / "slotbook.json";
    std::ofstream(path) << R"({"thresholds": {"maxRows": 10}})";

    ::setenv("SLOTBOOK_MAX_ROWS", "1234", 1);
    ::setenv("SLOTBOOK_AUTO_BACKUP_ENABLED", "true", 1);
    auto c = loadConfig(path);
    ::unsetenv("SLOTBOOK_MAX_ROWS");
    ::unsetenv("SLOTBOOK_AUTO_BACKUP_ENABLED");

    EXPECT_EQ(c.thresholds.maxRows, 1234u);
    EXPECT_TRUE(c.autoBackupEnabled);
}

TEST(Config, BadFilesThrow) {
    TempDir dir;
    EXPECT_THROW(loadConfig(dir.path() / "missing.json"), StoreIOError);

    auto broken = dir.path() / "broken.json";
    std::ofstream(broken) << "{ not json";
    EXPECT_THROW(loadConfig(broken), StoreIOError);

    auto wrongType = dir.path() / "wrong.json";
    std::ofstream(wrongType) << R"({"lock": {"retries": "many"}})";
    EXPECT_THROW(loadConfig(wrongType), StoreIOError);
}

TEST(Models, PatchFromJsonSkipsEmptyAndUnknown) {
    auto patch = nlohmann::json::parse(R"({"city": "Pune", "name": "", "id": "VRT-9", "status": "reviewed"})")
                     .get<SubmissionPatch>();
    EXPECT_EQ(patch.city, std::optional<std::string>("Pune"));
    EXPECT_FALSE(patch.name);
    EXPECT_EQ(patch.status, SubmissionStatus::Reviewed);
    EXPECT_FALSE(patch.empty());

    EXPECT_TRUE(nlohmann::json::object().get<SubmissionPatch>().empty());
    EXPECT_THROW(nlohmann::json::parse(R"({"status": "done"})").get<SubmissionPatch>(), std::invalid_argument);
    EXPECT_THROW(nlohmann::json::parse(R"({"bookingDate": "2024-02-30"})").get<SubmissionPatch>(), std::invalid_argument);
}

TEST(Models, DatesAndMonths) {
    auto d = parseDate("2024-03-31");
    ASSERT_TRUE(d);
    EXPECT_EQ(d->subtractMonths(1).toString(), "2024-02-29");
    EXPECT_EQ(d->subtractMonths(13).toString(), "2023-02-28");
    EXPECT_EQ(d->addDays(1).toString(), "2024-04-01");
    EXPECT_EQ(parseDate("2024-05-01T10:15:30.123Z")->toString(), "2024-05-01");
    EXPECT_FALSE(parseDate("yesterday"));

    auto tp = parseIso("2024-05-01T10:15:30.123Z");
    ASSERT_TRUE(tp);
    EXPECT_EQ(formatIso(*tp), "2024-05-01T10:15:30.123Z");
    EXPECT_EQ(fileStamp(*tp), "2024-05-01_10-15-30-123");
}

TEST(Models, DateParsingIsStrict) {
    EXPECT_EQ(parseDate("2024-02-29")->toString(), "2024-02-29");
    EXPECT_EQ(parseDate("2024-05-01T00:00:00Z")->toString(), "2024-05-01");
    EXPECT_FALSE(parseDate("2024-05-01xyz"));
    EXPECT_FALSE(parseDate("2024-05-01 "));
    EXPECT_FALSE(parseDate("24-5-1-----"));
    EXPECT_FALSE(parseDate("2024-5-01xx"));
    EXPECT_FALSE(parseDate("+024-05-01"));
    EXPECT_FALSE(parseDate("2024/05/01"));
    EXPECT_FALSE(parseDate("2023-02-29"));
    EXPECT_FALSE(parseDate("2024-13-01"));
    EXPECT_FALSE(parseDate(""));
    EXPECT_THROW(nlohmann::json::parse(R"({"bookingDate": "2024-05-01junk"})").get<SubmissionPatch>(),
                 std::invalid_argument);
}

TEST(Models, SubmissionIdFormat) {
    auto id = generateSubmissionId();
    ASSERT_EQ(id.rfind("VRT-", 0), 0u);
    auto dash = id.rfind('-');
    auto hex = id.substr(dash + 1);
    EXPECT_EQ(hex.size(), 8u);
    EXPECT_EQ(hex.find_first_not_of("0123456789ABCDEF"), std::string::npos);
    EXPECT_NE(generateSubmissionId(), id);
}

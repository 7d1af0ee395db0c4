#include <gtest/gtest.h>

#include <algorithm>

#include <slotbook/HealthMonitor.hpp>

#include "test_support.hpp"

using namespace slotbook;
using namespace slotbook::testing;

namespace {

    bool HasWarning(const HealthReport& r, const std::string& prefix) {
        return std::any_of(r.warnings.begin(), r.warnings.end(), [&](const std::string& w) {
            return w.rfind(prefix, 0) == 0;
        });
    }

    struct HealthFixture {
        TempDir dir;
        StoreConfig config;
        std::shared_ptr<BackupManager> backups;
        std::shared_ptr<RecordStore> store;

        explicit HealthFixture(Thresholds t = {}) {
            config = testConfig(dir.path());
            config.thresholds = t;
            backups = std::make_shared<BackupManager>(config);
            store = std::make_shared<RecordStore>(config, backups);
            store->initialize();
        }

        HealthMonitor monitor() const {
            return HealthMonitor(config, store, backups);
        }
    };

} // namespace

TEST(Health, NoBackupsIsWarning) {
    HealthFixture f;
    auto report = f.monitor().healthCheck();
    EXPECT_EQ(report.status, HealthStatus::Warning);
    EXPECT_TRUE(HasWarning(report, "No backups found"));
    EXPECT_EQ(report.backup.backupCount, 0u);
    EXPECT_FALSE(report.backup.lastBackup);
    EXPECT_EQ(report.file.rowCount, 0u);
    EXPECT_GT(report.file.sizeBytes, 0u);
    EXPECT_EQ(report.file.path, f.config.storePath());
}

TEST(Health, FreshBackupIsHealthy) {
    HealthFixture f;
    f.store->add(makeInput("A"));
    auto report = f.monitor().healthCheck();
    EXPECT_EQ(report.status, HealthStatus::Healthy);
    EXPECT_TRUE(report.warnings.empty());
    EXPECT_EQ(report.backup.backupCount, 1u);
    EXPECT_TRUE(report.backup.lastBackup);
    EXPECT_EQ(report.file.rowCount, 1u);
}

TEST(Health, StaleBackupWarns) {
    HealthFixture f;
    auto path = *f.backups->createBackup();
    setAge(path, std::chrono::hours(30));

    auto report = f.monitor().healthCheck();
    EXPECT_EQ(report.status, HealthStatus::Warning);
    EXPECT_TRUE(HasWarning(report, "Last backup was 30."));
}

TEST(Health, ThreeWarningsIsCritical) {
    Thresholds t;
    t.warningRows = 1;
    t.maxRows = 100;
    t.warningFileSizeMB = 0.0;
    t.maxFileSizeMB = 10.0;
    HealthFixture f(t);
    {
        RecordStore plain(f.config, nullptr);
        plain.add(makeInput("A"));
        plain.add(makeInput("B"));
    }

    auto report = f.monitor().healthCheck();
    EXPECT_TRUE(HasWarning(report, "File size is"));
    EXPECT_TRUE(HasWarning(report, "Row count is 2"));
    EXPECT_TRUE(HasWarning(report, "No backups found"));
    EXPECT_EQ(report.status, HealthStatus::Critical);
}

TEST(Health, RowCountAndSizeAreAdvisory) {
    Thresholds t;
    t.warningRows = 0;
    t.maxRows = 0;
    HealthFixture f(t);
    f.store->add(makeInput("A"));
    // past the hard maximum, yet writes still go through
    EXPECT_NO_THROW(f.store->add(makeInput("B")));

    auto m = f.monitor();
    EXPECT_EQ(m.rowCount(), 2u);
    EXPECT_GT(m.fileSizeMB(), 0.0);
}

TEST(Health, MissingStoreReportsError) {
    HealthFixture f;
    std::filesystem::remove(f.config.storePath());

    auto m = f.monitor();
    EXPECT_EQ(m.fileSizeMB(), 0.0);
    EXPECT_EQ(m.rowCount(), 0u);

    auto report = m.healthCheck();
    EXPECT_EQ(report.status, HealthStatus::Error);
    EXPECT_EQ(report.warnings, (std::vector<std::string>{"Failed to perform health check"}));
    EXPECT_FALSE(report.error.empty());

    auto j = nlohmann::json(report);
    EXPECT_EQ(j["status"], "error");
    EXPECT_FALSE(j.contains("file"));
}

TEST(Health, ReportSerializes) {
    HealthFixture f;
    f.store->add(makeInput("A"));
    auto j = nlohmann::json(f.monitor().healthCheck());
    EXPECT_EQ(j["status"], "healthy");
    EXPECT_EQ(j["file"]["rowCount"], 1);
    EXPECT_EQ(j["thresholds"]["maxRows"], 50000);
    EXPECT_EQ(j["backup"]["backupCount"], 1);
    EXPECT_TRUE(j["backup"]["lastBackup"].is_string());
}

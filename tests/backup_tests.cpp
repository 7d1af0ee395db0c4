#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include <slotbook/BackupManager.hpp>
#include <slotbook/RecordStore.hpp>
#include <slotbook/errors.hpp>

#include "test_support.hpp"

using namespace slotbook;
using namespace slotbook::testing;

namespace {

    std::set<std::string> NamesIn(const std::vector<BackupInfo>& list) {
        std::set<std::string> out;
        for (auto const& b : list) {
            out.insert(b.name);
        }
        return out;
    }

} // namespace

TEST(Backup, NoSourceFileReturnsNull) {
    TempDir dir;
    BackupManager backups(testConfig(dir.path()));
    EXPECT_FALSE(backups.createBackup());
    EXPECT_FALSE(backups.getLastBackupTime());
    EXPECT_TRUE(backups.listBackups().empty());
}

TEST(Backup, CopiesStoreWithSortableName) {
    TempDir dir;
    auto config = testConfig(dir.path());
    RecordStore store(config, nullptr);
    store.initialize();

    BackupManager backups(config);
    auto path = backups.createBackup();
    ASSERT_TRUE(path);
    EXPECT_EQ(path->parent_path(), config.backupPath());
    EXPECT_EQ(path->filename().string().rfind("submissions_backup_", 0), 0u);
    EXPECT_EQ(path->extension(), ".json");
    EXPECT_EQ(readAll(*path), readAll(config.storePath()));

    auto second = backups.createBackup();
    ASSERT_TRUE(second);
    EXPECT_LT(path->filename().string(), second->filename().string());
    EXPECT_TRUE(backups.getLastBackupTime().has_value());
}

TEST(Backup, RetentionKeepsNewest) {
    TempDir dir;
    auto config = testConfig(dir.path());
    config.maxBackups = 5;
    RecordStore store(config, nullptr);
    store.initialize();

    BackupManager backups(config);
    std::vector<std::string> created;
    for (int i = 0; i < 8; ++i) {
        created.push_back(backups.createBackup()->filename().string());
    }

    auto list = backups.listBackups();
    ASSERT_EQ(list.size(), 5u);
    std::set<std::string> expected(created.end() - 5, created.end());
    EXPECT_EQ(NamesIn(list), expected);
    // newest first
    EXPECT_EQ(list.front().name, created.back());
}

TEST(Backup, RetentionUsesModificationTime) {
    TempDir dir;
    auto config = testConfig(dir.path());
    config.maxBackups = 2;
    RecordStore store(config, nullptr);
    store.initialize();

    BackupManager backups(config);
    auto a = *backups.createBackup();
    auto b = *backups.createBackup();
    // b is the oldest file on disk despite its later name
    setAge(b, std::chrono::hours(48));
    setAge(a, std::chrono::hours(24));

    auto c = *backups.createBackup();
    EXPECT_TRUE(std::filesystem::exists(a));
    EXPECT_FALSE(std::filesystem::exists(b));
    EXPECT_TRUE(std::filesystem::exists(c));
}

TEST(Backup, ListIgnoresForeignFiles) {
    TempDir dir;
    auto config = testConfig(dir.path());
    RecordStore store(config, nullptr);
    store.initialize();

    BackupManager backups(config);
    backups.createBackup();
    std::filesystem::create_directories(config.backupPath());
    std::ofstream(config.backupPath() / "notes.txt") << "x";
    std::ofstream(config.backupPath() / "corrupted_1.json") << "{}";

    auto list = backups.listBackups();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_GE(list[0].sizeMB, 0.0);
    EXPECT_GT(list[0].size, 0u);
}

TEST(Backup, RestoreIsByteIdenticalAndKeepsSafetySnapshot) {
    TempDir dir;
    auto config = testConfig(dir.path());
    auto backups = std::make_shared<BackupManager>(config);
    RecordStore store(config, backups);
    store.initialize();

    store.add(makeInput("First"));
    auto saved = *backups->createBackup();
    const std::string backupBytes = readAll(saved);

    store.add(makeInput("Second"));
    const std::string beforeRestore = readAll(config.storePath());
    ASSERT_NE(beforeRestore, backupBytes);

    auto result = backups->restoreFromBackup(saved.filename().string());
    EXPECT_EQ(readAll(config.storePath()), backupBytes);
    EXPECT_EQ(result.backupFile, saved.filename().string());
    ASSERT_TRUE(result.safetySnapshot);
    EXPECT_EQ(result.safetySnapshot->filename().string().rfind("corrupted_", 0), 0u);
    EXPECT_EQ(readAll(*result.safetySnapshot), beforeRestore);
    EXPECT_EQ(store.list().size(), 1u);
    EXPECT_FALSE(store.lock().isLocked());
}

TEST(Backup, RestoreWithoutLiveFileIsTolerated) {
    TempDir dir;
    auto config = testConfig(dir.path());
    BackupManager backups(config);
    {
        RecordStore store(config, nullptr);
        store.initialize();
    }
    auto saved = *backups.createBackup();
    std::filesystem::remove(config.storePath());

    auto result = backups.restoreFromBackup(saved.filename().string());
    EXPECT_FALSE(result.safetySnapshot);
    EXPECT_EQ(readAll(config.storePath()), readAll(saved));
}

TEST(Backup, RestoreUnknownNameThrows) {
    TempDir dir;
    auto config = testConfig(dir.path());
    RecordStore store(config, nullptr);
    store.initialize();
    BackupManager backups(config);
    const auto before = readAll(config.storePath());

    EXPECT_THROW(backups.restoreFromBackup("submissions_backup_missing.json"), BackupNotFoundError);
    EXPECT_THROW(backups.restoreFromBackup("../submissions.json"), BackupNotFoundError);
    EXPECT_THROW(backups.restoreFromBackup(""), BackupNotFoundError);
    EXPECT_EQ(readAll(config.storePath()), before);
}

TEST(Backup, AutoBackupHonoursConfig) {
    TempDir dir;
    auto config = testConfig(dir.path());
    {
        BackupManager disabled(config);
        EXPECT_FALSE(disabled.scheduleAutoBackup());
        EXPECT_FALSE(disabled.autoBackupScheduled());
    }

    config.autoBackupEnabled = true;
    config.backupInterval = "weekly";
    BackupManager enabled(config);
    EXPECT_TRUE(enabled.scheduleAutoBackup());
    EXPECT_TRUE(enabled.autoBackupScheduled());
    enabled.stopAutoBackup();
    EXPECT_FALSE(enabled.autoBackupScheduled());

    config.backupInterval = "every tuesday";
    BackupManager broken(config);
    EXPECT_THROW(broken.scheduleAutoBackup(), std::invalid_argument);
}

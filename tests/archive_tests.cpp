#include <gtest/gtest.h>

#include <set>

#include <slotbook/Archiver.hpp>
#include <slotbook/FileJsonStorage.hpp>
#include <slotbook/errors.hpp>

#include "test_support.hpp"

using namespace slotbook;
using namespace slotbook::testing;

namespace {

    struct ArchiveFixture {
        TempDir dir;
        StoreConfig config = testConfig(dir.path());
        std::shared_ptr<BackupManager> backups = std::make_shared<BackupManager>(config);
        std::shared_ptr<RecordStore> store = std::make_shared<RecordStore>(config, backups);
        Archiver archiver{config, store};

        ArchiveFixture() {
            store->initialize();
        }
    };

    std::vector<Submission> ReadArchive(const std::filesystem::path& p) {
        Workbook wb = FileJsonStorage(p).loadState().get<Workbook>();
        EXPECT_EQ(wb.sheets.size(), 1u);
        std::vector<Submission> out;
        for (auto const& row : wb.sheets.at(0).rows) {
            out.push_back(fromRow(row));
        }
        return out;
    }

} // namespace

TEST(Archive, PartitionsByCutoff) {
    ArchiveFixture f;
    const CalendarDate cutoff = today().subtractMonths(6);

    auto oldA = f.store->add(makeInput("Old A", cutoff.addDays(-1)));
    auto oldB = f.store->add(makeInput("Old B", cutoff.addDays(-200)));
    auto edge = f.store->add(makeInput("Edge", cutoff));
    auto fresh = f.store->add(makeInput("Fresh", today().addDays(3)));
    auto undated = f.store->add(makeInput("Undated"));

    auto result = f.archiver.archiveOlderThan(6);
    EXPECT_EQ(result.archivedCount, 2u);
    EXPECT_EQ(result.cutoffDate, cutoff);
    ASSERT_TRUE(result.archivePath);
    EXPECT_EQ(result.archivePath->parent_path(), f.config.archivePath());
    EXPECT_EQ(result.archivePath->filename().string(), "archive_" + cutoff.toString() + "_2records.json");

    auto archived = ReadArchive(*result.archivePath);
    ASSERT_EQ(archived.size(), 2u);
    std::set<std::string> archivedIds;
    for (auto const& s : archived) {
        ASSERT_TRUE(s.bookingDate);
        EXPECT_LT(*s.bookingDate, cutoff);
        archivedIds.insert(s.id);
    }
    EXPECT_EQ(archivedIds, (std::set<std::string>{oldA.id, oldB.id}));

    EXPECT_FALSE(f.store->getById(oldA.id));
    EXPECT_FALSE(f.store->getById(oldB.id));
    EXPECT_TRUE(f.store->getById(edge.id));
    EXPECT_TRUE(f.store->getById(fresh.id));
    EXPECT_TRUE(f.store->getById(undated.id));
    EXPECT_EQ(f.store->rowCount(), 3u);

    Workbook wb = FileJsonStorage(f.config.storePath()).loadState().get<Workbook>();
    EXPECT_EQ(*summaryValue(wb, kTotalMetric), 3);
}

TEST(Archive, UntouchedRowsKeepOrderAndContent) {
    ArchiveFixture f;
    const CalendarDate cutoff = today().subtractMonths(1);
    auto keep1 = f.store->add(makeInput("Keep 1", today()));
    f.store->add(makeInput("Drop 1", cutoff.addDays(-3)));
    auto keep2 = f.store->add(makeInput("Keep 2", today().addDays(1)));
    f.store->add(makeInput("Drop 2", cutoff.addDays(-10)));
    auto keep3 = f.store->add(makeInput("Keep 3", today().addDays(2)));

    f.archiver.archiveOlderThan(1);

    // list() is newest first
    auto live = f.store->list();
    ASSERT_EQ(live.size(), 3u);
    EXPECT_EQ(live[0].id, keep3.id);
    EXPECT_EQ(live[1].id, keep2.id);
    EXPECT_EQ(live[2].id, keep1.id);
    EXPECT_EQ(live[2].name, "Keep 1");
}

TEST(Archive, NothingToArchiveWritesNoFiles) {
    ArchiveFixture f;
    f.store->add(makeInput("Fresh", today().addDays(1)));
    const auto before = readAll(f.config.storePath());

    auto result = f.archiver.archiveOlderThan(6);
    EXPECT_EQ(result.archivedCount, 0u);
    EXPECT_FALSE(result.archivePath);
    EXPECT_FALSE(std::filesystem::exists(f.config.archivePath()));
    EXPECT_EQ(readAll(f.config.storePath()), before);
}

TEST(Archive, TakesSafetyBackupFirst) {
    ArchiveFixture f;
    f.store->add(makeInput("Old", today().subtractMonths(12)));
    auto count = f.backups->listBackups().size();

    f.archiver.archiveOlderThan(6);
    EXPECT_EQ(f.backups->listBackups().size(), count + 1);
    // the newest backup still has the archived row
    auto newest = f.backups->listBackups().front();
    Workbook wb = FileJsonStorage(newest.path).loadState().get<Workbook>();
    EXPECT_EQ(wb.sheet(kSubmissionsSheet)->rows.size(), 1u);
}

TEST(Archive, SecondSweepGetsDistinctFile) {
    ArchiveFixture f;
    f.store->add(makeInput("Old 1", today().subtractMonths(12)));
    auto first = f.archiver.archiveOlderThan(6);
    f.store->add(makeInput("Old 2", today().subtractMonths(12)));
    auto second = f.archiver.archiveOlderThan(6);

    ASSERT_TRUE(first.archivePath);
    ASSERT_TRUE(second.archivePath);
    EXPECT_NE(*first.archivePath, *second.archivePath);
    EXPECT_TRUE(std::filesystem::exists(*first.archivePath));
    EXPECT_TRUE(std::filesystem::exists(*second.archivePath));
}

TEST(Archive, NegativeMonthsRejected) {
    ArchiveFixture f;
    EXPECT_THROW(f.archiver.archiveOlderThan(-1), ArchivalError);
}

TEST(Archive, FailureLeavesStoreUntouched) {
    ArchiveFixture f;
    f.store->add(makeInput("Old", today().subtractMonths(12)));
    const auto before = readAll(f.config.storePath());

    // a plain file where the archive directory should be
    std::ofstream(f.config.archivePath()) << "blocker";
    try {
        f.archiver.archiveOlderThan(6);
        FAIL() << "expected ArchivalError";
    } catch (const ArchivalError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::Archival);
    }
    EXPECT_EQ(readAll(f.config.storePath()), before);
    EXPECT_FALSE(f.store->lock().isLocked());
}

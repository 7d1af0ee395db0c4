#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "BackupManager.hpp"
#include "FileJsonStorage.hpp"
#include "FileLock.hpp"
#include "config.hpp"
#include "models.hpp"
#include "workbook.hpp"

namespace slotbook {

    // The store file as a miniature database. Every mutation is
    //   backup -> lock -> read whole file -> transform in memory -> rewrite -> unlock
    // and a failed backup aborts the mutation. Reads go straight to the file
    // unless StoreConfig::lockReads is set.
    class RecordStore {
    public:
        // `backups` may be null (no backup-before-write), e.g. for read-only tools.
        RecordStore(const StoreConfig& config, std::shared_ptr<BackupManager> backups);

        // Creates the file with header and Summary sheet; no-op if it exists.
        void initialize();

        Submission add(const SubmissionInput& input);
        // Same as add, but re-counts the booking date under the lock and throws
        // CapacityExceededError instead of writing a row past the cap.
        Submission addWithinCapacity(const SubmissionInput& input, std::size_t maxPerDay);

        // Newest submission first.
        std::vector<Submission> list(const SubmissionFilter& filter = {}) const;
        std::optional<Submission> getById(const std::string& id) const;

        // Writes only the fields set in `patch`. With maxPerDay, moving the row to a
        // different booking date, or taking it out of Archived, is refused when
        // the day it lands on is full.
        // throws NotFoundError, CapacityExceededError
        Submission update(const std::string& id, const SubmissionPatch& patch,
                          std::optional<std::size_t> maxPerDay = std::nullopt);
        // throws NotFoundError
        void remove(const std::string& id);

        std::vector<Submission> search(const std::string& query) const;
        Statistics statistics() const;
        // Writes the filtered rows to exportDir and returns the new file's path.
        std::filesystem::path exportFiltered(const SubmissionFilter& filter = {}) const;

        // Live rows on `date` whose status is not archived.
        std::size_t countForDate(const CalendarDate& date) const;
        // Same rule over an inclusive range, keyed by "YYYY-MM-DD"; days without bookings are absent.
        std::map<std::string, std::size_t> bookingCountsByDateRange(const CalendarDate& from, const CalendarDate& to) const;
        std::size_t rowCount() const;

        // Backup, lock, load, run `fn`, and persist if it returns true.
        void rewrite(const std::function<bool(Workbook&)>& fn);

        const std::filesystem::path& path() const {
            return storage_->path();
        }

        const FileLock& lock() const {
            return lock_;
        }

    private:
        Workbook load() const;
        Workbook loadForRead() const;
        void save(Workbook& wb);
        Submission insert(Workbook& wb, const SubmissionInput& input);

        std::unique_ptr<IStorage> storage_;
        std::filesystem::path export_dir_;
        bool lock_reads_;
        bool atomic_writes_;
        std::shared_ptr<BackupManager> backups_;
        mutable FileLock lock_;
    };

} // namespace slotbook

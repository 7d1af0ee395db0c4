#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "FileLock.hpp"
#include "Schedule.hpp"
#include "config.hpp"
#include "timeutil.hpp"

namespace slotbook {

    struct BackupInfo {
        std::string name;
        std::filesystem::path path;
        std::uintmax_t size = 0;
        double sizeMB = 0.0;
        TimePoint created;
    };

    struct RestoreResult {
        std::string backupFile;
        // absent when there was no live file to preserve
        std::optional<std::filesystem::path> safetySnapshot;
        std::string message;
    };

    // Point-in-time copies of the store file under backupDir, named
    // "<store-stem>_backup_<stamp><ext>" and pruned to the newest maxBackups.
    class BackupManager {
    public:
        explicit BackupManager(const StoreConfig& config);
        ~BackupManager();

        // nullopt when the store file does not exist yet. throws StoreIOError.
        std::optional<std::filesystem::path> createBackup();
        void cleanOldBackups();
        // newest first
        std::vector<BackupInfo> listBackups() const;
        // throws BackupNotFoundError, StoreIOError, LockTimeoutError
        RestoreResult restoreFromBackup(const std::string& name);
        std::optional<TimePoint> getLastBackupTime() const;

        // Returns false when auto backup is disabled in the config.
        // throws std::invalid_argument on a bad interval expression
        bool scheduleAutoBackup();
        void stopAutoBackup();
        bool autoBackupScheduled() const;

        const std::filesystem::path& backupDir() const {
            return backup_dir_;
        }

    private:
        std::string backupPrefix() const;
        bool isBackupName(const std::string& name) const;
        // oldest first
        std::vector<BackupInfo> collect() const;

        std::filesystem::path store_path_;
        std::filesystem::path backup_dir_;
        std::size_t max_backups_;
        bool auto_enabled_;
        std::string interval_;
        FileLock lock_;
        mutable std::mutex mutex_;
        std::unique_ptr<PeriodicTrigger> trigger_;
    };

    void to_json(nlohmann::json& j, const BackupInfo& b);
    void to_json(nlohmann::json& j, const RestoreResult& r);

} // namespace slotbook

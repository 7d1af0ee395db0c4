#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "BackupManager.hpp"
#include "RecordStore.hpp"
#include "config.hpp"

namespace slotbook {

    enum class HealthStatus {
        Healthy,
        Warning,
        Critical,
        Error
    };

    const char* toString(HealthStatus status);

    struct HealthReport {
        HealthStatus status = HealthStatus::Healthy;
        TimePoint timestamp;

        struct File {
            std::filesystem::path path;
            double sizeMB = 0.0;
            std::uintmax_t sizeBytes = 0;
            TimePoint lastModified;
            std::size_t rowCount = 0;
        } file;

        Thresholds thresholds;

        struct Backup {
            std::optional<TimePoint> lastBackup;
            std::size_t backupCount = 0;
            double totalBackupSizeMB = 0.0;
        } backup;

        std::vector<std::string> warnings;
        // set when status is Error
        std::string error;
    };

    // Advisory only: thresholds produce log output and report warnings, never block the store.
    class HealthMonitor {
    public:
        HealthMonitor(const StoreConfig& config, std::shared_ptr<const RecordStore> store,
                      std::shared_ptr<const BackupManager> backups);

        // 0 (and an error log) when the file cannot be stat'ed.
        double fileSizeMB() const;
        // 0 (and an error log) when the file cannot be read.
        std::size_t rowCount() const;

        HealthReport healthCheck() const;

    private:
        Thresholds thresholds_;
        std::shared_ptr<const RecordStore> store_;
        std::shared_ptr<const BackupManager> backups_;
    };

    void to_json(nlohmann::json& j, const HealthReport& r);

} // namespace slotbook

#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace slotbook {

    struct LockOptions {
        int retries = 15;
        std::chrono::milliseconds minTimeout{100};
        std::chrono::milliseconds maxTimeout{2000};
        double factor = 2.0;
        std::chrono::milliseconds stale{10000};
    };

    struct Thresholds {
        std::size_t maxRows = 50000;
        std::size_t warningRows = 10000;
        double maxFileSizeMB = 10.0;
        double warningFileSizeMB = 5.0;
    };

    struct StoreConfig {
        std::filesystem::path dataDir = "data";
        std::filesystem::path storeFile = "submissions.json";
        std::filesystem::path backupDir = "backups";
        std::filesystem::path exportDir = "exports";
        std::filesystem::path archiveDir = "archives";

        LockOptions lock;
        Thresholds thresholds;

        std::size_t maxBackups = 30;
        bool autoBackupEnabled = false;
        // "hourly", "daily", "weekly" or a 5-field cron expression
        std::string backupInterval = "daily";

        std::size_t maxBookingsPerDay = 3;
        int searchHorizonDays = 90;

        // Take the advisory lock on read paths too. Off by default: reads see
        // either the previous or the next complete file because writes are atomic.
        bool lockReads = false;
        bool atomicWrites = true;

        std::string logLevel = "info";
        std::string logPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

        // Relative sub-paths resolve against dataDir.
        std::filesystem::path storePath() const;
        std::filesystem::path backupPath() const;
        std::filesystem::path exportPath() const;
        std::filesystem::path archivePath() const;
    };

    // Defaults, then the JSON file (if path is non-empty), then SLOTBOOK_* environment overrides.
    // throws StoreIOError when the file cannot be read or parsed
    StoreConfig loadConfig(const std::filesystem::path& path = {});

    void applyJson(StoreConfig& config, const nlohmann::json& j);
    void applyEnvironment(StoreConfig& config);

} // namespace slotbook

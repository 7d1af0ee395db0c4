#include <slotbook/HealthMonitor.hpp>
#include <slotbook/errors.hpp>
#include <slotbook/logging.hpp>

#include <chrono>
#include <cmath>
#include <cstdio>
#include <system_error>

namespace slotbook {

    namespace {

        double round2(double v) {
            return std::round(v * 100.0) / 100.0;
        }

        std::string fixed(double v, int digits) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.*f", digits, v);
            return buf;
        }

        const double kBytesPerMB = 1024.0 * 1024.0;

    } // namespace

    const char* toString(HealthStatus status) {
        switch (status) {
            case HealthStatus::Healthy:
                return "healthy";
            case HealthStatus::Warning:
                return "warning";
            case HealthStatus::Critical:
                return "critical";
            case HealthStatus::Error:
                return "error";
        }
        return "error";
    }

    HealthMonitor::HealthMonitor(const StoreConfig& config, std::shared_ptr<const RecordStore> store,
                                 std::shared_ptr<const BackupManager> backups)
        : thresholds_(config.thresholds)
        , store_(std::move(store))
        , backups_(std::move(backups)) {
    }

    double HealthMonitor::fileSizeMB() const {
        std::error_code ec;
        auto bytes = std::filesystem::file_size(store_->path(), ec);
        if (ec) {
            log::get()->error("Error checking file size: {}", ec.message());
            return 0.0;
        }
        double mb = static_cast<double>(bytes) / kBytesPerMB;
        if (mb > thresholds_.warningFileSizeMB) {
            log::get()->warn("Store file is {}MB (warning threshold: {}MB)", fixed(mb, 2), thresholds_.warningFileSizeMB);
        }
        if (mb > thresholds_.maxFileSizeMB) {
            log::get()->error("Store file exceeds maximum size: {}MB > {}MB; archive old records", fixed(mb, 2), thresholds_.maxFileSizeMB);
        }
        return mb;
    }

    std::size_t HealthMonitor::rowCount() const {
        std::size_t rows = 0;
        try {
            rows = store_->rowCount();
        } catch (const Error& ex) {
            log::get()->error("Error getting row count: {}", ex.what());
            return 0;
        }
        if (rows > thresholds_.warningRows) {
            log::get()->warn("Store file has {} rows (warning threshold: {}); consider archiving old records", rows, thresholds_.warningRows);
        }
        if (rows > thresholds_.maxRows) {
            log::get()->error("Store file exceeds maximum rows: {} > {}; archive old records", rows, thresholds_.maxRows);
        }
        return rows;
    }

    HealthReport HealthMonitor::healthCheck() const {
        HealthReport report;
        report.timestamp = now();
        report.thresholds = thresholds_;
        report.file.path = store_->path();

        try {
            double sizeMB = fileSizeMB();
            std::size_t rows = rowCount();
            auto backups = backups_->listBackups();

            report.file.sizeBytes = std::filesystem::file_size(store_->path());
            report.file.lastModified = fromFileTime(std::filesystem::last_write_time(store_->path()));
            report.file.sizeMB = round2(sizeMB);
            report.file.rowCount = rows;

            report.backup.backupCount = backups.size();
            double total = 0.0;
            for (auto const& b : backups) {
                total += b.sizeMB;
            }
            report.backup.totalBackupSizeMB = round2(total);
            if (!backups.empty()) {
                report.backup.lastBackup = backups.front().created;
            }

            if (sizeMB > thresholds_.warningFileSizeMB) {
                report.warnings.push_back("File size is " + fixed(sizeMB, 2) + "MB (threshold: " + fixed(thresholds_.warningFileSizeMB, 0) + "MB)");
            }
            if (rows > thresholds_.warningRows) {
                report.warnings.push_back("Row count is " + std::to_string(rows) + " (threshold: " + std::to_string(thresholds_.warningRows) + ")");
            }
            if (report.backup.lastBackup) {
                double hours = std::chrono::duration<double, std::ratio<3600>>(now() - *report.backup.lastBackup).count();
                if (hours > 24.0) {
                    report.warnings.push_back("Last backup was " + fixed(hours, 1) + " hours ago");
                }
            } else {
                report.warnings.push_back("No backups found");
            }

            if (!report.warnings.empty()) {
                report.status = report.warnings.size() > 2 ? HealthStatus::Critical : HealthStatus::Warning;
            }
        } catch (const std::exception& ex) {
            log::get()->error("Health check failed: {}", ex.what());
            report.status = HealthStatus::Error;
            report.error = ex.what();
            report.warnings = {"Failed to perform health check"};
        }
        return report;
    }

    void to_json(nlohmann::json& j, const HealthReport& r) {
        j = nlohmann::json{{"status", toString(r.status)}, {"timestamp", formatIso(r.timestamp)}, {"warnings", r.warnings}};
        if (r.status == HealthStatus::Error) {
            j["error"] = r.error;
            return;
        }
        j["file"] = {{"path", r.file.path.string()},
                     {"sizeMB", r.file.sizeMB},
                     {"sizeBytes", r.file.sizeBytes},
                     {"lastModified", formatIso(r.file.lastModified)},
                     {"rowCount", r.file.rowCount}};
        j["thresholds"] = {{"maxRows", r.thresholds.maxRows},
                           {"warningRows", r.thresholds.warningRows},
                           {"maxFileSizeMB", r.thresholds.maxFileSizeMB},
                           {"warningFileSizeMB", r.thresholds.warningFileSizeMB}};
        j["backup"] = {{"lastBackup", r.backup.lastBackup ? nlohmann::json(formatIso(*r.backup.lastBackup)) : nlohmann::json(nullptr)},
                       {"backupCount", r.backup.backupCount},
                       {"totalBackupSizeMB", r.backup.totalBackupSizeMB}};
    }

} // namespace slotbook

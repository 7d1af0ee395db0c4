#include <slotbook/BackupManager.hpp>
#include <slotbook/errors.hpp>
#include <slotbook/logging.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <system_error>

namespace slotbook {

    namespace {

        double toMB(std::uintmax_t bytes) {
            return std::round(static_cast<double>(bytes) / (1024.0 * 1024.0) * 100.0) / 100.0;
        }

        TimePoint fromMillis(int64_t ms) {
            return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
        }

    } // namespace

    BackupManager::BackupManager(const StoreConfig& config)
        : store_path_(config.storePath())
        , backup_dir_(config.backupPath())
        , max_backups_(config.maxBackups)
        , auto_enabled_(config.autoBackupEnabled)
        , interval_(config.backupInterval)
        , lock_(config.storePath(), config.lock) {
    }

    BackupManager::~BackupManager() {
        stopAutoBackup();
    }

    std::string BackupManager::backupPrefix() const {
        return store_path_.stem().string() + "_backup_";
    }

    bool BackupManager::isBackupName(const std::string& name) const {
        const std::string prefix = backupPrefix();
        const std::string ext = store_path_.extension().string();
        return name.size() > prefix.size() + ext.size() &&
               name.compare(0, prefix.size(), prefix) == 0 &&
               name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
    }

    std::optional<std::filesystem::path> BackupManager::createBackup() {
        std::error_code ec;
        std::filesystem::create_directories(backup_dir_, ec);
        if (ec) {
            throw StoreIOError("Cannot create backup directory " + backup_dir_.string() + ": " + ec.message());
        }

        if (!std::filesystem::exists(store_path_, ec)) {
            log::get()->info("Store file {} does not exist yet, skipping backup", store_path_.string());
            return std::nullopt;
        }

        std::filesystem::path target;
        do {
            auto stamp = fileStamp(fromMillis(uniqueMillis()));
            target = backup_dir_ / (backupPrefix() + stamp + store_path_.extension().string());
        } while (std::filesystem::exists(target, ec));

        if (!std::filesystem::copy_file(store_path_, target, std::filesystem::copy_options::none, ec) || ec) {
            log::get()->error("Backup failed: {}", ec.message());
            throw StoreIOError("Backup of " + store_path_.string() + " failed: " + ec.message());
        }
        log::get()->info("Backup created: {}", target.filename().string());

        cleanOldBackups();
        return target;
    }

    std::vector<BackupInfo> BackupManager::collect() const {
        std::vector<BackupInfo> out;
        std::error_code ec;
        if (!std::filesystem::is_directory(backup_dir_, ec)) {
            return out;
        }
        for (auto const& entry : std::filesystem::directory_iterator(backup_dir_, ec)) {
            auto name = entry.path().filename().string();
            if (!entry.is_regular_file(ec) || !isBackupName(name)) {
                continue;
            }
            std::error_code statEc;
            auto size = std::filesystem::file_size(entry.path(), statEc);
            auto mtime = std::filesystem::last_write_time(entry.path(), statEc);
            if (statEc) {
                // pruned by another process while we were listing
                continue;
            }
            out.push_back(BackupInfo{name, entry.path(), size, toMB(size), fromFileTime(mtime)});
        }
        if (ec) {
            throw StoreIOError("Cannot list backups in " + backup_dir_.string() + ": " + ec.message());
        }
        std::sort(out.begin(), out.end(), [](const BackupInfo& a, const BackupInfo& b) {
            if (a.created != b.created) {
                return a.created < b.created;
            }
            return a.name < b.name;
        });
        return out;
    }

    void BackupManager::cleanOldBackups() {
        std::vector<BackupInfo> backups;
        try {
            backups = collect();
        } catch (const StoreIOError& ex) {
            log::get()->error("Error cleaning old backups: {}", ex.what());
            return;
        }
        if (backups.size() <= max_backups_) {
            return;
        }

        std::size_t excess = backups.size() - max_backups_;
        std::size_t deleted = 0;
        for (std::size_t i = 0; i < excess; ++i) {
            std::error_code ec;
            if (std::filesystem::remove(backups[i].path, ec)) {
                ++deleted;
                log::get()->debug("Deleted old backup: {}", backups[i].name);
            } else if (ec) {
                log::get()->error("Error deleting old backup {}: {}", backups[i].name, ec.message());
            }
        }
        if (deleted > 0) {
            log::get()->info("Cleaned {} old backup(s)", deleted);
        }
    }

    std::vector<BackupInfo> BackupManager::listBackups() const {
        auto out = collect();
        std::reverse(out.begin(), out.end());
        return out;
    }

    std::optional<TimePoint> BackupManager::getLastBackupTime() const {
        auto backups = collect();
        if (backups.empty()) {
            return std::nullopt;
        }
        return backups.back().created;
    }

    RestoreResult BackupManager::restoreFromBackup(const std::string& name) {
        std::filesystem::path plain(name);
        if (name.empty() || plain.filename() != plain || name == "." || name == "..") {
            throw BackupNotFoundError("Backup not found: " + name);
        }
        const auto source = backup_dir_ / plain;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(source, ec)) {
            throw BackupNotFoundError("Backup not found: " + name);
        }

        return lock_.withLock([&] {
            RestoreResult result;
            result.backupFile = name;

            std::error_code copyEc;
            if (std::filesystem::exists(store_path_, copyEc)) {
                auto snapshot = backup_dir_ / ("corrupted_" + std::to_string(uniqueMillis()) + store_path_.extension().string());
                if (std::filesystem::copy_file(store_path_, snapshot, std::filesystem::copy_options::none, copyEc) && !copyEc) {
                    result.safetySnapshot = snapshot;
                    log::get()->info("Current file backed up as: {}", snapshot.filename().string());
                } else {
                    log::get()->warn("Could not snapshot current file before restore: {}", copyEc.message());
                }
            } else {
                log::get()->warn("No current file to back up before restore");
            }

            auto tmp = store_path_;
            tmp += ".restore";
            copyEc.clear();
            std::filesystem::copy_file(source, tmp, std::filesystem::copy_options::overwrite_existing, copyEc);
            if (!copyEc) {
                std::filesystem::rename(tmp, store_path_, copyEc);
            }
            if (copyEc) {
                std::error_code ignored;
                std::filesystem::remove(tmp, ignored);
                log::get()->error("Restore failed: {}", copyEc.message());
                throw StoreIOError("Failed to restore from backup " + name + ": " + copyEc.message());
            }

            log::get()->info("Restored from backup: {}", name);
            result.message = "Successfully restored from " + name;
            return result;
        });
    }

    bool BackupManager::scheduleAutoBackup() {
        if (!auto_enabled_) {
            log::get()->info("Auto-backup is disabled");
            return false;
        }
        auto schedule = CronSchedule::forInterval(interval_);
        // surfaces unsatisfiable expressions ("0 0 31 2 *") here instead of in the worker thread
        schedule.nextFireTime(now());
        auto description = schedule.description();

        std::scoped_lock lk(mutex_);
        if (trigger_) {
            trigger_->stop();
        }
        trigger_ = std::make_unique<PeriodicTrigger>(std::move(schedule), [this] { createBackup(); });
        trigger_->start();
        log::get()->info("Auto-backup scheduled: {}", description);
        return true;
    }

    void BackupManager::stopAutoBackup() {
        std::scoped_lock lk(mutex_);
        if (trigger_) {
            trigger_->stop();
            trigger_.reset();
        }
    }

    bool BackupManager::autoBackupScheduled() const {
        std::scoped_lock lk(mutex_);
        return trigger_ && trigger_->running();
    }

    void to_json(nlohmann::json& j, const BackupInfo& b) {
        j = nlohmann::json{{"name", b.name},
                           {"path", b.path.string()},
                           {"size", b.size},
                           {"sizeMB", b.sizeMB},
                           {"created", formatIso(b.created)}};
    }

    void to_json(nlohmann::json& j, const RestoreResult& r) {
        j = nlohmann::json{{"success", true},
                           {"message", r.message},
                           {"backupFile", r.backupFile},
                           {"safetySnapshot", r.safetySnapshot ? nlohmann::json(r.safetySnapshot->string()) : nlohmann::json(nullptr)}};
    }

} // namespace slotbook

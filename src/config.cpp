#include <slotbook/config.hpp>
#include <slotbook/errors.hpp>

#include <cstdlib>
#include <fstream>

namespace slotbook {

    namespace {

        std::filesystem::path under(const std::filesystem::path& base, const std::filesystem::path& p) {
            return p.is_absolute() ? p : base / p;
        }

        std::chrono::milliseconds millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds fallback) {
            return std::chrono::milliseconds(j.value(key, static_cast<long long>(fallback.count())));
        }

        const char* env(const char* name) {
            const char* value = std::getenv(name);
            return (value && *value) ? value : nullptr;
        }

    } // namespace

    std::filesystem::path StoreConfig::storePath() const {
        return under(dataDir, storeFile);
    }

    std::filesystem::path StoreConfig::backupPath() const {
        return under(dataDir, backupDir);
    }

    std::filesystem::path StoreConfig::exportPath() const {
        return under(dataDir, exportDir);
    }

    std::filesystem::path StoreConfig::archivePath() const {
        return under(dataDir, archiveDir);
    }

    void applyJson(StoreConfig& config, const nlohmann::json& j) {
        if (!j.is_object()) {
            throw StoreIOError("Config root must be an object");
        }
        try {
            config.dataDir = j.value("dataDir", config.dataDir.string());
            config.storeFile = j.value("storeFile", config.storeFile.string());
            config.backupDir = j.value("backupDir", config.backupDir.string());
            config.exportDir = j.value("exportDir", config.exportDir.string());
            config.archiveDir = j.value("archiveDir", config.archiveDir.string());
            config.lockReads = j.value("lockReads", config.lockReads);
            config.atomicWrites = j.value("atomicWrites", config.atomicWrites);

            if (j.contains("lock")) {
                auto const& l = j["lock"];
                config.lock.retries = l.value("retries", config.lock.retries);
                config.lock.minTimeout = millis(l, "minTimeoutMs", config.lock.minTimeout);
                config.lock.maxTimeout = millis(l, "maxTimeoutMs", config.lock.maxTimeout);
                config.lock.factor = l.value("factor", config.lock.factor);
                config.lock.stale = millis(l, "staleMs", config.lock.stale);
            }
            if (j.contains("thresholds")) {
                auto const& t = j["thresholds"];
                config.thresholds.maxRows = t.value("maxRows", config.thresholds.maxRows);
                config.thresholds.warningRows = t.value("warningRows", config.thresholds.warningRows);
                config.thresholds.maxFileSizeMB = t.value("maxFileSizeMB", config.thresholds.maxFileSizeMB);
                config.thresholds.warningFileSizeMB = t.value("warningFileSizeMB", config.thresholds.warningFileSizeMB);
            }
            if (j.contains("backup")) {
                auto const& b = j["backup"];
                config.maxBackups = b.value("maxBackups", config.maxBackups);
                config.autoBackupEnabled = b.value("autoBackupEnabled", config.autoBackupEnabled);
                config.backupInterval = b.value("interval", config.backupInterval);
            }
            if (j.contains("booking")) {
                auto const& b = j["booking"];
                config.maxBookingsPerDay = b.value("maxBookingsPerDay", config.maxBookingsPerDay);
                config.searchHorizonDays = b.value("searchHorizonDays", config.searchHorizonDays);
            }
            if (j.contains("logging")) {
                auto const& l = j["logging"];
                config.logLevel = l.value("level", config.logLevel);
                config.logPattern = l.value("pattern", config.logPattern);
            }
        } catch (const nlohmann::json::exception& ex) {
            throw StoreIOError(std::string("Invalid config value: ") + ex.what());
        }
    }

    void applyEnvironment(StoreConfig& config) {
        if (const char* v = env("SLOTBOOK_DATA_DIR")) {
            config.dataDir = v;
        }
        if (const char* v = env("SLOTBOOK_MAX_ROWS")) {
            config.thresholds.maxRows = std::strtoull(v, nullptr, 10);
        }
        if (const char* v = env("SLOTBOOK_MAX_FILE_SIZE_MB")) {
            config.thresholds.maxFileSizeMB = std::strtod(v, nullptr);
        }
        if (const char* v = env("SLOTBOOK_AUTO_BACKUP_ENABLED")) {
            config.autoBackupEnabled = std::string(v) == "true";
        }
        if (const char* v = env("SLOTBOOK_BACKUP_INTERVAL")) {
            config.backupInterval = v;
        }
        if (const char* v = env("SLOTBOOK_LOG_LEVEL")) {
            config.logLevel = v;
        }
        if (const char* v = env("SLOTBOOK_LOG_PATTERN")) {
            config.logPattern = v;
        }
    }

    StoreConfig loadConfig(const std::filesystem::path& path) {
        StoreConfig config;
        if (!path.empty()) {
            std::ifstream in(path);
            if (!in) {
                throw StoreIOError("Cannot open config file: " + path.string());
            }
            nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
            if (j.is_discarded()) {
                throw StoreIOError("Config file is not valid JSON: " + path.string());
            }
            applyJson(config, j);
        }
        applyEnvironment(config);
        return config;
    }

} // namespace slotbook

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "AdmissionScheduler.hpp"
#include "Archiver.hpp"
#include "BackupManager.hpp"
#include "HealthMonitor.hpp"
#include "RecordStore.hpp"
#include "config.hpp"
#include "models.hpp"

namespace slotbook {

    struct SubmitResult {
        bool accepted = false;
        std::optional<Submission> submission;
        // filled for both accepted (count/remaining) and rejected submissions with a booking date
        std::optional<ValidationResult> validation;
        std::string message;
    };

    class BookingService {
    public:
        explicit BookingService(const StoreConfig& config);
        ~BookingService();

        // Creates the store file if missing and starts auto backup when enabled.
        void initialize();

        // Past dates and full days come back as a rejected SubmitResult, not an exception.
        // throws LockTimeoutError, StoreIOError
        SubmitResult submit(const SubmissionInput& input);
        // throws NotFoundError, PastDateError, CapacityExceededError
        Submission update(const std::string& id, const SubmissionPatch& patch);
        // throws NotFoundError
        void remove(const std::string& id);

        // throws StoreIOError when there is no store file to copy
        std::filesystem::path manualBackup();
        RestoreResult restore(const std::string& name);
        ArchiveResult archive(int months);

        const StoreConfig& config() const {
            return config_;
        }
        RecordStore& store() {
            return *store_;
        }
        const RecordStore& store() const {
            return *store_;
        }
        BackupManager& backups() {
            return *backups_;
        }
        const AdmissionScheduler& scheduler() const {
            return scheduler_;
        }
        const HealthMonitor& health() const {
            return health_;
        }

    private:
        StoreConfig config_;
        std::shared_ptr<BackupManager> backups_;
        std::shared_ptr<RecordStore> store_;
        AdmissionScheduler scheduler_;
        Archiver archiver_;
        HealthMonitor health_;
    };

    void to_json(nlohmann::json& j, const SubmitResult& r);

} // namespace slotbook

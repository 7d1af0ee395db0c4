#include <slotbook/BookingService.hpp>
#include <slotbook/errors.hpp>
#include <slotbook/logging.hpp>

namespace slotbook {

    BookingService::BookingService(const StoreConfig& config)
        : config_(config)
        , backups_(std::make_shared<BackupManager>(config_))
        , store_(std::make_shared<RecordStore>(config_, backups_))
        , scheduler_(store_, config_.maxBookingsPerDay, config_.searchHorizonDays)
        , archiver_(config_, store_)
        , health_(config_, store_, backups_) {
    }

    BookingService::~BookingService() {
        backups_->stopAutoBackup();
    }

    void BookingService::initialize() {
        store_->initialize();
        if (backups_->scheduleAutoBackup()) {
            log::get()->info("Auto backup scheduled ({})", config_.backupInterval);
        }
    }

    SubmitResult BookingService::submit(const SubmissionInput& input) {
        SubmitResult result;
        if (input.bookingDate) {
            auto v = scheduler_.validate(*input.bookingDate);
            result.validation = v;
            if (!v.valid) {
                result.message = v.reason;
                log::get()->info("Submission rejected for {}: {}", input.bookingDate->toString(), v.reason);
                return result;
            }
        }

        try {
            result.submission = store_->addWithinCapacity(input, config_.maxBookingsPerDay);
        } catch (const CapacityExceededError& ex) {
            // lost the race for the last slot between validation and the locked re-check
            result.validation = scheduler_.validate(*input.bookingDate);
            result.message = result.validation->valid ? ex.what() : result.validation->reason;
            log::get()->info("Submission rejected for {}: {}", input.bookingDate->toString(), result.message);
            return result;
        }

        result.accepted = true;
        result.message = "Submission saved successfully";
        if (result.validation) {
            // the new row consumed one slot
            result.validation->count += 1;
            result.validation->remaining = result.validation->remaining > 0 ? result.validation->remaining - 1 : 0;
        }
        return result;
    }

    Submission BookingService::update(const std::string& id, const SubmissionPatch& patch) {
        if (patch.bookingDate && *patch.bookingDate < today()) {
            auto current = store_->getById(id);
            if (!current) {
                throw NotFoundError("Submission not found: " + id);
            }
            if (!current->bookingDate || *current->bookingDate != *patch.bookingDate) {
                throw PastDateError("Past dates cannot be booked: " + patch.bookingDate->toString());
            }
        }
        return store_->update(id, patch, config_.maxBookingsPerDay);
    }

    void BookingService::remove(const std::string& id) {
        store_->remove(id);
    }

    std::filesystem::path BookingService::manualBackup() {
        auto path = backups_->createBackup();
        if (!path) {
            throw StoreIOError("Nothing to back up: " + store_->path().string() + " does not exist");
        }
        return *path;
    }

    RestoreResult BookingService::restore(const std::string& name) {
        return backups_->restoreFromBackup(name);
    }

    ArchiveResult BookingService::archive(int months) {
        return archiver_.archiveOlderThan(months);
    }

    void to_json(nlohmann::json& j, const SubmitResult& r) {
        j = nlohmann::json{{"success", r.accepted}, {"message", r.message}};
        if (r.submission) {
            j["submissionId"] = r.submission->id;
            j["submission"] = *r.submission;
        }
        if (r.validation) {
            j["validation"] = *r.validation;
        }
    }

} // namespace slotbook

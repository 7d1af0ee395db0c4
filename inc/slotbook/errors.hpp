#pragma once
#include <stdexcept>
#include <string>

namespace slotbook {

    enum class ErrorKind {
        LockTimeout,
        NotFound,
        PastDate,
        CapacityExceeded,
        BackupNotFound,
        StoreIO,
        Archival
    };

    // Base of every error the store raises. Callers classify on kind() / retriable()
    // instead of matching messages.
    class Error: public std::runtime_error {
    public:
        Error(ErrorKind kind, const std::string& msg)
            : std::runtime_error(msg)
            , kind_(kind) {
        }

        ErrorKind kind() const noexcept {
            return kind_;
        }

        bool retriable() const noexcept {
            return kind_ == ErrorKind::LockTimeout;
        }

    private:
        ErrorKind kind_;
    };

    class LockTimeoutError: public Error {
    public:
        explicit LockTimeoutError(const std::string& msg)
            : Error(ErrorKind::LockTimeout, msg) {
        }
    };

    class NotFoundError: public Error {
    public:
        explicit NotFoundError(const std::string& msg)
            : Error(ErrorKind::NotFound, msg) {
        }
    };

    class PastDateError: public Error {
    public:
        explicit PastDateError(const std::string& msg)
            : Error(ErrorKind::PastDate, msg) {
        }
    };

    class CapacityExceededError: public Error {
    public:
        explicit CapacityExceededError(const std::string& msg)
            : Error(ErrorKind::CapacityExceeded, msg) {
        }
    };

    class BackupNotFoundError: public Error {
    public:
        explicit BackupNotFoundError(const std::string& msg)
            : Error(ErrorKind::BackupNotFound, msg) {
        }
    };

    class StoreIOError: public Error {
    public:
        explicit StoreIOError(const std::string& msg)
            : Error(ErrorKind::StoreIO, msg) {
        }
    };

    class ArchivalError: public Error {
    public:
        explicit ArchivalError(const std::string& msg)
            : Error(ErrorKind::Archival, msg) {
        }
    };

    const char* toString(ErrorKind kind);

} // namespace slotbook

#include <slotbook/errors.hpp>

namespace slotbook {

    const char* toString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::LockTimeout:
                return "lock_timeout";
            case ErrorKind::NotFound:
                return "not_found";
            case ErrorKind::PastDate:
                return "past_date";
            case ErrorKind::CapacityExceeded:
                return "capacity_exceeded";
            case ErrorKind::BackupNotFound:
                return "backup_not_found";
            case ErrorKind::StoreIO:
                return "store_io";
            case ErrorKind::Archival:
                return "archival";
        }
        return "unknown";
    }

} // namespace slotbook

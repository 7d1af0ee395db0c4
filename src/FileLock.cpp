#include <slotbook/FileLock.hpp>
#include <slotbook/errors.hpp>
#include <slotbook/logging.hpp>
#include <slotbook/timeutil.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <sstream>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace slotbook {

    namespace {

        std::string makeToken() {
            static thread_local std::mt19937_64 rng{std::random_device{}()};
            std::ostringstream out;
            out << ::getpid() << ':' << std::hash<std::thread::id>{}(std::this_thread::get_id()) << ':' << std::hex << rng();
            return out.str();
        }

        // Exclusive flock on "<file>.lock.guard". Held around every
        // check-then-unlink of the marker so a stale takeover cannot remove a
        // marker another caller has just created. The guard file is never
        // deleted; the marker itself stays the lock.
        class GuardFile {
        public:
            explicit GuardFile(const std::filesystem::path& path) {
                fd_ = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
                if (fd_ < 0) {
                    throw StoreIOError("Cannot open lock guard " + path.string() + ": " + std::strerror(errno));
                }
                int rc;
                do {
                    rc = ::flock(fd_, LOCK_EX);
                } while (rc != 0 && errno == EINTR);
                if (rc != 0) {
                    int err = errno;
                    ::close(fd_);
                    throw StoreIOError("Cannot lock guard " + path.string() + ": " + std::strerror(err));
                }
            }
            ~GuardFile() {
                ::flock(fd_, LOCK_UN);
                ::close(fd_);
            }
            GuardFile(const GuardFile&) = delete;
            GuardFile& operator=(const GuardFile&) = delete;

        private:
            int fd_ = -1;
        };

        std::string readToken(const std::filesystem::path& path) {
            std::string token;
            std::ifstream in(path);
            if (in) {
                std::getline(in, token);
            }
            return token;
        }

    } // namespace

    FileLock::FileLock(std::filesystem::path target, LockOptions options)
        : target_(std::move(target))
        , options_(options) {
        lock_path_ = target_;
        lock_path_ += ".lock";
        guard_path_ = lock_path_;
        guard_path_ += ".guard";
    }

    bool FileLock::tryCreate(const std::string& token) {
        std::error_code ec;
        if (!lock_path_.parent_path().empty()) {
            std::filesystem::create_directories(lock_path_.parent_path(), ec);
        }

        int fd = ::open(lock_path_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
        if (fd < 0) {
            if (errno == EEXIST) {
                return false;
            }
            throw StoreIOError("Cannot create lock file " + lock_path_.string() + ": " + std::strerror(errno));
        }
        ssize_t written = ::write(fd, token.data(), token.size());
        ::close(fd);
        if (written != static_cast<ssize_t>(token.size())) {
            std::filesystem::remove(lock_path_, ec);
            throw StoreIOError("Cannot write lock file " + lock_path_.string());
        }
        return true;
    }

    bool FileLock::removeIfStale() {
        std::error_code ec;
        if (!std::filesystem::exists(lock_path_, ec)) {
            return true;
        }
        GuardFile guard(guard_path_);
        // re-read under the guard: the marker may have been replaced since our attempt
        auto mtime = std::filesystem::last_write_time(lock_path_, ec);
        if (ec) {
            return true;
        }
        auto age = now() - fromFileTime(mtime);
        if (age <= options_.stale) {
            return false;
        }
        log::get()->warn("Removing stale lock {} (age {} ms)", lock_path_.string(),
                         std::chrono::duration_cast<std::chrono::milliseconds>(age).count());
        std::filesystem::remove(lock_path_, ec);
        return !ec;
    }

    std::string FileLock::acquire() {
        const std::string token = makeToken();
        const int attempts = std::max(1, options_.retries);
        auto delay = options_.minTimeout;

        for (int attempt = 1; attempt <= attempts; ++attempt) {
            if (tryCreate(token)) {
                return token;
            }
            if (removeIfStale() && tryCreate(token)) {
                return token;
            }
            if (attempt == attempts) {
                break;
            }
            std::this_thread::sleep_for(delay);
            auto next = std::chrono::milliseconds(static_cast<long long>(delay.count() * options_.factor));
            delay = std::min(next, options_.maxTimeout);
        }

        log::get()->warn("Gave up on lock {} after {} attempts", lock_path_.string(), attempts);
        throw LockTimeoutError("Store file is locked by another process; resource busy, retry later");
    }

    void FileLock::release(const std::string& token) noexcept {
        try {
            {
                std::lock_guard lk(held_mutex_);
                held_token_.clear();
            }
            GuardFile guard(guard_path_);
            std::error_code ec;
            if (!std::filesystem::exists(lock_path_, ec)) {
                log::get()->error("Error releasing file lock {}: lock file is gone", lock_path_.string());
                return;
            }
            if (readToken(lock_path_) != token) {
                log::get()->error("Error releasing file lock {}: lock was taken over as stale", lock_path_.string());
                return;
            }
            std::filesystem::remove(lock_path_, ec);
            if (ec) {
                log::get()->error("Error releasing file lock {}: {}", lock_path_.string(), ec.message());
            }
        } catch (const std::exception& ex) {
            log::get()->error("Error releasing file lock {}: {}", lock_path_.string(), ex.what());
        }
    }

    void FileLock::hold(const std::string& token) {
        std::lock_guard lk(held_mutex_);
        held_token_ = token;
    }

    void FileLock::refresh() noexcept {
        try {
            std::string token;
            {
                std::lock_guard lk(held_mutex_);
                token = held_token_;
            }
            if (token.empty()) {
                return;
            }
            GuardFile guard(guard_path_);
            if (readToken(lock_path_) != token) {
                log::get()->warn("Not refreshing file lock {}: no longer held", lock_path_.string());
                return;
            }
            std::error_code ec;
            std::filesystem::last_write_time(lock_path_, std::filesystem::file_time_type::clock::now(), ec);
            if (ec) {
                log::get()->error("Error refreshing file lock {}: {}", lock_path_.string(), ec.message());
            }
        } catch (const std::exception& ex) {
            log::get()->error("Error refreshing file lock {}: {}", lock_path_.string(), ex.what());
        }
    }

    bool FileLock::isLocked() const {
        std::error_code ec;
        auto mtime = std::filesystem::last_write_time(lock_path_, ec);
        if (ec) {
            return false;
        }
        return now() - fromFileTime(mtime) <= options_.stale;
    }

} // namespace slotbook

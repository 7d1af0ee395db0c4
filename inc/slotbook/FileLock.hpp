#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <utility>

#include "config.hpp"

namespace slotbook {

    // Advisory exclusive lock on a file, held as a sibling "<file>.lock" marker
    // created with O_EXCL. Cooperating processes and threads serialize on it; a
    // marker older than LockOptions::stale is treated as abandoned and removed.
    //
    // Acquisition retries with exponential backoff and gives up with
    // LockTimeoutError instead of blocking forever. Release never throws.
    class FileLock {
    public:
        FileLock(std::filesystem::path target, LockOptions options);

        template <class F>
        auto withLock(F&& op) -> decltype(op()) {
            Holder holder(*this);
            return op();
        }

        // True while a non-stale marker exists.
        bool isLocked() const;

        // Bumps the marker's mtime so a long critical section is not mistaken
        // for a crashed holder. No-op unless called inside withLock.
        void refresh() noexcept;

        const std::filesystem::path& lockPath() const {
            return lock_path_;
        }

        const LockOptions& options() const {
            return options_;
        }

    private:
        class Holder {
        public:
            explicit Holder(FileLock& lock)
                : lock_(lock)
                , token_(lock.acquire()) {
                lock_.hold(token_);
            }
            ~Holder() {
                lock_.release(token_);
            }
            Holder(const Holder&) = delete;
            Holder& operator=(const Holder&) = delete;

        private:
            FileLock& lock_;
            std::string token_;
        };

        std::string acquire();
        void release(const std::string& token) noexcept;
        bool tryCreate(const std::string& token);
        bool removeIfStale();
        void hold(const std::string& token);

        std::filesystem::path target_;
        std::filesystem::path lock_path_;
        std::filesystem::path guard_path_;
        LockOptions options_;
        std::mutex held_mutex_;
        std::string held_token_;
    };

} // namespace slotbook

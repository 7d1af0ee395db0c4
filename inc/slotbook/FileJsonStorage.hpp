#pragma once
#include "storage.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>
#include <string>

namespace slotbook {

    // Whole-file JSON persistence. Every save rewrites the file; with atomic
    // writes enabled the new content goes to "<path>.tmp" and is renamed over
    // the target, so a concurrent reader sees either the old or the new file.
    class FileJsonStorage: public IStorage {
    public:
        explicit FileJsonStorage(std::filesystem::path path, bool atomic_writes = true);
        void saveState(const nlohmann::json& snapshot) override;
        nlohmann::json loadState() override;
        bool exists() const override;
        const std::filesystem::path& path() const override;

    private:
        std::filesystem::path path_;
        bool atomic_writes_;
        std::mutex mutex_;
        void atomicWrite(const std::filesystem::path& path, const nlohmann::json& j);
        void directWrite(const std::filesystem::path& path, const nlohmann::json& j);
    };

} // namespace slotbook

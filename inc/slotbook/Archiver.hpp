#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>

#include "RecordStore.hpp"
#include "config.hpp"
#include "timeutil.hpp"

namespace slotbook {

    struct ArchiveResult {
        std::size_t archivedCount = 0;
        std::optional<std::filesystem::path> archivePath;
        CalendarDate cutoffDate;
    };

    // Moves rows whose booking day is before the cutoff (submission day for rows
    // without a booking date) into archives/archive_<cutoff>_<n>records.json and
    // drops them from the live store.
    class Archiver {
    public:
        Archiver(const StoreConfig& config, std::shared_ptr<RecordStore> store);

        // throws ArchivalError
        ArchiveResult archiveOlderThan(int months);

    private:
        std::filesystem::path archive_dir_;
        std::shared_ptr<RecordStore> store_;
    };

    void to_json(nlohmann::json& j, const ArchiveResult& r);

} // namespace slotbook

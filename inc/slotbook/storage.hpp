#pragma once
#include <filesystem>
#include <nlohmann/json.hpp>

namespace slotbook {

    struct IStorage {
        virtual ~IStorage() = default;
        virtual void saveState(const nlohmann::json& snapshot) = 0;
        virtual nlohmann::json loadState() = 0;
        virtual bool exists() const = 0;
        virtual const std::filesystem::path& path() const = 0;
    };

} // namespace slotbook

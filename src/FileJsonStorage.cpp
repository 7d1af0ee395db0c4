#include <slotbook/FileJsonStorage.hpp>
#include <slotbook/errors.hpp>
#include <fstream>
#include <system_error>

namespace slotbook {

    FileJsonStorage::FileJsonStorage(std::filesystem::path path, bool atomic_writes)
        : path_(std::move(path))
        , atomic_writes_(atomic_writes) {
    }

    void FileJsonStorage::atomicWrite(const std::filesystem::path& path, const nlohmann::json& j) {
        std::error_code ec;
        auto tmp = path;
        tmp += ".tmp";

        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            throw StoreIOError("Cannot open temp file for writing: " + tmp.string());
        }
        ofs << j.dump(2);
        ofs.close();
        if (!ofs) {
            std::filesystem::remove(tmp, ec);
            throw StoreIOError("Write failed: " + tmp.string());
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw StoreIOError("Atomic rename failed: " + ec.message());
        }
    }

    void FileJsonStorage::directWrite(const std::filesystem::path& path, const nlohmann::json& j) {
        std::ofstream ofs(path, std::ios::trunc);
        if (!ofs) {
            throw StoreIOError("Cannot open file for writing: " + path.string());
        }
        ofs << j.dump(2);
        ofs.close();
        if (!ofs) {
            throw StoreIOError("Write failed: " + path.string());
        }
    }

    void FileJsonStorage::saveState(const nlohmann::json& snapshot) {
        std::scoped_lock lk(mutex_);
        std::error_code ec;
        if (!path_.parent_path().empty()) {
            std::filesystem::create_directories(path_.parent_path(), ec);
            if (ec) {
                throw StoreIOError("Cannot create directory " + path_.parent_path().string() + ": " + ec.message());
            }
        }
        if (atomic_writes_) {
            atomicWrite(path_, snapshot);
        } else {
            directWrite(path_, snapshot);
        }
    }

    nlohmann::json FileJsonStorage::loadState() {
        std::scoped_lock lk(mutex_);
        std::ifstream ifs(path_);
        if (!ifs) {
            throw StoreIOError("Cannot open file for reading: " + path_.string());
        }
        nlohmann::json j = nlohmann::json::parse(ifs, nullptr, false);
        if (j.is_discarded()) {
            throw StoreIOError("File is not valid JSON: " + path_.string());
        }
        return j;
    }

    bool FileJsonStorage::exists() const {
        std::error_code ec;
        return std::filesystem::exists(path_, ec);
    }

    const std::filesystem::path& FileJsonStorage::path() const {
        return path_;
    }

} // namespace slotbook

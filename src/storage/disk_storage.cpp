#include "disk_storage.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include "../core/logger/logger.hpp"

namespace Trawl {
namespace Storage {

namespace fs = std::filesystem;
using Trawl::Core::Logger;

DiskStorage::DiskStorage(const std::string& base_path) : base_path_(base_path) {
    if (!base_path_.empty()) {
        std::error_code ec;
        fs::create_directories(base_path_, ec);
        if (ec)
            Logger::error("Failed to create storage directory: " + base_path_ + " (" + ec.message()
                          + ")");
    }
}

fs::path DiskStorage::resolve(const std::string& key) const {
    fs::path path(base_path_);
    path /= key;
    return path;
}

bool DiskStorage::ensure_parent(const fs::path& path) const {
    if (!path.has_parent_path())
        return true;
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        Logger::error("FS Error: cannot create " + path.parent_path().string() + ": "
                      + ec.message());
        return false;
    }
    return true;
}

bool DiskStorage::save(const std::string& key, const std::string& content) {
    fs::path path = resolve(key);
    if (!ensure_parent(path))
        return false;

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            Logger::error("Write Error: " + tmp.string());
            return false;
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            Logger::error("Write Error: " + tmp.string());
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        Logger::error("FS Error: rename to " + path.string() + " failed: " + ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    Logger::debug("Saved: " + path.string());
    return true;
}

bool DiskStorage::append(const std::string& key, const std::string& content) {
    fs::path path = resolve(key);
    if (!ensure_parent(path))
        return false;

    std::ofstream file(path, std::ios::binary | std::ios::app);
    if (!file.is_open()) {
        Logger::error("Write Error: " + path.string());
        return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(file);
}

std::optional<std::string> DiskStorage::load(const std::string& key) const {
    std::ifstream file(resolve(key), std::ios::binary);
    if (!file.is_open())
        return std::nullopt;
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool DiskStorage::exists(const std::string& key) const {
    std::error_code ec;
    return fs::is_regular_file(resolve(key), ec);
}

bool DiskStorage::remove(const std::string& key) {
    std::error_code ec;
    bool            removed = fs::remove(resolve(key), ec);
    if (ec)
        Logger::warn("FS Error: cannot remove " + key + ": " + ec.message());
    return removed;
}

std::vector<std::string> DiskStorage::list(const std::string& directory) const {
    std::vector<std::string> out;
    std::error_code          ec;
    fs::path                 dir = resolve(directory);
    if (!fs::is_directory(dir, ec))
        return out;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec))
            out.push_back((fs::path(directory) / it->path().filename()).generic_string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace Storage
}  // namespace Trawl

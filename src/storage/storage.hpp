#pragma once
#include <optional>
#include <string>
#include <vector>

namespace Trawl {
namespace Storage {

// Key = path relative to the storage root, '/' separated.
class Storage {
public:
    virtual ~Storage() = default;

    // Replaces the whole object. Readers never observe a partial write.
    virtual bool save(const std::string& key, const std::string& content) = 0;
    virtual bool append(const std::string& key, const std::string& content) = 0;

    virtual std::optional<std::string> load(const std::string& key) const = 0;
    virtual bool                       exists(const std::string& key) const = 0;
    virtual bool                       remove(const std::string& key) = 0;

    // Keys of regular files directly under `directory`, sorted.
    virtual std::vector<std::string> list(const std::string& directory) const = 0;
};

}  // namespace Storage
}  // namespace Trawl

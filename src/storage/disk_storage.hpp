#pragma once
#include <filesystem>
#include <string>
#include "storage.hpp"

namespace Trawl {
namespace Storage {

class DiskStorage : public Storage {
public:
    explicit DiskStorage(const std::string& base_path);
    ~DiskStorage() override = default;

    bool save(const std::string& key, const std::string& content) override;
    bool append(const std::string& key, const std::string& content) override;

    std::optional<std::string> load(const std::string& key) const override;
    bool                       exists(const std::string& key) const override;
    bool                       remove(const std::string& key) override;
    std::vector<std::string>   list(const std::string& directory) const override;

    const std::string& base_path() const {
        return base_path_;
    }

private:
    std::filesystem::path resolve(const std::string& key) const;
    bool                  ensure_parent(const std::filesystem::path& path) const;

    std::string base_path_;
};

}  // namespace Storage
}  // namespace Trawl

#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "../core/clock/clock.hpp"
#include "../core/types/constants.hpp"
#include "../storage/storage.hpp"

namespace Trawl {
namespace Checkpoint {

struct Checkpoint {
    std::string     id;
    std::string     scraper_type;
    std::string     session_id;
    uint64_t        sequence = 0;
    Core::TimePoint timestamp{};
    nlohmann::json  state;
    nlohmann::json  metadata;

    nlohmann::json    to_json() const;
    // Throws Core::ValidationError when a required field is missing or mistyped.
    static Checkpoint from_json(const nlohmann::json& j);
};

struct CheckpointConfig {
    std::string  session_id;
    int          frequency       = Core::Constants::DEFAULT_CHECKPOINT_FREQUENCY;  // minutes
    int          item_interval   = Core::Constants::DEFAULT_CHECKPOINT_EVERY_NODES;
    Core::Millis max_age{Core::Constants::DEFAULT_MAX_CHECKPOINT_AGE};
    bool         backup          = true;
    bool         auto_checkpoint = true;
};

struct CheckpointStats {
    std::string                    session_id;
    uint64_t                       saved  = 0;
    uint64_t                       failed = 0;
    std::optional<std::string>     last_id;
    std::optional<Core::TimePoint> last_saved_at;
};

// Immutable, sequence-numbered snapshots under <root>/checkpoints/<scraper_type>/<id>.json.
// Sequences continue from the highest one on disk, so "latest" survives restarts.
class CheckpointStore {
public:
    CheckpointStore(CheckpointConfig config, Storage::Storage& storage, const Core::Clock& clock);

    // nullopt when auto checkpointing is off or the write failed (logged).
    std::optional<std::string> save(const std::string&    scraper_type,
                                    const nlohmann::json& state,
                                    const nlohmann::json& metadata = nlohmann::json::object());

    // Highest sequence, or nullopt if none exists or it is older than max_age.
    std::optional<Checkpoint> load_latest(const std::string& scraper_type);
    std::optional<Checkpoint> load(const std::string& scraper_type, const std::string& id);

    // Sorted by ascending sequence. Reads every file; unreadable ones are skipped.
    std::vector<Checkpoint> list(const std::string& scraper_type);
    bool                    remove(const std::string& scraper_type, const std::string& id);

    // Keeps the newest frequency * 2, returns how many were deleted.
    size_t prune(const std::string& scraper_type);

    bool   export_to(const std::string& scraper_type, const std::string& path);
    size_t import_from(const std::string& scraper_type, const std::string& path);

    bool            should_checkpoint(uint64_t items_processed) const;
    CheckpointStats stats() const;

    size_t retention() const {
        return static_cast<size_t>(config_.frequency) * 2;
    }

private:
    struct Entry {
        std::string id;
        uint64_t    sequence = 0;
    };

    // Ids and sequences by ascending sequence, taken from the file names.
    std::vector<Entry> entries(const std::string& scraper_type);

    std::string directory(const std::string& scraper_type) const;
    std::string path_for(const std::string& scraper_type, const std::string& id) const;
    uint64_t    next_sequence(const std::string& scraper_type);

    CheckpointConfig                config_;
    Storage::Storage&               storage_;
    const Core::Clock&              clock_;
    std::map<std::string, uint64_t> sequences_;
    CheckpointStats                 stats_;
    mutable std::mutex              mutex_;
};

}  // namespace Checkpoint
}  // namespace Trawl

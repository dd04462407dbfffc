#include "checkpoint_store.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"

namespace Trawl {
namespace Checkpoint {

using namespace Trawl::Core;
using json = nlohmann::json;

namespace {
constexpr const char* FORMAT_VERSION = "1.0.0";
constexpr const char* EXTENSION      = ".json";
constexpr const char* BACKUP_SUFFIX  = ".backup";

// Ids read <scraperType>_<sessionId>_<YYYYmmdd-HHMMSS>_<sequence>.
std::optional<uint64_t> sequence_of(const std::string& scraper_type, const std::string& id) {
    const std::string prefix = scraper_type + "_";
    if (id.compare(0, prefix.size(), prefix) != 0)
        return std::nullopt;

    size_t last = id.rfind('_');
    if (last == std::string::npos || last < prefix.size() || last + 1 == id.size())
        return std::nullopt;
    std::string digits = id.substr(last + 1);
    if (digits.size() > 19
        || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); }))
        return std::nullopt;

    size_t stamp = id.rfind('_', last - 1);
    if (stamp == std::string::npos || stamp + 1 < prefix.size() || last - stamp - 1 != 15
        || id[stamp + 9] != '-')
        return std::nullopt;
    return std::stoull(digits);
}
}  // namespace

json Checkpoint::to_json() const {
    return json{{"id", id},
                {"scraperType", scraper_type},
                {"sessionId", session_id},
                {"sequence", sequence},
                {"timestamp", to_iso8601(timestamp)},
                {"state", state},
                {"metadata", metadata}};
}

Checkpoint Checkpoint::from_json(const json& j) {
    try {
        Checkpoint cp;
        cp.id           = j.at("id").get<std::string>();
        cp.scraper_type = j.at("scraperType").get<std::string>();
        cp.session_id   = j.at("sessionId").get<std::string>();
        cp.sequence     = j.at("sequence").get<uint64_t>();
        auto stamp      = from_iso8601(j.at("timestamp").get<std::string>());
        if (!stamp)
            throw ValidationError("checkpoint " + cp.id + " has an unreadable timestamp");
        cp.timestamp = *stamp;
        cp.state     = j.value("state", json::object());
        cp.metadata  = j.value("metadata", json::object());
        return cp;
    } catch (const json::exception& e) {
        throw ValidationError(std::string("malformed checkpoint: ") + e.what());
    }
}

CheckpointStore::CheckpointStore(CheckpointConfig config,
                                 Storage::Storage& storage,
                                 const Clock&      clock)
    : config_(std::move(config)), storage_(storage), clock_(clock) {
    stats_.session_id = config_.session_id;
}

std::string CheckpointStore::directory(const std::string& scraper_type) const {
    return "checkpoints/" + scraper_type;
}

std::string CheckpointStore::path_for(const std::string& scraper_type,
                                      const std::string& id) const {
    return directory(scraper_type) + "/" + id + EXTENSION;
}

uint64_t CheckpointStore::next_sequence(const std::string& scraper_type) {
    auto it = sequences_.find(scraper_type);
    if (it == sequences_.end()) {
        auto     all     = entries(scraper_type);
        uint64_t highest = all.empty() ? 0 : all.back().sequence;
        it = sequences_.emplace(scraper_type, highest).first;
    }
    return ++it->second;
}

std::optional<std::string> CheckpointStore::save(const std::string& scraper_type,
                                                 const json&        state,
                                                 const json&        metadata) {
    if (!config_.auto_checkpoint)
        return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    Checkpoint                  cp;
    cp.scraper_type = scraper_type;
    cp.session_id   = config_.session_id;
    cp.sequence     = next_sequence(scraper_type);
    cp.timestamp    = clock_.now();
    cp.id           = scraper_type + "_" + config_.session_id + "_" + to_compact_stamp(cp.timestamp)
            + "_" + std::to_string(cp.sequence);
    cp.state    = state;
    cp.metadata = metadata.is_object() ? metadata : json::object();
    cp.metadata["version"]     = FORMAT_VERSION;
    cp.metadata["trawlVersion"] = Constants::VERSION;

    std::string body = cp.to_json().dump(2);
    std::string path = path_for(scraper_type, cp.id);
    if (!storage_.save(path, body)) {
        ++stats_.failed;
        Logger::error("Checkpoint write failed: " + cp.id);
        return std::nullopt;
    }
    if (config_.backup && !storage_.save(path + BACKUP_SUFFIX, body))
        Logger::warn("Checkpoint backup failed: " + cp.id);

    ++stats_.saved;
    stats_.last_id       = cp.id;
    stats_.last_saved_at = cp.timestamp;
    Logger::debug("Checkpoint saved: " + cp.id);
    return cp.id;
}

std::vector<Checkpoint> CheckpointStore::list(const std::string& scraper_type) {
    std::vector<Checkpoint> out;
    for (const auto& key : storage_.list(directory(scraper_type))) {
        if (!Utils::Text::ends_with(key, EXTENSION))
            continue;
        auto body = storage_.load(key);
        if (!body)
            continue;
        try {
            Checkpoint cp = Checkpoint::from_json(json::parse(*body));
            if (cp.scraper_type == scraper_type)
                out.push_back(std::move(cp));
        } catch (const std::exception& e) {
            Logger::warn("Skipping unreadable checkpoint " + key + ": " + e.what());
        }
    }
    std::sort(out.begin(), out.end(), [](const Checkpoint& a, const Checkpoint& b) {
        return a.sequence < b.sequence;
    });
    return out;
}

std::vector<CheckpointStore::Entry> CheckpointStore::entries(const std::string& scraper_type) {
    std::vector<Entry> out;
    for (const auto& key : storage_.list(directory(scraper_type))) {
        if (!Utils::Text::ends_with(key, EXTENSION))
            continue;
        size_t      slash = key.rfind('/');
        std::string name  = slash == std::string::npos ? key : key.substr(slash + 1);
        std::string id    = name.substr(0, name.size() - std::char_traits<char>::length(EXTENSION));

        if (auto sequence = sequence_of(scraper_type, id)) {
            out.push_back({id, *sequence});
            continue;
        }

        // A file named some other way has to be opened for its sequence.
        auto body = storage_.load(key);
        if (!body)
            continue;
        try {
            Checkpoint cp = Checkpoint::from_json(json::parse(*body));
            if (cp.scraper_type == scraper_type)
                out.push_back({id, cp.sequence});
        } catch (const std::exception& e) {
            Logger::warn("Skipping unreadable checkpoint " + key + ": " + e.what());
        }
    }
    std::sort(out.begin(), out.end(), [](const Entry& a, const Entry& b) {
        return a.sequence != b.sequence ? a.sequence < b.sequence : a.id < b.id;
    });
    return out;
}

std::optional<Checkpoint> CheckpointStore::load_latest(const std::string& scraper_type) {
    auto all = entries(scraper_type);
    for (auto it = all.rbegin(); it != all.rend(); ++it) {
        auto latest = load(scraper_type, it->id);
        if (!latest) {
            Logger::warn("Falling back past unreadable checkpoint " + it->id);
            continue;
        }

        auto age = std::chrono::duration_cast<Millis>(clock_.now() - latest->timestamp);
        if (age > config_.max_age) {
            Logger::warn("Latest checkpoint is too old, ignoring: " + latest->id + " (age "
                         + std::to_string(age.count() / 60000) + " minutes)");
            return std::nullopt;
        }

        Logger::info("Loaded checkpoint " + latest->id + " (sequence "
                     + std::to_string(latest->sequence) + ")");
        return latest;
    }

    Logger::info("No checkpoints found for " + scraper_type);
    return std::nullopt;
}

std::optional<Checkpoint> CheckpointStore::load(const std::string& scraper_type,
                                                const std::string& id) {
    auto body = storage_.load(path_for(scraper_type, id));
    if (!body) {
        Logger::warn("Checkpoint not found: " + id);
        return std::nullopt;
    }
    try {
        return Checkpoint::from_json(json::parse(*body));
    } catch (const std::exception& e) {
        Logger::error("Failed to load checkpoint " + id + ": " + e.what());
        return std::nullopt;
    }
}

bool CheckpointStore::remove(const std::string& scraper_type, const std::string& id) {
    std::string path    = path_for(scraper_type, id);
    bool        removed = storage_.remove(path);
    storage_.remove(path + BACKUP_SUFFIX);
    if (removed)
        Logger::debug("Checkpoint deleted: " + id);
    return removed;
}

size_t CheckpointStore::prune(const std::string& scraper_type) {
    auto all  = entries(scraper_type);
    auto keep = retention();
    if (all.size() <= keep)
        return 0;

    size_t doomed  = all.size() - keep;
    size_t deleted = 0;
    for (size_t i = 0; i < doomed; ++i) {
        if (remove(scraper_type, all[i].id))
            ++deleted;
    }
    Logger::info("Pruned " + std::to_string(deleted) + " checkpoints, kept "
                 + std::to_string(keep));
    return deleted;
}

bool CheckpointStore::export_to(const std::string& scraper_type, const std::string& path) {
    auto all = list(scraper_type);
    json doc{{"scraperType", scraper_type},
             {"exportTimestamp", to_iso8601(clock_.now())},
             {"checkpointCount", all.size()},
             {"checkpoints", json::array()}};
    for (const auto& cp : all)
        doc["checkpoints"].push_back(cp.to_json());

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        Logger::error("Failed to export checkpoints to " + path);
        return false;
    }
    out << doc.dump(2);
    if (!out) {
        Logger::error("Failed to export checkpoints to " + path);
        return false;
    }
    Logger::info("Exported " + std::to_string(all.size()) + " checkpoints to " + path);
    return true;
}

size_t CheckpointStore::import_from(const std::string& scraper_type, const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Logger::error("Failed to import checkpoints: cannot open " + path);
        return 0;
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::exception& e) {
        Logger::error("Failed to import checkpoints from " + path + ": " + e.what());
        return 0;
    }

    std::string found = doc.value("scraperType", "");
    if (found != scraper_type) {
        Logger::error("Scraper type mismatch: expected " + scraper_type + ", got " + found);
        return 0;
    }

    size_t imported = 0;
    size_t total    = 0;
    for (const auto& entry : doc.value("checkpoints", json::array())) {
        ++total;
        Checkpoint cp;
        try {
            cp = Checkpoint::from_json(entry);
        } catch (const ValidationError& e) {
            Logger::warn(std::string("Skipping imported checkpoint: ") + e.what());
            continue;
        }
        std::string key = path_for(scraper_type, cp.id);
        if (storage_.exists(key))
            continue;
        if (storage_.save(key, cp.to_json().dump(2)))
            ++imported;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sequences_.erase(scraper_type);
    }
    Logger::info("Imported " + std::to_string(imported) + " of " + std::to_string(total)
                 + " checkpoints from " + path);
    return imported;
}

bool CheckpointStore::should_checkpoint(uint64_t items_processed) const {
    if (!config_.auto_checkpoint)
        return false;
    if (items_processed > 0 && config_.item_interval > 0
        && items_processed % static_cast<uint64_t>(config_.item_interval) == 0)
        return true;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!stats_.last_saved_at)
        return true;
    return clock_.now() - *stats_.last_saved_at >= std::chrono::minutes(config_.frequency);
}

CheckpointStats CheckpointStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

}  // namespace Checkpoint
}  // namespace Trawl

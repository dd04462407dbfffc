#include "maintenance.hpp"
#include <nlohmann/json.hpp>
#include "../../checkpoint/checkpoint_store.hpp"
#include "../../core/logger/logger.hpp"
#include "../../proxy/pool/proxy_pool.hpp"
#include "../../storage/disk_storage.hpp"
#include "runtime.hpp"

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;
using json = nlohmann::json;

Maintenance::Maintenance(const Config& config, std::ostream& out) : config_(config), out_(out) {
}

int Maintenance::run() {
    if (config_.command == "proxies")
        return proxies();
    if (config_.command == "checkpoints")
        return checkpoints();
    Logger::error("Unknown maintenance command: " + config_.command);
    return 1;
}

int Maintenance::proxies() {
    auto                   store = Runtime::make_store(config_, clock_);
    Proxy::Pool::ProxyPool pool(Runtime::pool_config(config_), clock_, store.get());
    pool.load_mirror();
    pool.register_proxies(config_.proxies);

    if (config_.action == "list") {
        json list = json::array();
        for (const auto& record : pool.proxies()) {
            json entry{{"proxy", record.uri.masked()},
                       {"status", Proxy::Pool::to_string(record.status)},
                       {"requests", record.requests},
                       {"successes", record.successes},
                       {"failures", record.failures},
                       {"consecutiveFailures", record.consecutive_failures},
                       {"avgResponseMs", record.avg_response_ms}};
            if (record.cooldown_until)
                entry["cooldownUntil"] = to_iso8601(*record.cooldown_until);
            if (!record.last_error.empty())
                entry["lastError"] = record.last_error;
            list.push_back(std::move(entry));
        }
        auto stats = pool.stats();
        out_ << json{{"total", stats.total},
                     {"healthy", stats.healthy},
                     {"unhealthy", stats.unhealthy},
                     {"rateLimited", stats.rate_limited},
                     {"proxies", list}}
                    .dump(2)
             << std::endl;
        return 0;
    }

    if (config_.action == "remove") {
        size_t removed = pool.remove(config_.command_args);
        out_ << json{{"requested", config_.command_args.size()}, {"removed", removed}}.dump(2) << std::endl;
        if (removed < config_.command_args.size())
            Logger::warn("Some proxies were not in the pool");
        return removed == config_.command_args.size() ? 0 : 1;
    }

    if (config_.action == "reset") {
        pool.reset_stats();
        out_ << json{{"reset", pool.stats().total}}.dump(2) << std::endl;
        return 0;
    }

    Logger::error("Unknown proxies action: " + config_.action);
    return 1;
}

int Maintenance::checkpoints() {
    Storage::DiskStorage         storage(config_.output_dir);
    Checkpoint::CheckpointConfig checkpoint_config;
    checkpoint_config.session_id = config_.session_id;
    checkpoint_config.frequency  = config_.checkpoint_frequency;
    checkpoint_config.max_age    = Millis(config_.max_checkpoint_age_ms);
    checkpoint_config.backup     = config_.backup_checkpoints;
    Checkpoint::CheckpointStore store(checkpoint_config, storage, clock_);
    const std::string           type = Constants::SCRAPER_TYPE;

    if (config_.action == "list") {
        json list = json::array();
        for (const auto& checkpoint : store.list(type)) {
            const json metadata = checkpoint.metadata.is_object() ? checkpoint.metadata : json::object();
            list.push_back({{"id", checkpoint.id},
                            {"sessionId", checkpoint.session_id},
                            {"sequence", checkpoint.sequence},
                            {"timestamp", to_iso8601(checkpoint.timestamp)},
                            {"completed", metadata.value("completed", false)},
                            {"nodesProcessed", metadata.value("nodesProcessed", uint64_t{0})},
                            {"edgesEmitted", metadata.value("edgesEmitted", uint64_t{0})}});
        }
        out_ << list.dump(2) << std::endl;
        return 0;
    }

    if (config_.action == "remove") {
        size_t removed = 0;
        for (const auto& id : config_.command_args) {
            if (store.remove(type, id))
                ++removed;
            else
                Logger::warn("Checkpoint not found: " + id);
        }
        out_ << json{{"requested", config_.command_args.size()}, {"removed", removed}}.dump(2) << std::endl;
        return removed == config_.command_args.size() ? 0 : 1;
    }

    if (config_.command_args.size() != 1) {
        Logger::error("checkpoints " + config_.action + " takes exactly one path");
        return 1;
    }
    const std::string& path = config_.command_args.front();

    if (config_.action == "export") {
        bool exported = store.export_to(type, path);
        out_ << json{{"path", path}, {"exported", exported}}.dump(2) << std::endl;
        return exported ? 0 : 1;
    }

    if (config_.action == "import") {
        size_t imported = store.import_from(type, path);
        out_ << json{{"path", path}, {"imported", imported}}.dump(2) << std::endl;
        return 0;
    }

    Logger::error("Unknown checkpoints action: " + config_.action);
    return 1;
}

}  // namespace Engine
}  // namespace Trawl

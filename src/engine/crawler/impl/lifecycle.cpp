#include <algorithm>
#include <set>
#include <sstream>
#include "../../../api/response_parser.hpp"
#include "../../../core/errors/errors.hpp"
#include "../../../core/logger/logger.hpp"
#include "../../../utils/text/string_utils.hpp"
#include "../crawler.hpp"

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;

bool Crawler::restore() {
    auto checkpoint = services_.checkpoints.load_latest(config_.scraper_type);
    if (!checkpoint)
        return false;

    const auto& metadata = checkpoint->metadata;
    if (metadata.is_object() && metadata.value("completed", false)) {
        Logger::info("Crawler: checkpoint " + checkpoint->id
                     + " belongs to a finished crawl, starting fresh");
        return false;
    }

    try {
        FrontierState restored = FrontierState::from_json(checkpoint->state);
        if (restored.max_depth() != config_.max_depth) {
            Logger::warn("Crawler: checkpoint " + checkpoint->id + " was taken with max depth "
                         + std::to_string(restored.max_depth()) + ", starting fresh");
            return false;
        }
        frontier_ = std::move(restored);
    } catch (const ValidationError& e) {
        Logger::warn("Crawler: ignoring checkpoint " + checkpoint->id + ": " + e.what());
        return false;
    }

    resumed_         = true;
    deepest_         = frontier_.current_depth();
    last_checkpoint_ = checkpoint->id;
    Logger::success("Crawler: resumed from " + checkpoint->id + " at depth "
                    + std::to_string(frontier_.current_depth()) + " ("
                    + std::to_string(frontier_.visited_count()) + " visited)");
    return true;
}

boost::asio::awaitable<void> Crawler::seed(const std::vector<std::string>& seeds) {
    std::vector<FrontierNode> roots;
    for (const auto& raw : seeds) {
        std::string seed = Utils::Text::trim(raw);
        if (seed.empty())
            continue;

        const bool is_did = Utils::Text::starts_with(seed, "did:");
        std::optional<Api::Actor> profile;
        try {
            profile = co_await services_.api.get_profile(seed);
        } catch (const ApiError& e) {
            Logger::warn("Crawler: could not resolve seed " + seed + ": " + e.what());
        } catch (const ValidationError& e) {
            Logger::warn("Crawler: invalid profile for seed " + seed + ": " + e.what());
        }

        if (!profile) {
            ++frontier_.counters().errors;
            // A DID is crawlable without its profile; a handle is not.
            if (is_did)
                roots.push_back(FrontierNode{seed, "", std::nullopt, std::nullopt, 0});
            continue;
        }

        emit_seed(*profile, "bfs", "");
        roots.push_back(FrontierNode{profile->did,
                                     profile->handle,
                                     profile->followers_count,
                                     profile->follows_count,
                                     0});
    }

    size_t added = frontier_.enqueue_batch(std::move(roots), config_.prioritize_popular);
    Logger::info("Crawler: seeded " + std::to_string(added) + " of " + std::to_string(seeds.size())
                 + " nodes");
}

boost::asio::awaitable<void> Crawler::seed_from_search(const std::vector<std::string>& queries) {
    std::vector<FrontierNode> roots;
    for (const auto& raw : queries) {
        const std::string query = Utils::Text::trim(raw);
        if (query.empty())
            continue;

        std::optional<std::string> cursor;
        size_t                     found = 0;
        for (int page_number = 0; page_number < config_.search_pages && !stop_requested_; ++page_number) {
            Api::SearchPage page;
            try {
                page = co_await services_.api.search_actors(query, cursor, config_.page_limit);
            } catch (const ApiError& e) {
                ++frontier_.counters().errors;
                Logger::warn("Crawler: search for \"" + query + "\" failed: " + e.what());
                break;
            }
            frontier_.counters().errors += page.dropped;

            for (const auto& actor : page.actors) {
                if (actor.followers_count.value_or(0) < config_.min_follower_count)
                    continue;
                emit_seed(actor, "search", query);
                roots.push_back(
                    FrontierNode{actor.did, actor.handle, actor.followers_count, actor.follows_count, 0});
                ++found;
            }
            if (!page.cursor || page.actors.empty())
                break;
            cursor = std::move(page.cursor);
        }
        Logger::debug("Crawler: search \"" + query + "\" found " + std::to_string(found) + " seeds");
    }

    size_t added = frontier_.enqueue_batch(std::move(roots), config_.prioritize_popular);
    Logger::info("Crawler: seeded " + std::to_string(added) + " nodes from "
                 + std::to_string(queries.size()) + " search queries");
}

size_t Crawler::seed_from_discovery() {
    std::vector<FrontierNode> roots;
    std::set<std::string>     seen;
    size_t                    files = 0;
    for (const auto& key : services_.storage.list("nodes")) {
        if (!Utils::Text::ends_with(key, ".jsonl"))
            continue;
        auto body = services_.storage.load(key);
        if (!body) {
            Logger::warn("Crawler: could not read " + key);
            continue;
        }
        ++files;

        std::istringstream lines(*body);
        std::string        line;
        while (std::getline(lines, line)) {
            if (Utils::Text::trim(line).empty())
                continue;
            try {
                Api::Actor actor = Api::ResponseParser::parse_actor(nlohmann::json::parse(line));
                if (actor.followers_count.value_or(0) < config_.min_follower_count)
                    continue;
                if (seen.insert(actor.did).second)
                    roots.push_back(
                        FrontierNode{actor.did, actor.handle, actor.followers_count, actor.follows_count, 0});
            } catch (const nlohmann::json::exception& e) {
                Logger::debug("Crawler: skipping unparsable line in " + key + ": " + e.what());
            } catch (const ValidationError& e) {
                Logger::debug("Crawler: skipping record in " + key + ": " + e.what());
            }
        }
    }

    if (config_.prioritize_popular) {
        std::stable_sort(roots.begin(), roots.end(), [](const FrontierNode& a, const FrontierNode& b) {
            return a.followers_count.value_or(0) > b.followers_count.value_or(0);
        });
    }
    if (config_.prior_seed_limit > 0 && roots.size() > static_cast<size_t>(config_.prior_seed_limit))
        roots.resize(static_cast<size_t>(config_.prior_seed_limit));

    size_t added = frontier_.enqueue_batch(std::move(roots), false);
    if (added > 0)
        Logger::info("Crawler: seeded " + std::to_string(added) + " nodes from "
                     + std::to_string(files) + " earlier node files");
    return added;
}

// Seeds are written to the node output once, like any other discovery.
void Crawler::emit_seed(const Api::Actor& actor, const std::string& strategy, const std::string& source) {
    if (services_.dedup.is_duplicate(actor.did, Dedup::Namespace::Node))
        return;
    services_.dedup.mark_processed(
        actor.did, Dedup::Namespace::Node, {{"handle", actor.handle}, {"depth", 0}, {"source", strategy}});
    services_.sink.write_nodes({Output::NodeRecord{actor, {strategy, 0, services_.clock.now(), source}}});
}

nlohmann::json Crawler::checkpoint_metadata(bool completed) const {
    const CrawlCounters& counters = frontier_.counters();
    return {{"completed", completed},
            {"resumed", resumed_},
            {"currentDepth", frontier_.current_depth()},
            {"pending", frontier_.total_pending()},
            {"nodesProcessed", counters.nodes_processed},
            {"edgesEmitted", counters.edges_emitted}};
}

std::optional<std::string> Crawler::write_checkpoint(bool completed) {
    auto id = services_.checkpoints.save(
        config_.scraper_type, frontier_.to_json(), checkpoint_metadata(completed));
    if (id)
        last_checkpoint_ = id;
    return id;
}

void Crawler::maybe_checkpoint() {
    if (!services_.checkpoints.should_checkpoint(frontier_.counters().nodes_processed))
        return;

    // Output first: a checkpoint must never point past records that are still buffered.
    if (!services_.sink.flush())
        Logger::warn("Crawler: output flush failed, records stay buffered");
    if (write_checkpoint(false)) {
        services_.checkpoints.prune(config_.scraper_type);
        services_.dedup.save_filters();
    }
}

void Crawler::finish(TerminationReason reason) {
    if (!services_.sink.flush())
        Logger::error("Crawler: final output flush failed, "
                      + std::to_string(services_.sink.pending()) + " records still buffered");

    auto id = write_checkpoint(reason == TerminationReason::Completed);
    if (id)
        Logger::info("Crawler: final checkpoint " + *id);
    services_.checkpoints.prune(config_.scraper_type);
    services_.dedup.save_filters();
}

}  // namespace Engine
}  // namespace Trawl

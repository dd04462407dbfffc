#include <algorithm>
#include "../../../core/errors/errors.hpp"
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;
using Api::Direction;

boost::asio::awaitable<Crawler::NodeOutcome> Crawler::process_node(const FrontierNode& node) {
    Logger::info("Crawling " + (node.handle.empty() ? node.did : node.handle) + " (depth "
                 + std::to_string(node.depth) + ")");

    // A node requeued mid-listing picks up where the listing stopped.
    const std::optional<ListingProgress> resume = frontier_.take_progress(node.did);

    std::vector<FrontierNode> next_level;
    NodeOutcome               outcome = NodeOutcome::Done;
    for (Direction direction : {Direction::Followers, Direction::Follows}) {
        if (resume && resume->direction == Direction::Follows && direction == Direction::Followers)
            continue;
        const ListingProgress* from = resume && resume->direction == direction ? &*resume : nullptr;
        outcome                     = co_await crawl_direction(node, direction, from, next_level);
        if (outcome == NodeOutcome::Interrupted)
            break;
    }

    // Enqueue even when interrupted: these edges are already recorded as seen, so a
    // re-fetch after resume would not offer the far ends again.
    frontier_.enqueue_batch(std::move(next_level), config_.prioritize_popular);
    co_return outcome;
}

boost::asio::awaitable<Crawler::NodeOutcome>
Crawler::crawl_direction(const FrontierNode&         node,
                         Direction                   direction,
                         const ListingProgress*      resume,
                         std::vector<FrontierNode>& next_level) {
    const int                  cap     = cap_for(node, direction);
    int                        fetched = resume ? resume->fetched + resume->consumed : 0;
    int                        skip    = resume ? resume->consumed : 0;
    std::optional<std::string> cursor  = resume ? resume->cursor : std::nullopt;

    while (fetched < cap) {
        if (stop_requested_ || edge_budget_reached()) {
            frontier_.set_progress({node.did, direction, cursor, fetched - skip, skip});
            co_return NodeOutcome::Interrupted;
        }

        // A partly consumed page is fetched again with the limit it had the first time.
        const int     page_start = fetched - skip;
        const int     limit      = std::min(config_.page_limit, cap - page_start);
        Api::EdgePage page;
        try {
            page = co_await services_.api.list_edges(node.did, direction, cursor, limit);
        } catch (const ApiError& e) {
            ++frontier_.counters().errors;
            Logger::warn("Giving up on " + std::string(Api::to_string(direction)) + " of "
                         + node.did + ": " + e.what());
            co_return NodeOutcome::Done;
        }
        if (skip == 0)
            frontier_.counters().errors += page.dropped;

        int position = 0;
        for (const auto& actor : page.items) {
            if (position < skip) {
                ++position;
                continue;
            }
            if (fetched >= cap)
                break;
            if (edge_budget_reached()) {
                frontier_.set_progress({node.did, direction, cursor, page_start, position});
                co_return NodeOutcome::Interrupted;
            }
            ++position;
            ++fetched;
            admit(node, actor, direction, next_level);
        }
        skip = 0;

        if (!page.cursor || page.items.empty())
            break;
        cursor = std::move(page.cursor);
    }
    co_return NodeOutcome::Done;
}

void Crawler::admit(const FrontierNode&         source,
                    const Api::Actor&           target,
                    Direction                   direction,
                    std::vector<FrontierNode>& next_level) {
    auto&             counters = frontier_.counters();
    const std::string key      = Dedup::Deduplicator::edge_key(source.did, target.did, Api::to_string(direction));
    if (services_.dedup.is_duplicate(key, Dedup::Namespace::Edge)) {
        ++counters.duplicates_skipped;
        return;
    }

    services_.dedup.mark_processed(key,
                                   Dedup::Namespace::Edge,
                                   {{"source", source.did},
                                    {"target", target.did},
                                    {"direction", Api::to_string(direction)},
                                    {"depth", source.depth}});
    ++counters.edges_emitted;

    const TimePoint now = services_.clock.now();
    services_.sink.write_edges(
        {Output::EdgeRecord{source.did, source.handle, target, direction, {"bfs", source.depth, now, source.did}}});

    if (!frontier_.is_discovered(target.did) && !services_.dedup.is_duplicate(target.did, Dedup::Namespace::Node)) {
        services_.dedup.mark_processed(
            target.did, Dedup::Namespace::Node, {{"handle", target.handle}, {"depth", source.depth + 1}});
        services_.sink.write_nodes(
            {Output::NodeRecord{target, {"bfs", source.depth + 1, now, source.did}}});
    }

    if (source.depth >= config_.max_depth)
        return;
    if (target.followers_count.value_or(0) < config_.min_follower_count)
        return;
    if (frontier_.is_visited(target.did) || frontier_.is_discovered(target.did))
        return;
    next_level.push_back(FrontierNode{
        target.did, target.handle, target.followers_count, target.follows_count, source.depth + 1});
}

int Crawler::cap_for(const FrontierNode& node, Direction direction) const {
    const bool followers = direction == Direction::Followers;
    const int  cap       = followers ? config_.max_followers_per_node : config_.max_following_per_node;
    const auto known     = followers ? node.followers_count : node.follows_count;
    if (known && *known > 0)
        return static_cast<int>(std::min<int64_t>(cap, *known));
    return cap;
}

}  // namespace Engine
}  // namespace Trawl

#include "crawler.hpp"
#include <algorithm>
#include "../../core/logger/logger.hpp"

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;

const char* to_string(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::Completed:
            return "completed";
        case TerminationReason::NodeBudget:
            return "node_budget";
        case TerminationReason::EdgeBudget:
            return "edge_budget";
        case TerminationReason::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

nlohmann::json CrawlSummary::to_json() const {
    nlohmann::json j = {{"nodesProcessed", nodes_processed},
                        {"nodesDiscovered", nodes_discovered},
                        {"edgesEmitted", edges_emitted},
                        {"duplicatesSkipped", duplicates_skipped},
                        {"errors", errors},
                        {"elapsedMs", elapsed_ms},
                        {"finalDepth", final_depth},
                        {"reason", Engine::to_string(reason)},
                        {"resumed", resumed}};
    if (last_checkpoint)
        j["lastCheckpoint"] = *last_checkpoint;
    return j;
}

Crawler::Crawler(CrawlerConfig config, Services services)
    : config_(std::move(config)), services_(services), frontier_(config_.max_depth) {
}

void Crawler::stop() {
    if (!stop_requested_.exchange(true))
        Logger::warn("Crawler: stop requested, finishing the current page");
}

boost::asio::awaitable<CrawlSummary> Crawler::run(std::vector<std::string> seeds) {
    const TimePoint started = services_.clock.now();

    services_.dedup.load_filters();
    if (!(config_.resume && restore())) {
        if (!seeds.empty())
            co_await seed(seeds);
        else if (!config_.seed_queries.empty())
            co_await seed_from_search(config_.seed_queries);
        else if (seed_from_discovery() == 0)
            Logger::warn("Crawler: no seeds, no search queries and no prior discovery data");
    }

    Logger::info("Crawler: " + std::to_string(frontier_.total_pending()) + " nodes pending, max depth "
                 + std::to_string(config_.max_depth));

    TerminationReason reason = TerminationReason::Completed;
    while (true) {
        if (stop_requested_) {
            reason = TerminationReason::Cancelled;
            break;
        }
        if (node_budget_reached()) {
            reason = TerminationReason::NodeBudget;
            break;
        }

        auto node = frontier_.next();
        if (!node)
            break;

        // Visited before the fetch so nothing re-enqueues it while it is in flight.
        frontier_.mark_visited(node->did);
        NodeOutcome outcome = co_await process_node(*node);
        if (outcome == NodeOutcome::Interrupted) {
            frontier_.requeue(*node);
            reason = edge_budget_reached() ? TerminationReason::EdgeBudget
                                           : TerminationReason::Cancelled;
            break;
        }

        ++frontier_.counters().nodes_processed;
        deepest_ = std::max(deepest_, node->depth);

        if (edge_budget_reached()) {
            reason = TerminationReason::EdgeBudget;
            break;
        }
        maybe_checkpoint();
    }

    finish(reason);

    const CrawlCounters& counters = frontier_.counters();
    CrawlSummary         summary;
    summary.nodes_processed    = counters.nodes_processed;
    summary.nodes_discovered   = counters.nodes_discovered;
    summary.edges_emitted      = counters.edges_emitted;
    summary.duplicates_skipped = counters.duplicates_skipped;
    summary.errors             = counters.errors;
    summary.elapsed_ms =
        std::chrono::duration_cast<Millis>(services_.clock.now() - started).count();
    summary.final_depth     = deepest_;
    summary.reason          = reason;
    summary.resumed         = resumed_;
    summary.last_checkpoint = last_checkpoint_;

    Logger::success("Crawler: " + std::string(Engine::to_string(reason)) + " after "
                    + std::to_string(summary.nodes_processed) + " nodes, "
                    + std::to_string(summary.edges_emitted) + " edges");
    co_return summary;
}

bool Crawler::node_budget_reached() const {
    return config_.max_nodes > 0
           && frontier_.counters().nodes_processed >= static_cast<uint64_t>(config_.max_nodes);
}

bool Crawler::edge_budget_reached() const {
    return config_.max_edges > 0
           && frontier_.counters().edges_emitted >= static_cast<uint64_t>(config_.max_edges);
}

}  // namespace Engine
}  // namespace Trawl

#pragma once
#include <atomic>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "../../api/graph_api.hpp"
#include "../../checkpoint/checkpoint_store.hpp"
#include "../../core/clock/clock.hpp"
#include "../../core/types/constants.hpp"
#include "../../dedup/deduplicator.hpp"
#include "../../output/sink.hpp"
#include "../../storage/storage.hpp"
#include "../frontier/frontier_state.hpp"

namespace Trawl {
namespace Engine {

struct CrawlerConfig {
    int         max_depth              = Core::Constants::DEFAULT_MAX_DEPTH;
    int64_t     max_nodes              = Core::Constants::DEFAULT_MAX_NODES;
    int64_t     max_edges              = Core::Constants::DEFAULT_MAX_EDGES;
    int         max_followers_per_node = Core::Constants::DEFAULT_MAX_PER_NODE;
    int         max_following_per_node = Core::Constants::DEFAULT_MAX_PER_NODE;
    int64_t     min_follower_count     = Core::Constants::DEFAULT_MIN_FOLLOWERS;
    int         page_limit             = Core::Constants::DEFAULT_PAGE_LIMIT;
    bool        prioritize_popular     = true;
    bool        resume                 = true;
    std::string scraper_type           = Core::Constants::SCRAPER_TYPE;

    // Seeding when no explicit seeds are given: search results for `seed_queries`,
    // otherwise the most popular nodes recorded by earlier crawls.
    std::vector<std::string> seed_queries;
    int                      search_pages     = Core::Constants::DEFAULT_SEARCH_PAGES;
    int                      prior_seed_limit = Core::Constants::PRIOR_SEED_LIMIT;
};

enum class TerminationReason { Completed, NodeBudget, EdgeBudget, Cancelled };

const char* to_string(TerminationReason reason);

struct CrawlSummary {
    uint64_t                   nodes_processed    = 0;
    uint64_t                   nodes_discovered   = 0;
    uint64_t                   edges_emitted      = 0;
    uint64_t                   duplicates_skipped = 0;
    uint64_t                   errors             = 0;
    int64_t                    elapsed_ms         = 0;
    int                        final_depth        = 0;
    TerminationReason          reason             = TerminationReason::Completed;
    bool                       resumed            = false;
    std::optional<std::string> last_checkpoint;

    nlohmann::json to_json() const;
};

// Everything the crawler talks to. Owned elsewhere; must outlive the crawler.
struct Services {
    const Core::Clock&           clock;
    Api::GraphApi&               api;
    Dedup::Deduplicator&         dedup;
    Checkpoint::CheckpointStore& checkpoints;
    Output::Sink&                sink;
    const Storage::Storage&      storage;  // earlier node batches, read when seeding
};

// Depth-bounded breadth-first traversal of the follow graph. The traversal itself is
// serial: one node at a time, one page at a time. Every suspension point is an API call.
class Crawler {
#ifndef CPPCHECK
    friend class CrawlerTest_CapUsesKnownCount_Test;
#endif

public:
    Crawler(CrawlerConfig config, Services services);

    // Restores the latest checkpoint when resuming, otherwise seeds depth 0 from `seeds`
    // (DIDs or handles), from search, or from prior discovery data, in that order of
    // preference. Always flushes output and writes a final checkpoint on exit.
    boost::asio::awaitable<CrawlSummary> run(std::vector<std::string> seeds);

    // Cooperative; observed between nodes and between pages.
    void stop();
    bool stop_requested() const {
        return stop_requested_.load();
    }

    const FrontierState& frontier() const {
        return frontier_;
    }

private:
    enum class NodeOutcome { Done, Interrupted };

    // lifecycle
    bool                         restore();
    boost::asio::awaitable<void> seed(const std::vector<std::string>& seeds);
    boost::asio::awaitable<void> seed_from_search(const std::vector<std::string>& queries);
    size_t                       seed_from_discovery();
    void                         emit_seed(const Api::Actor& actor, const std::string& strategy, const std::string& source);
    std::optional<std::string>   write_checkpoint(bool completed);
    void                         maybe_checkpoint();
    void                         finish(TerminationReason reason);
    nlohmann::json               checkpoint_metadata(bool completed) const;

    // traversal
    boost::asio::awaitable<NodeOutcome> process_node(const FrontierNode& node);
    boost::asio::awaitable<NodeOutcome> crawl_direction(const FrontierNode&         node,
                                                        Api::Direction              direction,
                                                        const ListingProgress*      resume,
                                                        std::vector<FrontierNode>& next_level);
    void admit(const FrontierNode&         source,
               const Api::Actor&           target,
               Api::Direction              direction,
               std::vector<FrontierNode>& next_level);
    int  cap_for(const FrontierNode& node, Api::Direction direction) const;

    bool node_budget_reached() const;
    bool edge_budget_reached() const;

    CrawlerConfig              config_;
    Services                   services_;
    FrontierState              frontier_;
    std::atomic<bool>          stop_requested_{false};
    bool                       resumed_ = false;
    int                        deepest_ = 0;
    std::optional<std::string> last_checkpoint_;
};

}  // namespace Engine
}  // namespace Trawl

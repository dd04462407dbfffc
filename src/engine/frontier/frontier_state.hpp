#pragma once
#include <cstdint>
#include <deque>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "../../api/graph_api.hpp"

namespace Trawl {
namespace Engine {

struct FrontierNode {
    std::string            did;
    std::string            handle;
    std::optional<int64_t> followers_count;
    std::optional<int64_t> follows_count;
    int                    depth = 0;

    bool operator==(const FrontierNode& other) const = default;
};

struct CrawlCounters {
    uint64_t nodes_processed    = 0;
    uint64_t nodes_discovered   = 0;
    uint64_t edges_emitted      = 0;
    uint64_t duplicates_skipped = 0;
    uint64_t errors             = 0;

    bool operator==(const CrawlCounters& other) const = default;
};

// Where an interrupted listing stopped. `fetched` counts entries taken before the page at
// `cursor`; `consumed` counts entries already taken from that page.
struct ListingProgress {
    std::string                did;
    Api::Direction             direction = Api::Direction::Followers;
    std::optional<std::string> cursor;
    int                        fetched  = 0;
    int                        consumed = 0;

    bool operator==(const ListingProgress& other) const = default;
};

// One FIFO per depth 0..max_depth, the visited set, the discovered set (anything ever
// enqueued) and the counters. Serializes to JSON for checkpoints and back without loss.
class FrontierState {
public:
    explicit FrontierState(int max_depth = 0);

    // False when the node is past max_depth or was already enqueued this session.
    bool enqueue(const FrontierNode& node);
    // Enqueues in descending follower order when `by_popularity`, otherwise as given.
    size_t enqueue_batch(std::vector<FrontierNode> nodes, bool by_popularity);

    // Next node at the lowest non-empty depth. Moves the depth pointer forward as
    // levels drain; never moves it back.
    std::optional<FrontierNode> next();

    bool mark_visited(const std::string& did);
    // Puts an interrupted node back at the head of its level and forgets the visit.
    void requeue(const FrontierNode& node);
    bool is_visited(const std::string& did) const;
    void set_progress(ListingProgress progress) {
        progress_ = std::move(progress);
    }
    // Hands back the saved listing position when it belongs to `did`; clears it either way.
    std::optional<ListingProgress> take_progress(const std::string& did);
    const std::optional<ListingProgress>& progress() const {
        return progress_;
    }
    bool is_discovered(const std::string& did) const;

    int    max_depth() const {
        return max_depth_;
    }
    int    current_depth() const {
        return current_depth_;
    }
    size_t pending(int depth) const;
    size_t total_pending() const;
    size_t visited_count() const {
        return visited_.size();
    }

    CrawlCounters&       counters() {
        return counters_;
    }
    const CrawlCounters& counters() const {
        return counters_;
    }

    nlohmann::json       to_json() const;
    // Throws Core::ValidationError on a malformed snapshot.
    static FrontierState from_json(const nlohmann::json& j);

    bool operator==(const FrontierState& other) const = default;

private:
    int                                   max_depth_;
    int                                   current_depth_ = 0;
    std::vector<std::deque<FrontierNode>> queues_;
    std::set<std::string>                 visited_;
    std::set<std::string>                 discovered_;
    CrawlCounters                         counters_;
    std::optional<ListingProgress>        progress_;
};

void           to_json(nlohmann::json& j, const FrontierNode& node);
void           from_json(const nlohmann::json& j, FrontierNode& node);

}  // namespace Engine
}  // namespace Trawl

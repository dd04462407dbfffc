#include "frontier_state.hpp"
#include <algorithm>
#include "../../core/errors/errors.hpp"

namespace Trawl {
namespace Engine {

using json = nlohmann::json;

void to_json(json& j, const FrontierNode& node) {
    j = json{{"did", node.did}, {"handle", node.handle}, {"depth", node.depth}};
    if (node.followers_count)
        j["followersCount"] = *node.followers_count;
    if (node.follows_count)
        j["followsCount"] = *node.follows_count;
}

void from_json(const json& j, FrontierNode& node) {
    node.did    = j.at("did").get<std::string>();
    node.handle = j.value("handle", "");
    node.depth  = j.at("depth").get<int>();
    node.followers_count.reset();
    node.follows_count.reset();
    if (j.contains("followersCount"))
        node.followers_count = j["followersCount"].get<int64_t>();
    if (j.contains("followsCount"))
        node.follows_count = j["followsCount"].get<int64_t>();
}

FrontierState::FrontierState(int max_depth)
    : max_depth_(std::max(0, max_depth)), queues_(static_cast<size_t>(max_depth_) + 1) {
}

bool FrontierState::enqueue(const FrontierNode& node) {
    if (node.did.empty() || node.depth < 0 || node.depth > max_depth_)
        return false;
    if (!discovered_.insert(node.did).second)
        return false;
    queues_[static_cast<size_t>(node.depth)].push_back(node);
    ++counters_.nodes_discovered;
    return true;
}

size_t FrontierState::enqueue_batch(std::vector<FrontierNode> nodes, bool by_popularity) {
    if (by_popularity) {
        std::stable_sort(nodes.begin(), nodes.end(), [](const FrontierNode& a, const FrontierNode& b) {
            return a.followers_count.value_or(0) > b.followers_count.value_or(0);
        });
    }
    size_t added = 0;
    for (const auto& node : nodes) {
        if (enqueue(node))
            ++added;
    }
    return added;
}

std::optional<FrontierNode> FrontierState::next() {
    while (current_depth_ <= max_depth_) {
        auto& queue = queues_[static_cast<size_t>(current_depth_)];
        while (!queue.empty()) {
            FrontierNode node = std::move(queue.front());
            queue.pop_front();
            if (!visited_.count(node.did))
                return node;
        }
        if (current_depth_ == max_depth_)
            break;
        ++current_depth_;
    }
    return std::nullopt;
}

bool FrontierState::mark_visited(const std::string& did) {
    return visited_.insert(did).second;
}

void FrontierState::requeue(const FrontierNode& node) {
    if (node.depth < 0 || node.depth > max_depth_)
        return;
    visited_.erase(node.did);
    queues_[static_cast<size_t>(node.depth)].push_front(node);
    current_depth_ = std::min(current_depth_, node.depth);
}

bool FrontierState::is_visited(const std::string& did) const {
    return visited_.count(did) > 0;
}

std::optional<ListingProgress> FrontierState::take_progress(const std::string& did) {
    std::optional<ListingProgress> progress = std::move(progress_);
    progress_.reset();
    if (progress && progress->did != did)
        return std::nullopt;
    return progress;
}

bool FrontierState::is_discovered(const std::string& did) const {
    return discovered_.count(did) > 0;
}

size_t FrontierState::pending(int depth) const {
    if (depth < 0 || depth > max_depth_)
        return 0;
    return queues_[static_cast<size_t>(depth)].size();
}

size_t FrontierState::total_pending() const {
    size_t total = 0;
    for (const auto& queue : queues_)
        total += queue.size();
    return total;
}

json FrontierState::to_json() const {
    json queues = json::object();
    for (size_t depth = 0; depth < queues_.size(); ++depth)
        queues[std::to_string(depth)] = json(queues_[depth]);

    json j = json{{"maxDepth", max_depth_},
                {"currentDepth", current_depth_},
                {"depthQueues", queues},
                {"visited", visited_},
                {"discovered", discovered_},
                {"counters",
                 {{"nodesProcessed", counters_.nodes_processed},
                  {"nodesDiscovered", counters_.nodes_discovered},
                  {"edgesEmitted", counters_.edges_emitted},
                  {"duplicatesSkipped", counters_.duplicates_skipped},
                  {"errors", counters_.errors}}}};
    if (progress_) {
        j["inProgress"] = {{"did", progress_->did},
                           {"direction", Api::to_string(progress_->direction)},
                           {"cursor", progress_->cursor ? json(*progress_->cursor) : json(nullptr)},
                           {"fetched", progress_->fetched},
                           {"consumed", progress_->consumed}};
    }
    return j;
}

FrontierState FrontierState::from_json(const json& j) {
    try {
        FrontierState state(j.at("maxDepth").get<int>());
        state.current_depth_ = std::clamp(j.at("currentDepth").get<int>(), 0, state.max_depth_);

        for (const auto& [key, nodes] : j.at("depthQueues").items()) {
            int depth = std::stoi(key);
            if (depth < 0 || depth > state.max_depth_)
                throw Core::ValidationError("frontier queue depth out of range: " + key);
            state.queues_[static_cast<size_t>(depth)] = nodes.get<std::deque<FrontierNode>>();
        }
        state.visited_    = j.at("visited").get<std::set<std::string>>();
        state.discovered_ = j.at("discovered").get<std::set<std::string>>();

        const json& c                        = j.at("counters");
        state.counters_.nodes_processed    = c.value("nodesProcessed", uint64_t{0});
        state.counters_.nodes_discovered   = c.value("nodesDiscovered", uint64_t{0});
        state.counters_.edges_emitted      = c.value("edgesEmitted", uint64_t{0});
        state.counters_.duplicates_skipped = c.value("duplicatesSkipped", uint64_t{0});
        state.counters_.errors             = c.value("errors", uint64_t{0});

        if (j.contains("inProgress") && !j["inProgress"].is_null()) {
            const json&     p         = j["inProgress"];
            ListingProgress progress;
            progress.did              = p.at("did").get<std::string>();
            const auto direction      = p.at("direction").get<std::string>();
            if (direction == Api::to_string(Api::Direction::Followers))
                progress.direction = Api::Direction::Followers;
            else if (direction == Api::to_string(Api::Direction::Follows))
                progress.direction = Api::Direction::Follows;
            else
                throw Core::ValidationError("unknown listing direction: " + direction);
            if (p.contains("cursor") && p["cursor"].is_string())
                progress.cursor = p["cursor"].get<std::string>();
            progress.fetched  = std::max(0, p.value("fetched", 0));
            progress.consumed = std::max(0, p.value("consumed", 0));
            state.progress_   = std::move(progress);
        }
        return state;
    } catch (const json::exception& e) {
        throw Core::ValidationError(std::string("malformed frontier snapshot: ") + e.what());
    } catch (const std::logic_error& e) {
        throw Core::ValidationError(std::string("malformed frontier snapshot: ") + e.what());
    }
}

}  // namespace Engine
}  // namespace Trawl

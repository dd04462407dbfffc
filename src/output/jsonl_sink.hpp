#pragma once
#include <mutex>
#include <nlohmann/json.hpp>
#include "../core/types/constants.hpp"
#include "../storage/storage.hpp"
#include "sink.hpp"

namespace Trawl {
namespace Output {

// One JSON object per line; each flushed batch becomes
// <kind>/<kind>_<session>_<batch>.jsonl under the storage root.
class JsonlSink : public Sink {
public:
    JsonlSink(Storage::Storage& storage,
              std::string       session_id,
              size_t            batch_size = Core::Constants::DEFAULT_BATCH_SIZE);
    ~JsonlSink() override;

    void   write_nodes(std::vector<NodeRecord> nodes) override;
    void   write_edges(std::vector<EdgeRecord> edges) override;
    bool   flush() override;
    size_t pending() const override;

    size_t batches_written() const;

    static nlohmann::json to_json(const NodeRecord& record);
    static nlohmann::json to_json(const EdgeRecord& record);

private:
    // Caller holds mutex_.
    bool flush_kind(const std::string& kind, std::vector<nlohmann::json>& buffer, size_t& batch);

    Storage::Storage&           storage_;
    std::string                 session_id_;
    size_t                      batch_size_;
    std::vector<nlohmann::json> nodes_;
    std::vector<nlohmann::json> edges_;
    size_t                      node_batch_ = 0;
    size_t                      edge_batch_ = 0;
    mutable std::mutex          mutex_;
};

}  // namespace Output
}  // namespace Trawl

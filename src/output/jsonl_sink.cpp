#include "jsonl_sink.hpp"
#include "../api/response_parser.hpp"
#include "../core/logger/logger.hpp"

namespace Trawl {
namespace Output {

using json = nlohmann::json;
using Trawl::Core::Logger;

namespace {
json provenance_json(const Provenance& p) {
    return json{{"strategy", p.strategy},
                {"depth", p.depth},
                {"discoveredAt", Core::to_iso8601(p.discovered_at)},
                {"source", p.source},
                {"scraper", Core::Constants::SCRAPER_TYPE},
                {"version", Core::Constants::VERSION}};
}
}  // namespace

JsonlSink::JsonlSink(Storage::Storage& storage, std::string session_id, size_t batch_size)
    : storage_(storage), session_id_(std::move(session_id)), batch_size_(batch_size) {
    // A resumed session keeps numbering after the batches it already wrote.
    for (const std::string kind : {"nodes", "edges"}) {
        std::string prefix = kind + "/" + kind + "_" + session_id_ + "_";
        size_t      count  = 0;
        for (const auto& key : storage_.list(kind)) {
            if (key.rfind(prefix, 0) == 0)
                ++count;
        }
        (kind == "nodes" ? node_batch_ : edge_batch_) = count;
    }
}

JsonlSink::~JsonlSink() {
    if (pending() > 0 && !flush())
        Logger::error("Output sink destroyed with unflushed records");
}

json JsonlSink::to_json(const NodeRecord& record) {
    json j        = Api::ResponseParser::to_json(record.actor);
    j["_metadata"] = provenance_json(record.provenance);
    return j;
}

json JsonlSink::to_json(const EdgeRecord& record) {
    return json{{"source", {{"did", record.source}, {"handle", record.source_handle}}},
                {"target", Api::ResponseParser::to_json(record.target)},
                {"type", Api::to_string(record.direction)},
                {"depth", record.provenance.depth},
                {"_metadata", provenance_json(record.provenance)}};
}

void JsonlSink::write_nodes(std::vector<NodeRecord> nodes) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& node : nodes)
        nodes_.push_back(to_json(node));
    if (nodes_.size() >= batch_size_)
        flush_kind("nodes", nodes_, node_batch_);
}

void JsonlSink::write_edges(std::vector<EdgeRecord> edges) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& edge : edges)
        edges_.push_back(to_json(edge));
    if (edges_.size() >= batch_size_)
        flush_kind("edges", edges_, edge_batch_);
}

bool JsonlSink::flush_kind(const std::string& kind, std::vector<json>& buffer, size_t& batch) {
    if (buffer.empty())
        return true;

    std::string body;
    for (const auto& record : buffer) {
        body += record.dump();
        body += '\n';
    }

    std::string key = kind + "/" + kind + "_" + session_id_ + "_" + std::to_string(batch + 1)
                      + ".jsonl";
    if (!storage_.save(key, body)) {
        Logger::error("Failed to write " + kind + " batch; keeping "
                      + std::to_string(buffer.size()) + " records buffered");
        return false;
    }

    ++batch;
    Logger::info("Wrote " + std::to_string(buffer.size()) + " " + kind + " to " + key);
    buffer.clear();
    return true;
}

bool JsonlSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool                        nodes_ok = flush_kind("nodes", nodes_, node_batch_);
    bool                        edges_ok = flush_kind("edges", edges_, edge_batch_);
    return nodes_ok && edges_ok;
}

size_t JsonlSink::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size() + edges_.size();
}

size_t JsonlSink::batches_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return node_batch_ + edge_batch_;
}

}  // namespace Output
}  // namespace Trawl

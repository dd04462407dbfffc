#pragma once
#include <string>
#include <vector>
#include "../api/graph_api.hpp"
#include "../core/clock/clock.hpp"

namespace Trawl {
namespace Output {

struct Provenance {
    std::string     strategy = "bfs";
    int             depth    = 0;
    Core::TimePoint discovered_at{};
    std::string     source;  // DID of the node whose listing produced the record, or the search query
};

struct NodeRecord {
    Api::Actor actor;
    Provenance provenance;
};

struct EdgeRecord {
    std::string    source;
    std::string    source_handle;
    Api::Actor     target;
    Api::Direction direction = Api::Direction::Followers;
    Provenance     provenance;
};

// Downstream persistence for discovered nodes and edges. Records stay buffered
// until a flush succeeds.
class Sink {
public:
    virtual ~Sink() = default;

    virtual void   write_nodes(std::vector<NodeRecord> nodes) = 0;
    virtual void   write_edges(std::vector<EdgeRecord> edges) = 0;
    virtual bool   flush()                                    = 0;
    virtual size_t pending() const                            = 0;
};

}  // namespace Output
}  // namespace Trawl

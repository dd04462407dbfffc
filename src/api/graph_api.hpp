#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Trawl {
namespace Api {

enum class Direction { Followers, Follows };

const char* to_string(Direction direction);

struct Actor {
    std::string                did;     // required
    std::string                handle;  // required
    std::string                display_name;
    std::optional<int64_t>     followers_count;
    std::optional<int64_t>     follows_count;
    std::optional<int64_t>     posts_count;
    std::optional<std::string> indexed_at;
};

struct EdgePage {
    std::vector<Actor>         items;
    std::optional<std::string> cursor;  // absent = end of listing
    size_t                     dropped = 0;
};

struct SearchPage {
    std::vector<Actor>         actors;
    std::optional<std::string> cursor;
    size_t                     dropped = 0;
};

// Read-only view of the upstream social graph. Failures that outlive the retry policy
// surface as Core::ApiError.
class GraphApi {
public:
    virtual ~GraphApi() = default;

    virtual boost::asio::awaitable<Actor>    get_profile(const std::string& actor) = 0;
    virtual boost::asio::awaitable<EdgePage> list_edges(const std::string&                actor,
                                                        Direction                         direction,
                                                        const std::optional<std::string>& cursor,
                                                        int                               limit) = 0;
    virtual boost::asio::awaitable<SearchPage> search_actors(const std::string&                query,
                                                             const std::optional<std::string>& cursor,
                                                             int limit) = 0;
};

}  // namespace Api
}  // namespace Trawl

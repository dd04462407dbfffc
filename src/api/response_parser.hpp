#pragma once
#include <nlohmann/json.hpp>
#include "graph_api.hpp"

namespace Trawl {
namespace Api {

// Turns upstream JSON into the tagged structures above. Entities missing a required
// field throw Core::ValidationError; inside a page they are dropped and counted instead.
class ResponseParser {
public:
    static Actor      parse_actor(const nlohmann::json& j);
    static Actor      parse_profile(const std::string& body);
    static EdgePage   parse_edge_page(const std::string& body, Direction direction);
    static SearchPage parse_search_page(const std::string& body);

    static nlohmann::json to_json(const Actor& actor);

private:
    static nlohmann::json                 parse_body(const std::string& body);
    static std::optional<std::string>     cursor_of(const nlohmann::json& j);
    static std::vector<Actor>             parse_list(const nlohmann::json& list, size_t& dropped);
};

}  // namespace Api
}  // namespace Trawl

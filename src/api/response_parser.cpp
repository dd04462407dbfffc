#include "response_parser.hpp"
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"

namespace Trawl {
namespace Api {

using json = nlohmann::json;
using Trawl::Core::Logger;
using Trawl::Core::ValidationError;

const char* to_string(Direction direction) {
    return direction == Direction::Followers ? "followers" : "follows";
}

namespace {
std::optional<int64_t> optional_count(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer())
        return std::nullopt;
    int64_t value = it->get<int64_t>();
    if (value < 0)
        return std::nullopt;
    return value;
}

std::string required_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string() || it->get_ref<const std::string&>().empty())
        throw ValidationError(std::string("actor is missing '") + key + "'");
    return it->get<std::string>();
}
}  // namespace

json ResponseParser::parse_body(const std::string& body) {
    try {
        json j = json::parse(body);
        if (!j.is_object())
            throw ValidationError("response body is not a JSON object");
        return j;
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("response body is not JSON: ") + e.what());
    }
}

Actor ResponseParser::parse_actor(const json& j) {
    if (!j.is_object())
        throw ValidationError("actor is not an object");

    Actor actor;
    actor.did    = required_string(j, "did");
    actor.handle = required_string(j, "handle");
    if (!Utils::Text::starts_with(actor.did, "did:"))
        throw ValidationError("actor did is malformed: " + actor.did);

    actor.display_name    = j.value("displayName", "");
    actor.followers_count = optional_count(j, "followersCount");
    actor.follows_count   = optional_count(j, "followsCount");
    actor.posts_count     = optional_count(j, "postsCount");
    if (j.contains("indexedAt") && j["indexedAt"].is_string())
        actor.indexed_at = j["indexedAt"].get<std::string>();
    return actor;
}

std::optional<std::string> ResponseParser::cursor_of(const json& j) {
    auto it = j.find("cursor");
    if (it == j.end() || !it->is_string() || it->get_ref<const std::string&>().empty())
        return std::nullopt;
    return it->get<std::string>();
}

std::vector<Actor> ResponseParser::parse_list(const json& list, size_t& dropped) {
    std::vector<Actor> out;
    if (!list.is_array())
        return out;
    out.reserve(list.size());
    for (const auto& item : list) {
        try {
            out.push_back(parse_actor(item));
        } catch (const ValidationError& e) {
            ++dropped;
            Logger::debug(std::string("Dropped actor: ") + e.what());
        }
    }
    return out;
}

Actor ResponseParser::parse_profile(const std::string& body) {
    return parse_actor(parse_body(body));
}

EdgePage ResponseParser::parse_edge_page(const std::string& body, Direction direction) {
    json        j   = parse_body(body);
    const char* key = to_string(direction);
    if (!j.contains(key))
        throw ValidationError(std::string("edge listing has no '") + key + "' array");

    EdgePage page;
    page.items  = parse_list(j[key], page.dropped);
    page.cursor = cursor_of(j);
    return page;
}

SearchPage ResponseParser::parse_search_page(const std::string& body) {
    json       j = parse_body(body);
    SearchPage page;
    page.actors = parse_list(j.value("actors", json::array()), page.dropped);
    page.cursor = cursor_of(j);
    return page;
}

json ResponseParser::to_json(const Actor& actor) {
    json j{{"did", actor.did}, {"handle", actor.handle}};
    if (!actor.display_name.empty())
        j["displayName"] = actor.display_name;
    if (actor.followers_count)
        j["followersCount"] = *actor.followers_count;
    if (actor.follows_count)
        j["followsCount"] = *actor.follows_count;
    if (actor.posts_count)
        j["postsCount"] = *actor.posts_count;
    if (actor.indexed_at)
        j["indexedAt"] = *actor.indexed_at;
    return j;
}

}  // namespace Api
}  // namespace Trawl

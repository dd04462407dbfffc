#pragma once
#include <string>
#include <utility>
#include <vector>

namespace Trawl {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string username;
    std::string password;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

class Url {
public:
    static UrlParsed parse(const std::string& url);

    // Percent-encodes via libcurl. Empty values are skipped.
    static std::string encode_component(const std::string& value);
    static std::string build_query(const QueryParams& params);

    // "host:port" when the port differs from the scheme default, "host" otherwise.
    static std::string authority(const UrlParsed& url);
    static std::string default_port(const std::string& scheme);
};

}  // namespace Utils
}  // namespace Trawl

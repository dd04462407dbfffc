#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Trawl {
namespace Store {

// Shared state backend. Every operation throws Core::StoreUnavailableError when the
// backend cannot be reached; callers decide whether to degrade or propagate.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key)                          = 0;
    virtual void                       set(const std::string& key, const std::string& value) = 0;
    virtual void set_ex(const std::string& key, const std::string& value, int64_t ttl_seconds) = 0;
    virtual bool exists(const std::string& key)                                                = 0;
    virtual bool del(const std::string& key)                                                   = 0;
    virtual std::vector<std::string> keys(const std::string& prefix)                           = 0;

    virtual bool                     sadd(const std::string& key, const std::string& member)      = 0;
    virtual bool                     srem(const std::string& key, const std::string& member)      = 0;
    virtual bool                     sismember(const std::string& key, const std::string& member) = 0;
    virtual std::vector<std::string> smembers(const std::string& key)                             = 0;
    virtual int64_t                  scard(const std::string& key)                                = 0;

    virtual void hset(const std::string& key, const std::string& field, const std::string& value) = 0;
    virtual std::map<std::string, std::string> hgetall(const std::string& key)                    = 0;
    virtual int64_t                            incr(const std::string& key)                       = 0;

    virtual bool        ping()       = 0;
    virtual std::string name() const = 0;
};

}  // namespace Store
}  // namespace Trawl

#pragma once
#include <memory>
#include <sw/redis++/redis++.h>
#include "key_value_store.hpp"

namespace Trawl {
namespace Store {

class RedisStore : public KeyValueStore {
public:
    // Accepts redis://[:password@]host:port[/db]. Connection is lazy; the first
    // command surfaces an unreachable server as StoreUnavailableError.
    explicit RedisStore(const std::string& url);

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    void set_ex(const std::string& key, const std::string& value, int64_t ttl_seconds) override;
    bool exists(const std::string& key) override;
    bool del(const std::string& key) override;
    std::vector<std::string> keys(const std::string& prefix) override;

    bool                     sadd(const std::string& key, const std::string& member) override;
    bool                     srem(const std::string& key, const std::string& member) override;
    bool                     sismember(const std::string& key, const std::string& member) override;
    std::vector<std::string> smembers(const std::string& key) override;
    int64_t                  scard(const std::string& key) override;

    void hset(const std::string& key, const std::string& field, const std::string& value) override;
    std::map<std::string, std::string> hgetall(const std::string& key) override;
    int64_t                            incr(const std::string& key) override;

    bool        ping() override;
    std::string name() const override {
        return "redis";
    }

private:
    template <typename Fn>
    auto guarded(const char* op, Fn&& fn) -> decltype(fn());

    std::string                       url_;
    std::shared_ptr<sw::redis::Redis> redis_;
};

}  // namespace Store
}  // namespace Trawl

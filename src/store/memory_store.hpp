#pragma once
#include <mutex>
#include <set>
#include <unordered_map>
#include "../core/clock/clock.hpp"
#include "key_value_store.hpp"

namespace Trawl {
namespace Store {

// In-process store. Used when no Redis URL is configured, and as the fallback when Redis drops.
class MemoryStore : public KeyValueStore {
public:
    explicit MemoryStore(const Core::Clock& clock) : clock_(clock) {
    }

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

    bool ping() override {
        return true;
    }
    std::string name() const override {
        return "memory";
    }

    size_t size();

private:
    struct Entry {
        std::string                        value;
        std::map<std::string, std::string> hash;
        std::set<std::string>              members;
        std::optional<Core::TimePoint>     expires_at;
    };

    // Caller holds mutex_. Drops the entry if its TTL has passed.
    Entry* find_live(const std::string& key);

    const Core::Clock&                     clock_;
    std::mutex                             mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace Store
}  // namespace Trawl

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "../core/clock/clock.hpp"
#include "../core/types/constants.hpp"
#include "../store/memory_store.hpp"
#include "../utils/crypto/bloom_filter.hpp"

namespace Trawl {
namespace Core {
class StoreUnavailableError;
}
namespace Dedup {

enum class Namespace { Node, Edge };

const char* to_string(Namespace ns);

struct DedupConfig {
    int64_t     expected_nodes     = Core::Constants::DEFAULT_BLOOM_EXPECTED;
    double      false_positive_rate = Core::Constants::DEFAULT_BLOOM_FP_RATE;
    int         edge_factor        = Core::Constants::EDGE_CARDINALITY_FACTOR;
    int64_t     ttl_seconds        = Core::Constants::DEFAULT_DEDUP_TTL_SECONDS;
    std::string key_prefix         = Core::Constants::KEY_PREFIX;
};

struct BatchCheck {
    std::vector<std::string> duplicates;
    std::vector<std::string> fresh;
};

struct NamespaceStats {
    uint64_t checked            = 0;
    uint64_t duplicates         = 0;
    uint64_t added              = 0;
    uint64_t filter_negatives   = 0;  // answered without touching the store
    uint64_t store_checks       = 0;
    size_t   bit_count          = 0;
    int      hash_count         = 0;
    double   estimated_fp_rate  = 0;
};

// Two-tier "seen before?" check: a per-namespace bloom filter in front of TTL'd records
// in the key-value store. A filter miss answers "new" without a store round-trip; a
// filter hit is confirmed against the store, so records that expired become "new" again.
class Deduplicator {
public:
    Deduplicator(DedupConfig config, Store::KeyValueStore& store, const Core::Clock& clock);

    // "source:target:direction"
    static std::string edge_key(const std::string& source,
                                const std::string& target,
                                const std::string& direction);

    bool       is_duplicate(const std::string& id, Namespace ns);
    void       mark_processed(const std::string& id, Namespace ns, const nlohmann::json& metadata = {});
    BatchCheck check_batch(const std::vector<std::string>& ids, Namespace ns);

    bool save_filters();
    bool load_filters();
    void clear(Namespace ns);

    NamespaceStats stats(Namespace ns);
    bool           degraded() const;

    std::string record_key(const std::string& id, Namespace ns) const;
    std::string filter_key(Namespace ns) const;

private:
    struct State {
        std::unique_ptr<Utils::Crypto::BloomFilter> filter;
        NamespaceStats                              stats;
    };

    Store::KeyValueStore& store();
    void                  degrade(const Core::StoreUnavailableError& e);
    State&                state(Namespace ns);

    DedupConfig                         config_;
    Store::KeyValueStore*               primary_;
    const Core::Clock&                  clock_;
    std::unique_ptr<Store::MemoryStore> fallback_;
    std::map<Namespace, State>          states_;
    mutable std::mutex                  mutex_;
};

}  // namespace Dedup
}  // namespace Trawl

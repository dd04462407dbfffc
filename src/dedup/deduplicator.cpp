#include "deduplicator.hpp"
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"
#include "../utils/crypto/sha256.hpp"

namespace Trawl {
namespace Dedup {

using namespace Trawl::Core;
using Trawl::Utils::Crypto::BloomFilter;
using json = nlohmann::json;

const char* to_string(Namespace ns) {
    switch (ns) {
        case Namespace::Node:
            return "node";
        case Namespace::Edge:
            return "edge";
    }
    return "unknown";
}

Deduplicator::Deduplicator(DedupConfig config, Store::KeyValueStore& store, const Clock& clock)
    : config_(std::move(config)), primary_(&store), clock_(clock) {
    auto expected = static_cast<size_t>(config_.expected_nodes);
    const std::pair<Namespace, size_t> sizes[] = {
        {Namespace::Node, expected},
        {Namespace::Edge, expected * static_cast<size_t>(config_.edge_factor)},
    };
    for (const auto& [ns, n] : sizes) {
        State st;
        st.filter = BloomFilter::with_capacity(n, config_.false_positive_rate);
        Logger::debug(std::string("Bloom filter ") + to_string(ns) + ": "
                      + std::to_string(st.filter->bit_count()) + " bits, "
                      + std::to_string(st.filter->hash_count()) + " hashes");
        states_.emplace(ns, std::move(st));
    }
}

std::string Deduplicator::edge_key(const std::string& source,
                                   const std::string& target,
                                   const std::string& direction) {
    return source + ":" + target + ":" + direction;
}

std::string Deduplicator::record_key(const std::string& id, Namespace ns) const {
    return config_.key_prefix + "dedup:" + to_string(ns) + ":" + Utils::Crypto::sha256_hex(id);
}

std::string Deduplicator::filter_key(Namespace ns) const {
    return config_.key_prefix + "bloom:" + to_string(ns);
}

Deduplicator::State& Deduplicator::state(Namespace ns) {
    return states_.at(ns);
}

Store::KeyValueStore& Deduplicator::store() {
    return fallback_ ? *fallback_ : *primary_;
}

bool Deduplicator::degraded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fallback_ != nullptr;
}

void Deduplicator::degrade(const StoreUnavailableError& e) {
    if (fallback_)
        return;
    fallback_ = std::make_unique<Store::MemoryStore>(clock_);
    Logger::warn(std::string("Dedup store unavailable, continuing in-process only: ") + e.what());
}

bool Deduplicator::is_duplicate(const std::string& id, Namespace ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    State&                      st = state(ns);
    ++st.stats.checked;

    if (!st.filter->contains(id)) {
        ++st.stats.filter_negatives;
        return false;
    }

    bool duplicate = false;
    if (fallback_) {
        // Records written before the outage are gone; the filter is the best evidence left.
        duplicate = true;
    }
    else {
        ++st.stats.store_checks;
        try {
            duplicate = primary_->exists(record_key(id, ns));
        } catch (const StoreUnavailableError& e) {
            degrade(e);
            duplicate = true;
        }
    }

    if (duplicate)
        ++st.stats.duplicates;
    return duplicate;
}

void Deduplicator::mark_processed(const std::string& id, Namespace ns, const json& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    State&                      st = state(ns);
    st.filter->add(id);
    ++st.stats.added;

    json record = metadata.is_object() ? metadata : json::object();
    record["id"]        = id;
    record["namespace"] = to_string(ns);
    if (!record.contains("discoveredAt"))
        record["discoveredAt"] = to_iso8601(clock_.now());

    try {
        store().set_ex(record_key(id, ns), record.dump(), config_.ttl_seconds);
    } catch (const StoreUnavailableError& e) {
        degrade(e);
        fallback_->set_ex(record_key(id, ns), record.dump(), config_.ttl_seconds);
    }
}

BatchCheck Deduplicator::check_batch(const std::vector<std::string>& ids, Namespace ns) {
    BatchCheck result;
    for (const auto& id : ids) {
        if (is_duplicate(id, ns))
            result.duplicates.push_back(id);
        else
            result.fresh.push_back(id);
    }
    return result;
}

bool Deduplicator::save_filters() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        for (const auto& [ns, st] : states_) {
            auto blob = st.filter->serialize();
            store().set(filter_key(ns), std::string(blob.begin(), blob.end()));
        }
    } catch (const StoreUnavailableError& e) {
        degrade(e);
        return false;
    }
    Logger::debug("Bloom filters saved");
    return fallback_ == nullptr;
}

bool Deduplicator::load_filters() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t                      loaded = 0;
    for (auto& [ns, st] : states_) {
        std::optional<std::string> blob;
        try {
            blob = store().get(filter_key(ns));
        } catch (const StoreUnavailableError& e) {
            degrade(e);
            return false;
        }
        if (!blob)
            continue;

        try {
            st.filter = BloomFilter::deserialize(std::vector<uint8_t>(blob->begin(), blob->end()));
            ++loaded;
        } catch (const std::exception& e) {
            Logger::warn(std::string("Discarding unreadable bloom filter for ") + to_string(ns)
                         + ": " + e.what());
        }
    }
    if (loaded > 0)
        Logger::info("Restored " + std::to_string(loaded) + " bloom filters");
    return loaded > 0;
}

void Deduplicator::clear(Namespace ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    State&                      st = state(ns);
    st.filter->clear();
    st.stats = NamespaceStats{};

    try {
        Store::KeyValueStore& kv = store();
        for (const auto& key : kv.keys(config_.key_prefix + "dedup:" + to_string(ns) + ":"))
            kv.del(key);
        kv.del(filter_key(ns));
    } catch (const StoreUnavailableError& e) {
        degrade(e);
    }
    Logger::info(std::string("Cleared dedup namespace ") + to_string(ns));
}

NamespaceStats Deduplicator::stats(Namespace ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    State&                      st  = state(ns);
    NamespaceStats              out = st.stats;
    out.bit_count                   = st.filter->bit_count();
    out.hash_count                  = st.filter->hash_count();
    out.estimated_fp_rate           = st.filter->estimated_false_positive_rate();
    return out;
}

}  // namespace Dedup
}  // namespace Trawl

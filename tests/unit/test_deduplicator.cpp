#include <gtest/gtest.h>
#include "../../src/core/clock/clock.hpp"
#include "../../src/dedup/deduplicator.hpp"
#include "../../src/store/memory_store.hpp"
#include "../../src/utils/crypto/sha256.hpp"
#include "../support/fakes.hpp"

using namespace Trawl::Dedup;
using Trawl::Core::ManualClock;
using Trawl::Core::Millis;
using Trawl::Store::MemoryStore;

namespace {

DedupConfig small_config(int64_t ttl_seconds = 3600) {
    DedupConfig config;
    config.expected_nodes = 1000;
    config.ttl_seconds    = ttl_seconds;
    return config;
}

}  // namespace

TEST(DeduplicatorTest, MarkThenDuplicateAtScale) {
    ManualClock clock;
    MemoryStore store(clock);
    DedupConfig config;
    config.expected_nodes      = 1000000;
    config.false_positive_rate = 0.01;
    Deduplicator dedup(config, store, clock);

    EXPECT_FALSE(dedup.is_duplicate("did:plc:alice", Namespace::Node));
    dedup.mark_processed("did:plc:alice", Namespace::Node);
    EXPECT_TRUE(dedup.is_duplicate("did:plc:alice", Namespace::Node));
    EXPECT_EQ(dedup.stats(Namespace::Node).bit_count, 9585059u);
}

TEST(DeduplicatorTest, NamespacesAreIndependent) {
    ManualClock  clock;
    MemoryStore  store(clock);
    Deduplicator dedup(small_config(), store, clock);

    dedup.mark_processed("did:plc:alice", Namespace::Node);
    EXPECT_FALSE(dedup.is_duplicate("did:plc:alice", Namespace::Edge));
    EXPECT_TRUE(dedup.is_duplicate("did:plc:alice", Namespace::Node));
}

TEST(DeduplicatorTest, RecordKeyAndEdgeKeyFormats) {
    ManualClock  clock;
    MemoryStore  store(clock);
    Deduplicator dedup(small_config(), store, clock);

    EXPECT_EQ(Deduplicator::edge_key("did:plc:a", "did:plc:b", "followers"),
              "did:plc:a:did:plc:b:followers");
    EXPECT_EQ(dedup.record_key("x", Namespace::Edge),
              "trawl:dedup:edge:" + Trawl::Utils::Crypto::sha256_hex("x"));
    EXPECT_EQ(dedup.filter_key(Namespace::Node), "trawl:bloom:node");
}

TEST(DeduplicatorTest, RecordCarriesMetadata) {
    ManualClock  clock;
    MemoryStore  store(clock);
    Deduplicator dedup(small_config(), store, clock);

    dedup.mark_processed("did:plc:alice", Namespace::Node, {{"handle", "alice.bsky.social"}, {"depth", 1}});
    auto raw = store.get(dedup.record_key("did:plc:alice", Namespace::Node));
    ASSERT_TRUE(raw.has_value());

    auto record = nlohmann::json::parse(*raw);
    EXPECT_EQ(record["id"], "did:plc:alice");
    EXPECT_EQ(record["namespace"], "node");
    EXPECT_EQ(record["handle"], "alice.bsky.social");
    EXPECT_EQ(record["depth"], 1);
    EXPECT_TRUE(record.contains("discoveredAt"));
}

TEST(DeduplicatorTest, ExpiredRecordIsNewAgain) {
    ManualClock  clock;
    MemoryStore  store(clock);
    Deduplicator dedup(small_config(60), store, clock);

    dedup.mark_processed("a:b:followers", Namespace::Edge);
    clock.advance(Millis(59000));
    EXPECT_TRUE(dedup.is_duplicate("a:b:followers", Namespace::Edge));

    clock.advance(Millis(1000));
    EXPECT_FALSE(dedup.is_duplicate("a:b:followers", Namespace::Edge));

    auto stats = dedup.stats(Namespace::Edge);
    EXPECT_EQ(stats.checked, 2u);
    EXPECT_EQ(stats.store_checks, 2u);
    EXPECT_EQ(stats.duplicates, 1u);
}

TEST(DeduplicatorTest, FilterMissSkipsStore) {
    ManualClock  clock;
    MemoryStore  store(clock);
    Deduplicator dedup(small_config(), store, clock);

    for (int i = 0; i < 50; ++i)
        EXPECT_FALSE(dedup.is_duplicate("fresh_" + std::to_string(i), Namespace::Node));

    auto stats = dedup.stats(Namespace::Node);
    EXPECT_EQ(stats.checked, 50u);
    EXPECT_GE(stats.filter_negatives, 45u);
    EXPECT_EQ(stats.filter_negatives + stats.store_checks, 50u);
}

TEST(DeduplicatorTest, CheckBatchSplitsInOrder) {
    ManualClock  clock;
    MemoryStore  store(clock);
    Deduplicator dedup(small_config(), store, clock);

    dedup.mark_processed("b", Namespace::Node);
    dedup.mark_processed("d", Namespace::Node);

    auto result = dedup.check_batch({"a", "b", "c", "d"}, Namespace::Node);
    EXPECT_EQ(result.duplicates, (std::vector<std::string>{"b", "d"}));
    EXPECT_EQ(result.fresh, (std::vector<std::string>{"a", "c"}));
}

TEST(DeduplicatorTest, FiltersSurviveRestart) {
    ManualClock clock;
    MemoryStore store(clock);
    {
        Deduplicator first(small_config(), store, clock);
        first.mark_processed("did:plc:alice", Namespace::Node);
        EXPECT_TRUE(first.save_filters());
    }

    Deduplicator cold(small_config(), store, clock);
    EXPECT_FALSE(cold.is_duplicate("did:plc:alice", Namespace::Node));

    Deduplicator warm(small_config(), store, clock);
    EXPECT_TRUE(warm.load_filters());
    EXPECT_TRUE(warm.is_duplicate("did:plc:alice", Namespace::Node));
}

TEST(DeduplicatorTest, UnreadableFilterIsDiscarded) {
    ManualClock  clock;
    MemoryStore  store(clock);
    Deduplicator dedup(small_config(), store, clock);

    store.set(dedup.filter_key(Namespace::Node), "not a filter");
    EXPECT_FALSE(dedup.load_filters());
    EXPECT_FALSE(dedup.is_duplicate("anything", Namespace::Node));
}

TEST(DeduplicatorTest, ClearForgetsNamespace) {
    ManualClock  clock;
    MemoryStore  store(clock);
    Deduplicator dedup(small_config(), store, clock);

    dedup.mark_processed("n1", Namespace::Node);
    dedup.mark_processed("e1", Namespace::Edge);
    dedup.save_filters();

    dedup.clear(Namespace::Node);
    EXPECT_FALSE(dedup.is_duplicate("n1", Namespace::Node));
    EXPECT_TRUE(dedup.is_duplicate("e1", Namespace::Edge));
    EXPECT_TRUE(store.keys("trawl:dedup:node:").empty());
    EXPECT_FALSE(store.exists("trawl:bloom:node"));
    EXPECT_EQ(store.keys("trawl:dedup:edge:").size(), 1u);
}

TEST(DeduplicatorTest, StoreOutageDegradesToInProcess) {
    ManualClock                  clock;
    Trawl::Testing::FailingStore store;
    Deduplicator                 dedup(small_config(), store, clock);

    EXPECT_FALSE(dedup.degraded());
    EXPECT_NO_THROW(dedup.mark_processed("did:plc:alice", Namespace::Node));
    EXPECT_TRUE(dedup.degraded());

    int calls = store.calls;
    EXPECT_TRUE(dedup.is_duplicate("did:plc:alice", Namespace::Node));
    EXPECT_FALSE(dedup.is_duplicate("did:plc:bob", Namespace::Node));
    EXPECT_EQ(store.calls, calls);
    EXPECT_FALSE(dedup.save_filters());
}

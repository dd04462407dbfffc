#include <algorithm>
#include <gtest/gtest.h>
#include <set>
#include "../../src/api/response_parser.hpp"
#include "../../src/checkpoint/checkpoint_store.hpp"
#include "../../src/core/clock/clock.hpp"
#include "../../src/dedup/deduplicator.hpp"
#include "../../src/engine/crawler/crawler.hpp"
#include "../../src/store/memory_store.hpp"
#include "../support/fakes.hpp"

using namespace Trawl::Engine;
using Trawl::Api::Actor;
using Trawl::Api::Direction;
using Trawl::Core::ManualClock;
using Trawl::Testing::make_actor;
using Trawl::Testing::run_sync;

namespace {

Trawl::Dedup::DedupConfig dedup_config() {
    Trawl::Dedup::DedupConfig config;
    config.expected_nodes = 1000;
    return config;
}

Trawl::Checkpoint::CheckpointConfig checkpoint_config() {
    Trawl::Checkpoint::CheckpointConfig config;
    config.session_id    = "test";
    config.item_interval = 0;
    return config;
}

CrawlerConfig crawler_config(int max_depth) {
    CrawlerConfig config;
    config.max_depth          = max_depth;
    config.min_follower_count = 0;
    config.page_limit         = 100;
    return config;
}

std::string key_of(const Trawl::Output::EdgeRecord& edge) {
    return edge.source + "|" + edge.target.did + "|" + Trawl::Api::to_string(edge.direction);
}

// Durable state that outlives a single crawler: the store, the checkpoint files and
// the upstream graph. Each Session below is one process lifetime over it.
struct World {
    ManualClock                   clock;
    Trawl::Store::MemoryStore     store{clock};
    Trawl::Testing::MemoryStorage storage;
    Trawl::Testing::FakeGraphApi  api;
};

struct Session {
    Session(World& world, CrawlerConfig config) : Session(world, world.store, std::move(config)) {
    }
    // A session whose dedup state lives in `store` rather than the shared one.
    Session(World& world, Trawl::Store::KeyValueStore& store, CrawlerConfig config)
        : dedup(dedup_config(), store, world.clock),
          checkpoints(checkpoint_config(), world.storage, world.clock),
          crawler(std::move(config), Services{world.clock, world.api, dedup, checkpoints, sink, world.storage}) {
    }

    Trawl::Dedup::Deduplicator          dedup;
    Trawl::Checkpoint::CheckpointStore  checkpoints;
    Trawl::Testing::RecordingSink       sink;
    Crawler                             crawler;
};

void add_followers(World& world, const Actor& of, const std::vector<Actor>& followers) {
    world.api.set_edges(of.did, Direction::Followers, followers);
}

}  // namespace

TEST(CrawlerTest, SharedFollowerEnqueuedOnce) {
    World world;
    Actor a = make_actor("a"), b = make_actor("b"), shared = make_actor("shared");
    world.api.add_profile(a);
    world.api.add_profile(b);
    add_followers(world, a, {make_actor("a1"), make_actor("a2"), shared});
    add_followers(world, b, {make_actor("b1"), shared, make_actor("b2")});

    Session session(world, crawler_config(1));
    CrawlSummary summary = run_sync(session.crawler.run({"a.bsky.social", "did:plc:b"}));

    EXPECT_EQ(summary.reason, TerminationReason::Completed);
    EXPECT_EQ(summary.edges_emitted, 6u);
    EXPECT_EQ(summary.nodes_discovered, 7u);
    EXPECT_EQ(summary.nodes_processed, 7u);
    EXPECT_EQ(summary.final_depth, 1);
    EXPECT_EQ(summary.errors, 0u);

    size_t depth_one = std::count_if(session.sink.nodes.begin(), session.sink.nodes.end(),
                                     [](const auto& n) { return n.provenance.depth == 1; });
    EXPECT_EQ(depth_one, 5u);

    auto shared_listings = std::count_if(world.api.listed.begin(), world.api.listed.end(),
                                         [&](const auto& l) { return l.first == shared.did; });
    EXPECT_EQ(shared_listings, 2);
    EXPECT_EQ(session.crawler.frontier().total_pending(), 0u);
}

TEST(CrawlerTest, EdgeRecordsCarryProvenance) {
    World world;
    Actor a = make_actor("a");
    world.api.add_profile(a);
    world.api.set_edges(a.did, Direction::Follows, {make_actor("f")});

    Session session(world, crawler_config(0));
    run_sync(session.crawler.run({"did:plc:a"}));

    ASSERT_EQ(session.sink.edges.size(), 1u);
    const auto& edge = session.sink.edges[0];
    EXPECT_EQ(edge.source, "did:plc:a");
    EXPECT_EQ(edge.source_handle, "a.bsky.social");
    EXPECT_EQ(edge.target.did, "did:plc:f");
    EXPECT_EQ(edge.direction, Direction::Follows);
    EXPECT_EQ(edge.provenance.strategy, "bfs");
    EXPECT_EQ(edge.provenance.depth, 0);
    EXPECT_EQ(edge.provenance.source, "did:plc:a");
}

TEST(CrawlerTest, DepthLimitStopsExpansion) {
    World world;
    Actor a = make_actor("a"), child = make_actor("child");
    world.api.add_profile(a);
    add_followers(world, a, {child});
    add_followers(world, child, {make_actor("grandchild")});

    Session session(world, crawler_config(0));
    CrawlSummary summary = run_sync(session.crawler.run({"did:plc:a"}));

    EXPECT_EQ(summary.nodes_processed, 1u);
    EXPECT_EQ(summary.edges_emitted, 1u);
    EXPECT_FALSE(session.crawler.frontier().is_discovered(child.did));
    // The far end is still reported as a node.
    EXPECT_EQ(session.sink.nodes.size(), 2u);
}

TEST(CrawlerTest, MinFollowerCountFiltersExpansion) {
    World world;
    Actor a = make_actor("a");
    world.api.add_profile(a);
    add_followers(world, a, {make_actor("popular", 500), make_actor("quiet", 3), make_actor("unknown", std::nullopt)});

    CrawlerConfig config      = crawler_config(1);
    config.min_follower_count = 10;
    Session session(world, config);
    CrawlSummary summary = run_sync(session.crawler.run({"did:plc:a"}));

    EXPECT_EQ(summary.edges_emitted, 3u);
    EXPECT_EQ(summary.nodes_discovered, 2u);
    EXPECT_TRUE(session.crawler.frontier().is_discovered("did:plc:popular"));
    EXPECT_FALSE(session.crawler.frontier().is_discovered("did:plc:quiet"));
    EXPECT_FALSE(session.crawler.frontier().is_discovered("did:plc:unknown"));
}

TEST(CrawlerTest, PopularNodesCrawledFirst) {
    World world;
    Actor a = make_actor("a");
    world.api.add_profile(a);
    add_followers(world, a, {make_actor("small", 20), make_actor("huge", 9000), make_actor("mid", 300)});

    Session session(world, crawler_config(1));
    run_sync(session.crawler.run({"did:plc:a"}));

    std::vector<std::string> followers_order;
    for (const auto& [did, direction] : world.api.listed) {
        if (direction == Direction::Followers && did != a.did)
            followers_order.push_back(did);
    }
    EXPECT_EQ(followers_order, (std::vector<std::string>{"did:plc:huge", "did:plc:mid", "did:plc:small"}));
}

TEST(CrawlerTest, PagesUntilCapReached) {
    World world;
    Actor a = make_actor("a", 7, 0);
    world.api.add_profile(a);
    std::vector<Actor> followers;
    for (int i = 0; i < 10; ++i)
        followers.push_back(make_actor("f" + std::to_string(i)));
    add_followers(world, a, followers);

    CrawlerConfig config = crawler_config(0);
    config.page_limit    = 3;
    Session session(world, config);
    CrawlSummary summary = run_sync(session.crawler.run({"did:plc:a"}));

    // followersCount 7 caps the walk below the ten that exist: pages of 3, 3, 1.
    EXPECT_EQ(summary.edges_emitted, 7u);
    auto follower_pages = std::count_if(world.api.listed.begin(), world.api.listed.end(),
                                        [](const auto& l) { return l.second == Direction::Followers; });
    EXPECT_EQ(follower_pages, 3);
}

// Declared a friend of Crawler, so it lives in the crawler's namespace.
namespace Trawl {
namespace Engine {

TEST(CrawlerTest, CapUsesKnownCount) {
    World         world;
    CrawlerConfig config          = crawler_config(1);
    config.max_followers_per_node = 1000;
    config.max_following_per_node = 5;
    Session session(world, config);

    FrontierNode node{"did:plc:a", "a.test", 40, 100, 0};
    EXPECT_EQ(session.crawler.cap_for(node, Direction::Followers), 40);
    EXPECT_EQ(session.crawler.cap_for(node, Direction::Follows), 5);

    node.followers_count = 0;
    node.follows_count.reset();
    EXPECT_EQ(session.crawler.cap_for(node, Direction::Followers), 1000);
    EXPECT_EQ(session.crawler.cap_for(node, Direction::Follows), 5);
}

}  // namespace Engine
}  // namespace Trawl

TEST(CrawlerTest, UnresolvableSeeds) {
    World world;
    world.api.set_edges("did:plc:ghost", Direction::Followers, {make_actor("x")});

    Session session(world, crawler_config(0));
    CrawlSummary summary = run_sync(session.crawler.run({"nobody.bsky.social", "did:plc:ghost", "  "}));

    // The handle cannot be crawled without a profile; the DID can.
    EXPECT_EQ(summary.errors, 2u);
    EXPECT_EQ(summary.nodes_processed, 1u);
    EXPECT_EQ(summary.edges_emitted, 1u);
    EXPECT_EQ(world.api.profile_calls, 2);
}

TEST(CrawlerTest, ListingErrorsAreCountedAndSkipped) {
    World world;
    Actor a = make_actor("a"), b = make_actor("b");
    world.api.add_profile(a);
    world.api.add_profile(b);
    world.api.fail_listing(a.did);
    add_followers(world, b, {make_actor("x")});

    Session session(world, crawler_config(0));
    CrawlSummary summary = run_sync(session.crawler.run({"did:plc:a", "did:plc:b"}));

    EXPECT_EQ(summary.reason, TerminationReason::Completed);
    EXPECT_EQ(summary.errors, 2u);
    EXPECT_EQ(summary.nodes_processed, 2u);
    EXPECT_EQ(summary.edges_emitted, 1u);
}

TEST(CrawlerTest, NodeBudget) {
    World world;
    world.api.add_profile(make_actor("a"));
    world.api.add_profile(make_actor("b"));

    CrawlerConfig config = crawler_config(1);
    config.max_nodes     = 1;
    Session session(world, config);
    CrawlSummary summary = run_sync(session.crawler.run({"did:plc:a", "did:plc:b"}));

    EXPECT_EQ(summary.reason, TerminationReason::NodeBudget);
    EXPECT_EQ(summary.nodes_processed, 1u);
    EXPECT_EQ(session.crawler.frontier().total_pending(), 1u);
}

TEST(CrawlerTest, EdgeBudgetInterruptsMidListing) {
    World world;
    Actor a = make_actor("a");
    world.api.add_profile(a);
    add_followers(world, a, {make_actor("x"), make_actor("y"), make_actor("z")});

    CrawlerConfig config = crawler_config(1);
    config.max_edges     = 2;
    Session session(world, config);
    CrawlSummary summary = run_sync(session.crawler.run({"did:plc:a"}));

    EXPECT_EQ(summary.reason, TerminationReason::EdgeBudget);
    EXPECT_EQ(summary.edges_emitted, 2u);
    EXPECT_EQ(summary.nodes_processed, 0u);
    // The interrupted node goes back to the head of its level, its far ends behind it.
    EXPECT_FALSE(session.crawler.frontier().is_visited(a.did));
    EXPECT_EQ(session.crawler.frontier().pending(0), 1u);
    EXPECT_EQ(session.crawler.frontier().pending(1), 2u);
}

TEST(CrawlerTest, FinalCheckpointMarksCompletion) {
    World world;
    world.api.add_profile(make_actor("a"));

    Session session(world, crawler_config(1));
    CrawlSummary summary = run_sync(session.crawler.run({"did:plc:a"}));

    ASSERT_TRUE(summary.last_checkpoint.has_value());
    auto latest = session.checkpoints.load_latest("relationships");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->id, *summary.last_checkpoint);
    EXPECT_TRUE(latest->metadata["completed"].get<bool>());
    EXPECT_EQ(latest->metadata["nodesProcessed"], 1);
    EXPECT_GE(session.sink.flushes, 1);
}

TEST(CrawlerTest, CompletedCrawlIsNotResumed) {
    World world;
    Actor a = make_actor("a");
    world.api.add_profile(a);
    add_followers(world, a, {make_actor("x"), make_actor("y")});

    {
        Session first(world, crawler_config(0));
        run_sync(first.crawler.run({"did:plc:a"}));
    }

    Session      second(world, crawler_config(0));
    CrawlSummary summary = run_sync(second.crawler.run({"did:plc:a"}));
    EXPECT_FALSE(summary.resumed);
    EXPECT_EQ(summary.nodes_processed, 1u);
    EXPECT_EQ(summary.edges_emitted, 0u);
    EXPECT_EQ(summary.duplicates_skipped, 2u);
    EXPECT_TRUE(second.sink.nodes.empty());
}

TEST(CrawlerTest, DifferentDepthStartsFresh) {
    World world;
    Actor a = make_actor("a");
    world.api.add_profile(a);
    add_followers(world, a, {make_actor("x")});

    {
        CrawlerConfig config = crawler_config(1);
        config.max_nodes     = 1;
        Session first(world, config);
        run_sync(first.crawler.run({"did:plc:a"}));
    }

    Session      second(world, crawler_config(2));
    CrawlSummary summary = run_sync(second.crawler.run({"did:plc:a"}));
    EXPECT_FALSE(summary.resumed);
    EXPECT_EQ(second.crawler.frontier().max_depth(), 2);
}

TEST(CrawlerTest, FreshFlagIgnoresCheckpoint) {
    World world;
    world.api.add_profile(make_actor("a"));
    world.api.add_profile(make_actor("b"));

    {
        CrawlerConfig config = crawler_config(0);
        config.max_nodes     = 1;
        Session first(world, config);
        run_sync(first.crawler.run({"did:plc:a", "did:plc:b"}));
    }

    CrawlerConfig config = crawler_config(0);
    config.resume        = false;
    Session      second(world, config);
    CrawlSummary summary = run_sync(second.crawler.run({"did:plc:a", "did:plc:b"}));
    EXPECT_FALSE(summary.resumed);
    EXPECT_EQ(summary.nodes_processed, 2u);
}

TEST(CrawlerTest, ResumeAfterCancelMatchesUninterruptedCrawl) {
    auto build = [](World& world) {
        Actor root = make_actor("root");
        world.api.add_profile(root);
        std::vector<Actor> followers;
        for (int i = 0; i < 5; ++i)
            followers.push_back(make_actor("f" + std::to_string(i), 100 - i));
        add_followers(world, root, followers);
        world.api.set_edges(root.did, Direction::Follows, {make_actor("g0"), make_actor("f2", 98)});
        add_followers(world, make_actor("f0"), {make_actor("h0"), make_actor("h1"), make_actor("h2"), root});
        world.api.set_edges("did:plc:g0", Direction::Follows, {make_actor("f3", 97), make_actor("h3")});
    };

    CrawlerConfig config = crawler_config(2);
    config.page_limit    = 2;

    World reference_world;
    build(reference_world);
    Session reference(reference_world, config);
    CrawlSummary expected = run_sync(reference.crawler.run({"did:plc:root"}));
    ASSERT_EQ(expected.reason, TerminationReason::Completed);

    World world;
    build(world);
    std::vector<std::string> emitted;
    std::vector<std::string> nodes;
    {
        Session first(world, config);
        world.api.on_list([&](const std::string&, Direction) {
            if (world.api.list_calls == 2)
                first.crawler.stop();
        });
        CrawlSummary partial = run_sync(first.crawler.run({"did:plc:root"}));
        EXPECT_EQ(partial.reason, TerminationReason::Cancelled);
        EXPECT_LT(partial.edges_emitted, expected.edges_emitted);
        for (const auto& edge : first.sink.edges)
            emitted.push_back(key_of(edge));
        for (const auto& node : first.sink.nodes)
            nodes.push_back(node.actor.did);
    }
    world.api.on_list(nullptr);

    Session      second(world, config);
    CrawlSummary resumed = run_sync(second.crawler.run({"did:plc:root"}));
    EXPECT_TRUE(resumed.resumed);
    EXPECT_EQ(resumed.reason, TerminationReason::Completed);
    for (const auto& edge : second.sink.edges)
        emitted.push_back(key_of(edge));
    for (const auto& node : second.sink.nodes)
        nodes.push_back(node.actor.did);

    std::set<std::string> expected_edges;
    for (const auto& edge : reference.sink.edges)
        expected_edges.insert(key_of(edge));
    std::set<std::string> expected_nodes;
    for (const auto& node : reference.sink.nodes)
        expected_nodes.insert(node.actor.did);

    EXPECT_EQ(emitted.size(), expected_edges.size());
    EXPECT_EQ(std::set<std::string>(emitted.begin(), emitted.end()), expected_edges);
    EXPECT_EQ(nodes.size(), expected_nodes.size());
    EXPECT_EQ(std::set<std::string>(nodes.begin(), nodes.end()), expected_nodes);
    EXPECT_EQ(resumed.nodes_processed, expected.nodes_processed);
    EXPECT_EQ(resumed.edges_emitted, expected.edges_emitted);
}

TEST(CrawlerTest, ResumeWithFreshStoreEmitsEachEdgeOnce) {
    World world;
    Actor root = make_actor("root");
    world.api.add_profile(root);
    std::vector<Actor> followers;
    for (int i = 0; i < 6; ++i)
        followers.push_back(make_actor("f" + std::to_string(i)));
    add_followers(world, root, followers);

    CrawlerConfig config = crawler_config(0);
    config.page_limit    = 2;

    std::vector<std::string> emitted;
    std::vector<std::string> nodes;
    {
        Trawl::Store::MemoryStore store(world.clock);
        Session                   first(world, store, config);
        world.api.on_list([&](const std::string&, Direction) {
            if (world.api.list_calls == 2)
                first.crawler.stop();
        });
        CrawlSummary partial = run_sync(first.crawler.run({"did:plc:root"}));
        EXPECT_EQ(partial.reason, TerminationReason::Cancelled);
        EXPECT_EQ(partial.edges_emitted, 4u);
        ASSERT_TRUE(first.crawler.frontier().progress().has_value());
        EXPECT_EQ(first.crawler.frontier().progress()->cursor, "4");
        for (const auto& edge : first.sink.edges)
            emitted.push_back(key_of(edge));
        for (const auto& node : first.sink.nodes)
            nodes.push_back(node.actor.did);
    }
    world.api.on_list(nullptr);
    world.api.listed.clear();

    Trawl::Store::MemoryStore store(world.clock);
    Session                   second(world, store, config);
    CrawlSummary              resumed = run_sync(second.crawler.run({"did:plc:root"}));
    EXPECT_TRUE(resumed.resumed);
    EXPECT_EQ(resumed.reason, TerminationReason::Completed);
    EXPECT_EQ(resumed.duplicates_skipped, 0u);
    for (const auto& edge : second.sink.edges)
        emitted.push_back(key_of(edge));
    for (const auto& node : second.sink.nodes)
        nodes.push_back(node.actor.did);

    // Followers continue at the saved cursor, then follows are listed once.
    ASSERT_EQ(world.api.listed.size(), 2u);
    EXPECT_EQ(world.api.listed[0].second, Direction::Followers);
    EXPECT_EQ(world.api.listed[1].second, Direction::Follows);

    EXPECT_EQ(emitted.size(), 6u);
    EXPECT_EQ(std::set<std::string>(emitted.begin(), emitted.end()).size(), 6u);
    EXPECT_EQ(nodes.size(), 7u);
    EXPECT_EQ(std::set<std::string>(nodes.begin(), nodes.end()).size(), 7u);
    EXPECT_EQ(resumed.edges_emitted, 6u);
}

TEST(CrawlerTest, ResumeMidPageSkipsConsumedEntries) {
    World world;
    Actor root = make_actor("root");
    world.api.add_profile(root);
    std::vector<Actor> followers;
    for (int i = 0; i < 6; ++i)
        followers.push_back(make_actor("f" + std::to_string(i)));
    add_followers(world, root, followers);

    CrawlerConfig config = crawler_config(0);
    config.page_limit    = 2;
    config.max_edges     = 3;

    std::vector<std::string> emitted;
    {
        Trawl::Store::MemoryStore store(world.clock);
        Session                   first(world, store, config);
        CrawlSummary              partial = run_sync(first.crawler.run({"did:plc:root"}));
        EXPECT_EQ(partial.reason, TerminationReason::EdgeBudget);
        const auto& progress = first.crawler.frontier().progress();
        ASSERT_TRUE(progress.has_value());
        EXPECT_EQ(progress->cursor, "2");
        EXPECT_EQ(progress->fetched, 2);
        EXPECT_EQ(progress->consumed, 1);
        for (const auto& edge : first.sink.edges)
            emitted.push_back(key_of(edge));
    }

    config.max_edges = 0;
    Trawl::Store::MemoryStore store(world.clock);
    Session                   second(world, store, config);
    CrawlSummary              resumed = run_sync(second.crawler.run({"did:plc:root"}));
    EXPECT_EQ(resumed.reason, TerminationReason::Completed);
    for (const auto& edge : second.sink.edges)
        emitted.push_back(key_of(edge));

    std::vector<std::string> expected;
    for (const auto& follower : followers)
        expected.push_back("did:plc:root|" + follower.did + "|followers");
    EXPECT_EQ(emitted, expected);
}

TEST(CrawlerTest, SeedsFromSearchWhenNoSeedsGiven) {
    World world;
    world.api.set_search("rust", {make_actor("popular", 900), make_actor("tiny", 3), make_actor("mid", 400)});
    world.api.set_search("go", {make_actor("mid", 400), make_actor("late", 700)});

    CrawlerConfig config      = crawler_config(1);
    config.min_follower_count = 10;
    config.page_limit         = 2;
    config.search_pages       = 1;
    config.seed_queries       = {"rust", "go"};
    Session      session(world, config);
    CrawlSummary summary = run_sync(session.crawler.run({}));

    EXPECT_EQ(world.api.search_calls, 2);
    // "rust" stops after its first page, so "mid" only arrives through "go".
    EXPECT_EQ(summary.nodes_processed, 3u);
    ASSERT_EQ(world.api.listed.size(), 6u);
    EXPECT_EQ(world.api.listed[0].first, "did:plc:popular");
    EXPECT_EQ(world.api.listed[2].first, "did:plc:late");
    EXPECT_EQ(world.api.listed[4].first, "did:plc:mid");

    ASSERT_EQ(session.sink.nodes.size(), 3u);
    EXPECT_EQ(session.sink.nodes[0].actor.did, "did:plc:popular");
    EXPECT_EQ(session.sink.nodes[0].provenance.strategy, "search");
    EXPECT_EQ(session.sink.nodes[0].provenance.source, "rust");
    EXPECT_EQ(session.sink.nodes[1].provenance.source, "go");
}

TEST(CrawlerTest, SeedsFromEarlierNodeOutput) {
    World world;
    auto  line = [](const Actor& actor) { return Trawl::Api::ResponseParser::to_json(actor).dump() + "\n"; };
    world.storage.files["nodes/nodes_old_0.jsonl"] =
        line(make_actor("small", 20)) + line(make_actor("big", 5000)) + "{not json\n" + line(make_actor("quiet", 2));
    world.storage.files["nodes/nodes_old_1.jsonl"] =
        line(make_actor("big", 5000)) + "\n" + line(make_actor("medium", 300)) + R"({"handle":"nodid.test"})" "\n";
    world.storage.files["nodes/readme.txt"] = line(make_actor("ignored", 99999));

    CrawlerConfig config      = crawler_config(1);
    config.min_follower_count = 10;
    config.prior_seed_limit   = 2;
    Session      session(world, config);
    CrawlSummary summary = run_sync(session.crawler.run({}));

    EXPECT_EQ(world.api.profile_calls, 0);
    EXPECT_EQ(summary.nodes_processed, 2u);
    ASSERT_EQ(world.api.listed.size(), 4u);
    EXPECT_EQ(world.api.listed[0].first, "did:plc:big");
    EXPECT_EQ(world.api.listed[2].first, "did:plc:medium");
    // Their node records were written by the crawl that found them.
    EXPECT_TRUE(session.sink.nodes.empty());
}

TEST(CrawlerTest, NoSeedSourceLeavesNothingToCrawl) {
    World        world;
    Session      session(world, crawler_config(1));
    CrawlSummary summary = run_sync(session.crawler.run({}));

    EXPECT_EQ(summary.reason, TerminationReason::Completed);
    EXPECT_EQ(summary.nodes_processed, 0u);
    EXPECT_EQ(world.api.list_calls, 0);
}

TEST(CrawlerTest, SummaryJson) {
    CrawlSummary summary;
    summary.nodes_processed = 3;
    summary.reason          = TerminationReason::EdgeBudget;
    summary.last_checkpoint = "relationships_s_1";

    auto j = summary.to_json();
    EXPECT_EQ(j["nodesProcessed"], 3);
    EXPECT_EQ(j["reason"], "edge_budget");
    EXPECT_EQ(j["lastCheckpoint"], "relationships_s_1");
    EXPECT_FALSE(CrawlSummary{}.to_json().contains("lastCheckpoint"));
}

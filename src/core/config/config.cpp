#include "config.hpp"
#include <CLI/CLI.hpp>
#include <fstream>
#include <yaml-cpp/yaml.h>
#include "../errors/errors.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Trawl {
namespace Core {

using Trawl::Utils::Text::starts_with;
using Trawl::Utils::Text::trim;

std::vector<std::string> read_list_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw ConfigError("Cannot open list file: " + path);

    std::vector<std::string> entries;
    std::string              line;
    while (std::getline(file, line)) {
        size_t hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);
        line = trim(line);
        if (!line.empty())
            entries.push_back(line);
    }
    return entries;
}

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);

        auto read = [&yaml](const char* key, auto& target) {
            if (yaml[key])
                target = yaml[key].as<std::decay_t<decltype(target)>>();
        };

        read("log_level", config.log_level);
        read("output_dir", config.output_dir);
        read("output", config.output_dir);
        read("redis_url", config.redis_url);
        read("session_id", config.session_id);

        read("api_base_url", config.api_base_url);
        read("user_agent", config.user_agent);
        read("request_timeout_ms", config.request_timeout_ms);
        read("connect_timeout_ms", config.connect_timeout_ms);

        read("max_depth", config.max_depth);
        read("depth", config.max_depth);
        read("max_nodes", config.max_nodes);
        read("max_edges", config.max_edges);
        read("max_followers_per_node", config.max_followers_per_node);
        read("max_following_per_node", config.max_following_per_node);
        read("min_follower_count", config.min_follower_count);
        read("page_limit", config.page_limit);
        read("prioritize_popular", config.prioritize_popular);
        read("batch_size", config.batch_size);
        read("checkpoint_every_nodes", config.checkpoint_every_nodes);
        read("resume", config.resume);
        read("respect_robots_txt", config.respect_robots_txt);
        read("search_pages", config.search_pages);
        read("prior_seed_limit", config.prior_seed_limit);

        read("requests_per_minute", config.requests_per_minute);
        read("burst_limit", config.burst_limit);
        read("max_concurrent", config.max_concurrent);
        read("min_interval_ms", config.min_interval_ms);
        read("randomize_delays", config.randomize_delays);

        read("failure_threshold", config.failure_threshold);
        read("rate_limit_cooldown_ms", config.rate_limit_cooldown_ms);
        read("health_check_interval_ms", config.health_check_interval_ms);
        read("health_check_url", config.health_check_url);

        read("retry_attempts", config.retry_attempts);
        read("retry_base_ms", config.retry_base_ms);
        read("retry_max_ms", config.retry_max_ms);

        read("bloom_expected_nodes", config.bloom_expected_nodes);
        read("bloom_fp_rate", config.bloom_fp_rate);
        read("edge_cardinality_factor", config.edge_cardinality_factor);
        read("dedup_ttl_seconds", config.dedup_ttl_seconds);

        read("auto_checkpoint", config.auto_checkpoint);
        read("backup_checkpoints", config.backup_checkpoints);
        read("checkpoint_frequency", config.checkpoint_frequency);
        read("max_checkpoint_age_ms", config.max_checkpoint_age_ms);

        if (yaml["seeds"] && yaml["seeds"].IsSequence()) {
            for (const auto& node : yaml["seeds"])
                config.seeds.push_back(node.as<std::string>());
        }

        if (yaml["search_queries"] && yaml["search_queries"].IsSequence()) {
            for (const auto& node : yaml["search_queries"])
                config.seed_queries.push_back(node.as<std::string>());
        }

        if (yaml["proxies"] && yaml["proxies"].IsSequence()) {
            for (const auto& node : yaml["proxies"])
                config.proxies.push_back(node.as<std::string>());
        }

        if (yaml["proxy_list"]) {
            for (auto& entry : read_list_file(yaml["proxy_list"].as<std::string>()))
                config.proxies.push_back(std::move(entry));
        }

        YAML::Node limits = yaml["rate_limits"];
        if (limits && limits.IsMap()) {
            for (auto it = limits.begin(); it != limits.end(); ++it) {
                EndpointLimit limit;
                if (it->second["requests_per_minute"])
                    limit.requests_per_minute = it->second["requests_per_minute"].as<int>();
                if (it->second["burst_limit"])
                    limit.burst_limit = it->second["burst_limit"].as<int>();
                config.rate_limits[it->first.as<std::string>()] = limit;
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Trawl - Resumable social graph crawler"};

    std::string proxy_list_path;
    std::string seed_file;
    std::string single_proxy;
    bool        verbose = false;
    bool        quiet   = false;
    bool        fresh   = false;

    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_option("-d,--max-depth", config.max_depth, "Maximum traversal depth (1-5)");
    app.add_option("--max-nodes", config.max_nodes, "Node budget");
    app.add_option("--max-edges", config.max_edges, "Edge budget");
    app.add_option("--max-followers", config.max_followers_per_node, "Follower cap per node");
    app.add_option("--max-following", config.max_following_per_node, "Following cap per node");
    app.add_option("--min-followers", config.min_follower_count, "Admission threshold");
    app.add_option("-o,--output", config.output_dir, "Output directory");
    app.add_option("--redis", config.redis_url, "Redis URL for shared state");
    app.add_option("--session", config.session_id, "Session id (generated if empty)");
    app.add_option("--api-base", config.api_base_url, "Upstream API base URL");
    app.add_option("--rpm", config.requests_per_minute, "Default requests per minute");
    app.add_option("--burst", config.burst_limit, "Default burst limit");
    app.add_option("-p,--proxy", single_proxy, "Single proxy URI");
    app.add_option("--proxy-list", proxy_list_path, "File containing proxy URIs");
    app.add_option("--seed-file", seed_file, "File containing seed handles or DIDs");
    app.add_option("--search", config.seed_queries, "Seed from actor search results (repeatable)");
    app.add_option("--search-pages", config.search_pages, "Result pages read per search query");
    app.add_option("--prior-seed-limit", config.prior_seed_limit, "Seeds taken from earlier node output");
    app.add_option("--log-level", config.log_level, "debug|info|warn|error|none");

    app.add_flag("-v,--verbose", verbose, "Debug logging");
    app.add_flag("-q,--quiet", quiet, "Errors only");
    app.add_flag("--fresh", fresh, "Ignore existing checkpoints");
    app.add_flag(
        "--no-prioritize",
        [&](size_t count) {
            if (count > 0)
                config.prioritize_popular = false;
        },
        "Keep discovery order instead of sorting by popularity");

    app.add_option("seeds", config.seeds, "Seed handles or DIDs");

    // Global options stay usable after a subcommand, e.g. `trawl checkpoints list -o data`.
    app.fallthrough();
    CLI::App* proxies = app.add_subcommand("proxies", "Inspect or maintain the proxy pool");
    proxies->add_subcommand("list", "Show every proxy with its health and counters");
    proxies->add_subcommand("remove", "Remove proxies from the pool and the shared store")
        ->add_option("uris", config.command_args, "Proxy URIs")
        ->required();
    proxies->add_subcommand("reset", "Clear counters and mark every proxy healthy");
    proxies->require_subcommand(1);

    CLI::App* checkpoints = app.add_subcommand("checkpoints", "Inspect or maintain checkpoints");
    checkpoints->add_subcommand("list", "Show stored checkpoints, oldest first");
    checkpoints->add_subcommand("remove", "Delete checkpoints by id")
        ->add_option("ids", config.command_args, "Checkpoint ids")
        ->required();
    checkpoints->add_subcommand("export", "Write every checkpoint to one JSON file")
        ->add_option("path", config.command_args, "Destination file")
        ->required()
        ->expected(1);
    checkpoints->add_subcommand("import", "Add checkpoints from an exported file")
        ->add_option("path", config.command_args, "Exported file")
        ->required()
        ->expected(1);
    checkpoints->require_subcommand(1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    for (CLI::App* group : {proxies, checkpoints}) {
        if (!group->parsed())
            continue;
        config.command = group->get_name();
        for (CLI::App* action : group->get_subcommands())
            config.action = action->get_name();
    }

    if (!single_proxy.empty())
        config.proxies.push_back(single_proxy);
    if (!proxy_list_path.empty()) {
        for (auto& entry : read_list_file(proxy_list_path))
            config.proxies.push_back(std::move(entry));
    }
    if (!seed_file.empty()) {
        for (auto& entry : read_list_file(seed_file))
            config.seeds.push_back(std::move(entry));
    }

    if (verbose)
        config.log_level = "debug";
    else if (quiet)
        config.log_level = "error";
    if (fresh)
        config.resume = false;

    return config;
}

void Config::validate() const {
    auto require = [](bool ok, const std::string& message) {
        if (!ok)
            throw ConfigError("Invalid configuration: " + message);
    };

    require(max_depth >= 1 && max_depth <= Constants::MAX_SUPPORTED_DEPTH,
            "max_depth must be between 1 and " + std::to_string(Constants::MAX_SUPPORTED_DEPTH));
    require(max_nodes > 0, "max_nodes must be greater than 0");
    require(max_edges > 0, "max_edges must be greater than 0");
    require(max_followers_per_node >= 0, "max_followers_per_node must not be negative");
    require(max_following_per_node >= 0, "max_following_per_node must not be negative");
    require(min_follower_count >= 0, "min_follower_count must not be negative");
    require(page_limit >= 1 && page_limit <= 100, "page_limit must be between 1 and 100");
    require(batch_size > 0, "batch_size must be greater than 0");
    require(checkpoint_every_nodes > 0, "checkpoint_every_nodes must be greater than 0");
    require(search_pages >= 1, "search_pages must be at least 1");
    require(prior_seed_limit >= 0, "prior_seed_limit must not be negative");

    require(requests_per_minute > 0, "requests_per_minute must be greater than 0");
    require(burst_limit > 0, "burst_limit must be greater than 0");
    require(max_concurrent > 0, "max_concurrent must be greater than 0");
    require(min_interval_ms >= 0, "min_interval_ms must not be negative");
    for (const auto& [endpoint, limit] : rate_limits) {
        require(limit.requests_per_minute > 0 && limit.burst_limit > 0,
                "rate_limits." + endpoint + " must have positive requests_per_minute and burst_limit");
    }

    require(failure_threshold >= 1, "failure_threshold must be at least 1");
    require(rate_limit_cooldown_ms > 0, "rate_limit_cooldown_ms must be greater than 0");
    require(health_check_interval_ms >= 0, "health_check_interval_ms must not be negative");

    require(retry_attempts >= 1, "retry_attempts must be at least 1");
    require(retry_base_ms >= 0 && retry_max_ms >= retry_base_ms,
            "retry_base_ms must be >= 0 and <= retry_max_ms");

    require(bloom_expected_nodes >= 1, "bloom_expected_nodes must be at least 1");
    require(bloom_fp_rate > 0.0 && bloom_fp_rate < 1.0, "bloom_fp_rate must be in (0, 1)");
    require(edge_cardinality_factor >= 1, "edge_cardinality_factor must be at least 1");
    require(dedup_ttl_seconds > 0, "dedup_ttl_seconds must be greater than 0");

    require(checkpoint_frequency >= 1, "checkpoint_frequency must be at least 1");
    require(max_checkpoint_age_ms > 0, "max_checkpoint_age_ms must be greater than 0");

    require(redis_url.empty() || starts_with(redis_url, "redis://")
                || starts_with(redis_url, "tcp://") || starts_with(redis_url, "unix://"),
            "redis_url must start with redis://, tcp:// or unix://");
    require(starts_with(api_base_url, "https://") || starts_with(api_base_url, "http://"),
            "api_base_url must be an http(s) URL");
    require(!output_dir.empty(), "output_dir must be specified");
    require(request_timeout_ms > 0 && connect_timeout_ms > 0, "timeouts must be positive");
}

}  // namespace Core
}  // namespace Trawl

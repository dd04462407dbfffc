#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <curl/curl.h>
#include <iostream>

#include "core/config/config.hpp"
#include "core/errors/errors.hpp"
#include "core/logger/logger.hpp"
#include "engine/runtime/maintenance.hpp"
#include "engine/runtime/runtime.hpp"

namespace {

using namespace Trawl;

int run_crawl(const Core::Config& config) {
    namespace net = boost::asio;

    int                     exit_code = 0;
    net::io_context         ioc;
    Engine::Runtime         runtime(config, ioc);
    net::signal_set         signals(ioc, SIGINT, SIGTERM);

    signals.async_wait([&](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Core::Logger::warn("Received signal " + std::to_string(signal_number)
                               + ", stopping after the current page");
            runtime.crawler().stop();
        }
    });

    net::co_spawn(ioc, runtime.monitor_proxies(), net::detached);
    net::co_spawn(
        ioc,
        [&]() -> net::awaitable<void> {
            auto summary = co_await runtime.run();
            std::cout << summary.to_json().dump(2) << std::endl;
        },
        [&](std::exception_ptr failure) {
            runtime.stop_monitor();
            signals.cancel();
            if (!failure)
                return;
            try {
                std::rethrow_exception(failure);
            } catch (const std::exception& e) {
                Core::Logger::error("Crawl aborted: " + std::string(e.what()));
                exit_code = 1;
            }
        });

    ioc.run();
    return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
    Trawl::Core::Config config;
    try {
        config = Trawl::Core::Config::parse(argc, argv);
        config.validate();
    } catch (const Trawl::Core::ConfigError& e) {
        Trawl::Core::Logger::error(e.what());
        return 2;
    }
    Trawl::Core::Logger::set_level(Trawl::Core::Logger::parse_level(config.log_level));

    if (!config.command.empty()) {
        try {
            return Trawl::Engine::Maintenance(config, std::cout).run();
        } catch (const std::exception& e) {
            Trawl::Core::Logger::error(e.what());
            return 1;
        }
    }

    if (config.seeds.empty() && config.seed_queries.empty())
        Trawl::Core::Logger::info("No seeds given; resuming a checkpoint or seeding from earlier node output");

    curl_global_init(CURL_GLOBAL_ALL);
    int exit_code = 0;
    try {
        exit_code = run_crawl(config);
    } catch (const std::exception& e) {
        Trawl::Core::Logger::error(e.what());
        exit_code = 1;
    }
    curl_global_cleanup();
    return exit_code;
}

#pragma once
#include <utility>
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../../src/api/graph_api.hpp"
#include "../../src/core/errors/errors.hpp"
#include "../../src/network/http/http_client.hpp"
#include "../../src/output/sink.hpp"
#include "../../src/storage/storage.hpp"
#include "../../src/store/key_value_store.hpp"

namespace Trawl {
namespace Testing {

// Drives a coroutine to completion on a private io_context and hands back its result.
template <typename T>
T run_sync(boost::asio::awaitable<T> task) {
    boost::asio::io_context ioc;
    std::optional<T>        result;
    std::exception_ptr      error;
    boost::asio::co_spawn(ioc, std::move(task), [&](std::exception_ptr e, T value) {
        error = e;
        if (!e)
            result.emplace(std::move(value));
    });
    ioc.run();
    if (error)
        std::rethrow_exception(error);
    return std::move(*result);
}

inline void run_sync(boost::asio::awaitable<void> task) {
    boost::asio::io_context ioc;
    std::exception_ptr      error;
    boost::asio::co_spawn(ioc, std::move(task), [&](std::exception_ptr e) { error = e; });
    ioc.run();
    if (error)
        std::rethrow_exception(error);
}

inline Api::Actor make_actor(const std::string&     name,
                             std::optional<int64_t> followers = 100,
                             std::optional<int64_t> follows   = 50) {
    Api::Actor actor;
    actor.did             = "did:plc:" + name;
    actor.handle          = name + ".bsky.social";
    actor.followers_count = followers;
    actor.follows_count   = follows;
    return actor;
}

// In-process graph. Listings page by index; the cursor is the next offset.
class FakeGraphApi : public Api::GraphApi {
public:
    void add_profile(const Api::Actor& actor) {
        profiles_[actor.did]    = actor;
        profiles_[actor.handle] = actor;
    }

    void set_edges(const std::string& did, Api::Direction direction, std::vector<Api::Actor> actors) {
        edges_[{did, direction}] = std::move(actors);
    }

    void set_search(const std::string& query, std::vector<Api::Actor> actors) {
        search_[query] = std::move(actors);
    }

    void fail_listing(const std::string& did, Core::ErrorKind kind = Core::ErrorKind::Client) {
        failing_[did] = kind;
    }

    // Runs before each listing is answered.
    void on_list(std::function<void(const std::string&, Api::Direction)> hook) {
        hook_ = std::move(hook);
    }

    boost::asio::awaitable<Api::Actor> get_profile(const std::string& actor) override {
        ++profile_calls;
        auto it = profiles_.find(actor);
        if (it == profiles_.end())
            throw Core::ApiError(Core::ErrorKind::Client, 400, "profile not found: " + actor);
        co_return it->second;
    }

    boost::asio::awaitable<Api::EdgePage> list_edges(const std::string&                actor,
                                                     Api::Direction                    direction,
                                                     const std::optional<std::string>& cursor,
                                                     int                               limit) override {
        ++list_calls;
        listed.emplace_back(actor, direction);
        if (hook_)
            hook_(actor, direction);

        auto failing = failing_.find(actor);
        if (failing != failing_.end())
            throw Core::ApiError(failing->second, 400, "listing refused for " + actor);

        Api::EdgePage page;
        auto          it = edges_.find({actor, direction});
        if (it == edges_.end())
            co_return page;

        size_t offset = cursor ? std::stoul(*cursor) : 0;
        size_t end    = std::min(it->second.size(), offset + static_cast<size_t>(limit));
        for (size_t i = offset; i < end; ++i)
            page.items.push_back(it->second[i]);
        if (end < it->second.size())
            page.cursor = std::to_string(end);
        co_return page;
    }

    boost::asio::awaitable<Api::SearchPage> search_actors(const std::string&                query,
                                                          const std::optional<std::string>& cursor,
                                                          int                               limit) override {
        ++search_calls;
        Api::SearchPage page;
        auto            it = search_.find(query);
        if (it == search_.end())
            co_return page;

        size_t offset = cursor ? std::stoul(*cursor) : 0;
        size_t end    = std::min(it->second.size(), offset + static_cast<size_t>(limit));
        for (size_t i = offset; i < end; ++i)
            page.actors.push_back(it->second[i]);
        if (end < it->second.size())
            page.cursor = std::to_string(end);
        co_return page;
    }

    int                                                 profile_calls = 0;
    int                                                 list_calls    = 0;
    int                                                 search_calls  = 0;
    std::vector<std::pair<std::string, Api::Direction>> listed;

private:
    std::map<std::string, Api::Actor>                                        profiles_;
    std::map<std::pair<std::string, Api::Direction>, std::vector<Api::Actor>> edges_;
    std::map<std::string, std::vector<Api::Actor>>                           search_;
    std::map<std::string, Core::ErrorKind>                                   failing_;
    std::function<void(const std::string&, Api::Direction)>                  hook_;
};

// A store whose backend is gone.
class FailingStore : public Store::KeyValueStore {
public:
    std::optional<std::string> get(const std::string&) override {
        fail();
    }
    void set(const std::string&, const std::string&) override {
        fail();
    }
    void set_ex(const std::string&, const std::string&, int64_t) override {
        fail();
    }
    bool exists(const std::string&) override {
        fail();
    }
    bool del(const std::string&) override {
        fail();
    }
    std::vector<std::string> keys(const std::string&) override {
        fail();
    }
    bool sadd(const std::string&, const std::string&) override {
        fail();
    }
    bool srem(const std::string&, const std::string&) override {
        fail();
    }
    bool sismember(const std::string&, const std::string&) override {
        fail();
    }
    std::vector<std::string> smembers(const std::string&) override {
        fail();
    }
    int64_t scard(const std::string&) override {
        fail();
    }
    void hset(const std::string&, const std::string&, const std::string&) override {
        fail();
    }
    std::map<std::string, std::string> hgetall(const std::string&) override {
        fail();
    }
    int64_t incr(const std::string&) override {
        fail();
    }
    bool ping() override {
        return false;
    }
    std::string name() const override {
        return "failing";
    }

    int calls = 0;

private:
    [[noreturn]] void fail() {
        ++calls;
        throw Core::StoreUnavailableError("connection refused");
    }
};

// Scripted transport. Replies are consumed in order; the last one repeats.
class FakeHttpClient : public Network::Http::HttpClient {
public:
    void reply(long status, std::string body = "{}") {
        Response response;
        response.status_code = status;
        response.success     = status >= 200 && status < 300;
        response.body        = std::move(body);
        response.elapsed_ms  = 5;
        replies_.push_back(std::move(response));
    }

    void fail_transport(Network::Http::ErrorType type = Network::Http::ErrorType::Network) {
        Response response;
        response.error      = "connection reset";
        response.error_type = type;
        replies_.push_back(std::move(response));
    }

    // Replies keyed by proxy URI take precedence over the script.
    void reply_for_proxy(const std::string& proxy, long status) {
        Response response;
        response.status_code = status;
        response.success     = status >= 200 && status < 300;
        per_proxy_[proxy]    = response;
    }

    boost::asio::awaitable<Response> get(const std::string&                     url,
                                         const Network::Http::RequestOptions& options) override {
        requests.emplace_back(url, options.proxy);

        auto it = per_proxy_.find(options.proxy);
        if (it != per_proxy_.end())
            co_return it->second;

        if (replies_.empty())
            co_return Response{};
        Response response = replies_.front();
        if (replies_.size() > 1)
            replies_.pop_front();
        co_return response;
    }

    std::vector<std::pair<std::string, std::string>> requests;  // (url, proxy)

private:
    std::deque<Response>            replies_;
    std::map<std::string, Response> per_proxy_;
};

// Storage kept in a map; writes can be switched off to simulate a full disk.
class MemoryStorage : public Storage::Storage {
public:
    bool save(const std::string& key, const std::string& content) override {
        if (fail_writes)
            return false;
        files[key] = content;
        return true;
    }

    bool append(const std::string& key, const std::string& content) override {
        if (fail_writes)
            return false;
        files[key] += content;
        return true;
    }

    std::optional<std::string> load(const std::string& key) const override {
        ++loads;
        auto it = files.find(key);
        if (it == files.end())
            return std::nullopt;
        return it->second;
    }

    bool exists(const std::string& key) const override {
        return files.count(key) > 0;
    }

    bool remove(const std::string& key) override {
        return files.erase(key) > 0;
    }

    std::vector<std::string> list(const std::string& directory) const override {
        std::vector<std::string> out;
        std::string              prefix = directory.empty() ? "" : directory + "/";
        for (const auto& [key, content] : files) {
            if (key.compare(0, prefix.size(), prefix) != 0)
                continue;
            if (key.find('/', prefix.size()) != std::string::npos)
                continue;
            out.push_back(key);
        }
        return out;
    }

    std::map<std::string, std::string> files;
    bool                               fail_writes = false;
    mutable int                        loads       = 0;
};

// Keeps every record it is handed.
class RecordingSink : public Output::Sink {
public:
    void write_nodes(std::vector<Output::NodeRecord> records) override {
        for (auto& record : records)
            nodes.push_back(std::move(record));
    }

    void write_edges(std::vector<Output::EdgeRecord> records) override {
        for (auto& record : records)
            edges.push_back(std::move(record));
    }

    bool flush() override {
        ++flushes;
        return true;
    }

    size_t pending() const override {
        return 0;
    }

    std::vector<Output::NodeRecord> nodes;
    std::vector<Output::EdgeRecord> edges;
    int                             flushes = 0;
};

}  // namespace Testing
}  // namespace Trawl

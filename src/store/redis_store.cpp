#include "redis_store.hpp"
#include <iterator>
#include "../core/errors/errors.hpp"

namespace Trawl {
namespace Store {

using Core::StoreUnavailableError;

RedisStore::RedisStore(const std::string& url) : url_(url) {
    try {
        redis_ = std::make_shared<sw::redis::Redis>(url);
    } catch (const sw::redis::Error& e) {
        throw StoreUnavailableError("Cannot create Redis client for " + url + ": " + e.what());
    }
}

template <typename Fn>
auto RedisStore::guarded(const char* op, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const sw::redis::Error& e) {
        throw StoreUnavailableError(std::string("Redis ") + op + " failed: " + e.what());
    }
}

std::optional<std::string> RedisStore::get(const std::string& key) {
    return guarded("GET", [&]() -> std::optional<std::string> {
        auto value = redis_->get(key);
        if (!value)
            return std::nullopt;
        return *value;
    });
}

void RedisStore::set(const std::string& key, const std::string& value) {
    guarded("SET", [&] { redis_->set(key, value); });
}

void RedisStore::set_ex(const std::string& key, const std::string& value, int64_t ttl_seconds) {
    guarded("SETEX", [&] { redis_->setex(key, std::chrono::seconds(ttl_seconds), value); });
}

bool RedisStore::exists(const std::string& key) {
    return guarded("EXISTS", [&] { return redis_->exists(key) > 0; });
}

bool RedisStore::del(const std::string& key) {
    return guarded("DEL", [&] { return redis_->del(key) > 0; });
}

std::vector<std::string> RedisStore::keys(const std::string& prefix) {
    return guarded("SCAN", [&] {
        std::vector<std::string> out;
        long long                cursor = 0;
        do {
            cursor = redis_->scan(cursor, prefix + "*", 500, std::back_inserter(out));
        } while (cursor != 0);
        return out;
    });
}

bool RedisStore::sadd(const std::string& key, const std::string& member) {
    return guarded("SADD", [&] { return redis_->sadd(key, member) > 0; });
}

bool RedisStore::srem(const std::string& key, const std::string& member) {
    return guarded("SREM", [&] { return redis_->srem(key, member) > 0; });
}

bool RedisStore::sismember(const std::string& key, const std::string& member) {
    return guarded("SISMEMBER", [&] { return redis_->sismember(key, member); });
}

std::vector<std::string> RedisStore::smembers(const std::string& key) {
    return guarded("SMEMBERS", [&] {
        std::vector<std::string> out;
        redis_->smembers(key, std::back_inserter(out));
        return out;
    });
}

int64_t RedisStore::scard(const std::string& key) {
    return guarded("SCARD", [&] { return static_cast<int64_t>(redis_->scard(key)); });
}

void RedisStore::hset(const std::string& key, const std::string& field, const std::string& value) {
    guarded("HSET", [&] { redis_->hset(key, field, value); });
}

std::map<std::string, std::string> RedisStore::hgetall(const std::string& key) {
    return guarded("HGETALL", [&] {
        std::map<std::string, std::string> out;
        redis_->hgetall(key, std::inserter(out, out.end()));
        return out;
    });
}

int64_t RedisStore::incr(const std::string& key) {
    return guarded("INCR", [&] { return static_cast<int64_t>(redis_->incr(key)); });
}

bool RedisStore::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error&) {
        return false;
    }
}

}  // namespace Store
}  // namespace Trawl

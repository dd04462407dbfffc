#include "memory_store.hpp"
#include <algorithm>
#include "../utils/text/string_utils.hpp"

namespace Trawl {
namespace Store {

MemoryStore::Entry* MemoryStore::find_live(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end())
        return nullptr;
    if (it->second.expires_at && clock_.now() >= *it->second.expires_at) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

std::optional<std::string> MemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry*                      entry = find_live(key);
    if (!entry)
        return std::nullopt;
    return entry->value;
}

void MemoryStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = Entry{value, {}, {}, std::nullopt};
}

void MemoryStore::set_ex(const std::string& key, const std::string& value, int64_t ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = Entry{value, {}, {}, clock_.now() + std::chrono::seconds(ttl_seconds)};
}

bool MemoryStore::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_live(key) != nullptr;
}

bool MemoryStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

std::vector<std::string> MemoryStore::keys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string>    out;
    auto                        now = clock_.now();
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at && now >= *it->second.expires_at) {
            it = entries_.erase(it);
            continue;
        }
        if (Utils::Text::starts_with(it->first, prefix))
            out.push_back(it->first);
        ++it;
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool MemoryStore::sadd(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry*                      entry = find_live(key);
    if (!entry)
        entry = &entries_[key];
    return entry->members.insert(member).second;
}

bool MemoryStore::srem(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry*                      entry = find_live(key);
    return entry && entry->members.erase(member) > 0;
}

bool MemoryStore::sismember(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry*                      entry = find_live(key);
    return entry && entry->members.count(member) > 0;
}

std::vector<std::string> MemoryStore::smembers(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry*                      entry = find_live(key);
    if (!entry)
        return {};
    return {entry->members.begin(), entry->members.end()};
}

int64_t MemoryStore::scard(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry*                      entry = find_live(key);
    return entry ? static_cast<int64_t>(entry->members.size()) : 0;
}

void MemoryStore::hset(const std::string& key, const std::string& field, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry*                      entry = find_live(key);
    if (!entry)
        entry = &entries_[key];
    entry->hash[field] = value;
}

std::map<std::string, std::string> MemoryStore::hgetall(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry*                      entry = find_live(key);
    if (!entry)
        return {};
    return entry->hash;
}

int64_t MemoryStore::incr(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry*                      entry = find_live(key);
    if (!entry)
        entry = &entries_[key];
    int64_t value = entry->value.empty() ? 0 : std::stoll(entry->value);
    entry->value  = std::to_string(++value);
    return value;
}

size_t MemoryStore::size() {
    return keys("").size();
}

}  // namespace Store
}  // namespace Trawl

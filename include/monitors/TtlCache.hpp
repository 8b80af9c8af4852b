#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <utility>

namespace netdiag::monitors {

struct CacheStats {
  size_t size{};     // all entries, stale included
  size_t entries{};  // entries still fresh
};

template <typename T>
struct CacheEntry {
  T value;
  std::chrono::steady_clock::time_point fetched_at;
};

// Key -> value store where an entry is fresh iff now - fetched_at < ttl.
// Stale entries are kept (and counted) until the key is refreshed.
// Not synchronized; owners lock around it.
template <typename K, typename T>
class TtlCache {
public:
  using time_point = std::chrono::steady_clock::time_point;

  explicit TtlCache(std::chrono::steady_clock::duration ttl) : ttl_(ttl) {}

  [[nodiscard]] const CacheEntry<T>* find_fresh(const K& key, time_point now) const {
    auto it = map_.find(key);
    if (it == map_.end() || !fresh(it->second, now)) return nullptr;
    return &it->second;
  }

  // Replaces any previous entry wholesale.
  void put(const K& key, T value, time_point now) {
    map_.insert_or_assign(key, CacheEntry<T>{std::move(value), now});
  }

  [[nodiscard]] size_t size() const { return map_.size(); }

  [[nodiscard]] CacheStats stats(time_point now) const {
    CacheStats s{map_.size(), 0};
    for (const auto& [k, e] : map_) if (fresh(e, now)) ++s.entries;
    return s;
  }

  [[nodiscard]] std::chrono::steady_clock::duration ttl() const { return ttl_; }

private:
  [[nodiscard]] bool fresh(const CacheEntry<T>& e, time_point now) const { return now - e.fetched_at < ttl_; }

  std::chrono::steady_clock::duration ttl_;
  std::map<K, CacheEntry<T>> map_;
};

} // namespace netdiag::monitors

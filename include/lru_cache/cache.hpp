#pragma once

#include "lru_cache/clock.hpp"
#include "lru_cache/recency_list.hpp"
#include "lru_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lru_cache {

struct CacheConfig {
  std::size_t capacity{1000};
  // Return a stale value once (still discarding it) instead of a miss.
  bool allow_stale{false};
  // Applied to entries set without an explicit ttl. Limited to kMaxTtl.
  std::optional<Duration> default_ttl;
};

// A stale value handed back under allow_stale counts as a miss and an
// expiration, never as a hit.
struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
};

bool validate_config(const CacheConfig &cfg, std::string *err = nullptr);

// Fixed-capacity LRU map of string keys to string values. Not thread-safe:
// guard the whole object with one lock if it is shared.
class LruCache {
public:
  using const_iterator = RecencyList::const_iterator;
  using const_reverse_iterator = RecencyList::const_reverse_iterator;
  using Visitor = std::function<void(const Entry &, std::size_t)>;

  // Throws std::invalid_argument when cfg.capacity is 0.
  explicit LruCache(CacheConfig cfg,
                    std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());

  bool set(const std::string &key, std::string value,
           std::optional<Duration> ttl = std::nullopt,
           std::string *err = nullptr);
  std::optional<std::string> get(const std::string &key);
  bool has(const std::string &key) const;
  bool remove(const std::string &key);
  std::optional<std::string> pop();
  void reset();

  std::size_t size() const { return index_.size(); }
  bool empty() const { return index_.empty(); }
  std::size_t capacity() const { return cfg_.capacity; }

  // Read-only traversal, MRU first. Indices run 0..size()-1.
  void for_each(const Visitor &fn) const;
  // LRU first; indices count down from size()-1.
  void for_each_reverse(const Visitor &fn) const;
  std::vector<std::string> keys() const;
  std::vector<std::string> values() const;
  std::vector<EntrySnapshot> to_array() const;
  std::vector<EntrySnapshot> to_array_reverse() const;

  const_iterator begin() const { return list_.begin(); }
  const_iterator end() const { return list_.end(); }
  const_reverse_iterator rbegin() const { return list_.rbegin(); }
  const_reverse_iterator rend() const { return list_.rend(); }

  std::optional<std::string> head_key() const;
  std::optional<std::string> tail_key() const;

  std::string info() const;
  const CacheStats &stats() const { return stats_; }
  const CacheConfig &config() const { return cfg_; }
  const IClock &clock() const { return *clock_; }

private:
  using Index = std::unordered_map<std::string, Handle>;

  Entry erase_internal(Index::iterator it);
  void evict_tail();

  CacheConfig cfg_;
  std::shared_ptr<IClock> clock_;
  Index index_;
  RecencyList list_;
  CacheStats stats_;
};

} // namespace lru_cache

#include "lru_cache/cache.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

using namespace lru_cache;

namespace {
constexpr int kOps = 200000;

struct Workload {
  std::string name;
  // Runs operation i; returns true on a get hit.
  std::function<bool(LruCache &, ManualClock &, std::mt19937_64 &, int)> step;
  std::optional<Duration> default_ttl;
};

std::string key_of(std::uint64_t k) { return "k" + std::to_string(k); }

std::vector<Workload> workloads(std::size_t capacity) {
  std::vector<Workload> out;

  // Keyspace ten times the capacity, writes only: every insert evicts.
  out.push_back({"eviction_churn",
                 [capacity](LruCache &c, ManualClock &, std::mt19937_64 &rng,
                            int) {
                   c.set(key_of(rng() % (capacity * 10)), "v");
                   return false;
                 },
                 std::nullopt});

  // A hot set a tenth of the capacity read repeatedly while cold keys stream
  // through; the hot keys survive only because reads promote them.
  out.push_back({"promotion",
                 [capacity](LruCache &c, ManualClock &, std::mt19937_64 &rng,
                            int i) {
                   const auto hot = std::max<std::size_t>(1, capacity / 10);
                   if (i % 3 == 0) {
                     c.set(key_of(capacity + rng() % (capacity * 100)), "cold");
                     return false;
                   }
                   const auto k = key_of(rng() % hot);
                   if (c.get(k).has_value())
                     return true;
                   c.set(k, "hot");
                   return false;
                 },
                 std::nullopt});

  // Cyclic scan one key wider than the cache: the textbook LRU miss pattern.
  out.push_back({"cyclic_scan",
                 [capacity](LruCache &c, ManualClock &, std::mt19937_64 &,
                            int i) {
                   const auto k = key_of(static_cast<std::uint64_t>(i) %
                                         (capacity + 1));
                   if (c.get(k).has_value())
                     return true;
                   c.set(k, "s");
                   return false;
                 },
                 std::nullopt});

  // Overwrites of a resident keyspace; exercises unlink-before-relink.
  out.push_back({"overwrite",
                 [capacity](LruCache &c, ManualClock &, std::mt19937_64 &rng,
                            int i) {
                   c.set(key_of(rng() % capacity), std::to_string(i));
                   return false;
                 },
                 std::nullopt});

  // Reads against entries aging out under a manual clock.
  out.push_back({"ttl_expiry",
                 [capacity](LruCache &c, ManualClock &clock,
                            std::mt19937_64 &rng, int i) {
                   if (i % 100 == 0)
                     clock.advance(Duration(1));
                   const auto k = key_of(rng() % capacity);
                   if (c.get(k).has_value())
                     return true;
                   c.set(k, "t");
                   return false;
                 },
                 Duration(20)});
  return out;
}
} // namespace

int main() {
  const std::vector<std::size_t> capacities = {100, 1000, 10000};

  for (const auto capacity : capacities) {
    std::cout << "capacity=" << capacity << "\n";
    for (const auto &w : workloads(capacity)) {
      auto clock = std::make_shared<ManualClock>();
      CacheConfig cfg;
      cfg.capacity = capacity;
      cfg.default_ttl = w.default_ttl;
      LruCache cache(cfg, clock);
      std::mt19937_64 rng(42);

      std::uint64_t hits = 0;
      const auto start = std::chrono::steady_clock::now();
      for (int i = 0; i < kOps; ++i)
        if (w.step(cache, *clock, rng, i))
          ++hits;
      const auto elapsed = std::chrono::steady_clock::now() - start;

      const double seconds = std::chrono::duration<double>(elapsed).count();
      const double ns_per_op =
          std::chrono::duration<double, std::nano>(elapsed).count() / kOps;
      std::cout << "  workload=" << w.name << std::fixed
                << std::setprecision(2) << " ops/s=" << (kOps / seconds)
                << " ns/op=" << ns_per_op << " hit_rate="
                << (static_cast<double>(hits) / kOps)
                << " size=" << cache.size()
                << " evictions=" << cache.stats().evictions
                << " expirations=" << cache.stats().expirations << "\n";
    }
  }
  return 0;
}

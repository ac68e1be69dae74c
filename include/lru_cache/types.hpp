#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace lru_cache {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// Slot index into the recency list arena.
using Handle = std::uint32_t;
inline constexpr Handle kNullHandle = std::numeric_limits<Handle>::max();

// Largest ttl whose age comparison stays representable at clock resolution.
inline constexpr Duration kMaxTtl{Duration::max().count() / 1000000};

inline bool valid_ttl(Duration ttl) {
  return ttl.count() >= 0 && ttl <= kMaxTtl;
}

struct Entry {
  std::string key;
  std::string value;
  TimePoint created_at{};
  std::optional<Duration> ttl;
  Handle prev{kNullHandle};
  Handle next{kNullHandle};

  bool is_stale(TimePoint now) const {
    return ttl.has_value() &&
           std::chrono::duration_cast<Duration>(now - created_at) > *ttl;
  }
};

struct EntrySnapshot {
  std::string key;
  std::string value;
  TimePoint created_at{};
};

} // namespace lru_cache

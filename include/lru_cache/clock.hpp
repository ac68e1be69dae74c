#pragma once

#include "lru_cache/types.hpp"

namespace lru_cache {

class IClock {
public:
  virtual ~IClock() = default;
  virtual TimePoint now() const = 0;
};

class SystemClock final : public IClock {
public:
  TimePoint now() const override { return Clock::now(); }
};

// Only moves when told to. Starts at the steady clock's current reading so
// snapshots taken from it stay comparable with real timestamps.
class ManualClock final : public IClock {
public:
  ManualClock() : now_(Clock::now()) {}
  explicit ManualClock(TimePoint start) : now_(start) {}

  TimePoint now() const override { return now_; }
  void advance(Duration d) { now_ += d; }
  void set(TimePoint t) { now_ = t; }

private:
  TimePoint now_;
};

} // namespace lru_cache

#pragma once

#include "lru_cache/cache.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lru_cache {

struct ShellStats {
  std::uint64_t commands{0};
  std::uint64_t rejected{0};
};

// Text command front end over a cache. Replies are human-readable:
// OK, PONG, (nil), (integer) N, the raw value, numbered lists, ERR <reason>.
class CommandProcessor {
public:
  explicit CommandProcessor(LruCache &cache);

  std::string execute(const std::vector<std::string> &cmd);
  std::string execute_line(const std::string &line);

  const ShellStats &stats() const { return stats_; }

private:
  std::string reject(const std::string &reason);

  LruCache &cache_;
  ShellStats stats_{};
};

std::string reply_ok();
std::string reply_nil();
std::string reply_error(const std::string &reason);
std::string reply_integer(long long v);
std::string reply_list(const std::vector<std::string> &items);

} // namespace lru_cache

#include "lru_cache/command.hpp"

#include "lru_cache/util.hpp"

#include <chrono>
#include <sstream>

namespace lru_cache {

std::string reply_ok() { return "OK"; }
std::string reply_nil() { return "(nil)"; }
std::string reply_error(const std::string &reason) { return "ERR " + reason; }
std::string reply_integer(long long v) {
  return "(integer) " + std::to_string(v);
}

std::string reply_list(const std::vector<std::string> &items) {
  if (items.empty())
    return "(empty list)";
  std::ostringstream os;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i)
      os << "\n";
    os << (i + 1) << ") " << items[i];
  }
  return os.str();
}

CommandProcessor::CommandProcessor(LruCache &cache) : cache_(cache) {}

std::string CommandProcessor::reject(const std::string &reason) {
  ++stats_.rejected;
  return reply_error(reason);
}

std::string CommandProcessor::execute_line(const std::string &line) {
  std::vector<std::string> cmd;
  std::string err;
  if (!tokenize(line, cmd, &err)) {
    ++stats_.commands;
    return reject(err);
  }
  return execute(cmd);
}

std::string CommandProcessor::execute(const std::vector<std::string> &cmd) {
  ++stats_.commands;
  if (cmd.empty())
    return reject("empty command");

  const std::string op = upper(cmd[0]);

  if (op == "PING")
    return "PONG";

  if (op == "SET") {
    if (cmd.size() != 3 && cmd.size() != 5)
      return reject("SET key value [PX ms|EX sec]");
    std::optional<Duration> ttl;
    if (cmd.size() == 5) {
      const auto opt = upper(cmd[3]);
      std::uint64_t n = 0;
      if (!parse_u64(cmd[4], n))
        return reject("invalid numeric argument");
      const auto max_ms = static_cast<std::uint64_t>(kMaxTtl.count());
      if (opt == "PX") {
        if (n > max_ms)
          return reject("invalid ttl");
        ttl = Duration(static_cast<Duration::rep>(n));
      } else if (opt == "EX") {
        if (n > max_ms / 1000)
          return reject("invalid ttl");
        ttl = std::chrono::duration_cast<Duration>(
            std::chrono::seconds(static_cast<std::chrono::seconds::rep>(n)));
      } else {
        return reject("syntax error");
      }
    }
    std::string err;
    if (!cache_.set(cmd[1], cmd[2], ttl, &err))
      return reject(err);
    return reply_ok();
  }

  if (op == "GET") {
    if (cmd.size() != 2)
      return reject("GET key");
    auto v = cache_.get(cmd[1]);
    return v ? *v : reply_nil();
  }

  if (op == "HAS") {
    if (cmd.size() != 2)
      return reject("HAS key");
    return reply_integer(cache_.has(cmd[1]) ? 1 : 0);
  }

  if (op == "DEL") {
    if (cmd.size() < 2)
      return reject("DEL key [key...]");
    long long removed = 0;
    for (std::size_t i = 1; i < cmd.size(); ++i)
      if (cache_.remove(cmd[i]))
        ++removed;
    return reply_integer(removed);
  }

  if (op == "POP") {
    if (cmd.size() != 1)
      return reject("POP");
    auto v = cache_.pop();
    return v ? *v : reply_nil();
  }

  if (op == "SIZE") {
    if (cmd.size() != 1)
      return reject("SIZE");
    return reply_integer(static_cast<long long>(cache_.size()));
  }

  if (op == "RESET") {
    if (cmd.size() != 1)
      return reject("RESET");
    cache_.reset();
    return reply_ok();
  }

  if (op == "KEYS") {
    if (cmd.size() != 1)
      return reject("KEYS");
    return reply_list(cache_.keys());
  }

  if (op == "VALUES") {
    if (cmd.size() != 1)
      return reject("VALUES");
    return reply_list(cache_.values());
  }

  if (op == "DUMP") {
    bool reverse = false;
    if (cmd.size() == 2 && upper(cmd[1]) == "REV")
      reverse = true;
    else if (cmd.size() != 1)
      return reject("DUMP [REV]");
    const auto now = cache_.clock().now();
    const auto snapshots =
        reverse ? cache_.to_array_reverse() : cache_.to_array();
    std::vector<std::string> lines;
    lines.reserve(snapshots.size());
    for (const auto &s : snapshots) {
      const auto age =
          std::chrono::duration_cast<Duration>(now - s.created_at).count();
      lines.push_back(s.key + " " + s.value + " age_ms:" + std::to_string(age));
    }
    return reply_list(lines);
  }

  if (op == "INFO") {
    if (cmd.size() != 1)
      return reject("INFO");
    std::ostringstream info;
    info << cache_.info();
    info << "commands:" << stats_.commands << "\n";
    info << "rejected_commands:" << stats_.rejected;
    return info.str();
  }

  return reject("unknown command");
}

} // namespace lru_cache

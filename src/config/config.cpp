#include "lru_cache/config.hpp"

#include "lru_cache/util.hpp"

#include <fstream>
#include <regex>
#include <sstream>

namespace lru_cache {
namespace {
enum class Extract { Absent, Ok, Invalid };

Extract extract_u64(const std::string &text, const std::string &key,
                    std::uint64_t &out) {
  std::regex present("\"" + key + "\"\\s*:");
  if (!std::regex_search(text, present))
    return Extract::Absent;
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re) || !parse_u64(m[1].str(), out))
    return Extract::Invalid;
  return Extract::Ok;
}

Extract extract_bool(const std::string &text, const std::string &key,
                     bool &out) {
  std::regex present("\"" + key + "\"\\s*:");
  if (!std::regex_search(text, present))
    return Extract::Absent;
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return Extract::Invalid;
  out = m[1].str() == "true";
  return Extract::Ok;
}

bool next_value(const std::vector<std::string> &args, std::size_t &i,
                std::string &out) {
  if (i + 1 >= args.size())
    return false;
  out = args[++i];
  return true;
}
} // namespace

bool parse_config_text(const std::string &text, CacheConfig &out,
                       std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheConfig cfg = out;
  std::uint64_t u = 0;
  bool b = false;

  switch (extract_u64(text, "capacity", u)) {
  case Extract::Ok:
    cfg.capacity = static_cast<std::size_t>(u);
    break;
  case Extract::Invalid:
    if (err)
      *err = "capacity must be a non-negative integer";
    return false;
  case Extract::Absent:
    break;
  }
  switch (extract_bool(text, "allow_stale", b)) {
  case Extract::Ok:
    cfg.allow_stale = b;
    break;
  case Extract::Invalid:
    if (err)
      *err = "allow_stale must be true or false";
    return false;
  case Extract::Absent:
    break;
  }
  switch (extract_u64(text, "default_ttl_ms", u)) {
  case Extract::Ok:
    if (u > static_cast<std::uint64_t>(kMaxTtl.count())) {
      if (err)
        *err = "invalid default ttl";
      return false;
    }
    cfg.default_ttl = Duration(static_cast<Duration::rep>(u));
    break;
  case Extract::Invalid:
    if (err)
      *err = "default_ttl_ms must be a non-negative integer";
    return false;
  case Extract::Absent:
    break;
  }

  if (!validate_config(cfg, err))
    return false;
  out = cfg;
  return true;
}

bool load_config(const std::string &path, CacheConfig &out, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config_text(ss.str(), out, err);
}

bool parse_cli_args(const std::vector<std::string> &args, CliOptions &out,
                    std::string *err) {
  CliOptions opts = out;
  std::string v;

  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--config") {
      if (!next_value(args, i, v)) {
        if (err)
          *err = "--config requires a path";
        return false;
      }
      opts.config_path = v;
    }
  }
  if (!opts.config_path.empty() &&
      !load_config(opts.config_path, opts.cache, err))
    return false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto &a = args[i];
    std::uint64_t u = 0;
    if (a == "--config") {
      ++i;
    } else if (a == "--allow-stale") {
      opts.cache.allow_stale = true;
    } else if (a == "--help" || a == "-h") {
      opts.show_help = true;
    } else if (a == "--capacity") {
      if (!next_value(args, i, v) || !parse_u64(v, u)) {
        if (err)
          *err = "--capacity requires a number";
        return false;
      }
      opts.cache.capacity = static_cast<std::size_t>(u);
    } else if (a == "--default-ttl-ms") {
      if (!next_value(args, i, v) || !parse_u64(v, u)) {
        if (err)
          *err = "--default-ttl-ms requires a number";
        return false;
      }
      if (u > static_cast<std::uint64_t>(kMaxTtl.count())) {
        if (err)
          *err = "invalid default ttl";
        return false;
      }
      opts.cache.default_ttl = Duration(static_cast<Duration::rep>(u));
    } else {
      if (err)
        *err = "unknown option " + a;
      return false;
    }
  }

  if (!validate_config(opts.cache, err))
    return false;
  out = opts;
  return true;
}

} // namespace lru_cache

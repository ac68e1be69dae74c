#pragma once

#include "lru_cache/cache.hpp"

#include <string>
#include <vector>

namespace lru_cache {

// Reads {"capacity":N,"allow_stale":bool,"default_ttl_ms":N}. Absent keys keep
// the value already in `out`; on failure `out` is left untouched.
bool load_config(const std::string &path, CacheConfig &out,
                 std::string *err = nullptr);
bool parse_config_text(const std::string &text, CacheConfig &out,
                       std::string *err = nullptr);

struct CliOptions {
  CacheConfig cache;
  std::string config_path;
  bool show_help{false};
};

// Flags: --capacity N, --default-ttl-ms N, --allow-stale, --config PATH,
// --help. Values given as flags win over the config file.
bool parse_cli_args(const std::vector<std::string> &args, CliOptions &out,
                    std::string *err = nullptr);

} // namespace lru_cache

#include "lru_cache/cache.hpp"
#include "lru_cache/command.hpp"
#include "lru_cache/config.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void usage() {
  std::cout << "usage: lru_cache_cli [--capacity N] [--default-ttl-ms N] "
               "[--allow-stale] [--config PATH]\n"
               "reads commands from stdin, one per line; 'quit' exits\n";
}
} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  lru_cache::CliOptions opts;
  std::string err;
  if (!lru_cache::parse_cli_args(args, opts, &err)) {
    std::cerr << "lru_cache_cli: " << err << "\n";
    usage();
    return 1;
  }
  if (opts.show_help) {
    usage();
    return 0;
  }

  try {
    lru_cache::LruCache cache(opts.cache);
    lru_cache::CommandProcessor shell(cache);
    std::cout << "lru_cache_cli ready, capacity " << cache.capacity() << "\n";

    std::string line;
    while (std::getline(std::cin, line)) {
      if (line == "quit")
        break;
      if (line.find_first_not_of(" \t\r") == std::string::npos)
        continue;
      std::cout << shell.execute_line(line) << std::endl;
    }
  } catch (const std::invalid_argument &e) {
    std::cerr << "lru_cache_cli: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

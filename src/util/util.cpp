#include "lru_cache/util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace lru_cache {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

bool parse_u64(const std::string &s, std::uint64_t &out) {
  if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
      }))
    return false;
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size();
  } catch (const std::out_of_range &) {
    return false;
  }
}

bool tokenize(const std::string &line, std::vector<std::string> &out,
              std::string *err) {
  std::vector<std::string> tokens;
  std::size_t i = 0;
  while (i < line.size()) {
    if (std::isspace(static_cast<unsigned char>(line[i]))) {
      ++i;
      continue;
    }
    std::string tok;
    if (line[i] == '"') {
      ++i;
      bool closed = false;
      while (i < line.size()) {
        const char c = line[i++];
        if (c == '"') {
          closed = true;
          break;
        }
        if (c == '\\' && i < line.size() &&
            (line[i] == '"' || line[i] == '\\'))
          tok.push_back(line[i++]);
        else
          tok.push_back(c);
      }
      if (!closed) {
        if (err)
          *err = "unterminated quote";
        return false;
      }
    } else {
      while (i < line.size() &&
             !std::isspace(static_cast<unsigned char>(line[i])))
        tok.push_back(line[i++]);
    }
    tokens.push_back(std::move(tok));
  }
  out = std::move(tokens);
  return true;
}

} // namespace lru_cache

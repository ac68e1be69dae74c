#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lru_cache {

std::string upper(std::string s);
// Digits only; rejects signs, whitespace, trailing junk and overflow.
bool parse_u64(const std::string &s, std::uint64_t &out);
// Splits on whitespace. Double quotes group a token and may be empty; \" and
// \\ escape inside quotes. Returns false on an unterminated quote.
bool tokenize(const std::string &line, std::vector<std::string> &out,
              std::string *err = nullptr);

} // namespace lru_cache

#include "lru_cache/cache.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lru_cache {
namespace {
constexpr std::size_t kInitialReserve = 4096;

EntrySnapshot snapshot_of(const Entry &e) {
  return {e.key, e.value, e.created_at};
}
} // namespace

bool validate_config(const CacheConfig &cfg, std::string *err) {
  if (cfg.capacity == 0) {
    if (err)
      *err = "capacity must be positive";
    return false;
  }
  if (cfg.default_ttl.has_value() && !valid_ttl(*cfg.default_ttl)) {
    if (err)
      *err = "invalid default ttl";
    return false;
  }
  return true;
}

LruCache::LruCache(CacheConfig cfg, std::shared_ptr<IClock> clock)
    : cfg_(std::move(cfg)), clock_(std::move(clock)) {
  std::string err;
  if (!validate_config(cfg_, &err))
    throw std::invalid_argument(err);
  if (!clock_)
    throw std::invalid_argument("clock must not be null");
  const auto reserve = std::min(cfg_.capacity, kInitialReserve);
  index_.reserve(reserve);
  list_.reserve(reserve);
}

bool LruCache::set(const std::string &key, std::string value,
                   std::optional<Duration> ttl, std::string *err) {
  if (key.empty()) {
    if (err)
      *err = "invalid key length";
    return false;
  }
  if (ttl.has_value() && !valid_ttl(*ttl)) {
    if (err)
      *err = "invalid ttl";
    return false;
  }

  // The old node must be gone before the capacity check and the relink.
  if (auto it = index_.find(key); it != index_.end())
    erase_internal(it);
  if (index_.size() >= cfg_.capacity)
    evict_tail();

  Entry entry;
  entry.key = key;
  entry.value = std::move(value);
  entry.created_at = clock_->now();
  entry.ttl = ttl.has_value() ? ttl : cfg_.default_ttl;
  const Handle h = list_.push_front(std::move(entry));
  index_.emplace(key, h);
  return true;
}

std::optional<std::string> LruCache::get(const std::string &key) {
  auto it = index_.find(key);
  if (it == index_.end()) {
    ++stats_.misses;
    return std::nullopt;
  }
  const Handle h = it->second;
  if (list_.at(h).is_stale(clock_->now())) {
    Entry stale = erase_internal(it);
    ++stats_.expirations;
    ++stats_.misses;
    if (cfg_.allow_stale)
      return std::move(stale.value);
    return std::nullopt;
  }
  // Promotion keeps created_at and ttl, so the staleness clock keeps running.
  list_.move_to_front(h);
  ++stats_.hits;
  return list_.at(h).value;
}

bool LruCache::has(const std::string &key) const {
  return index_.find(key) != index_.end();
}

bool LruCache::remove(const std::string &key) {
  auto it = index_.find(key);
  if (it == index_.end())
    return false;
  erase_internal(it);
  return true;
}

std::optional<std::string> LruCache::pop() {
  if (list_.empty())
    return std::nullopt;
  auto it = index_.find(list_.at(list_.tail()).key);
  const bool stale = list_.at(it->second).is_stale(clock_->now());
  Entry evicted = erase_internal(it);
  if (stale) {
    ++stats_.expirations;
    if (!cfg_.allow_stale)
      return std::nullopt;
  }
  return std::move(evicted.value);
}

void LruCache::reset() {
  index_ = Index{};
  list_.clear();
}

void LruCache::for_each(const Visitor &fn) const {
  std::size_t i = 0;
  for (const auto &e : list_)
    fn(e, i++);
}

void LruCache::for_each_reverse(const Visitor &fn) const {
  std::size_t i = list_.size();
  for (auto it = list_.rbegin(); it != list_.rend(); ++it)
    fn(*it, --i);
}

std::vector<std::string> LruCache::keys() const {
  std::vector<std::string> out;
  out.reserve(list_.size());
  for (const auto &e : list_)
    out.push_back(e.key);
  return out;
}

std::vector<std::string> LruCache::values() const {
  std::vector<std::string> out;
  out.reserve(list_.size());
  for (const auto &e : list_)
    out.push_back(e.value);
  return out;
}

std::vector<EntrySnapshot> LruCache::to_array() const {
  std::vector<EntrySnapshot> out;
  out.reserve(list_.size());
  for (const auto &e : list_)
    out.push_back(snapshot_of(e));
  return out;
}

std::vector<EntrySnapshot> LruCache::to_array_reverse() const {
  std::vector<EntrySnapshot> out;
  out.reserve(list_.size());
  for (auto it = list_.rbegin(); it != list_.rend(); ++it)
    out.push_back(snapshot_of(*it));
  return out;
}

std::optional<std::string> LruCache::head_key() const {
  if (list_.empty())
    return std::nullopt;
  return list_.at(list_.head()).key;
}

std::optional<std::string> LruCache::tail_key() const {
  if (list_.empty())
    return std::nullopt;
  return list_.at(list_.tail()).key;
}

std::string LruCache::info() const {
  std::ostringstream os;
  os << "capacity:" << cfg_.capacity << "\n";
  os << "keys:" << index_.size() << "\n";
  os << "allow_stale:" << (cfg_.allow_stale ? 1 : 0) << "\n";
  os << "default_ttl_ms:"
     << (cfg_.default_ttl.has_value() ? cfg_.default_ttl->count() : -1)
     << "\n";
  os << "hits:" << stats_.hits << "\n";
  os << "misses:" << stats_.misses << "\n";
  os << "evictions:" << stats_.evictions << "\n";
  os << "expirations:" << stats_.expirations << "\n";
  return os.str();
}

Entry LruCache::erase_internal(Index::iterator it) {
  const Handle h = it->second;
  index_.erase(it);
  return list_.release(h);
}

void LruCache::evict_tail() {
  if (list_.empty())
    return;
  auto it = index_.find(list_.at(list_.tail()).key);
  erase_internal(it);
  ++stats_.evictions;
}

} // namespace lru_cache

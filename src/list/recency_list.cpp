#include "lru_cache/recency_list.hpp"

#include <stdexcept>
#include <utility>

namespace lru_cache {

Handle RecencyList::push_front(Entry entry) {
  Handle h;
  if (!free_.empty()) {
    h = free_.back();
    free_.pop_back();
  } else {
    if (slots_.size() >= static_cast<std::size_t>(kNullHandle))
      throw std::length_error("recency list arena exhausted");
    h = static_cast<Handle>(slots_.size());
    slots_.emplace_back();
  }
  auto &slot = slots_[h];
  slot.entry = std::move(entry);
  slot.live = true;
  link_front(h);
  return h;
}

void RecencyList::unlink(Handle h) {
  auto &e = slots_[h].entry;
  if (e.prev != kNullHandle)
    slots_[e.prev].entry.next = e.next;
  else
    head_ = e.next;
  if (e.next != kNullHandle)
    slots_[e.next].entry.prev = e.prev;
  else
    tail_ = e.prev;
  e.prev = kNullHandle;
  e.next = kNullHandle;
  --size_;
}

void RecencyList::link_front(Handle h) {
  auto &e = slots_[h].entry;
  e.prev = kNullHandle;
  e.next = head_;
  if (head_ != kNullHandle)
    slots_[head_].entry.prev = h;
  else
    tail_ = h;
  head_ = h;
  ++size_;
}

void RecencyList::move_to_front(Handle h) {
  if (h == head_)
    return;
  unlink(h);
  link_front(h);
}

Entry RecencyList::release(Handle h) {
  unlink(h);
  auto &slot = slots_[h];
  Entry out = std::move(slot.entry);
  slot.entry = Entry{};
  slot.live = false;
  free_.push_back(h);
  return out;
}

void RecencyList::clear() {
  slots_.clear();
  free_.clear();
  head_ = kNullHandle;
  tail_ = kNullHandle;
  size_ = 0;
}

void RecencyList::reserve(std::size_t n) {
  slots_.reserve(n);
  free_.reserve(n);
}

} // namespace lru_cache

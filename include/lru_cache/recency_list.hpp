#pragma once

#include "lru_cache/types.hpp"

#include <cstddef>
#include <iterator>
#include <vector>

namespace lru_cache {

// Doubly linked list of entries, MRU at head, LRU at tail. Entries live in an
// arena of slots and are addressed by handles that stay valid until the
// entry is released or the list is cleared.
class RecencyList {
public:
  class const_iterator {
  public:
    using iterator_category = std::bidirectional_iterator_tag;
    using value_type = Entry;
    using difference_type = std::ptrdiff_t;
    using pointer = const Entry *;
    using reference = const Entry &;

    const_iterator() = default;

    reference operator*() const { return list_->at(handle_); }
    pointer operator->() const { return &list_->at(handle_); }

    const_iterator &operator++() {
      handle_ = list_->at(handle_).next;
      return *this;
    }
    const_iterator operator++(int) {
      auto tmp = *this;
      ++*this;
      return tmp;
    }
    // Decrementing end() lands on the tail.
    const_iterator &operator--() {
      handle_ = handle_ == kNullHandle ? list_->tail_ : list_->at(handle_).prev;
      return *this;
    }
    const_iterator operator--(int) {
      auto tmp = *this;
      --*this;
      return tmp;
    }

    Handle handle() const { return handle_; }

    bool operator==(const const_iterator &other) const {
      return list_ == other.list_ && handle_ == other.handle_;
    }
    bool operator!=(const const_iterator &other) const {
      return !(*this == other);
    }

  private:
    friend class RecencyList;
    const_iterator(const RecencyList *list, Handle h) : list_(list), handle_(h) {}

    const RecencyList *list_{nullptr};
    Handle handle_{kNullHandle};
  };

  using const_reverse_iterator = std::reverse_iterator<const_iterator>;

  // Stores the entry in a free slot and links it at the head.
  Handle push_front(Entry entry);
  // Detaches from the chain but keeps the slot; pair with link_front.
  void unlink(Handle h);
  void link_front(Handle h);
  void move_to_front(Handle h);
  // Unlinks, frees the slot and hands the entry back.
  Entry release(Handle h);
  void clear();
  void reserve(std::size_t n);

  const Entry &at(Handle h) const { return slots_[h].entry; }
  bool live(Handle h) const { return h < slots_.size() && slots_[h].live; }
  Handle head() const { return head_; }
  Handle tail() const { return tail_; }
  std::size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  std::size_t slot_count() const { return slots_.size(); }

  const_iterator begin() const { return {this, head_}; }
  const_iterator end() const { return {this, kNullHandle}; }
  const_reverse_iterator rbegin() const { return const_reverse_iterator(end()); }
  const_reverse_iterator rend() const { return const_reverse_iterator(begin()); }

private:
  struct Slot {
    Entry entry;
    bool live{false};
  };

  std::vector<Slot> slots_;
  std::vector<Handle> free_;
  Handle head_{kNullHandle};
  Handle tail_{kNullHandle};
  std::size_t size_{0};
};

} // namespace lru_cache

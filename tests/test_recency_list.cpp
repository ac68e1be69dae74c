#include "lru_cache/recency_list.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace lru_cache;

namespace {
Entry make_entry(const std::string &key) {
  Entry e;
  e.key = key;
  e.value = "v-" + key;
  return e;
}

std::vector<std::string> forward(const RecencyList &l) {
  std::vector<std::string> out;
  for (const auto &e : l)
    out.push_back(e.key);
  return out;
}

std::vector<std::string> backward(const RecencyList &l) {
  std::vector<std::string> out;
  for (auto it = l.rbegin(); it != l.rend(); ++it)
    out.push_back(it->key);
  return out;
}
} // namespace

TEST_CASE("push_front links new entries at the head", "[list]") {
  RecencyList l;
  CHECK(l.head() == kNullHandle);
  CHECK(l.tail() == kNullHandle);

  const auto a = l.push_front(make_entry("a"));
  CHECK(l.head() == a);
  CHECK(l.tail() == a);
  CHECK(l.at(a).prev == kNullHandle);
  CHECK(l.at(a).next == kNullHandle);

  l.push_front(make_entry("b"));
  l.push_front(make_entry("c"));
  CHECK(l.size() == 3);
  CHECK(forward(l) == std::vector<std::string>{"c", "b", "a"});
  CHECK(backward(l) == std::vector<std::string>{"a", "b", "c"});
  CHECK(l.at(l.head()).prev == kNullHandle);
  CHECK(l.at(l.tail()).next == kNullHandle);
}

TEST_CASE("release repairs neighbours for every position", "[list]") {
  RecencyList l;
  const auto a = l.push_front(make_entry("a"));
  const auto b = l.push_front(make_entry("b"));
  const auto c = l.push_front(make_entry("c"));
  const auto d = l.push_front(make_entry("d"));

  auto mid = l.release(b);
  CHECK(mid.key == "b");
  CHECK(mid.value == "v-b");
  CHECK(forward(l) == std::vector<std::string>{"d", "c", "a"});
  CHECK(backward(l) == std::vector<std::string>{"a", "c", "d"});

  l.release(d);
  CHECK(l.head() == c);
  CHECK(l.at(c).prev == kNullHandle);

  l.release(a);
  CHECK(l.tail() == c);
  CHECK(l.at(c).next == kNullHandle);

  l.release(c);
  CHECK(l.empty());
  CHECK(l.head() == kNullHandle);
  CHECK(l.tail() == kNullHandle);
  CHECK(l.begin() == l.end());
}

TEST_CASE("freed slots are reused and handles stay stable", "[list][arena]") {
  RecencyList l;
  const auto a = l.push_front(make_entry("a"));
  const auto b = l.push_front(make_entry("b"));
  l.release(a);
  CHECK_FALSE(l.live(a));
  const auto c = l.push_front(make_entry("c"));
  CHECK(c == a);
  CHECK(l.slot_count() == 2);
  CHECK(l.live(b));
  CHECK(l.at(b).key == "b");
  CHECK(forward(l) == std::vector<std::string>{"c", "b"});
}

TEST_CASE("move_to_front promotes tail and middle entries", "[list]") {
  RecencyList l;
  const auto a = l.push_front(make_entry("a"));
  const auto b = l.push_front(make_entry("b"));
  l.push_front(make_entry("c"));

  l.move_to_front(a);
  CHECK(forward(l) == std::vector<std::string>{"a", "c", "b"});
  CHECK(l.tail() == b);
  l.move_to_front(a);
  CHECK(forward(l) == std::vector<std::string>{"a", "c", "b"});
  l.move_to_front(l.at(a).next);
  CHECK(forward(l) == std::vector<std::string>{"c", "a", "b"});
  CHECK(backward(l) == std::vector<std::string>{"b", "a", "c"});
  CHECK(l.size() == 3);
}

TEST_CASE("clear drops every slot", "[list]") {
  RecencyList l;
  l.push_front(make_entry("a"));
  l.push_front(make_entry("b"));
  l.clear();
  CHECK(l.size() == 0);
  CHECK(l.slot_count() == 0);
  CHECK(l.rbegin() == l.rend());
  const auto h = l.push_front(make_entry("x"));
  CHECK(h == 0);
  CHECK(forward(l) == std::vector<std::string>{"x"});
}

// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <map>
#include <random>
#include <string>
#include <symbol_tables/red_black_bst.hpp>
#include <vector>

using namespace symbol_tables;

// Key generators for the typed tests
struct IntKeys {
  using key_type = int;
  static int make(int i) { return i; }
};
struct Int64Keys {
  using key_type = std::int64_t;
  static std::int64_t make(int i) {
    return static_cast<std::int64_t>(i) * 1'000'003 - 250'000'000;
  }
};
struct StringKeys {
  using key_type = std::string;
  static std::string make(int i) { return "key-" + std::to_string(i); }
};

namespace {

template <typename Table, typename Map>
void require_same_contents(const Table& st, const Map& expected) {
  REQUIRE(st.size() == expected.size());
  auto keys = st.keys();
  REQUIRE(keys.size() == expected.size());
  auto it = expected.begin();
  for (const auto& key : keys) {
    REQUIRE(key == it->first);
    REQUIRE(st.get(key) == it->second);
    ++it;
  }
}

template <typename Table>
void require_height_bound(const Table& st) {
  const double bound = 2.0 * std::log2(static_cast<double>(st.size()) + 1.0);
  REQUIRE(static_cast<double>(st.height()) <= bound);
}

}  // namespace

TEMPLATE_TEST_CASE("red_black_bst matches std::map under random put/erase",
                   "[red_black_bst][random]", IntKeys, Int64Keys,
                   StringKeys) {
  using Key = typename TestType::key_type;
  red_black_bst<Key, int> st;
  std::map<Key, int> expected;

  std::mt19937 rng(20251019);
  std::uniform_int_distribution<int> key_dist(0, 399);
  std::uniform_int_distribution<int> op_dist(0, 99);

  for (int step = 0; step < 3000; ++step) {
    const Key key = TestType::make(key_dist(rng));
    const int op = op_dist(rng);

    if (op < 55) {
      const std::size_t before = st.size();
      const bool is_new = expected.find(key) == expected.end();
      st.put(key, step);
      expected[key] = step;
      REQUIRE(st.size() == before + (is_new ? 1 : 0));
    } else if (op < 90) {
      const std::size_t before = st.size();
      const std::size_t removed = expected.erase(key);
      REQUIRE(st.erase(key) == removed);
      REQUIRE(st.size() == before - removed);
    } else if (op < 95) {
      if (!expected.empty()) {
        REQUIRE(st.min() == expected.begin()->first);
        st.erase_min();
        expected.erase(expected.begin());
      }
    } else {
      if (!expected.empty()) {
        REQUIRE(st.max() == std::prev(expected.end())->first);
        st.erase_max();
        expected.erase(std::prev(expected.end()));
      }
    }

    REQUIRE(st.is_bst());
    REQUIRE(st.count_check());
    REQUIRE(st.is_23());
    REQUIRE(st.is_balanced());
    if (step % 50 == 0) {
      REQUIRE(st.rank_check());
      require_same_contents(st, expected);
      require_height_bound(st);
    }
  }

  require_same_contents(st, expected);
  REQUIRE(st.check());
}

TEMPLATE_TEST_CASE("red_black_bst ordered queries agree with std::map",
                   "[red_black_bst][random]", IntKeys, Int64Keys,
                   StringKeys) {
  using Key = typename TestType::key_type;
  red_black_bst<Key, int> st;
  std::map<Key, int> expected;

  std::mt19937 rng(7);
  std::uniform_int_distribution<int> key_dist(0, 999);
  // Only even ids are inserted so odd ids probe the gaps
  for (int i = 0; i < 300; ++i) {
    const int id = key_dist(rng) & ~1;
    st.put(TestType::make(id), id);
    expected[TestType::make(id)] = id;
  }
  REQUIRE(st.check());

  SECTION("Order statistics duality") {
    for (std::size_t i = 0; i < st.size(); ++i) {
      REQUIRE(st.rank(st.select(i)) == i);
    }
    for (const auto& [key, value] : expected) {
      REQUIRE(st.select(st.rank(key)) == key);
    }
  }

  SECTION("Rank, floor and ceiling of arbitrary probes") {
    for (int id = 0; id < 1000; ++id) {
      const Key probe = TestType::make(id);
      auto lower = expected.lower_bound(probe);
      auto upper = expected.upper_bound(probe);

      REQUIRE(st.rank(probe) ==
              static_cast<std::size_t>(
                  std::distance(expected.begin(), lower)));

      if (lower == expected.end()) {
        REQUIRE_THROWS_AS(st.ceil(probe), key_not_found);
      } else {
        REQUIRE(st.ceil(probe) == lower->first);
      }

      if (upper == expected.begin()) {
        REQUIRE_THROWS_AS(st.floor(probe), key_not_found);
      } else {
        REQUIRE(st.floor(probe) == std::prev(upper)->first);
      }
    }
  }

  SECTION("Range queries") {
    for (int trial = 0; trial < 200; ++trial) {
      const Key lo = TestType::make(key_dist(rng));
      const Key hi = TestType::make(key_dist(rng));

      std::vector<Key> in_range;
      if (!(hi < lo)) {
        for (auto it = expected.lower_bound(lo);
             it != expected.end() && !(hi < it->first); ++it) {
          in_range.push_back(it->first);
        }
      }
      REQUIRE(st.range_keys(lo, hi) == in_range);
      REQUIRE(st.key_size(lo, hi) == in_range.size());
    }
  }

  SECTION("Erasing absent keys leaves the structure untouched") {
    auto levels_before = st.level_order();
    for (int id = 1; id < 1000; id += 2) {
      REQUIRE(st.erase(TestType::make(id)) == 0);
    }
    REQUIRE(st.level_order() == levels_before);
    REQUIRE(st.check());
  }

  SECTION("Level order covers every key once") {
    std::size_t total = 0;
    for (const auto& level : st.level_order()) {
      total += level.size();
    }
    REQUIRE(total == st.size());
    REQUIRE(st.level_order().size() ==
            static_cast<std::size_t>(st.height() + 1));
  }
}

TEST_CASE("red_black_bst height stays logarithmic", "[red_black_bst][balance]") {
  red_black_bst<int, int> st;
  std::mt19937 rng(99);
  std::uniform_int_distribution<int> dist(0, 1 << 20);

  SECTION("Random inserts") {
    for (int i = 0; i < 20000; ++i) {
      st.put(dist(rng), i);
    }
    require_height_bound(st);
    REQUIRE(st.check());
  }

  SECTION("Descending inserts then random erases") {
    for (int i = 20000; i > 0; --i) {
      st.put(i, i);
    }
    require_height_bound(st);
    for (int i = 0; i < 15000; ++i) {
      st.erase(dist(rng) % 20000 + 1);
    }
    require_height_bound(st);
    REQUIRE(st.check());
  }
}

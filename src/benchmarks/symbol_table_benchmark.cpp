// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_map.h>
#include <benchmark/benchmark.h>

#include <cstdint>
#include <map>
#include <random>
#include <symbol_tables/red_black_bst.hpp>
#include <vector>

using namespace symbol_tables;

// Benchmark parameters
constexpr size_t TABLE_SIZE = 100000;
constexpr size_t BATCH_SIZE = 10000;
constexpr size_t BATCHES = 10;

static std::vector<int64_t> make_keys(size_t count) {
  std::vector<int64_t> keys(count);
  std::mt19937 rng(42);
  std::uniform_int_distribution<int64_t> dist;
  for (auto& k : keys)
    k = dist(rng);
  return keys;
}

/**
 * Remove-Insert-Find cycles against a pre-populated table:
 * 1. Pre-populate table to TABLE_SIZE
 * 2. Run BATCHES of: erase BATCH_SIZE, insert BATCH_SIZE, find all keys
 */
static void BM_RedBlackBST_Churn(benchmark::State& state) {
  red_black_bst<int64_t, size_t> table;
  auto keys = make_keys(TABLE_SIZE);
  for (size_t i = 0; i < TABLE_SIZE; ++i) {
    table.put(keys[i], i);
  }

  for (auto _ : state) {
    for (size_t batch = 0; batch < BATCHES; ++batch) {
      for (size_t i = 0; i < BATCH_SIZE; ++i) {
        table.erase(keys[i]);
      }
      for (size_t i = 0; i < BATCH_SIZE; ++i) {
        table.put(keys[i], i);
      }
      for (size_t i = 0; i < TABLE_SIZE; ++i) {
        benchmark::DoNotOptimize(table.get(keys[i]));
      }
    }
  }

  state.SetItemsProcessed(state.iterations() * BATCHES *
                          (2 * BATCH_SIZE + TABLE_SIZE));
}
BENCHMARK(BM_RedBlackBST_Churn);

template <typename Map>
static void RunMapChurn(benchmark::State& state) {
  Map table;
  auto keys = make_keys(TABLE_SIZE);
  for (size_t i = 0; i < TABLE_SIZE; ++i) {
    table.insert({keys[i], i});
  }

  for (auto _ : state) {
    for (size_t batch = 0; batch < BATCHES; ++batch) {
      for (size_t i = 0; i < BATCH_SIZE; ++i) {
        table.erase(keys[i]);
      }
      for (size_t i = 0; i < BATCH_SIZE; ++i) {
        table.insert({keys[i], i});
      }
      for (size_t i = 0; i < TABLE_SIZE; ++i) {
        benchmark::DoNotOptimize(table.find(keys[i]));
      }
    }
  }

  state.SetItemsProcessed(state.iterations() * BATCHES *
                          (2 * BATCH_SIZE + TABLE_SIZE));
}

static void BM_StdMap_Churn(benchmark::State& state) {
  RunMapChurn<std::map<int64_t, size_t>>(state);
}
BENCHMARK(BM_StdMap_Churn);

static void BM_AbslBtreeMap_Churn(benchmark::State& state) {
  RunMapChurn<absl::btree_map<int64_t, size_t>>(state);
}
BENCHMARK(BM_AbslBtreeMap_Churn);

// ============================================================================
// Growth and order statistics
// ============================================================================

static void BM_RedBlackBST_AscendingPut(benchmark::State& state) {
  const auto n = static_cast<int64_t>(state.range(0));
  for (auto _ : state) {
    red_black_bst<int64_t, int64_t> table;
    for (int64_t i = 0; i < n; ++i) {
      table.put(i, i);
    }
    benchmark::DoNotOptimize(table.height());
  }
  state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_RedBlackBST_AscendingPut)->Range(1 << 10, 1 << 18);

static void BM_RedBlackBST_RankSelect(benchmark::State& state) {
  const auto n = static_cast<size_t>(state.range(0));
  red_black_bst<int64_t, size_t> table;
  auto keys = make_keys(n);
  for (size_t i = 0; i < n; ++i) {
    table.put(keys[i], i);
  }

  size_t i = 0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(table.select(table.rank(keys[i])));
    i = (i + 1) % n;
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RedBlackBST_RankSelect)->Range(1 << 10, 1 << 18);

static void BM_RedBlackBST_FloorCeil(benchmark::State& state) {
  const auto n = static_cast<size_t>(state.range(0));
  red_black_bst<int64_t, size_t> table;
  // Even keys only, so odd probes miss
  for (size_t i = 0; i < n; ++i) {
    table.put(static_cast<int64_t>(2 * i), i);
  }

  int64_t probe = 1;
  for (auto _ : state) {
    benchmark::DoNotOptimize(table.floor(probe));
    benchmark::DoNotOptimize(table.ceil(probe));
    probe += 2;
    if (probe >= static_cast<int64_t>(2 * n - 1)) {
      probe = 1;
    }
  }
  state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(BM_RedBlackBST_FloorCeil)->Range(1 << 10, 1 << 18);

static void BM_RedBlackBST_RangeKeys(benchmark::State& state) {
  const auto n = static_cast<int64_t>(state.range(0));
  red_black_bst<int64_t, int64_t> table;
  for (int64_t i = 0; i < n; ++i) {
    table.put(i, i);
  }

  for (auto _ : state) {
    benchmark::DoNotOptimize(table.range_keys(n / 4, n / 4 + 100));
  }
  state.SetItemsProcessed(state.iterations() * 101);
}
BENCHMARK(BM_RedBlackBST_RangeKeys)->Range(1 << 10, 1 << 18);

BENCHMARK_MAIN();

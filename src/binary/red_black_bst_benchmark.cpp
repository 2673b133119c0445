// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_map.h>
#include <ankerl/unordered_dense.h>
#include <benchmark/benchmark.h>
#include <x86intrin.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <lyra/lyra.hpp>
#include <map>
#include <print>
#include <random>
#include <stdexcept>
#include <string>
#include <symbol_tables/red_black_bst.hpp>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

struct TimingStats {
  uint64_t insert_time{0};
  uint64_t find_time{0};
  uint64_t erase_time{0};
  uint64_t iterate_time{0};

  TimingStats& operator+=(const TimingStats& rhs) {
    insert_time += rhs.insert_time;
    find_time += rhs.find_time;
    erase_time += rhs.erase_time;
    iterate_time += rhs.iterate_time;
    return *this;
  }
};

template <typename T>
concept SymbolTable = requires(T& t, const typename T::key_type& key) {
  t.put(key, typename T::mapped_type{});
  t.get(key);
  t.for_each([](const auto&, const auto&) {});
};

// The symbol table and the std-style maps spell insert/find/iterate
// differently; these keep run_benchmark agnostic.
template <typename T>
void table_insert(T& table, const typename T::key_type& key) {
  if constexpr (SymbolTable<T>) {
    table.put(key, typename T::mapped_type{});
  } else {
    table.insert({key, {}});
  }
}

template <typename T>
void table_find(T& table, const typename T::key_type& key) {
  if constexpr (SymbolTable<T>) {
    benchmark::DoNotOptimize(table.get(key));
  } else {
    benchmark::DoNotOptimize(table.find(key));
  }
}

template <typename T>
void table_iterate(T& table) {
  if constexpr (SymbolTable<T>) {
    table.for_each([](const auto& key, const auto& value) {
      benchmark::DoNotOptimize(key);
      benchmark::DoNotOptimize(value);
    });
  } else {
    auto it = table.begin();
    while (it != table.end()) {
      benchmark::DoNotOptimize(it++);
    }
  }
}

template <typename T>
void run_benchmark(T& table, uint64_t seed, size_t table_size, size_t batches,
                   size_t batch_size, TimingStats& stats) {
  using key_type = typename T::key_type;
  if (table_size > static_cast<size_t>(std::numeric_limits<key_type>::max()) /
                       2) {
    throw std::runtime_error("Table size too large for key data type");
  }
  std::mt19937 rng(seed);
  std::uniform_int_distribution<key_type> dist(
      std::numeric_limits<key_type>::min(),
      std::numeric_limits<key_type>::max());
  unsigned int dummy;
  std::unordered_set<key_type> keys{};

  auto insert = [&]() -> void {
    bool inserted;
    key_type key;
    do {
      key = dist(rng);
      auto [_, i] = keys.insert(key);
      inserted = i;
    } while (!inserted);
    uint64_t start = __rdtscp(&dummy);
    table_insert(table, key);
    uint64_t stop = __rdtscp(&dummy);
    stats.insert_time += stop - start;
  };

  auto find = [&](const key_type& key) -> void {
    uint64_t start = __rdtscp(&dummy);
    table_find(table, key);
    uint64_t stop = __rdtscp(&dummy);
    stats.find_time += stop - start;
  };

  auto erase = [&]() -> void {
    auto key = *keys.begin();
    keys.erase(key);
    uint64_t start = __rdtscp(&dummy);
    benchmark::DoNotOptimize(table.erase(key));
    uint64_t stop = __rdtscp(&dummy);
    stats.erase_time += stop - start;
  };

  auto iterate = [&]() -> void {
    uint64_t start = __rdtscp(&dummy);
    table_iterate(table);
    uint64_t stop = __rdtscp(&dummy);
    stats.iterate_time += stop - start;
  };

  while (table.size() < table_size) {
    insert();
  }

  for (const auto& key : keys) {
    find(key);
  }

  for (size_t batch = 0; batch < batches; ++batch) {
    for (size_t i = 0; i < batch_size; ++i) {
      erase();
    }
    for (size_t i = 0; i < batch_size; ++i) {
      insert();
    }
    for (const auto& key : keys) {
      find(key);
    }
  }

  iterate();
}

using LambdaType = std::function<void(TimingStats&)>;

int main(int argc, char** argv) {
  bool show_help = false;
  uint64_t seed = 42;
  size_t target_iterations = 10;
  size_t table_size = 100000;
  size_t batches = 100;
  size_t batch_size = 1000;
  std::vector<std::string> names;
  std::unordered_map<std::string, TimingStats> results;

  auto benchmarker = [&](auto table, TimingStats& stats) -> void {
    run_benchmark(table, seed, table_size, batches, batch_size, stats);
  };

  std::map<std::string, LambdaType> benchmarkers{
      /* 8 byte values */
      {"red_black_bst_8_8",
       [&](TimingStats& stats) -> void {
         benchmarker(symbol_tables::red_black_bst<std::int64_t, std::int64_t>{},
                     stats);
       }},
      {"absl_8_8",
       [&](TimingStats& stats) -> void {
         benchmarker(absl::btree_map<std::int64_t, std::int64_t>{}, stats);
       }},
      {"map_8_8",
       [&](TimingStats& stats) -> void {
         benchmarker(std::map<std::int64_t, std::int64_t>{}, stats);
       }},
      {"unordered_dense_8_8",
       [&](TimingStats& stats) -> void {
         benchmarker(ankerl::unordered_dense::map<std::int64_t, std::int64_t>{},
                     stats);
       }},

      /* 256 byte values */
      {"red_black_bst_8_256",
       [&](TimingStats& stats) -> void {
         benchmarker(symbol_tables::red_black_bst<std::int64_t,
                                                  std::array<std::byte, 256>>{},
                     stats);
       }},
      {"absl_8_256",
       [&](TimingStats& stats) -> void {
         benchmarker(
             absl::btree_map<std::int64_t, std::array<std::byte, 256>>{},
             stats);
       }},
      {"map_8_256",
       [&](TimingStats& stats) -> void {
         benchmarker(std::map<std::int64_t, std::array<std::byte, 256>>{},
                     stats);
       }},
      {"unordered_dense_8_256",
       [&](TimingStats& stats) -> void {
         benchmarker(ankerl::unordered_dense::map<std::int64_t,
                                                  std::array<std::byte, 256>>{},
                     stats);
       }},
  };

  auto print_valid_benchmarks = [&]() {
    std::cout << "Valid benchmark names:" << std::endl;
    for (const auto& name : benchmarkers) {
      std::cout << "  " << name.first << std::endl;
    }
  };

  // Define command line interface
  auto cli = lyra::cli() | lyra::help(show_help) |
             lyra::opt(seed, "seed")["-d"]["--seed"]("Random seed") |
             lyra::opt(target_iterations, "iterations")["-i"]["--iterations"](
                 "Iterations to run") |
             lyra::opt(table_size, "table_size")["-t"]["--table-size"](
                 "Keys to hold in the table") |
             lyra::opt(batches, "batches")["-b"]["--batches"](
                 "Number of erase/insert batches to run") |
             lyra::opt(batch_size, "batch_size")["-s"]["--batch-size"](
                 "Size of an erase/insert batch") |
             lyra::opt(names, "name")["-n"]["--name"](
                 "Name of a benchmark to run (repeatable)") |
             lyra::arg(names, "names")("Names of the benchmarks to run");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    print_valid_benchmarks();
    return 0;
  }

  if (batch_size > table_size) {
    std::cerr << "Batch size must not exceed table size" << std::endl;
    return 1;
  }

  if (names.empty()) {
    for (const auto& [name, _] : benchmarkers) {
      names.push_back(name);
    }
  }

  for (const auto& name : names) {
    if (!benchmarkers.count(name)) {
      std::cerr << "Unknown benchmark: " << name << std::endl;
      print_valid_benchmarks();
      return 1;
    }
  }

  for (size_t iter = 0; iter < target_iterations; ++iter) {
    std::cout << "Iteration " << iter << std::endl;
    for (const auto& name : names) {
      TimingStats stats;
      benchmarkers.at(name)(stats);
      results[name] += stats;
    }
  }

  auto start = std::chrono::high_resolution_clock::now();
  uint64_t rdtsc_start = __rdtsc();
  std::this_thread::sleep_for(std::chrono::milliseconds{1000});
  auto end = std::chrono::high_resolution_clock::now();
  uint64_t rdtsc_end = __rdtsc();
  const double cycles_per_nano =
      static_cast<double>(rdtsc_end - rdtsc_start) /
      std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
  std::cout << "rdtsc calibration: " << cycles_per_nano << " cycles / ns"
            << std::endl
            << std::endl;

  std::println("{:>24}, {:>16}, {:>16}, {:>16}, {:>16}", "Benchmark Name",
               "Insert cycles", "Find cycles", "Erase cycles",
               "Iterate cycles");
  for (const auto& name : names) {
    const auto& stats = results.at(name);
    std::println("{:>24}, {:>16}, {:>16}, {:>16}, {:>16}", name,
                 stats.insert_time, stats.find_time, stats.erase_time,
                 stats.iterate_time);
  }

  // Mean nanoseconds per operation
  const double inserts =
      static_cast<double>(target_iterations) *
      static_cast<double>(table_size + batches * batch_size);
  const double finds = static_cast<double>(target_iterations) *
                       static_cast<double>(table_size * (batches + 1));
  const double erases = static_cast<double>(target_iterations) *
                        static_cast<double>(batches * batch_size);
  std::cout << std::endl;
  std::println("{:>24}, {:>16}, {:>16}, {:>16}", "Benchmark Name",
               "Insert ns/op", "Find ns/op", "Erase ns/op");
  for (const auto& name : names) {
    const auto& stats = results.at(name);
    std::println("{:>24}, {:>16.2f}, {:>16.2f}, {:>16.2f}", name,
                 stats.insert_time / cycles_per_nano / inserts,
                 stats.find_time / cycles_per_nano / finds,
                 erases > 0 ? stats.erase_time / cycles_per_nano / erases
                            : 0.0);
  }
  return 0;
}

// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <lyra/lyra.hpp>
#include <map>
#include <random>
#include <symbol_tables/red_black_bst.hpp>
#include <unordered_set>

int main(int argc, char** argv) {
  bool show_help = false;
  uint64_t seed = std::chrono::system_clock::now().time_since_epoch().count();
  size_t target_iterations = 10;
  size_t min_keys = 10000;
  size_t max_keys = 200000;
  size_t batches = 20;
  size_t batch_size = 1000;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(seed, "seed")["-d"]["--seed"](
          "Random seed (defaults to time since epoch)") |
      lyra::opt(target_iterations,
                "iterations")["-i"]["--iterations"]("Iterations to run") |
      lyra::opt(min_keys,
                "min_keys")["--min-keys"]("Minimum keys to target in tree") |
      lyra::opt(max_keys,
                "max_keys")["--max-keys"]("Maximum keys to target in tree") |
      lyra::opt(batches, "batches")["-b"]["--batches"](
          "Number of erase/insert batches to run") |
      lyra::opt(batch_size, "batch_size")["-s"]["--batch-size"](
          "Size of an erase/insert batch");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (min_keys > max_keys) {
    std::cerr << "--min-keys must not exceed --max-keys" << std::endl;
    return 1;
  }

  std::uniform_int_distribution<size_t> num_key_dist(min_keys, max_keys);
  for (size_t iter = 0; iter < target_iterations; ++iter) {
    std::mt19937 rng(iter + seed);
    std::uniform_int_distribution<int> dist(std::numeric_limits<int>::min(),
                                            std::numeric_limits<int>::max());

    size_t num_keys = num_key_dist(rng);
    std::cout << "Iteration " << iter << " using " << num_keys << " keys, seed "
              << iter + seed << std::endl;

    std::map<int, int> ordered_map;
    symbol_tables::red_black_bst<int, int> tree;
    std::unordered_set<int> seen;

    auto insert = [&]() -> void {
      int key = dist(rng);
      int val = dist(rng);
      ordered_map[key] = val;
      tree.put(key, val);
      seen.insert(key);
    };

    auto remove = [&]() -> void {
      auto key = *seen.begin();
      seen.erase(key);
      ordered_map.erase(key);
      if (tree.erase(key) != 1) {
        std::cout << "Erase of present key " << key << " removed nothing"
                  << std::endl;
        exit(1);
      }
    };

    auto validate = [&]() -> void {
      if (tree.size() != ordered_map.size()) {
        std::cout << "Size mismatch: " << tree.size()
                  << " != " << ordered_map.size() << std::endl;
        exit(1);
      }

      // Walk both in order, checking keys, values and order statistics
      auto it = ordered_map.begin();
      size_t rank = 0;
      bool matched = true;
      tree.for_each([&](const int& key, const int& value) {
        if (!matched) {
          return;
        }
        if (it == ordered_map.end()) {
          std::cout << "Ordered map ended early!" << std::endl;
          matched = false;
          return;
        }
        if (it->first != key || it->second != value) {
          std::cout << "Mismatch at key " << it->first << " != " << key
                    << " or val " << it->second << " != " << value
                    << std::endl;
          matched = false;
          return;
        }
        if (tree.rank(key) != rank || tree.select(rank) != key) {
          std::cout << "Rank/select mismatch at key " << key << ", rank "
                    << rank << std::endl;
          matched = false;
          return;
        }
        ++it;
        ++rank;
      });
      if (!matched) {
        exit(1);
      }
      if (it != ordered_map.end()) {
        std::cout << "Red-black tree ended early!" << std::endl;
        exit(1);
      }

      // Floor/ceiling of random probes
      for (int probe_count = 0; probe_count < 1000 && !tree.empty();
           ++probe_count) {
        int probe = dist(rng);
        auto lower = ordered_map.lower_bound(probe);
        auto upper = ordered_map.upper_bound(probe);
        try {
          int ceil_key = tree.ceil(probe);
          if (lower == ordered_map.end() || lower->first != ceil_key) {
            std::cout << "Ceiling mismatch for " << probe << std::endl;
            exit(1);
          }
        } catch (const symbol_tables::key_not_found&) {
          if (lower != ordered_map.end()) {
            std::cout << "Missing ceiling for " << probe << std::endl;
            exit(1);
          }
        }
        try {
          int floor_key = tree.floor(probe);
          if (upper == ordered_map.begin() ||
              std::prev(upper)->first != floor_key) {
            std::cout << "Floor mismatch for " << probe << std::endl;
            exit(1);
          }
        } catch (const symbol_tables::key_not_found&) {
          if (upper != ordered_map.begin()) {
            std::cout << "Missing floor for " << probe << std::endl;
            exit(1);
          }
        }
      }

      if (!tree.is_bst()) {
        std::cout << "Tree is not in symmetric order" << std::endl;
        exit(1);
      }
      if (!tree.count_check()) {
        std::cout << "Subtree counts not consistent" << std::endl;
        exit(1);
      }
      if (!tree.is_23()) {
        std::cout << "Tree is not a 2-3 tree" << std::endl;
        exit(1);
      }
      if (!tree.is_balanced()) {
        std::cout << "Tree is not black-balanced" << std::endl;
        exit(1);
      }

      const double bound =
          2.0 * std::log2(static_cast<double>(tree.size()) + 1.0);
      if (static_cast<double>(tree.height()) > bound) {
        std::cout << "Height " << tree.height() << " exceeds bound " << bound
                  << std::endl;
        exit(1);
      }
    };

    // Build up the initial trees/maps
    while (ordered_map.size() < num_keys) {
      insert();
    }
    validate();

    // Run erase/insert batches
    for (size_t batch = 0; batch < batches; ++batch) {
      for (size_t i = 0; i < batch_size && !seen.empty(); ++i) {
        remove();
      }
      for (size_t i = 0; i < batch_size; ++i) {
        insert();
      }
      validate();
    }

    // Empty out the tree/map from both ends
    while (!tree.empty()) {
      if (tree.size() % 2 == 0) {
        ordered_map.erase(tree.min());
        tree.erase_min();
      } else {
        ordered_map.erase(tree.max());
        tree.erase_max();
      }
    }
    seen.clear();
    validate();
  }
  return 0;
}

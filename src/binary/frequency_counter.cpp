// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// Reads words from standard input (or --file) and prints the most frequent
// word whose length is at least min_length, e.g.
//
//   frequency_counter 8 < tale.txt
//   business 122

#include <cstddef>
#include <fstream>
#include <iostream>
#include <lyra/lyra.hpp>
#include <print>
#include <string>
#include <symbol_tables/red_black_bst.hpp>

int main(int argc, char** argv) {
  // Command line parameters
  bool show_help = false;
  bool verbose = false;
  std::size_t min_length = 0;
  std::string file;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(verbose)["-v"]["--verbose"](
          "Also print the number of distinct and total words") |
      lyra::opt(file, "file")["-f"]["--file"](
          "Read words from this file instead of standard input") |
      lyra::arg(min_length, "min_length")(
          "Ignore words shorter than this many characters")
          .required();

  // Parse command line
  auto result = cli.parse({argc, argv});

  // Check for errors
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    std::cerr << cli << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  std::ifstream file_stream;
  if (!file.empty()) {
    file_stream.open(file);
    if (!file_stream) {
      std::cerr << "Cannot open " << file << std::endl;
      return 1;
    }
  }
  std::istream& input = file.empty() ? std::cin : file_stream;

  symbol_tables::red_black_bst<std::string, std::size_t> counts;
  std::size_t words = 0;
  std::string word;
  while (input >> word) {
    if (word.size() < min_length) {
      continue;
    }
    ++words;
    auto count = counts.get(word);
    counts.put(word, count.value_or(0) + 1);
  }

  if (counts.empty()) {
    std::cerr << "No words of length " << min_length << " or more"
              << std::endl;
    return 1;
  }

  // Keys arrive in ascending order, so ties go to the smallest word
  const std::string* best = nullptr;
  std::size_t best_count = 0;
  counts.for_each([&](const std::string& key, std::size_t count) {
    if (count > best_count) {
      best = &key;
      best_count = count;
    }
  });

  std::println("{} {}", *best, best_count);
  if (verbose) {
    std::println("distinct = {}", counts.size());
    std::println("words    = {}", words);
  }
  return 0;
}

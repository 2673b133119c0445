// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <stdexcept>

namespace symbol_tables {

/**
 * Thrown by operations that need at least one key (min, max, floor, ceil,
 * erase_min, erase_max) when the table is empty.
 */
class underflow_error : public std::underflow_error {
 public:
  using std::underflow_error::underflow_error;
};

/**
 * Thrown by floor() and ceil() when the table is non-empty but holds no key
 * on the requested side of the argument.
 */
class key_not_found : public std::out_of_range {
 public:
  using std::out_of_range::out_of_range;
};

}  // namespace symbol_tables

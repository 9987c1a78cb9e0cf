/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <stdexcept>

#include <fmt/format.h>

namespace droidflow {

/* Thrown when an internal invariant does not hold. */
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& message)
      : std::logic_error(message) {}
};

} // namespace droidflow

#define df_assert(condition)                                              \
  do {                                                                    \
    if (!(condition)) {                                                   \
      throw droidflow::InvariantViolation(fmt::format(                    \
          "{}:{}: assertion `{}` failed.", __FILE__, __LINE__, #condition)); \
    }                                                                     \
  } while (false)

#define df_assert_log(condition, message, ...)                    \
  do {                                                            \
    if (!(condition)) {                                           \
      throw droidflow::InvariantViolation(fmt::format(            \
          "{}:{}: assertion `{}` failed: {}",                    \
          __FILE__,                                               \
          __LINE__,                                               \
          #condition,                                             \
          fmt::format(message, ##__VA_ARGS__)));                  \
    }                                                             \
  } while (false)

#define df_unreachable()                                      \
  do {                                                        \
    throw droidflow::InvariantViolation(                      \
        fmt::format("{}:{}: unreachable", __FILE__, __LINE__)); \
  } while (true)

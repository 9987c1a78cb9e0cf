/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>

#include <droidflow/IncludeMacros.h>

namespace droidflow {

class Timer final {
 public:
  Timer() : start_(std::chrono::steady_clock::now()) {}

  INCLUDE_DEFAULT_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Timer)

  double duration_in_seconds() const {
    return std::chrono::duration<double>(
               std::chrono::steady_clock::now() - start_)
        .count();
  }

 private:
  std::chrono::time_point<std::chrono::steady_clock> start_;
};

} // namespace droidflow

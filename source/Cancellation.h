/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <stdexcept>

#include <droidflow/IncludeMacros.h>

namespace droidflow {

class AnalysisCancelled : public std::runtime_error {
 public:
  AnalysisCancelled() : std::runtime_error("Analysis was cancelled.") {}
};

/**
 * Cooperative cancellation flag shared between the thread running a search
 * and the thread that wants to stop it. Searches call `check()` inside their
 * loops.
 */
class Cancellation final {
 public:
  Cancellation() : cancelled_(false) {}

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Cancellation)

  void cancel() {
    cancelled_.store(true, std::memory_order_relaxed);
  }

  void reset() {
    cancelled_.store(false, std::memory_order_relaxed);
  }

  bool is_cancelled() const {
    return cancelled_.load(std::memory_order_relaxed);
  }

  void check() const {
    if (is_cancelled()) {
      throw AnalysisCancelled();
    }
  }

 private:
  std::atomic<bool> cancelled_;
};

} // namespace droidflow

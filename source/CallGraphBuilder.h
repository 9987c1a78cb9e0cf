/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <droidflow/Apk.h>
#include <droidflow/CallGraph.h>
#include <droidflow/ClassTable.h>
#include <droidflow/Diagnostics.h>

namespace droidflow {

/**
 * Builds the call graph of a package from the invokes found in the bytecode
 * of its methods.
 *
 * With a package filter, only methods of classes whose name starts with one
 * of the prefixes are scanned. The methods they call are still added, as
 * leaves. Every scanned method is a node, even without outgoing calls.
 */
class CallGraphBuilder final {
 public:
  CallGraphBuilder(const Apk& apk, const ClassTable& classes);

  CallGraph build(
      const std::optional<std::vector<std::string>>& package_filter,
      Diagnostics& diagnostics) const;

  /* Same graph as `build`, scanning classes on `threads` workers. */
  CallGraph build_parallel(
      const std::optional<std::vector<std::string>>& package_filter,
      Diagnostics& diagnostics,
      unsigned int threads) const;

  /**
   * Decode one method and resolve its invokes. Decoding and resolution
   * failures are reported in `diagnostics` and skip the method or the call.
   */
  std::vector<Call> calls_of(const DexMethod& method, Diagnostics& diagnostics)
      const;

 private:
  const Apk& apk_;
  const ClassTable& classes_;
};

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <droidflow/Apk.h>
#include <droidflow/CallGraph.h>
#include <droidflow/Cancellation.h>
#include <droidflow/ClassTable.h>
#include <droidflow/DataFlowAnalyzer.h>
#include <droidflow/Diagnostics.h>
#include <droidflow/EntryPointAnalyzer.h>
#include <droidflow/Flow.h>
#include <droidflow/IncludeMacros.h>
#include <droidflow/LifecycleMethods.h>
#include <droidflow/ResourceResolver.h>

namespace droidflow {

/**
 * Entry point of the analysis of one package.
 *
 * Every artifact (class table, entry points, call graph per package filter)
 * is built on first use and kept for later queries. Results only depend on
 * the package, so calling an operation twice gives the same answer.
 *
 * This class is not thread safe. Long searches can be interrupted from
 * another thread through `cancellation()`.
 */
class ApkAnalyzer final {
 public:
  explicit ApkAnalyzer(
      Apk apk,
      LifecycleMethods lifecycle_methods = LifecycleMethods(),
      std::unique_ptr<ResourceResolver> resolver = nullptr);

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(ApkAnalyzer)

  /**
   * Load the unpacked package in `directory`. String resources are read from
   * `strings.json` when the package has one.
   */
  static ApkAnalyzer load(
      const std::filesystem::path& directory,
      LifecycleMethods lifecycle_methods = LifecycleMethods());

  const Apk& apk() const {
    return apk_;
  }

  /* Number of segments of the package prefixes used by the optimized mode. */
  void set_package_depth(std::size_t package_depth) {
    package_depth_ = package_depth;
  }

  /* Run every phase on a single thread. */
  void set_sequential(bool sequential) {
    sequential_ = sequential;
  }

  const ClassTable& extract_classes(bool parallel = true);

  const EntryPointAnalyzer& analyze_entry_points();

  const CallGraph& build_call_graph(
      const std::optional<std::vector<std::string>>& package_filter =
          std::nullopt);

  /**
   * Flows from the entry points to methods matching `sink_patterns`.
   *
   * With `optimize`, the call graph only covers the packages of the entry
   * point classes (see `app_packages`).
   */
  std::vector<Flow> find_flows(
      const std::vector<std::string>& sink_patterns,
      std::size_t max_depth,
      bool optimize = false);

  std::vector<DataFlow> analyze_data_flows(const std::vector<Flow>& flows);

  /* Package prefixes of the classes implementing entry points. */
  std::vector<std::string> app_packages();

  DataFlowAnalyzer::Stats data_flow_stats();

  const Diagnostics& diagnostics() const {
    return diagnostics_;
  }

  Cancellation& cancellation() {
    return cancellation_;
  }

  const ResourceResolver* DF_NULLABLE resolver() const {
    return resolver_.get();
  }

 private:
  unsigned int threads() const;

  DataFlowAnalyzer data_flow_analyzer(const CallGraph& graph);

 private:
  Apk apk_;
  LifecycleMethods lifecycle_methods_;
  std::unique_ptr<ResourceResolver> resolver_;
  std::size_t package_depth_;
  bool sequential_;

  Diagnostics diagnostics_;
  Cancellation cancellation_;

  std::unique_ptr<ClassTable> classes_;
  std::unique_ptr<EntryPointAnalyzer> entry_points_;
  std::map<
      std::optional<std::vector<std::string>>,
      std::unique_ptr<CallGraph>>
      call_graphs_;
  std::optional<std::vector<std::string>> last_package_filter_;
};

} // namespace droidflow

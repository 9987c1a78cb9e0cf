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

#include <json/json.h>

#include <droidflow/Apk.h>
#include <droidflow/CallGraph.h>
#include <droidflow/Cancellation.h>
#include <droidflow/ClassTable.h>
#include <droidflow/Compiler.h>
#include <droidflow/EntryPointAnalyzer.h>
#include <droidflow/Flow.h>
#include <droidflow/Heuristics.h>
#include <droidflow/IncludeMacros.h>
#include <droidflow/LifecycleMethods.h>
#include <droidflow/ResourceResolver.h>

namespace droidflow {

/**
 * Finds call paths from the lifecycle methods of entry points to sink
 * methods, and scores how likely it is that data extracted from the incoming
 * intent reaches the sink.
 *
 * The register analysis is flow-insensitive within a method: it follows
 * `move-result` after an intent extraction call through moves, casts and
 * invoke arguments, without looking at fields, arrays or aliasing.
 */
class DataFlowAnalyzer final {
 public:
  struct Stats {
    std::size_t entry_points = 0;
    std::size_t deeplink_handlers = 0;

    Json::Value to_json() const;
  };

 public:
  DataFlowAnalyzer(
      const Apk& apk,
      const ClassTable& classes,
      const EntryPointAnalyzer& entry_points,
      const CallGraph& graph,
      const LifecycleMethods& lifecycle_methods,
      const Heuristics& heuristics,
      const ResourceResolver* DF_NULLABLE resolver = nullptr,
      const Cancellation* DF_NULLABLE cancellation = nullptr);

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(DataFlowAnalyzer)

  /**
   * One flow per pair of entry point and sink method with at least one path
   * of at most `max_depth` calls, sorted by entry point and sink signature.
   */
  std::vector<Flow> find_flows_to(
      const std::vector<std::string>& sink_patterns,
      std::size_t max_depth) const;

  std::vector<Flow> find_webview_flows(std::size_t max_depth) const;
  std::vector<Flow> find_file_flows(std::size_t max_depth) const;
  std::vector<Flow> find_network_flows(std::size_t max_depth) const;
  std::vector<Flow> find_sql_flows(std::size_t max_depth) const;

  /* Flows starting from an entry point that handles deeplinks. */
  std::vector<Flow> find_deeplink_flows(
      const std::vector<std::string>& sink_patterns,
      std::size_t max_depth) const;

  /* One data flow per flow, in the same order. */
  std::vector<DataFlow> analyze_data_flows(const std::vector<Flow>& flows)
      const;

  /* Score every path of the flow and keep the best one. */
  DataFlow analyze_data_flow(const Flow& flow) const;

  Stats get_stats() const;

 private:
  struct PathEvidence {
    std::optional<MethodReference> source;
    std::optional<MethodReference> source_caller;
    /* A tainted register is passed along the path. */
    std::optional<std::size_t> linked_step;
    bool constant_sink = false;
  };

  PathEvidence analyze_path(const CallPath& path) const;

  DataFlow score_path(const Flow& flow, const CallPath& path) const;

  void check_cancellation() const;

 private:
  const Apk& apk_;
  const ClassTable& classes_;
  const EntryPointAnalyzer& entry_points_;
  const CallGraph& graph_;
  const LifecycleMethods& lifecycle_methods_;
  const Heuristics& heuristics_;
  const ResourceResolver* DF_NULLABLE resolver_;
  const Cancellation* DF_NULLABLE cancellation_;
};

} // namespace droidflow

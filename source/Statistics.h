/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <json/json.h>

#include <droidflow/CallGraph.h>
#include <droidflow/DataFlowAnalyzer.h>
#include <droidflow/EntryPointAnalyzer.h>
#include <droidflow/Timer.h>

namespace droidflow {

/**
 * Record various statistics during the analysis.
 */
class Statistics final {
 public:
  Statistics() = default;

  Statistics(const Statistics&) = delete;
  Statistics(Statistics&&) = delete;
  Statistics& operator=(const Statistics& other) = delete;
  Statistics& operator=(Statistics&& other) = delete;
  ~Statistics() = default;

  void log_time(const std::string& name, const Timer& timer);
  void log_count(const std::string& name, std::size_t count);
  void log_call_graph(const CallGraph::Stats& stats);
  void log_entry_points(const EntryPointAnalyzer::Stats& stats);
  void log_data_flows(const DataFlowAnalyzer::Stats& stats);

  Json::Value to_json() const;

 private:
  mutable std::mutex mutex_;

  // Recorded times for each step of the analysis.
  std::map<std::string, double> times_;

  // Number of classes, flows, diagnostics...
  std::map<std::string, std::size_t> counts_;

  std::optional<CallGraph::Stats> call_graph_;
  std::optional<EntryPointAnalyzer::Stats> entry_points_;
  std::optional<DataFlowAnalyzer::Stats> data_flows_;
};

} // namespace droidflow

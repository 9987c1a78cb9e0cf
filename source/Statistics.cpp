/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <cmath>

#include <sparta/WorkQueue.h>

#include <droidflow/Statistics.h>

namespace droidflow {

void Statistics::log_time(const std::string& name, const Timer& timer) {
  std::lock_guard<std::mutex> lock(mutex_);
  times_[name] = timer.duration_in_seconds();
}

void Statistics::log_count(const std::string& name, std::size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  counts_[name] = count;
}

void Statistics::log_call_graph(const CallGraph::Stats& stats) {
  std::lock_guard<std::mutex> lock(mutex_);
  call_graph_ = stats;
}

void Statistics::log_entry_points(const EntryPointAnalyzer::Stats& stats) {
  std::lock_guard<std::mutex> lock(mutex_);
  entry_points_ = stats;
}

void Statistics::log_data_flows(const DataFlowAnalyzer::Stats& stats) {
  std::lock_guard<std::mutex> lock(mutex_);
  data_flows_ = stats;
}

namespace {

double round(double x, int digits) {
  double y = std::pow(10, digits);
  return std::round(x * y) / y;
}

} // namespace

Json::Value Statistics::to_json() const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto value = Json::Value(Json::objectValue);
  value["cores"] = Json::Value(sparta::parallel::default_num_threads());

  auto times_value = Json::Value(Json::objectValue);
  for (const auto& record : times_) {
    times_value[record.first] = Json::Value(round(record.second, 3));
  }
  value["times"] = times_value;

  auto counts_value = Json::Value(Json::objectValue);
  for (const auto& record : counts_) {
    counts_value[record.first] =
        Json::Value(static_cast<Json::UInt64>(record.second));
  }
  value["counts"] = counts_value;

  if (call_graph_) {
    value["call_graph"] = call_graph_->to_json();
  }
  if (entry_points_) {
    value["entry_points"] = entry_points_->to_json();
  }
  if (data_flows_) {
    value["data_flows"] = data_flows_->to_json();
  }
  return value;
}

} // namespace droidflow

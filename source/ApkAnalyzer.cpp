/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <boost/algorithm/string/join.hpp>
#include <sparta/WorkQueue.h>

#include <droidflow/ApkAnalyzer.h>
#include <droidflow/CallGraphBuilder.h>
#include <droidflow/ClassExtractor.h>
#include <droidflow/Heuristics.h>
#include <droidflow/Log.h>
#include <droidflow/Timer.h>
#include <droidflow/TypeNames.h>

namespace droidflow {

ApkAnalyzer::ApkAnalyzer(
    Apk apk,
    LifecycleMethods lifecycle_methods,
    std::unique_ptr<ResourceResolver> resolver)
    : apk_(std::move(apk)),
      lifecycle_methods_(std::move(lifecycle_methods)),
      resolver_(std::move(resolver)),
      package_depth_(2),
      sequential_(false) {
  diagnostics_.extend(apk_.diagnostics());
}

ApkAnalyzer ApkAnalyzer::load(
    const std::filesystem::path& directory,
    LifecycleMethods lifecycle_methods) {
  auto apk = Apk::load(directory);
  std::unique_ptr<ResourceResolver> resolver;
  if (const auto& strings_path = apk.string_resources_path()) {
    resolver = std::make_unique<JsonStringResources>(
        JsonStringResources::from_file(*strings_path));
  }
  return ApkAnalyzer(
      std::move(apk), std::move(lifecycle_methods), std::move(resolver));
}

unsigned int ApkAnalyzer::threads() const {
  return sequential_ ? 1u : sparta::parallel::default_num_threads();
}

const ClassTable& ApkAnalyzer::extract_classes(bool parallel) {
  if (!classes_) {
    auto classes = droidflow::extract_classes(
        apk_, parallel && !sequential_, diagnostics_);
    // Duplicates are already reported by the extraction.
    classes_ = std::make_unique<ClassTable>(std::move(classes));
  }
  return *classes_;
}

const EntryPointAnalyzer& ApkAnalyzer::analyze_entry_points() {
  if (!entry_points_) {
    const auto& classes = extract_classes();
    Timer timer;
    entry_points_ =
        std::make_unique<EntryPointAnalyzer>(apk_.manifest(), classes);
    LOG(1,
        "Linked {} entry points in {:.2f}s.",
        entry_points_->entry_points().size(),
        timer.duration_in_seconds());
  }
  return *entry_points_;
}

const CallGraph& ApkAnalyzer::build_call_graph(
    const std::optional<std::vector<std::string>>& package_filter) {
  auto found = call_graphs_.find(package_filter);
  if (found != call_graphs_.end()) {
    return *found->second;
  }

  const auto& classes = extract_classes();
  CallGraphBuilder builder(apk_, classes);
  auto graph = std::make_unique<CallGraph>(
      builder.build_parallel(package_filter, diagnostics_, threads()));
  const auto& result = *graph;
  call_graphs_.emplace(package_filter, std::move(graph));
  return result;
}

std::vector<std::string> ApkAnalyzer::app_packages() {
  std::vector<std::string> packages;
  for (const auto* entry_point : analyze_entry_points().found_entry_points()) {
    auto prefix =
        type_names::package_prefix(entry_point->class_name(), package_depth_);
    if (!prefix.empty()) {
      // Only match whole package segments.
      prefix.push_back('.');
    }
    packages.push_back(std::move(prefix));
  }
  std::sort(packages.begin(), packages.end());
  packages.erase(std::unique(packages.begin(), packages.end()), packages.end());
  return packages;
}

DataFlowAnalyzer ApkAnalyzer::data_flow_analyzer(const CallGraph& graph) {
  return DataFlowAnalyzer(
      apk_,
      extract_classes(),
      analyze_entry_points(),
      graph,
      lifecycle_methods_,
      Heuristics::singleton(),
      resolver_.get(),
      &cancellation_);
}

std::vector<Flow> ApkAnalyzer::find_flows(
    const std::vector<std::string>& sink_patterns,
    std::size_t max_depth,
    bool optimize) {
  std::optional<std::vector<std::string>> package_filter;
  if (optimize) {
    package_filter = app_packages();
    WARNING(
        1,
        "Optimized mode only scans classes in `{}`: flows going through library code outside of these packages may be missed.",
        boost::algorithm::join(*package_filter, ", "));
  }

  const auto& graph = build_call_graph(package_filter);
  last_package_filter_ = package_filter;
  return data_flow_analyzer(graph).find_flows_to(sink_patterns, max_depth);
}

std::vector<DataFlow> ApkAnalyzer::analyze_data_flows(
    const std::vector<Flow>& flows) {
  const auto& graph = build_call_graph(last_package_filter_);
  return data_flow_analyzer(graph).analyze_data_flows(flows);
}

DataFlowAnalyzer::Stats ApkAnalyzer::data_flow_stats() {
  const auto& graph = build_call_graph(last_package_filter_);
  return data_flow_analyzer(graph).get_stats();
}

} // namespace droidflow

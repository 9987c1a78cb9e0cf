/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <filesystem>
#include <memory>
#include <optional>

#include <droidflow/DroidFlow.h>
#include <droidflow/Heuristics.h>
#include <droidflow/JsonReaderWriter.h>
#include <droidflow/LifecycleMethods.h>
#include <droidflow/Log.h>
#include <droidflow/Timer.h>

namespace droidflow {

namespace program_options = boost::program_options;

void DroidFlow::add_options(
    program_options::options_description& options) const {
  options.add_options()(
      "verbosity,v",
      program_options::value<int>(),
      "Logging verbosity level, overrides the `TRACE` environment variable.")(
      "log-file",
      program_options::value<std::string>(),
      "Append log messages to this file instead of stderr.");
}

void DroidFlow::analyze(
    ApkAnalyzer& analyzer,
    const Options& options,
    Statistics& statistics) {
  Timer classes_timer;
  LOG(1, "Extracting classes...");
  const auto& classes = analyzer.extract_classes(!options.sequential());
  statistics.log_time("extract_classes", classes_timer);
  statistics.log_count("classes", classes.size());
  statistics.log_count("methods", classes.number_methods());
  LOG(1,
      "Extracted {} classes in {:.2f}s.",
      classes.size(),
      classes_timer.duration_in_seconds());

  if (options.dump_classes()) {
    auto class_filter = options.class_filter().value_or(ClassFilter{});
    auto classes_value = Json::Value(Json::arrayValue);
    for (const auto* dex_class : find_classes(classes, class_filter)) {
      classes_value.append(dex_class->to_json());
    }
    auto classes_path = options.classes_output_path();
    LOG(1, "Writing classes to `{}`.", classes_path.native());
    JsonWriter::write_json_file(classes_path, classes_value);

    if (auto method_filter = options.method_filter()) {
      auto methods_value = Json::Value(Json::arrayValue);
      for (const auto& [dex_class, method] :
           find_methods(classes, class_filter, *method_filter)) {
        methods_value.append(method->signature());
      }
      auto methods_path = options.methods_output_path();
      LOG(1, "Writing methods to `{}`.", methods_path.native());
      JsonWriter::write_json_file(methods_path, methods_value);
    }
  }

  Timer entry_points_timer;
  LOG(1, "Linking entry points...");
  const auto& entry_points = analyzer.analyze_entry_points();
  statistics.log_time("entry_points", entry_points_timer);
  statistics.log_entry_points(entry_points.get_stats());
  JsonWriter::write_json_file(
      options.entry_points_output_path(), entry_points.to_json());

  Timer flows_timer;
  LOG(1, "Finding flows...");
  auto flows = analyzer.find_flows(
      options.all_sink_patterns(), options.max_depth(), options.optimize());
  statistics.log_time("flows", flows_timer);
  statistics.log_count("flows", flows.size());

  auto flows_value = Json::Value(Json::arrayValue);
  for (const auto& flow : flows) {
    flows_value.append(flow.to_json());
  }
  auto flows_path = options.flows_output_path();
  LOG(1, "Writing {} flows to `{}`.", flows.size(), flows_path.native());
  JsonWriter::write_json_file(flows_path, flows_value);

  Timer data_flows_timer;
  LOG(1, "Scoring data flows...");
  auto data_flows = analyzer.analyze_data_flows(flows);
  statistics.log_time("data_flows", data_flows_timer);
  statistics.log_data_flows(analyzer.data_flow_stats());

  std::size_t high_confidence = 0;
  auto data_flows_value = Json::Value(Json::arrayValue);
  for (const auto& data_flow : data_flows) {
    if (data_flow.level == ConfidenceLevel::High) {
      high_confidence++;
    }
    data_flows_value.append(data_flow.to_json());
  }
  statistics.log_count("high_confidence_data_flows", high_confidence);
  LOG(1,
      "Found {} data flows, {} with high confidence.",
      data_flows.size(),
      high_confidence);
  JsonWriter::write_json_file(
      options.data_flows_output_path(), data_flows_value);

  std::optional<std::vector<std::string>> package_filter;
  if (options.optimize()) {
    package_filter = analyzer.app_packages();
  }
  const auto& graph = analyzer.build_call_graph(package_filter);
  statistics.log_call_graph(graph.get_stats());
  if (options.dump_call_graph()) {
    auto call_graph_path = options.call_graph_output_path();
    LOG(1, "Writing call graph to `{}`.", call_graph_path.native());
    JsonWriter::write_json_file(call_graph_path, graph.to_json());
  }
}

void DroidFlow::run(const program_options::variables_map& variables) {
  if (variables.count("verbosity")) {
    Logger::set_level(variables["verbosity"].as<int>());
  }
  if (variables.count("log-file")) {
    Logger::set_output_file(variables["log-file"].as<std::string>());
  }
  std::filesystem::path json_file_path =
      std::filesystem::path(variables["config"].as<std::string>());
  auto options = Options::from_json_file(json_file_path);
  run(*options);
}

void DroidFlow::run(const Options& options) {
  Statistics statistics;
  Timer total_timer;

  if (auto heuristics_path = options.heuristics_path()) {
    Heuristics::init_from_file(*heuristics_path);
  }

  std::vector<std::filesystem::path> lifecycles_paths(
      options.lifecycles_paths().begin(), options.lifecycles_paths().end());
  auto lifecycle_methods = LifecycleMethods::from_files(lifecycles_paths);

  std::filesystem::create_directories(options.output_directory());

  Timer load_timer;
  LOG(1, "Loading package from `{}`...", options.apk_directory());
  auto apk = Apk::load(options.apk_directory());
  std::unique_ptr<ResourceResolver> resolver;
  auto strings_path =
      options.string_resources_path() ? options.string_resources_path()
                                      : apk.string_resources_path();
  if (strings_path) {
    resolver = std::make_unique<JsonStringResources>(
        JsonStringResources::from_file(*strings_path));
  }
  statistics.log_time("load", load_timer);
  statistics.log_count("dex_files", apk.dex_files().size());
  LOG(1,
      "Loaded {} bytecode files in {:.2f}s.",
      apk.dex_files().size(),
      load_timer.duration_in_seconds());

  ApkAnalyzer analyzer(
      std::move(apk), std::move(lifecycle_methods), std::move(resolver));
  analyzer.set_package_depth(options.package_depth());
  analyzer.set_sequential(options.sequential());

  analyze(analyzer, options, statistics);

  const auto& diagnostics = analyzer.diagnostics();
  statistics.log_count("diagnostics", diagnostics.size());
  auto diagnostics_path = options.diagnostics_output_path();
  LOG(1,
      "Writing {} diagnostics to `{}`.",
      diagnostics.size(),
      diagnostics_path.native());
  JsonWriter::write_json_file(diagnostics_path, diagnostics.to_json());

  statistics.log_time("total", total_timer);
  JsonWriter::write_json_file(
      options.statistics_output_path(), statistics.to_json());
  LOG(1, "Analysis done in {:.2f}s.", total_timer.duration_in_seconds());
}

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <optional>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include <droidflow/Assert.h>
#include <droidflow/Constants.h>
#include <droidflow/JsonReaderWriter.h>
#include <droidflow/JsonValidation.h>
#include <droidflow/Options.h>

namespace droidflow {

namespace {

std::string check_path_exists(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw std::invalid_argument(fmt::format("File `{}` does not exist.", path));
  }
  return path;
}

std::string check_directory_exists(const std::string& path) {
  if (!std::filesystem::is_directory(path)) {
    throw std::invalid_argument(
        fmt::format("Directory `{}` does not exist.", path));
  }
  return path;
}

/* Parse a ';'-separated list of files or directories. */
std::vector<std::string> parse_paths_list(
    const std::string& input,
    const std::optional<std::string>& extension) {
  std::vector<std::string> input_paths;
  boost::split(input_paths, input, boost::is_any_of(",;"));

  std::vector<std::string> paths;
  for (const auto& path : input_paths) {
    if (std::filesystem::is_directory(path)) {
      std::vector<std::string> directory_paths;
      for (const auto& entry : std::filesystem::directory_iterator(path)) {
        if (!extension || entry.path().extension() == *extension) {
          directory_paths.push_back(entry.path().native());
        }
      }
      // Directory iteration order is unspecified.
      std::sort(directory_paths.begin(), directory_paths.end());
      paths.insert(paths.end(), directory_paths.begin(), directory_paths.end());
    } else if (std::filesystem::exists(path)) {
      paths.push_back(path);
    } else {
      throw std::invalid_argument(
          fmt::format("File `{}` does not exist.", path));
    }
  }
  return paths;
}

SinkCategory parse_sink_category(const Json::Value& value) {
  auto name = JsonValidation::string(value);
  if (name == "webview") {
    return SinkCategory::WebView;
  } else if (name == "file") {
    return SinkCategory::File;
  } else if (name == "network") {
    return SinkCategory::Network;
  } else if (name == "sql") {
    return SinkCategory::Sql;
  }
  throw JsonValidationError(
      value,
      /* field */ std::nullopt,
      "one of `webview`, `file`, `network` or `sql`");
}

std::size_t positive_integer(
    const Json::Value& json,
    const std::string& field,
    std::uint32_t default_value) {
  auto value =
      JsonValidation::unsigned_integer_or_default(json, field, default_value);
  if (value == 0) {
    throw JsonValidationError(json, field, "a positive integer");
  }
  return value;
}

} // namespace

std::string_view show(SinkCategory category) {
  switch (category) {
    case SinkCategory::WebView:
      return "webview";
    case SinkCategory::File:
      return "file";
    case SinkCategory::Network:
      return "network";
    case SinkCategory::Sql:
      return "sql";
  }
  df_unreachable();
}

Options::Options(const Json::Value& json) {
  JsonValidation::validate_object(json);
  JsonValidation::check_unexpected_members(
      json,
      {"apk-directory",
       "output-directory",
       "sinks",
       "sink-patterns",
       "max-depth",
       "optimize",
       "package-depth",
       "sequential",
       "lifecycles-paths",
       "string-resources-path",
       "heuristics",
       "dump-call-graph",
       "dump-classes",
       "class-filter",
       "method-filter"});

  apk_directory_ =
      check_directory_exists(JsonValidation::string(json, "apk-directory"));
  output_directory_ =
      std::filesystem::path(JsonValidation::string(json, "output-directory"));

  if (JsonValidation::has_field(json, "sinks")) {
    for (const auto& value : JsonValidation::null_or_array(json, "sinks")) {
      auto category = parse_sink_category(value);
      if (std::find(sinks_.begin(), sinks_.end(), category) == sinks_.end()) {
        sinks_.push_back(category);
      }
    }
  } else {
    sinks_ = {
        SinkCategory::WebView,
        SinkCategory::File,
        SinkCategory::Network,
        SinkCategory::Sql,
    };
  }
  if (JsonValidation::has_field(json, "sink-patterns")) {
    sink_patterns_ = JsonValidation::string_list(json, "sink-patterns");
  }

  max_depth_ = positive_integer(json, "max-depth", 10);
  optimize_ = JsonValidation::optional_boolean(json, "optimize", false);
  package_depth_ = positive_integer(json, "package-depth", 2);
  sequential_ = JsonValidation::optional_boolean(json, "sequential", false);

  if (JsonValidation::has_field(json, "lifecycles-paths")) {
    lifecycles_paths_ = parse_paths_list(
        JsonValidation::string(json, "lifecycles-paths"),
        /* extension */ ".json");
  }
  if (JsonValidation::has_field(json, "string-resources-path")) {
    string_resources_path_ = std::filesystem::path(check_path_exists(
        JsonValidation::string(json, "string-resources-path")));
  }
  if (JsonValidation::has_field(json, "heuristics")) {
    heuristics_path_ = std::filesystem::path(
        check_path_exists(JsonValidation::string(json, "heuristics")));
  }

  dump_call_graph_ =
      JsonValidation::optional_boolean(json, "dump-call-graph", false);
  dump_classes_ = JsonValidation::optional_boolean(json, "dump-classes", false);

  if (JsonValidation::has_field(json, "class-filter")) {
    class_filter_ =
        ClassFilter::from_json(JsonValidation::object(json, "class-filter"));
  }
  if (JsonValidation::has_field(json, "method-filter")) {
    method_filter_ =
        MethodFilter::from_json(JsonValidation::object(json, "method-filter"));
  }
}

std::unique_ptr<Options> Options::from_json_file(
    const std::filesystem::path& options_json_path) {
  Json::Value json = JsonReader::parse_json_file(options_json_path);
  JsonValidation::validate_object(json);
  return std::make_unique<Options>(json);
}

std::vector<std::string> Options::all_sink_patterns() const {
  std::vector<std::string> patterns;
  for (auto category : sinks_) {
    const std::vector<std::string>* category_patterns = nullptr;
    switch (category) {
      case SinkCategory::WebView:
        category_patterns = &constants::get_webview_sink_patterns();
        break;
      case SinkCategory::File:
        category_patterns = &constants::get_file_sink_patterns();
        break;
      case SinkCategory::Network:
        category_patterns = &constants::get_network_sink_patterns();
        break;
      case SinkCategory::Sql:
        category_patterns = &constants::get_sql_sink_patterns();
        break;
    }
    patterns.insert(
        patterns.end(), category_patterns->begin(), category_patterns->end());
  }
  patterns.insert(patterns.end(), sink_patterns_.begin(), sink_patterns_.end());
  return patterns;
}

std::filesystem::path Options::entry_points_output_path() const {
  return output_directory_ / "entry_points.json";
}

std::filesystem::path Options::flows_output_path() const {
  return output_directory_ / "flows.json";
}

std::filesystem::path Options::data_flows_output_path() const {
  return output_directory_ / "data_flows.json";
}

std::filesystem::path Options::diagnostics_output_path() const {
  return output_directory_ / "diagnostics.json";
}

std::filesystem::path Options::statistics_output_path() const {
  return output_directory_ / "statistics.json";
}

std::filesystem::path Options::call_graph_output_path() const {
  return output_directory_ / "call_graph.json";
}

std::filesystem::path Options::classes_output_path() const {
  return output_directory_ / "classes.json";
}

std::filesystem::path Options::methods_output_path() const {
  return output_directory_ / "methods.json";
}

} // namespace droidflow

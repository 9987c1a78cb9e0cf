/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

#include <droidflow/ClassFilter.h>
#include <droidflow/IncludeMacros.h>

namespace droidflow {

/* A predefined set of sink patterns. */
enum class SinkCategory {
  WebView,
  File,
  Network,
  Sql,
};

std::string_view show(SinkCategory category);

class Options final {
 public:
  explicit Options(const Json::Value& json);

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Options)

  static std::unique_ptr<Options> from_json_file(
      const std::filesystem::path& options_json_path);

  const std::string& apk_directory() const {
    return apk_directory_;
  }

  const std::filesystem::path& output_directory() const {
    return output_directory_;
  }

  const std::vector<SinkCategory>& sinks() const {
    return sinks_;
  }

  /* Additional sink patterns, substrings or regular expressions. */
  const std::vector<std::string>& sink_patterns() const {
    return sink_patterns_;
  }

  /* Patterns of every requested sink category, then the additional ones. */
  std::vector<std::string> all_sink_patterns() const;

  std::size_t max_depth() const {
    return max_depth_;
  }

  bool optimize() const {
    return optimize_;
  }

  std::size_t package_depth() const {
    return package_depth_;
  }

  bool sequential() const {
    return sequential_;
  }

  const std::vector<std::string>& lifecycles_paths() const {
    return lifecycles_paths_;
  }

  const std::optional<std::filesystem::path>& string_resources_path() const {
    return string_resources_path_;
  }

  const std::optional<std::filesystem::path>& heuristics_path() const {
    return heuristics_path_;
  }

  bool dump_call_graph() const {
    return dump_call_graph_;
  }

  bool dump_classes() const {
    return dump_classes_;
  }

  const std::optional<ClassFilter>& class_filter() const {
    return class_filter_;
  }

  const std::optional<MethodFilter>& method_filter() const {
    return method_filter_;
  }

  std::filesystem::path entry_points_output_path() const;
  std::filesystem::path flows_output_path() const;
  std::filesystem::path data_flows_output_path() const;
  std::filesystem::path diagnostics_output_path() const;
  std::filesystem::path statistics_output_path() const;
  std::filesystem::path call_graph_output_path() const;
  std::filesystem::path classes_output_path() const;
  std::filesystem::path methods_output_path() const;

 private:
  std::string apk_directory_;
  std::filesystem::path output_directory_;

  std::vector<SinkCategory> sinks_;
  std::vector<std::string> sink_patterns_;
  std::size_t max_depth_;
  bool optimize_;
  std::size_t package_depth_;
  bool sequential_;

  std::vector<std::string> lifecycles_paths_;
  std::optional<std::filesystem::path> string_resources_path_;
  std::optional<std::filesystem::path> heuristics_path_;

  bool dump_call_graph_;
  bool dump_classes_;
  std::optional<ClassFilter> class_filter_;
  std::optional<MethodFilter> method_filter_;
};

} // namespace droidflow

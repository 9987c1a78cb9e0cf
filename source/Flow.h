/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

#include <droidflow/CallGraph.h>
#include <droidflow/Manifest.h>
#include <droidflow/MethodReference.h>

namespace droidflow {

/**
 * Every call path found from the lifecycle methods of one entry point to one
 * sink method.
 */
class Flow final {
 public:
  /* `paths` must be non-empty and sorted by length, then by signatures. */
  Flow(
      std::string entry_point,
      ComponentKind component_kind,
      MethodReference sink_method,
      std::vector<CallPath> paths,
      bool is_deeplink_handler);

  const std::string& entry_point() const {
    return entry_point_;
  }

  ComponentKind component_kind() const {
    return component_kind_;
  }

  const MethodReference& sink_method() const {
    return sink_method_;
  }

  const std::vector<CallPath>& paths() const {
    return paths_;
  }

  std::size_t min_path_length() const {
    return paths_.front().length();
  }

  std::size_t path_count() const {
    return paths_.size();
  }

  bool is_deeplink_handler() const {
    return is_deeplink_handler_;
  }

  const CallPath& shortest_path() const {
    return paths_.front();
  }

  /* Distinct methods the paths start from, in path order. */
  std::vector<MethodReference> lifecycle_methods() const;

  Json::Value to_json() const;

 private:
  std::string entry_point_;
  ComponentKind component_kind_;
  MethodReference sink_method_;
  std::vector<CallPath> paths_;
  bool is_deeplink_handler_;
};

enum class ConfidenceLevel {
  Low,
  Medium,
  High,
};

std::string_view show(ConfidenceLevel level);

/* The scored data flow of the best path of a `Flow`. */
struct DataFlow {
  std::string entry_point;
  /* Intent extraction call found along the path. */
  std::optional<MethodReference> source;
  MethodReference sink;
  CallPath flow_path;
  double confidence;
  ConfidenceLevel level;
  std::vector<std::string> evidence;

  Json::Value to_json() const;
};

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <droidflow/Assert.h>
#include <droidflow/Flow.h>

namespace droidflow {

Flow::Flow(
    std::string entry_point,
    ComponentKind component_kind,
    MethodReference sink_method,
    std::vector<CallPath> paths,
    bool is_deeplink_handler)
    : entry_point_(std::move(entry_point)),
      component_kind_(component_kind),
      sink_method_(std::move(sink_method)),
      paths_(std::move(paths)),
      is_deeplink_handler_(is_deeplink_handler) {
  df_assert(!paths_.empty());
}

std::vector<MethodReference> Flow::lifecycle_methods() const {
  std::vector<MethodReference> result;
  for (const auto& path : paths_) {
    if (std::find(result.begin(), result.end(), path.source()) ==
        result.end()) {
      result.push_back(path.source());
    }
  }
  return result;
}

Json::Value Flow::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["entry_point"] = entry_point_;
  value["component_kind"] = std::string(show(component_kind_));
  value["sink_method"] = sink_method_.show();
  value["is_deeplink_handler"] = is_deeplink_handler_;
  value["min_path_length"] =
      Json::Value(static_cast<Json::UInt64>(min_path_length()));
  value["path_count"] = Json::Value(static_cast<Json::UInt64>(path_count()));

  auto lifecycle_methods_value = Json::Value(Json::arrayValue);
  for (const auto& method : lifecycle_methods()) {
    lifecycle_methods_value.append(method.show());
  }
  value["lifecycle_methods"] = lifecycle_methods_value;

  auto paths_value = Json::Value(Json::arrayValue);
  for (const auto& path : paths_) {
    paths_value.append(path.show());
  }
  value["paths"] = paths_value;
  return value;
}

std::string_view show(ConfidenceLevel level) {
  switch (level) {
    case ConfidenceLevel::Low:
      return "low";
    case ConfidenceLevel::Medium:
      return "medium";
    case ConfidenceLevel::High:
      return "high";
  }
  df_unreachable();
}

Json::Value DataFlow::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["entry_point"] = entry_point;
  if (source) {
    value["source"] = source->show();
  } else {
    value["source"] = Json::Value(Json::nullValue);
  }
  value["sink"] = sink.show();
  value["flow_path"] = flow_path.to_json();
  value["confidence"] = confidence;
  value["level"] = std::string(show(level));
  auto evidence_value = Json::Value(Json::arrayValue);
  for (const auto& line : evidence) {
    evidence_value.append(line);
  }
  value["evidence"] = evidence_value;
  return value;
}

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <droidflow/Constants.h>
#include <droidflow/EntryPoint.h>

namespace droidflow {

namespace {

bool has_scheme_or_host(const DataFilter& data) {
  return (data.scheme && !data.scheme->empty()) ||
      (data.host && !data.host->empty());
}

} // namespace

EntryPoint::EntryPoint(ManifestComponent component, bool class_found)
    : component_(std::move(component)),
      class_found_(class_found),
      is_launcher_(false),
      is_deeplink_handler_(false) {
  for (const auto& filter : component_.intent_filters) {
    is_launcher_ = is_launcher_ || is_launcher(filter);
    is_deeplink_handler_ = is_deeplink_handler_ || is_deeplink(filter);
  }
}

bool EntryPoint::is_deeplink(const IntentFilter& filter) {
  if (!filter.has_action(constants::k_action_view)) {
    return false;
  }
  if (!filter.has_category(constants::k_category_default) &&
      !filter.has_category(constants::k_category_browsable)) {
    return false;
  }
  return std::any_of(
      filter.data.begin(), filter.data.end(), has_scheme_or_host);
}

bool EntryPoint::is_launcher(const IntentFilter& filter) {
  return filter.has_action(constants::k_action_main) &&
      filter.has_category(constants::k_category_launcher);
}

bool EntryPoint::is_exported() const {
  if (component_.exported) {
    return *component_.exported;
  }
  return !component_.intent_filters.empty();
}

std::vector<std::string> EntryPoint::deeplink_patterns() const {
  std::vector<std::string> patterns;
  for (const auto& filter : component_.intent_filters) {
    for (const auto& data : filter.data) {
      std::string pattern;
      if (data.scheme) {
        pattern += *data.scheme;
        pattern += "://";
      }
      if (data.host) {
        pattern += *data.host;
      }
      if (data.path) {
        pattern += *data.path;
      } else if (data.path_prefix) {
        pattern += *data.path_prefix;
        pattern += '*';
      } else if (data.path_pattern) {
        pattern += *data.path_pattern;
      }
      if (!pattern.empty()) {
        patterns.push_back(std::move(pattern));
      }
    }
  }
  return patterns;
}

std::vector<std::string> EntryPoint::actions() const {
  std::vector<std::string> result;
  for (const auto& filter : component_.intent_filters) {
    result.insert(result.end(), filter.actions.begin(), filter.actions.end());
  }
  return result;
}

bool EntryPoint::handles_action(std::string_view action) const {
  return std::any_of(
      component_.intent_filters.begin(),
      component_.intent_filters.end(),
      [&](const IntentFilter& filter) { return filter.has_action(action); });
}

Json::Value EntryPoint::to_json() const {
  auto value = component_.to_json();
  value["class_found"] = class_found_;
  value["exported"] = is_exported();
  value["is_launcher"] = is_launcher_;
  value["is_deeplink_handler"] = is_deeplink_handler_;
  auto patterns_value = Json::Value(Json::arrayValue);
  for (const auto& pattern : deeplink_patterns()) {
    patterns_value.append(pattern);
  }
  value["deeplink_patterns"] = patterns_value;
  return value;
}

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <droidflow/EntryPointAnalyzer.h>
#include <droidflow/Log.h>

namespace droidflow {

Json::Value EntryPointAnalyzer::Stats::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["total"] = Json::Value(static_cast<Json::UInt64>(total));
  value["found"] = Json::Value(static_cast<Json::UInt64>(found));
  value["deeplink_handlers"] =
      Json::Value(static_cast<Json::UInt64>(deeplink_handlers));
  value["launchers"] = Json::Value(static_cast<Json::UInt64>(launchers));
  value["exported"] = Json::Value(static_cast<Json::UInt64>(exported));
  value["activities"] = Json::Value(static_cast<Json::UInt64>(activities));
  value["services"] = Json::Value(static_cast<Json::UInt64>(services));
  value["receivers"] = Json::Value(static_cast<Json::UInt64>(receivers));
  value["providers"] = Json::Value(static_cast<Json::UInt64>(providers));
  return value;
}

EntryPointAnalyzer::EntryPointAnalyzer(
    const Manifest& manifest,
    const ClassTable& classes)
    : classes_(classes), entry_points_(analyze(manifest, classes)) {
  for (std::size_t position = 0; position < entry_points_.size();
       position++) {
    // A class declared twice keeps its first component.
    class_index_.emplace(entry_points_[position].class_name(), position);
  }
}

std::vector<EntryPoint> EntryPointAnalyzer::analyze(
    const Manifest& manifest,
    const ClassTable& classes) {
  std::vector<EntryPoint> entry_points;
  entry_points.reserve(manifest.components().size());
  for (const auto& component : manifest.components()) {
    bool class_found = classes.contains(component.class_name);
    if (!class_found) {
      LOG(3,
          "No implementation found for {} `{}`.",
          show(component.kind),
          component.class_name);
    }
    entry_points.emplace_back(component, class_found);
  }
  return entry_points;
}

std::vector<const EntryPoint*> EntryPointAnalyzer::get_deeplink_handlers()
    const {
  std::vector<const EntryPoint*> result;
  for (const auto& entry_point : entry_points_) {
    if (entry_point.is_deeplink_handler() && entry_point.class_found()) {
      result.push_back(&entry_point);
    }
  }
  return result;
}

std::vector<const EntryPoint*> EntryPointAnalyzer::found_entry_points() const {
  std::vector<const EntryPoint*> result;
  for (const auto& entry_point : entry_points_) {
    if (entry_point.class_found()) {
      result.push_back(&entry_point);
    }
  }
  return result;
}

std::optional<std::pair<const EntryPoint*, const DexClass*>>
EntryPointAnalyzer::get_entry_point_with_class(
    const std::string& class_name) const {
  auto found = class_index_.find(class_name);
  if (found == class_index_.end()) {
    return std::nullopt;
  }
  const auto* dex_class = classes_.get(class_name);
  if (dex_class == nullptr) {
    return std::nullopt;
  }
  return std::make_pair(&entry_points_[found->second], dex_class);
}

EntryPointAnalyzer::Stats EntryPointAnalyzer::get_stats() const {
  Stats stats;
  stats.total = entry_points_.size();
  for (const auto& entry_point : entry_points_) {
    stats.found += entry_point.class_found() ? 1 : 0;
    stats.deeplink_handlers += entry_point.is_deeplink_handler() ? 1 : 0;
    stats.launchers += entry_point.is_launcher() ? 1 : 0;
    stats.exported += entry_point.is_exported() ? 1 : 0;
    switch (entry_point.kind()) {
      case ComponentKind::Activity:
        stats.activities++;
        break;
      case ComponentKind::Service:
        stats.services++;
        break;
      case ComponentKind::Receiver:
        stats.receivers++;
        break;
      case ComponentKind::Provider:
        stats.providers++;
        break;
    }
  }
  return stats;
}

Json::Value EntryPointAnalyzer::to_json() const {
  auto value = Json::Value(Json::arrayValue);
  for (const auto& entry_point : entry_points_) {
    value.append(entry_point.to_json());
  }
  return value;
}

} // namespace droidflow

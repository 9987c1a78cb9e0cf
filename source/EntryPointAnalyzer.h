/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <json/json.h>

#include <droidflow/ClassTable.h>
#include <droidflow/EntryPoint.h>
#include <droidflow/IncludeMacros.h>
#include <droidflow/Manifest.h>

namespace droidflow {

/**
 * Links the components declared in the manifest to the classes that
 * implement them.
 */
class EntryPointAnalyzer final {
 public:
  struct Stats {
    std::size_t total = 0;
    std::size_t found = 0;
    std::size_t deeplink_handlers = 0;
    std::size_t launchers = 0;
    std::size_t exported = 0;
    std::size_t activities = 0;
    std::size_t services = 0;
    std::size_t receivers = 0;
    std::size_t providers = 0;

    Json::Value to_json() const;
  };

 public:
  EntryPointAnalyzer(const Manifest& manifest, const ClassTable& classes);

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(EntryPointAnalyzer)

  /* One entry point per declared component, in manifest order. */
  static std::vector<EntryPoint> analyze(
      const Manifest& manifest,
      const ClassTable& classes);

  const std::vector<EntryPoint>& entry_points() const {
    return entry_points_;
  }

  /* Entry points with a deeplink filter and an implementation class. */
  std::vector<const EntryPoint*> get_deeplink_handlers() const;

  std::vector<const EntryPoint*> found_entry_points() const;

  std::optional<std::pair<const EntryPoint*, const DexClass*>>
  get_entry_point_with_class(const std::string& class_name) const;

  Stats get_stats() const;

  Json::Value to_json() const;

 private:
  const ClassTable& classes_;
  std::vector<EntryPoint> entry_points_;
  std::unordered_map<std::string, std::size_t> class_index_;
};

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <json/json.h>

#include <droidflow/JsonValidation.h>
#include <droidflow/Manifest.h>

namespace droidflow {

class LifecycleMethodsJsonError : public JsonValidationError {
 public:
  LifecycleMethodsJsonError(
      const Json::Value& value,
      const std::optional<std::string>& field,
      const std::string& expected);
};

/**
 * Names of the methods the framework calls on each kind of component. Data
 * flow searches start from these methods.
 *
 * Additional definitions are read from JSON documents of the form:
 * ```
 * [{"component": "activity", "methods": ["onPause", "onRestart"]}]
 * ```
 */
class LifecycleMethods final {
 public:
  /* The framework entry methods of each component kind. */
  LifecycleMethods();

  static LifecycleMethods from_files(
      const std::vector<std::filesystem::path>& paths);

  void add_methods_from_json(const Json::Value& lifecycle_definitions);

  /* Method names for the kind, in declaration order. */
  const std::vector<std::string>& methods(ComponentKind kind) const;

  bool is_lifecycle_method(ComponentKind kind, const std::string& name) const;

 private:
  std::map<ComponentKind, std::vector<std::string>> lifecycle_methods_;
};

} // namespace droidflow

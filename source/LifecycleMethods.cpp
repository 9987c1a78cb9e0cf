/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <droidflow/JsonReaderWriter.h>
#include <droidflow/LifecycleMethods.h>
#include <droidflow/Log.h>

namespace droidflow {

namespace {

ComponentKind component_kind_from_json(const Json::Value& value) {
  auto kind = JsonValidation::string(value, "component");
  for (auto candidate :
       {ComponentKind::Activity,
        ComponentKind::Service,
        ComponentKind::Receiver,
        ComponentKind::Provider}) {
    if (show(candidate) == kind) {
      return candidate;
    }
  }
  throw LifecycleMethodsJsonError(
      value,
      /* field */ "component",
      "one of `activity`, `service`, `receiver` or `provider`");
}

} // namespace

LifecycleMethodsJsonError::LifecycleMethodsJsonError(
    const Json::Value& value,
    const std::optional<std::string>& field,
    const std::string& expected)
    : JsonValidationError(value, field, expected) {}

LifecycleMethods::LifecycleMethods()
    : lifecycle_methods_{
          {ComponentKind::Activity,
           {"onCreate",
            "onStart",
            "onResume",
            "onNewIntent",
            "onActivityResult"}},
          {ComponentKind::Service,
           {"onCreate", "onStartCommand", "onStart", "onBind"}},
          {ComponentKind::Receiver, {"onReceive"}},
          {ComponentKind::Provider,
           {"onCreate", "query", "insert", "update", "delete"}},
      } {}

LifecycleMethods LifecycleMethods::from_files(
    const std::vector<std::filesystem::path>& paths) {
  LifecycleMethods lifecycle_methods;
  for (const auto& path : paths) {
    LOG(2, "Reading lifecycle methods from `{}`.", path.string());
    lifecycle_methods.add_methods_from_json(JsonReader::parse_json_file(path));
  }
  return lifecycle_methods;
}

void LifecycleMethods::add_methods_from_json(
    const Json::Value& lifecycle_definitions) {
  for (const auto& lifecycle_definition :
       JsonValidation::null_or_array(lifecycle_definitions)) {
    JsonValidation::check_unexpected_members(
        lifecycle_definition, {"component", "methods"});
    auto kind = component_kind_from_json(lifecycle_definition);
    auto& methods = lifecycle_methods_[kind];
    for (auto& name :
         JsonValidation::string_list(lifecycle_definition, "methods")) {
      if (std::find(methods.begin(), methods.end(), name) != methods.end()) {
        // Each method is a search root at most once per component kind.
        throw LifecycleMethodsJsonError(
            lifecycle_definition,
            /* field */ "methods",
            "method names not already defined for the component");
      }
      methods.push_back(std::move(name));
    }
  }
}

const std::vector<std::string>& LifecycleMethods::methods(
    ComponentKind kind) const {
  static const std::vector<std::string> empty;
  auto found = lifecycle_methods_.find(kind);
  if (found == lifecycle_methods_.end()) {
    return empty;
  }
  return found->second;
}

bool LifecycleMethods::is_lifecycle_method(
    ComponentKind kind,
    const std::string& name) const {
  const auto& names = methods(kind);
  return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace droidflow

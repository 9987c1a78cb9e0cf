/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

#include <droidflow/Manifest.h>

namespace droidflow {

/**
 * A component declared in the manifest, bound to its implementation class.
 *
 * The binding is only recorded as `class_found`. The class itself is looked
 * up by name in the class table when needed.
 */
class EntryPoint final {
 public:
  EntryPoint(ManifestComponent component, bool class_found);

  /**
   * A filter makes a deeplink when it has the `VIEW` action, the `DEFAULT`
   * or `BROWSABLE` category and a data element with a scheme or a host.
   */
  static bool is_deeplink(const IntentFilter& filter);

  /* `MAIN` action with the `LAUNCHER` category. */
  static bool is_launcher(const IntentFilter& filter);

  const ManifestComponent& component() const {
    return component_;
  }

  const std::string& class_name() const {
    return component_.class_name;
  }

  ComponentKind kind() const {
    return component_.kind;
  }

  bool class_found() const {
    return class_found_;
  }

  bool is_launcher() const {
    return is_launcher_;
  }

  bool is_deeplink_handler() const {
    return is_deeplink_handler_;
  }

  /**
   * Whether other applications can start the component. Without an explicit
   * attribute, a component with intent filters is exported.
   */
  bool is_exported() const;

  /* `scheme://host` followed by the path, `path_prefix*` or the pattern. */
  std::vector<std::string> deeplink_patterns() const;

  /* Actions of all filters, in declaration order. */
  std::vector<std::string> actions() const;

  bool handles_action(std::string_view action) const;

  Json::Value to_json() const;

 private:
  ManifestComponent component_;
  bool class_found_;
  bool is_launcher_;
  bool is_deeplink_handler_;
};

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

namespace droidflow {

enum class ComponentKind {
  Activity,
  Service,
  Receiver,
  Provider,
};

std::string_view show(ComponentKind kind);

/* One `<data>` element of an intent filter. */
struct DataFilter {
  std::optional<std::string> scheme;
  std::optional<std::string> host;
  std::optional<std::string> port;
  std::optional<std::string> path;
  std::optional<std::string> path_prefix;
  std::optional<std::string> path_pattern;
  std::optional<std::string> mime_type;

  static DataFilter from_json(const Json::Value& value);
  Json::Value to_json() const;
};

struct IntentFilter {
  std::set<std::string> actions;
  std::set<std::string> categories;
  std::vector<DataFilter> data;

  bool has_action(std::string_view action) const;
  bool has_category(std::string_view category) const;

  static IntentFilter from_json(const Json::Value& value);
  Json::Value to_json() const;
};

struct ManifestComponent {
  /* Fully qualified, relative names are resolved against the package. */
  std::string class_name;
  ComponentKind kind;
  std::optional<bool> exported;
  std::optional<std::string> permission;
  std::vector<IntentFilter> intent_filters;

  Json::Value to_json() const;
};

/**
 * The decoded `AndroidManifest.xml` of a package, as produced by an external
 * AXML decoder.
 */
class Manifest final {
 public:
  Manifest(
      std::string package_name,
      std::vector<ManifestComponent> components,
      std::vector<std::string> permissions = {});

  /* Throws `ManifestError` if the document is not a valid manifest. */
  static Manifest from_json(const Json::Value& value);
  static Manifest from_file(const std::filesystem::path& path);

  /**
   * Resolve a component name as the platform does: `.Main` and `Main` are
   * relative to the package.
   */
  static std::string resolve_class_name(
      std::string_view package_name,
      std::string_view name);

  const std::string& package_name() const {
    return package_name_;
  }

  const std::optional<std::string>& version_code() const {
    return version_code_;
  }

  const std::optional<std::string>& version_name() const {
    return version_name_;
  }

  const std::optional<int>& min_sdk_version() const {
    return min_sdk_version_;
  }

  const std::optional<int>& target_sdk_version() const {
    return target_sdk_version_;
  }

  const std::vector<std::string>& permissions() const {
    return permissions_;
  }

  /* Components in declaration order: activities, services, receivers then
   * providers. */
  const std::vector<ManifestComponent>& components() const {
    return components_;
  }

  std::vector<const ManifestComponent*> components(ComponentKind kind) const;

  Json::Value to_json() const;

 private:
  std::string package_name_;
  std::optional<std::string> version_code_;
  std::optional<std::string> version_name_;
  std::optional<int> min_sdk_version_;
  std::optional<int> target_sdk_version_;
  std::vector<std::string> permissions_;
  std::vector<ManifestComponent> components_;
};

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>

#include <droidflow/Assert.h>
#include <droidflow/Errors.h>
#include <droidflow/JsonReaderWriter.h>
#include <droidflow/JsonValidation.h>
#include <droidflow/Log.h>
#include <droidflow/Manifest.h>

namespace droidflow {

std::string_view show(ComponentKind kind) {
  switch (kind) {
    case ComponentKind::Activity:
      return "activity";
    case ComponentKind::Service:
      return "service";
    case ComponentKind::Receiver:
      return "receiver";
    case ComponentKind::Provider:
      return "provider";
  }
  df_unreachable();
}

namespace {

/* Decoders emit numeric attributes either as numbers or as strings. */
std::optional<std::string> optional_scalar(
    const Json::Value& value,
    const std::string& field) {
  JsonValidation::validate_object(value);
  const auto& member = value[field];
  if (member.isNull()) {
    return std::nullopt;
  }
  if (member.isString()) {
    return member.asString();
  }
  if (member.isIntegral()) {
    return std::to_string(member.asLargestInt());
  }
  throw JsonValidationError(value, field, /* expected */ "string or integer");
}

std::optional<int> optional_sdk_version(
    const Json::Value& value,
    const std::string& field) {
  auto version = optional_scalar(value, field);
  if (!version) {
    return std::nullopt;
  }
  try {
    return std::stoi(*version);
  } catch (const std::exception&) {
    throw JsonValidationError(value, field, /* expected */ "an SDK level");
  }
}

void set_optional(
    Json::Value& value,
    const char* field,
    const std::optional<std::string>& member) {
  if (member) {
    value[field] = *member;
  }
}

Json::Value strings_to_json(const std::set<std::string>& strings) {
  auto value = Json::Value(Json::arrayValue);
  for (const auto& string : strings) {
    value.append(string);
  }
  return value;
}

} // namespace

DataFilter DataFilter::from_json(const Json::Value& value) {
  JsonValidation::validate_object(value);
  DataFilter filter;
  filter.scheme = JsonValidation::optional_string(value, "scheme");
  filter.host = JsonValidation::optional_string(value, "host");
  filter.port = optional_scalar(value, "port");
  filter.path = JsonValidation::optional_string(value, "path");
  filter.path_prefix = JsonValidation::optional_string(value, "path_prefix");
  filter.path_pattern = JsonValidation::optional_string(value, "path_pattern");
  filter.mime_type = JsonValidation::optional_string(value, "mime_type");
  return filter;
}

Json::Value DataFilter::to_json() const {
  auto value = Json::Value(Json::objectValue);
  set_optional(value, "scheme", scheme);
  set_optional(value, "host", host);
  set_optional(value, "port", port);
  set_optional(value, "path", path);
  set_optional(value, "path_prefix", path_prefix);
  set_optional(value, "path_pattern", path_pattern);
  set_optional(value, "mime_type", mime_type);
  return value;
}

bool IntentFilter::has_action(std::string_view action) const {
  return actions.count(std::string(action)) != 0;
}

bool IntentFilter::has_category(std::string_view category) const {
  return categories.count(std::string(category)) != 0;
}

IntentFilter IntentFilter::from_json(const Json::Value& value) {
  JsonValidation::validate_object(value);
  IntentFilter filter;
  for (auto& action : JsonValidation::string_list(value, "actions")) {
    filter.actions.insert(std::move(action));
  }
  for (auto& category : JsonValidation::string_list(value, "categories")) {
    filter.categories.insert(std::move(category));
  }
  for (const auto& data : JsonValidation::null_or_array(value, "data")) {
    filter.data.push_back(DataFilter::from_json(data));
  }
  return filter;
}

Json::Value IntentFilter::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["actions"] = strings_to_json(actions);
  value["categories"] = strings_to_json(categories);
  auto data_value = Json::Value(Json::arrayValue);
  for (const auto& filter : data) {
    data_value.append(filter.to_json());
  }
  value["data"] = data_value;
  return value;
}

Json::Value ManifestComponent::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["class"] = class_name;
  value["kind"] = std::string(show(kind));
  if (exported) {
    value["exported"] = *exported;
  }
  set_optional(value, "permission", permission);
  auto filters_value = Json::Value(Json::arrayValue);
  for (const auto& filter : intent_filters) {
    filters_value.append(filter.to_json());
  }
  value["intent_filters"] = filters_value;
  return value;
}

Manifest::Manifest(
    std::string package_name,
    std::vector<ManifestComponent> components,
    std::vector<std::string> permissions)
    : package_name_(std::move(package_name)),
      permissions_(std::move(permissions)),
      components_(std::move(components)) {}

std::string Manifest::resolve_class_name(
    std::string_view package_name,
    std::string_view name) {
  if (!name.empty() && name.front() == '.') {
    return fmt::format("{}{}", package_name, name);
  }
  if (name.find('.') == std::string_view::npos && !package_name.empty()) {
    return fmt::format("{}.{}", package_name, name);
  }
  return std::string(name);
}

Manifest Manifest::from_json(const Json::Value& value) {
  try {
    JsonValidation::validate_object(value);
    auto package_name = JsonValidation::string(value, "package");

    std::vector<ManifestComponent> components;
    auto parse_components = [&](const char* field, ComponentKind kind) {
      for (const auto& component_value :
           JsonValidation::null_or_array(value, field)) {
        auto name = JsonValidation::string(component_value, "name");
        if (name.empty()) {
          throw JsonValidationError(
              component_value, "name", /* expected */ "non-empty string");
        }
        ManifestComponent component{
            resolve_class_name(package_name, name),
            kind,
            JsonValidation::optional_boolean(component_value, "exported"),
            JsonValidation::optional_string(component_value, "permission"),
            {}};
        for (const auto& filter_value :
             JsonValidation::null_or_array(component_value, "intent_filters")) {
          component.intent_filters.push_back(
              IntentFilter::from_json(filter_value));
        }
        components.push_back(std::move(component));
      }
    };
    parse_components("activities", ComponentKind::Activity);
    parse_components("services", ComponentKind::Service);
    parse_components("receivers", ComponentKind::Receiver);
    parse_components("providers", ComponentKind::Provider);

    Manifest manifest(
        std::move(package_name),
        std::move(components),
        JsonValidation::string_list(value, "permissions"));
    manifest.version_code_ = optional_scalar(value, "version_code");
    manifest.version_name_ =
        JsonValidation::optional_string(value, "version_name");
    manifest.min_sdk_version_ = optional_sdk_version(value, "min_sdk_version");
    manifest.target_sdk_version_ =
        optional_sdk_version(value, "target_sdk_version");
    return manifest;
  } catch (const JsonValidationError& error) {
    throw ManifestError(error.what());
  }
}

Manifest Manifest::from_file(const std::filesystem::path& path) {
  Json::Value value;
  try {
    value = JsonReader::parse_json_file(path);
  } catch (const std::exception& error) {
    throw ManifestError(
        fmt::format("unable to read `{}`: {}", path.string(), error.what()));
  }
  auto manifest = from_json(value);
  LOG(2,
      "Read manifest of `{}` with {} components.",
      manifest.package_name(),
      manifest.components().size());
  return manifest;
}

std::vector<const ManifestComponent*> Manifest::components(
    ComponentKind kind) const {
  std::vector<const ManifestComponent*> result;
  for (const auto& component : components_) {
    if (component.kind == kind) {
      result.push_back(&component);
    }
  }
  return result;
}

Json::Value Manifest::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["package"] = package_name_;
  set_optional(value, "version_code", version_code_);
  set_optional(value, "version_name", version_name_);
  if (min_sdk_version_) {
    value["min_sdk_version"] = *min_sdk_version_;
  }
  if (target_sdk_version_) {
    value["target_sdk_version"] = *target_sdk_version_;
  }
  auto permissions_value = Json::Value(Json::arrayValue);
  for (const auto& permission : permissions_) {
    permissions_value.append(permission);
  }
  value["permissions"] = permissions_value;
  auto components_value = Json::Value(Json::arrayValue);
  for (const auto& component : components_) {
    components_value.append(component.to_json());
  }
  value["components"] = components_value;
  return value;
}

} // namespace droidflow

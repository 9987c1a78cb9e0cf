/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <boost/algorithm/string/predicate.hpp>

#include <droidflow/ClassFilter.h>
#include <droidflow/JsonValidation.h>

namespace droidflow {

namespace {

bool has_package_prefix(
    const std::string& package_name,
    const std::vector<std::string>& prefixes) {
  return std::any_of(
      prefixes.begin(), prefixes.end(), [&](const std::string& prefix) {
        return boost::starts_with(package_name, prefix);
      });
}

bool has_flags(std::uint32_t access_flags, std::optional<std::uint32_t> flags) {
  return !flags || (access_flags & *flags) == *flags;
}

bool contains(const std::string& string, const std::string& substring) {
  return string.find(substring) != std::string::npos;
}

std::optional<std::uint32_t> optional_modifiers(const Json::Value& value) {
  if (!JsonValidation::has_field(value, "modifiers")) {
    return std::nullopt;
  }
  return JsonValidation::unsigned_integer(value, "modifiers");
}

} // namespace

bool ClassFilter::matches(const DexClass& dex_class) const {
  auto package_name = dex_class.package_name();
  if (!packages.empty() && !has_package_prefix(package_name, packages)) {
    return false;
  }
  if (has_package_prefix(package_name, exclude_packages)) {
    return false;
  }
  if (class_name && !contains(dex_class.class_name(), *class_name) &&
      !contains(dex_class.simple_name(), *class_name)) {
    return false;
  }
  return has_flags(dex_class.access_flags(), modifiers);
}

ClassFilter ClassFilter::from_json(const Json::Value& value) {
  JsonValidation::check_unexpected_members(
      value, {"packages", "exclude-packages", "class-name", "modifiers"});
  ClassFilter filter;
  filter.packages = JsonValidation::string_list(value, "packages");
  filter.exclude_packages =
      JsonValidation::string_list(value, "exclude-packages");
  filter.class_name = JsonValidation::optional_string(value, "class-name");
  filter.modifiers = optional_modifiers(value);
  return filter;
}

bool MethodFilter::matches(const DexMethod& method) const {
  if (name && !contains(method.name(), *name)) {
    return false;
  }
  const auto& method_parameters = method.parameter_types();
  if (parameter_count && method_parameters.size() != *parameter_count) {
    return false;
  }
  if (!parameter_types.empty()) {
    if (method_parameters.size() != parameter_types.size()) {
      return false;
    }
    for (std::size_t i = 0; i < parameter_types.size(); i++) {
      if (!contains(method_parameters[i], parameter_types[i])) {
        return false;
      }
    }
  }
  if (return_type && !contains(method.return_type(), *return_type)) {
    return false;
  }
  return has_flags(method.access_flags(), modifiers);
}

MethodFilter MethodFilter::from_json(const Json::Value& value) {
  JsonValidation::check_unexpected_members(
      value,
      {"name",
       "parameter-count",
       "parameter-types",
       "return-type",
       "modifiers"});
  MethodFilter filter;
  filter.name = JsonValidation::optional_string(value, "name");
  if (JsonValidation::has_field(value, "parameter-count")) {
    filter.parameter_count =
        JsonValidation::unsigned_integer(value, "parameter-count");
  }
  filter.parameter_types =
      JsonValidation::string_list(value, "parameter-types");
  filter.return_type = JsonValidation::optional_string(value, "return-type");
  filter.modifiers = optional_modifiers(value);
  return filter;
}

std::vector<const DexClass*> find_classes(
    const ClassTable& table,
    const ClassFilter& filter,
    std::optional<std::size_t> limit) {
  std::vector<const DexClass*> result;
  for (const auto& dex_class : table) {
    if (limit && result.size() >= *limit) {
      break;
    }
    if (filter.matches(dex_class)) {
      result.push_back(&dex_class);
    }
  }
  return result;
}

std::vector<std::pair<const DexClass*, const DexMethod*>> find_methods(
    const ClassTable& table,
    const ClassFilter& class_filter,
    const MethodFilter& method_filter,
    std::optional<std::size_t> limit) {
  std::vector<std::pair<const DexClass*, const DexMethod*>> result;
  for (const auto& dex_class : table) {
    if (!class_filter.matches(dex_class)) {
      continue;
    }
    for (const auto& method : dex_class.methods()) {
      if (limit && result.size() >= *limit) {
        return result;
      }
      if (method_filter.matches(method)) {
        result.emplace_back(&dex_class, &method);
      }
    }
  }
  return result;
}

} // namespace droidflow

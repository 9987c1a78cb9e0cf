/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <json/json.h>

#include <droidflow/ClassTable.h>

namespace droidflow {

/**
 * Selects classes of the package. Empty criteria match everything.
 *
 * Package prefixes are compared against the package name of the class.
 * `class_name` is a substring of either the full or the simple name.
 * `modifiers` are access flags that must all be set.
 */
struct ClassFilter {
  std::vector<std::string> packages;
  std::vector<std::string> exclude_packages;
  std::optional<std::string> class_name;
  std::optional<std::uint32_t> modifiers;

  bool matches(const DexClass& dex_class) const;

  static ClassFilter from_json(const Json::Value& value);
};

/**
 * Selects methods. `name`, each parameter type and the return type are
 * substrings. Listing parameter types also constrains their count.
 */
struct MethodFilter {
  std::optional<std::string> name;
  std::optional<std::size_t> parameter_count;
  std::vector<std::string> parameter_types;
  std::optional<std::string> return_type;
  std::optional<std::uint32_t> modifiers;

  bool matches(const DexMethod& method) const;

  static MethodFilter from_json(const Json::Value& value);
};

/* Classes matching the filter, in table order, up to `limit`. */
std::vector<const DexClass*> find_classes(
    const ClassTable& table,
    const ClassFilter& filter,
    std::optional<std::size_t> limit = std::nullopt);

/* Methods matching `method_filter` in classes matching `class_filter`. */
std::vector<std::pair<const DexClass*, const DexMethod*>> find_methods(
    const ClassTable& table,
    const ClassFilter& class_filter,
    const MethodFilter& method_filter,
    std::optional<std::size_t> limit = std::nullopt);

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <json/json.h>

namespace droidflow {

class JsonValidationError : public std::invalid_argument {
 public:
  JsonValidationError(
      const Json::Value& value,
      const std::optional<std::string>& field,
      const std::string& expected);
};

/**
 * Typed accessors over `Json::Value`. Every accessor throws a
 * `JsonValidationError` describing the offending value when the shape does
 * not match.
 */
class JsonValidation final {
 public:
  static void validate_object(const Json::Value& value);
  static void validate_object(
      const Json::Value& value,
      const std::string& expected);

  static const Json::Value& object(
      const Json::Value& value,
      const std::string& field);

  static std::string string(const Json::Value& value);
  static std::string string(const Json::Value& value, const std::string& field);
  static std::optional<std::string> optional_string(
      const Json::Value& value,
      const std::string& field);

  /* Accepts either a single string or an array of strings. */
  static std::vector<std::string> string_list(
      const Json::Value& value,
      const std::string& field);

  static std::uint32_t unsigned_integer(const Json::Value& value);
  static std::uint32_t unsigned_integer(
      const Json::Value& value,
      const std::string& field);
  static std::uint32_t unsigned_integer_or_default(
      const Json::Value& value,
      const std::string& field,
      std::uint32_t default_value);

  static double number(const Json::Value& value, const std::string& field);

  static bool optional_boolean(
      const Json::Value& value,
      const std::string& field,
      bool default_value);
  static std::optional<bool> optional_boolean(
      const Json::Value& value,
      const std::string& field);

  static const Json::Value& null_or_array(const Json::Value& value);
  static const Json::Value& null_or_array(
      const Json::Value& value,
      const std::string& field);

  static bool has_field(const Json::Value& value, const std::string& field);

  /* Error on invalid members of a json object. */
  static void check_unexpected_members(
      const Json::Value& value,
      const std::unordered_set<std::string>& valid_members);
};

} // namespace droidflow

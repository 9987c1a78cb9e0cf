/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <droidflow/JsonReaderWriter.h>
#include <droidflow/JsonValidation.h>

namespace droidflow {

namespace {

std::string invalid_argument_message(
    const Json::Value& value,
    const std::optional<std::string>& field,
    const std::string& expected) {
  auto field_information = field ? fmt::format(" for field `{}`", *field) : "";
  return fmt::format(
      "Error validating `{}`. Expected {}{}.",
      boost::algorithm::trim_copy(JsonWriter::to_styled_string(value)),
      expected,
      field_information);
}

/* Returns the member, or the null singleton when it is absent. */
const Json::Value& member(
    const Json::Value& value,
    const std::string& field,
    const char* type) {
  JsonValidation::validate_object(
      value, fmt::format("non-null object with {} field `{}`", type, field));
  if (!value.isMember(field)) {
    return Json::Value::nullSingleton();
  }
  return value[field];
}

} // namespace

JsonValidationError::JsonValidationError(
    const Json::Value& value,
    const std::optional<std::string>& field,
    const std::string& expected)
    : std::invalid_argument(invalid_argument_message(value, field, expected)) {}

void JsonValidation::validate_object(
    const Json::Value& value,
    const std::string& expected) {
  if (value.isNull() || !value.isObject()) {
    throw JsonValidationError(value, /* field */ std::nullopt, expected);
  }
}

void JsonValidation::validate_object(const Json::Value& value) {
  validate_object(value, /* expected */ "non-null object");
}

const Json::Value& JsonValidation::object(
    const Json::Value& value,
    const std::string& field) {
  const auto& attribute = member(value, field, "object");
  if (attribute.isNull() || !attribute.isObject()) {
    throw JsonValidationError(value, field, /* expected */ "non-null object");
  }
  return attribute;
}

std::string JsonValidation::string(const Json::Value& value) {
  if (value.isNull() || !value.isString()) {
    throw JsonValidationError(
        value, /* field */ std::nullopt, /* expected */ "string");
  }
  return value.asString();
}

std::string JsonValidation::string(
    const Json::Value& value,
    const std::string& field) {
  const auto& string = member(value, field, "string");
  if (string.isNull() || !string.isString()) {
    throw JsonValidationError(value, field, /* expected */ "string");
  }
  return string.asString();
}

std::optional<std::string> JsonValidation::optional_string(
    const Json::Value& value,
    const std::string& field) {
  const auto& string = member(value, field, "string");
  if (string.isNull()) {
    return std::nullopt;
  }
  if (!string.isString()) {
    throw JsonValidationError(value, field, /* expected */ "string");
  }
  return string.asString();
}

std::vector<std::string> JsonValidation::string_list(
    const Json::Value& value,
    const std::string& field) {
  const auto& list = member(value, field, "string or array");
  std::vector<std::string> result;
  if (list.isNull()) {
    return result;
  }
  if (list.isString()) {
    result.push_back(list.asString());
    return result;
  }
  if (!list.isArray()) {
    throw JsonValidationError(
        value, field, /* expected */ "string or array of strings");
  }
  for (const auto& element : list) {
    result.push_back(string(element));
  }
  return result;
}

std::uint32_t JsonValidation::unsigned_integer(const Json::Value& value) {
  if (value.isNull() || !value.isUInt()) {
    throw JsonValidationError(
        value,
        /* field */ std::nullopt,
        /* expected */ "unsigned integer (32-bit)");
  }
  return value.asUInt();
}

std::uint32_t JsonValidation::unsigned_integer(
    const Json::Value& value,
    const std::string& field) {
  const auto& integer = member(value, field, "unsigned integer");
  if (integer.isNull() || !integer.isUInt()) {
    throw JsonValidationError(value, field, /* expected */ "unsigned integer");
  }
  return integer.asUInt();
}

std::uint32_t JsonValidation::unsigned_integer_or_default(
    const Json::Value& value,
    const std::string& field,
    std::uint32_t default_value) {
  const auto& integer = member(value, field, "unsigned integer");
  if (integer.isNull()) {
    return default_value;
  }
  if (!integer.isUInt()) {
    throw JsonValidationError(value, field, /* expected */ "unsigned integer");
  }
  return integer.asUInt();
}

double JsonValidation::number(
    const Json::Value& value,
    const std::string& field) {
  const auto& number = member(value, field, "number");
  if (number.isNull() || !number.isNumeric()) {
    throw JsonValidationError(value, field, /* expected */ "number");
  }
  return number.asDouble();
}

bool JsonValidation::optional_boolean(
    const Json::Value& value,
    const std::string& field,
    bool default_value) {
  return optional_boolean(value, field).value_or(default_value);
}

std::optional<bool> JsonValidation::optional_boolean(
    const Json::Value& value,
    const std::string& field) {
  const auto& boolean = member(value, field, "boolean");
  if (boolean.isNull()) {
    return std::nullopt;
  }
  if (!boolean.isBool()) {
    throw JsonValidationError(value, field, /* expected */ "boolean");
  }
  return boolean.asBool();
}

const Json::Value& JsonValidation::null_or_array(const Json::Value& value) {
  if (!value.isNull() && !value.isArray()) {
    throw JsonValidationError(
        value, /* field */ std::nullopt, /* expected */ "null or array");
  }
  return value;
}

const Json::Value& JsonValidation::null_or_array(
    const Json::Value& value,
    const std::string& field) {
  const auto& array = member(value, field, "null or array");
  if (!array.isNull() && !array.isArray()) {
    throw JsonValidationError(value, field, /* expected */ "null or array");
  }
  return array;
}

bool JsonValidation::has_field(
    const Json::Value& value,
    const std::string& field) {
  return value.isObject() && !value[field].isNull();
}

void JsonValidation::check_unexpected_members(
    const Json::Value& value,
    const std::unordered_set<std::string>& valid_members) {
  validate_object(value);

  for (const std::string& member : value.getMemberNames()) {
    if (valid_members.count(member) != 0) {
      continue;
    }
    std::vector<std::string> expected(
        valid_members.begin(), valid_members.end());
    std::sort(expected.begin(), expected.end());
    throw JsonValidationError(
        value,
        /* field */ std::nullopt,
        /* expected */
        fmt::format(
            "fields `{}`, got `{}`", fmt::join(expected, "`, `"), member));
  }
}

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

#include <droidflow/IncludeMacros.h>

namespace droidflow {

/**
 * A resolved method reference, with Java names for every type.
 *
 * The string form is `com.example.Foo.bar(java.lang.String,int):void`.
 */
class MethodReference final {
 public:
  MethodReference(
      std::string class_name,
      std::string name,
      std::vector<std::string> parameter_types,
      std::string return_type);

  INCLUDE_DEFAULT_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(MethodReference)

  /* Parse the string form. Returns nothing if it is not well formed. */
  static std::optional<MethodReference> parse(std::string_view signature);

  const std::string& class_name() const {
    return class_name_;
  }

  const std::string& name() const {
    return name_;
  }

  const std::vector<std::string>& parameter_types() const {
    return parameter_types_;
  }

  const std::string& return_type() const {
    return return_type_;
  }

  /* `com.example.Foo.bar` */
  std::string qualified_name() const;

  std::string show() const;

  Json::Value to_json() const;

  bool operator==(const MethodReference& other) const;
  bool operator!=(const MethodReference& other) const {
    return !(*this == other);
  }
  bool operator<(const MethodReference& other) const;

 private:
  std::string class_name_;
  std::string name_;
  std::vector<std::string> parameter_types_;
  std::string return_type_;
};

std::ostream& operator<<(std::ostream& out, const MethodReference& method);

} // namespace droidflow

template <>
struct std::hash<droidflow::MethodReference> {
  std::size_t operator()(const droidflow::MethodReference& method) const;
};

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <tuple>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/functional/hash.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <droidflow/MethodReference.h>

namespace droidflow {

MethodReference::MethodReference(
    std::string class_name,
    std::string name,
    std::vector<std::string> parameter_types,
    std::string return_type)
    : class_name_(std::move(class_name)),
      name_(std::move(name)),
      parameter_types_(std::move(parameter_types)),
      return_type_(std::move(return_type)) {}

std::optional<MethodReference> MethodReference::parse(
    std::string_view signature) {
  auto open = signature.find('(');
  auto close = signature.find("):", open);
  if (open == std::string_view::npos || close == std::string_view::npos) {
    return std::nullopt;
  }

  auto qualified_name = signature.substr(0, open);
  auto dot = qualified_name.rfind('.');
  if (dot == std::string_view::npos || dot == 0 ||
      dot + 1 == qualified_name.size()) {
    return std::nullopt;
  }

  auto return_type = signature.substr(close + 2);
  if (return_type.empty()) {
    return std::nullopt;
  }

  std::vector<std::string> parameter_types;
  auto parameters = std::string(signature.substr(open + 1, close - open - 1));
  if (!parameters.empty()) {
    boost::split(parameter_types, parameters, boost::is_any_of(","));
  }

  return MethodReference(
      std::string(qualified_name.substr(0, dot)),
      std::string(qualified_name.substr(dot + 1)),
      std::move(parameter_types),
      std::string(return_type));
}

std::string MethodReference::qualified_name() const {
  return fmt::format("{}.{}", class_name_, name_);
}

std::string MethodReference::show() const {
  return fmt::format(
      "{}.{}({}):{}",
      class_name_,
      name_,
      fmt::join(parameter_types_, ","),
      return_type_);
}

Json::Value MethodReference::to_json() const {
  return Json::Value(show());
}

bool MethodReference::operator==(const MethodReference& other) const {
  return class_name_ == other.class_name_ && name_ == other.name_ &&
      parameter_types_ == other.parameter_types_ &&
      return_type_ == other.return_type_;
}

bool MethodReference::operator<(const MethodReference& other) const {
  return std::tie(class_name_, name_, parameter_types_, return_type_) <
      std::tie(
             other.class_name_,
             other.name_,
             other.parameter_types_,
             other.return_type_);
}

std::ostream& operator<<(std::ostream& out, const MethodReference& method) {
  return out << method.show();
}

} // namespace droidflow

std::size_t std::hash<droidflow::MethodReference>::operator()(
    const droidflow::MethodReference& method) const {
  std::size_t seed = 0;
  boost::hash_combine(seed, method.class_name());
  boost::hash_combine(seed, method.name());
  boost::hash_range(
      seed, method.parameter_types().begin(), method.parameter_types().end());
  boost::hash_combine(seed, method.return_type());
  return seed;
}

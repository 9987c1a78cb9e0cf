/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <iterator>

#include <droidflow/Assert.h>
#include <droidflow/Diagnostics.h>

namespace droidflow {

std::string_view show(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MalformedDex:
      return "malformed_dex";
    case ErrorKind::MethodDecodeFailure:
      return "method_decode_failure";
    case ErrorKind::UnknownOpcode:
      return "unknown_opcode";
    case ErrorKind::UnresolvedMethod:
      return "unresolved_method";
    case ErrorKind::DuplicateClass:
      return "duplicate_class";
  }
  df_unreachable();
}

Json::Value Diagnostic::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["kind"] = Json::Value(std::string(show(kind)));
  value["location"] = Json::Value(location);
  value["message"] = Json::Value(message);
  return value;
}

void Diagnostics::add(
    ErrorKind kind,
    std::string location,
    std::string message) {
  diagnostics_.push_back(
      Diagnostic{kind, std::move(location), std::move(message)});
}

void Diagnostics::extend(const Diagnostics& other) {
  diagnostics_.insert(
      diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

void Diagnostics::extend(Diagnostics&& other) {
  if (diagnostics_.empty()) {
    diagnostics_ = std::move(other.diagnostics_);
  } else {
    std::move(
        other.diagnostics_.begin(),
        other.diagnostics_.end(),
        std::back_inserter(diagnostics_));
  }
  other.diagnostics_.clear();
}

std::size_t Diagnostics::count(ErrorKind kind) const {
  return std::count_if(
      diagnostics_.begin(),
      diagnostics_.end(),
      [kind](const Diagnostic& diagnostic) { return diagnostic.kind == kind; });
}

Json::Value Diagnostics::to_json() const {
  auto value = Json::Value(Json::arrayValue);
  for (const auto& diagnostic : diagnostics_) {
    value.append(diagnostic.to_json());
  }
  return value;
}

} // namespace droidflow

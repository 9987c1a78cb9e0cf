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

namespace droidflow {

enum class ErrorKind {
  MalformedDex,
  MethodDecodeFailure,
  UnknownOpcode,
  UnresolvedMethod,
  DuplicateClass,
};

std::string_view show(ErrorKind kind);

/**
 * A non-fatal problem found while analyzing one unit (a bytecode file, a
 * class, a method or an instruction). The unit is excluded from the results
 * and the analysis continues.
 */
struct Diagnostic {
  ErrorKind kind;
  std::string location;
  std::string message;

  bool operator==(const Diagnostic& other) const {
    return kind == other.kind && location == other.location &&
        message == other.message;
  }

  Json::Value to_json() const;
};

/**
 * Ordered list of diagnostics produced during one analysis session.
 *
 * This is not thread-safe. Parallel phases give each worker its own list and
 * `extend` the session list once all workers are done.
 */
class Diagnostics final {
 public:
  Diagnostics() = default;

  void add(ErrorKind kind, std::string location, std::string message);
  void extend(const Diagnostics& other);
  void extend(Diagnostics&& other);

  std::size_t size() const {
    return diagnostics_.size();
  }

  bool empty() const {
    return diagnostics_.empty();
  }

  std::size_t count(ErrorKind kind) const;

  auto begin() const {
    return diagnostics_.cbegin();
  }

  auto end() const {
    return diagnostics_.cend();
  }

  const std::vector<Diagnostic>& entries() const {
    return diagnostics_;
  }

  Json::Value to_json() const;

 private:
  std::vector<Diagnostic> diagnostics_;
};

} // namespace droidflow

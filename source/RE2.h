/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <re2/re2.h>

namespace droidflow {

/**
 * If the regular expression is equivalent to an equality check, return the
 * string literal, otherwise return std::nullopt.
 *
 * For instance:
 * ```
 * >>> as_string_literal(re2::RE2("loadUrl"))
 * <<< std::optional<std::string>("loadUrl")
 * >>> as_string_literal(re2::RE2("load.*"))
 * <<< std::nullopt
 * ```
 */
std::optional<std::string> as_string_literal(const re2::RE2& pattern);

/**
 * A pattern matched anywhere in a method signature.
 *
 * Plain literals are matched as substrings, anything else as an RE2 partial
 * match. An invalid regular expression is matched as a plain substring.
 */
class SignaturePattern final {
 public:
  explicit SignaturePattern(const std::string& pattern);

  const std::string& pattern() const {
    return pattern_;
  }

  bool is_literal() const {
    return regex_ == nullptr;
  }

  bool matches(std::string_view signature) const;

 private:
  std::string pattern_;
  std::string literal_;
  std::shared_ptr<re2::RE2> regex_;
};

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

#include <json/json.h>

namespace droidflow {

/**
 * Resolves resource identifiers found as literals in the bytecode.
 *
 * Decoding the binary resource table is left to an external tool, which
 * hands the string resources over.
 */
class ResourceResolver {
 public:
  virtual ~ResourceResolver() = default;

  /* Whether the literal looks like an application or framework resource. */
  static bool is_resource_id(std::int64_t literal);

  virtual std::optional<std::string> resolve_string(
      std::uint32_t resource_id) const = 0;
};

/* String resources read from a `{"0x7f0a0001": "text"}` document. */
class JsonStringResources final : public ResourceResolver {
 public:
  explicit JsonStringResources(
      std::unordered_map<std::uint32_t, std::string> strings);

  /* Throws `JsonValidationError` on an invalid document. */
  static JsonStringResources from_json(const Json::Value& value);
  static JsonStringResources from_file(const std::filesystem::path& path);

  std::optional<std::string> resolve_string(
      std::uint32_t resource_id) const override;

  std::size_t size() const {
    return strings_.size();
  }

 private:
  std::unordered_map<std::uint32_t, std::string> strings_;
};

} // namespace droidflow

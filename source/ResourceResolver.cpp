/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <droidflow/JsonReaderWriter.h>
#include <droidflow/JsonValidation.h>
#include <droidflow/Log.h>
#include <droidflow/ResourceResolver.h>

namespace droidflow {

namespace {

constexpr std::uint32_t k_application_package = 0x7f;
constexpr std::uint32_t k_framework_package = 0x01;

} // namespace

bool ResourceResolver::is_resource_id(std::int64_t literal) {
  if (literal < 0 || literal > 0xffffffffLL) {
    return false;
  }
  auto package = static_cast<std::uint32_t>(literal) >> 24;
  auto type = (static_cast<std::uint32_t>(literal) >> 16) & 0xff;
  return (package == k_application_package || package == k_framework_package) &&
      type != 0;
}

JsonStringResources::JsonStringResources(
    std::unordered_map<std::uint32_t, std::string> strings)
    : strings_(std::move(strings)) {}

JsonStringResources JsonStringResources::from_json(const Json::Value& value) {
  JsonValidation::validate_object(value);
  std::unordered_map<std::uint32_t, std::string> strings;
  for (const auto& key : value.getMemberNames()) {
    std::uint32_t resource_id = 0;
    try {
      std::size_t end = 0;
      auto parsed = std::stoul(key, &end, /* base */ 0);
      if (end != key.size() || parsed > 0xffffffffUL) {
        throw std::out_of_range(key);
      }
      resource_id = static_cast<std::uint32_t>(parsed);
    } catch (const std::logic_error&) {
      throw JsonValidationError(
          value, key, /* expected */ "a resource identifier as key");
    }
    strings.emplace(resource_id, JsonValidation::string(value[key]));
  }
  return JsonStringResources(std::move(strings));
}

JsonStringResources JsonStringResources::from_file(
    const std::filesystem::path& path) {
  auto resources = from_json(JsonReader::parse_json_file(path));
  LOG(2,
      "Read {} string resources from `{}`.",
      resources.size(),
      path.string());
  return resources;
}

std::optional<std::string> JsonStringResources::resolve_string(
    std::uint32_t resource_id) const {
  auto found = strings_.find(resource_id);
  if (found == strings_.end()) {
    return std::nullopt;
  }
  return found->second;
}

} // namespace droidflow

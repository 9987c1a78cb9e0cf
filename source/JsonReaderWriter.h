/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <json/json.h>

namespace droidflow {

class JsonReader {
 public:
  static Json::Value parse_json(std::string string);
  static Json::Value parse_json_file(const std::filesystem::path& path);
};

class JsonWriter {
 public:
  static std::unique_ptr<Json::StreamWriter> compact_writer();
  static std::unique_ptr<Json::StreamWriter> styled_writer();

  /* Results are written styled so they can be diffed and reviewed. */
  static void write_json_file(
      const std::filesystem::path& path,
      const Json::Value& value,
      bool styled = true);

  static std::string to_styled_string(const Json::Value& value);
};

} // namespace droidflow

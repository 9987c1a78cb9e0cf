/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

#include <droidflow/JsonReaderWriter.h>
#include <droidflow/Log.h>

namespace droidflow {

namespace {

Json::Value parse_stream(std::istream& stream, const std::string& origin) {
  static const auto reader = Json::CharReaderBuilder();
  std::string errors;
  Json::Value json;

  if (!Json::parseFromStream(reader, stream, &json, &errors)) {
    throw std::invalid_argument(
        fmt::format("{} is not valid json: {}", origin, errors));
  }
  return json;
}

Json::StreamWriterBuilder writer_builder(const char* indentation) {
  Json::StreamWriterBuilder writer;
  writer["indentation"] = indentation;
  writer["emitUTF8"] = true;
  return writer;
}

} // namespace

Json::Value JsonReader::parse_json(std::string string) {
  std::istringstream stream(std::move(string));
  return parse_stream(stream, "Input");
}

Json::Value JsonReader::parse_json_file(const std::filesystem::path& path) {
  std::ifstream file;
  file.exceptions(std::ifstream::failbit | std::ifstream::badbit);
  try {
    file.open(path, std::ios_base::binary);
  } catch (const std::ifstream::failure&) {
    ERROR(1, "Could not open json file: `{}`.", path.string());
    throw std::invalid_argument(
        fmt::format("Could not open json file `{}`.", path.string()));
  }
  // Parsing reads until the end of the stream, which sets the failbit.
  file.exceptions(std::ifstream::badbit);
  return parse_stream(file, fmt::format("File `{}`", path.string()));
}

std::unique_ptr<Json::StreamWriter> JsonWriter::compact_writer() {
  static const auto builder = writer_builder("");
  return std::unique_ptr<Json::StreamWriter>(builder.newStreamWriter());
}

std::unique_ptr<Json::StreamWriter> JsonWriter::styled_writer() {
  static const auto builder = writer_builder("  ");
  return std::unique_ptr<Json::StreamWriter>(builder.newStreamWriter());
}

void JsonWriter::write_json_file(
    const std::filesystem::path& path,
    const Json::Value& value,
    bool styled) {
  std::ofstream file;
  file.exceptions(std::ofstream::failbit | std::ofstream::badbit);
  file.open(path, std::ios_base::binary);
  auto writer = styled ? styled_writer() : compact_writer();
  writer->write(value, &file);
  file << "\n";
  file.close();
}

std::string JsonWriter::to_styled_string(const Json::Value& value) {
  std::ostringstream string;
  styled_writer()->write(value, &string);
  return string.str();
}

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fstream>

#include <gmock/gmock.h>

#include <droidflow/JsonValidation.h>
#include <droidflow/Options.h>
#include <droidflow/tests/Test.h>

namespace droidflow {

class OptionsTest : public test::Test {};

namespace {

Json::Value minimal_options(const test::TemporaryDirectory& directory) {
  auto value = Json::Value(Json::objectValue);
  value["apk-directory"] = directory.path().string();
  value["output-directory"] = (directory.path() / "output").string();
  return value;
}

void write_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream output(path);
  output << content;
}

} // namespace

TEST_F(OptionsTest, Defaults) {
  test::TemporaryDirectory directory;
  Options options(minimal_options(directory));

  EXPECT_EQ(options.apk_directory(), directory.path().string());
  EXPECT_EQ(
      options.output_directory().string(),
      (directory.path() / "output").string());
  EXPECT_THAT(
      options.sinks(),
      testing::ElementsAre(
          SinkCategory::WebView,
          SinkCategory::File,
          SinkCategory::Network,
          SinkCategory::Sql));
  EXPECT_TRUE(options.sink_patterns().empty());
  EXPECT_EQ(options.max_depth(), 10);
  EXPECT_FALSE(options.optimize());
  EXPECT_EQ(options.package_depth(), 2);
  EXPECT_FALSE(options.sequential());
  EXPECT_TRUE(options.lifecycles_paths().empty());
  EXPECT_FALSE(options.string_resources_path().has_value());
  EXPECT_FALSE(options.heuristics_path().has_value());
  EXPECT_FALSE(options.dump_call_graph());
  EXPECT_FALSE(options.dump_classes());
  EXPECT_FALSE(options.class_filter().has_value());
  EXPECT_FALSE(options.method_filter().has_value());

  EXPECT_EQ(
      options.flows_output_path().string(),
      (directory.path() / "output" / "flows.json").string());
  EXPECT_EQ(
      options.data_flows_output_path().filename().string(), "data_flows.json");
}

TEST_F(OptionsTest, SinkPatterns) {
  test::TemporaryDirectory directory;
  auto value = minimal_options(directory);
  value["sinks"] = test::parse_json(R"(["sql", "webview", "sql"])");
  value["sink-patterns"] = test::parse_json(R"(["Custom\\.sink\\("])");
  value["max-depth"] = 4;
  value["optimize"] = true;
  value["package-depth"] = 3;
  value["sequential"] = true;
  Options options(value);

  EXPECT_THAT(
      options.sinks(),
      testing::ElementsAre(SinkCategory::Sql, SinkCategory::WebView));
  EXPECT_EQ(show(options.sinks()[0]), "sql");
  EXPECT_EQ(options.max_depth(), 4);
  EXPECT_TRUE(options.optimize());
  EXPECT_EQ(options.package_depth(), 3);
  EXPECT_TRUE(options.sequential());

  auto patterns = options.all_sink_patterns();
  EXPECT_THAT(patterns, testing::Contains("execSQL"));
  EXPECT_THAT(patterns, testing::Contains("loadUrl"));
  EXPECT_THAT(patterns, testing::Not(testing::Contains("FileOutputStream")));
  EXPECT_EQ(patterns.back(), "Custom\\.sink\\(");
}

TEST_F(OptionsTest, Paths) {
  test::TemporaryDirectory directory;
  auto lifecycles = directory.path() / "lifecycles";
  std::filesystem::create_directories(lifecycles);
  write_file(lifecycles / "b.json", "[]");
  write_file(lifecycles / "a.json", "[]");
  write_file(lifecycles / "notes.txt", "");
  write_file(directory.path() / "extra.json", "[]");
  write_file(directory.path() / "heuristics.json", "{}");
  write_file(directory.path() / "strings.json", "{}");

  auto value = minimal_options(directory);
  value["lifecycles-paths"] =
      lifecycles.string() + ";" + (directory.path() / "extra.json").string();
  value["heuristics"] = (directory.path() / "heuristics.json").string();
  value["string-resources-path"] = (directory.path() / "strings.json").string();
  value["dump-classes"] = true;
  value["class-filter"] = test::parse_json(R"({"packages": ["com.example"]})");
  value["method-filter"] = test::parse_json(R"({"name": "onCreate"})");
  Options options(value);

  EXPECT_THAT(
      options.lifecycles_paths(),
      testing::ElementsAre(
          (lifecycles / "a.json").string(),
          (lifecycles / "b.json").string(),
          (directory.path() / "extra.json").string()));
  ASSERT_TRUE(options.heuristics_path().has_value());
  EXPECT_EQ(options.heuristics_path()->filename().string(), "heuristics.json");
  ASSERT_TRUE(options.string_resources_path().has_value());
  EXPECT_TRUE(options.dump_classes());
  EXPECT_TRUE(options.class_filter().has_value());
  EXPECT_TRUE(options.method_filter().has_value());
}

TEST_F(OptionsTest, InvalidOptions) {
  test::TemporaryDirectory directory;

  auto value = minimal_options(directory);
  value["sinks"] = test::parse_json(R"(["sms"])");
  EXPECT_THROW(Options{value}, JsonValidationError);

  value = minimal_options(directory);
  value["max-depth"] = 0;
  EXPECT_THROW(Options{value}, JsonValidationError);

  value = minimal_options(directory);
  value["package-depth"] = 0;
  EXPECT_THROW(Options{value}, JsonValidationError);

  value = minimal_options(directory);
  value["max_depth"] = 3;
  EXPECT_THROW(Options{value}, JsonValidationError);

  value = minimal_options(directory);
  value.removeMember("output-directory");
  EXPECT_THROW(Options{value}, JsonValidationError);

  value = minimal_options(directory);
  value["apk-directory"] = (directory.path() / "missing").string();
  EXPECT_THROW(Options{value}, std::invalid_argument);

  value = minimal_options(directory);
  value["heuristics"] = (directory.path() / "missing.json").string();
  EXPECT_THROW(Options{value}, std::invalid_argument);

  EXPECT_THROW(Options{test::parse_json("[]")}, JsonValidationError);
}

TEST_F(OptionsTest, FromJsonFile) {
  test::TemporaryDirectory directory;
  auto path = directory.path() / "options.json";
  write_file(path, minimal_options(directory).toStyledString());

  auto options = Options::from_json_file(path);
  EXPECT_EQ(options->apk_directory(), directory.path().string());
}

} // namespace droidflow

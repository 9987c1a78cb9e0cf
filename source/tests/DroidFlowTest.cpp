/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fstream>

#include <gmock/gmock.h>

#include <droidflow/DroidFlow.h>
#include <droidflow/JsonReaderWriter.h>
#include <droidflow/tests/Test.h>

namespace droidflow {

class DroidFlowTest : public test::Test {};

namespace {

Json::Value read_output(
    const std::filesystem::path& directory,
    const std::string& name) {
  auto path = directory / name;
  EXPECT_TRUE(std::filesystem::exists(path)) << path.string();
  return JsonReader::parse_json_file(path);
}

} // namespace

TEST_F(DroidFlowTest, Run) {
  test::TemporaryDirectory directory;
  auto apk_directory = directory.path() / "apk";
  auto output_directory = directory.path() / "output";
  test::write_webview_application(apk_directory);

  auto value = Json::Value(Json::objectValue);
  value["apk-directory"] = apk_directory.string();
  value["output-directory"] = output_directory.string();
  value["sinks"] = test::parse_json(R"(["webview"])");
  value["dump-call-graph"] = true;
  Options options(value);

  DroidFlow().run(options);

  auto entry_points = read_output(output_directory, "entry_points.json");
  EXPECT_EQ(entry_points.size(), 4);

  auto flows = read_output(output_directory, "flows.json");
  ASSERT_EQ(flows.size(), 2);
  EXPECT_EQ(flows[0]["entry_point"], "com.example.app.MainActivity");
  EXPECT_EQ(flows[0]["min_path_length"].asUInt(), 2);
  EXPECT_EQ(flows[1]["entry_point"], "com.example.app.StaticActivity");

  auto data_flows = read_output(output_directory, "data_flows.json");
  ASSERT_EQ(data_flows.size(), 2);
  EXPECT_EQ(data_flows[0]["level"], "high");
  EXPECT_DOUBLE_EQ(data_flows[0]["confidence"].asDouble(), 0.875);
  EXPECT_EQ(data_flows[1]["level"], "low");

  auto diagnostics = read_output(output_directory, "diagnostics.json");
  EXPECT_EQ(diagnostics.size(), 0);

  auto statistics = read_output(output_directory, "statistics.json");
  EXPECT_EQ(statistics["counts"]["classes"].asUInt(), 3);
  EXPECT_EQ(statistics["counts"]["flows"].asUInt(), 2);
  EXPECT_EQ(statistics["counts"]["high_confidence_data_flows"].asUInt(), 1);
  EXPECT_EQ(statistics["entry_points"]["total"].asUInt(), 4);
  EXPECT_EQ(statistics["data_flows"]["deeplink_handlers"].asUInt(), 1);
  EXPECT_TRUE(statistics["times"].isMember("total"));

  auto call_graph = read_output(output_directory, "call_graph.json");
  EXPECT_EQ(call_graph["methods"].size(), 7);
  EXPECT_FALSE(std::filesystem::exists(output_directory / "classes.json"));
}

TEST_F(DroidFlowTest, RunWithConfiguration) {
  test::TemporaryDirectory directory;
  auto apk_directory = directory.path() / "apk";
  auto output_directory = directory.path() / "output";
  test::write_webview_application(apk_directory);

  auto heuristics_path = directory.path() / "heuristics.json";
  {
    std::ofstream output(heuristics_path);
    output << R"({"deeplink_bonus": 0.0, "high_confidence_threshold": 0.8})";
  }

  auto value = Json::Value(Json::objectValue);
  value["apk-directory"] = apk_directory.string();
  value["output-directory"] = output_directory.string();
  value["sinks"] = test::parse_json(R"(["sql"])");
  value["sink-patterns"] = test::parse_json(R"(["WebView\\.loadUrl\\("])");
  value["optimize"] = true;
  value["sequential"] = true;
  value["heuristics"] = heuristics_path.string();
  value["dump-classes"] = true;
  value["method-filter"] = test::parse_json(R"({"name": "onCreate"})");
  Options options(value);

  DroidFlow().run(options);

  auto data_flows = read_output(output_directory, "data_flows.json");
  ASSERT_EQ(data_flows.size(), 2);
  EXPECT_DOUBLE_EQ(data_flows[0]["confidence"].asDouble(), 0.725);
  EXPECT_EQ(data_flows[0]["level"], "medium");

  auto classes = read_output(output_directory, "classes.json");
  EXPECT_EQ(classes.size(), 3);
  auto methods = read_output(output_directory, "methods.json");
  ASSERT_EQ(methods.size(), 3);
  EXPECT_EQ(
      methods[0],
      "com.example.app.MainActivity.onCreate(android.os.Bundle):void");
  EXPECT_FALSE(std::filesystem::exists(output_directory / "call_graph.json"));
}

} // namespace droidflow

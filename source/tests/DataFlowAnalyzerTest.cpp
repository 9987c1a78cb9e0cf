/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fstream>

#include <gmock/gmock.h>

#include <droidflow/Apk.h>
#include <droidflow/CallGraphBuilder.h>
#include <droidflow/ClassExtractor.h>
#include <droidflow/Constants.h>
#include <droidflow/DataFlowAnalyzer.h>
#include <droidflow/ResourceResolver.h>
#include <droidflow/tests/Test.h>

namespace droidflow {

class DataFlowAnalyzerTest : public test::Test {};

namespace {

/* Every phase preceding the data flow analysis, over one package. */
struct Analysis {
  explicit Analysis(const std::filesystem::path& directory)
      : apk(Apk::load(directory)),
        classes(extract_classes(apk, /* parallel */ false, diagnostics)),
        entry_points(apk.manifest(), classes),
        graph(CallGraphBuilder(apk, classes).build(std::nullopt, diagnostics)) {
  }

  DataFlowAnalyzer analyzer(
      const ResourceResolver* resolver = nullptr,
      const Cancellation* cancellation = nullptr) const {
    return DataFlowAnalyzer(
        apk,
        classes,
        entry_points,
        graph,
        lifecycle_methods,
        Heuristics::singleton(),
        resolver,
        cancellation);
  }

  Diagnostics diagnostics;
  Apk apk;
  ClassTable classes;
  EntryPointAnalyzer entry_points;
  CallGraph graph;
  LifecycleMethods lifecycle_methods;
};

/**
 * `ResourceActivity` loads a url read from the string resources.
 * `UnlinkedActivity` reads an extra but loads another value.
 */
void write_resource_application(const std::filesystem::path& directory) {
  using namespace test::bytecode;

  const std::string resource_activity = "Lcom/example/res/ResourceActivity;";
  const std::string unlinked_activity = "Lcom/example/res/UnlinkedActivity;";
  const std::string string_type = "Ljava/lang/String;";
  const std::string bundle_type = "Landroid/os/Bundle;";

  test::DexBuilder dex;
  auto get_intent = dex.method(
      unlinked_activity, "getIntent", {}, "Landroid/content/Intent;");
  auto get_string_extra = dex.method(
      "Landroid/content/Intent;", "getStringExtra", {string_type}, string_type);
  auto load_url =
      dex.method("Landroid/webkit/WebView;", "loadUrl", {string_type}, "V");
  auto key = dex.string("key");

  dex.add_class(resource_activity, "Landroid/app/Activity;")
      .add_method(
          resource_activity,
          "onCreate",
          {bundle_type},
          "V",
          access_flags::k_protected,
          concat({
              const_literal(0, 0x7f0a0001),
              const_4(1, 0),
              invoke_virtual(load_url, {1, 0}),
              return_void(),
          }),
          /* registers_size */ 4,
          /* ins_size */ 2,
          /* outs_size */ 2);
  dex.add_class(unlinked_activity, "Landroid/app/Activity;")
      .add_method(
          unlinked_activity,
          "onCreate",
          {bundle_type},
          "V",
          access_flags::k_protected,
          concat({
              invoke_virtual(get_intent, {2}),
              move_result_object(0),
              const_string(1, key),
              invoke_virtual(get_string_extra, {0, 1}),
              move_result_object(0),
              const_4(0, 0),
              const_4(1, 0),
              invoke_virtual(load_url, {1, 0}),
              return_void(),
          }),
          /* registers_size */ 4,
          /* ins_size */ 2,
          /* outs_size */ 2);

  test::write_apk_directory(
      directory,
      {dex},
      test::parse_json(R"({
        "package": "com.example.res",
        "activities": [
          {"name": ".ResourceActivity", "exported": true},
          {"name": ".UnlinkedActivity", "exported": true}
        ]
      })"),
      test::parse_json(R"({"0x7f0a0001": "https://example.com/help"})"));
}

/**
 * `FileActivity` writes to a file named by `File.getPath`, `UriActivity`
 * by `Uri.getPath`.
 */
void write_file_application(const std::filesystem::path& directory) {
  using namespace test::bytecode;

  const std::string file_activity = "Lcom/example/file/FileActivity;";
  const std::string uri_activity = "Lcom/example/file/UriActivity;";
  const std::string string_type = "Ljava/lang/String;";
  const std::string bundle_type = "Landroid/os/Bundle;";

  test::DexBuilder dex;
  auto file_get_path =
      dex.method("Ljava/io/File;", "getPath", {}, string_type);
  auto uri_get_path =
      dex.method("Landroid/net/Uri;", "getPath", {}, string_type);
  auto open_file =
      dex.method("Ljava/io/FileOutputStream;", "<init>", {string_type}, "V");

  for (const auto& [activity, get_path] :
       {std::make_pair(file_activity, file_get_path),
        std::make_pair(uri_activity, uri_get_path)}) {
    dex.add_class(activity, "Landroid/app/Activity;")
        .add_method(
            activity,
            "onCreate",
            {bundle_type},
            "V",
            access_flags::k_protected,
            concat({
                const_4(1, 0),
                invoke_virtual(get_path, {1}),
                move_result_object(0),
                invoke_direct(open_file, {1, 0}),
                return_void(),
            }),
            /* registers_size */ 4,
            /* ins_size */ 2,
            /* outs_size */ 2);
  }

  test::write_apk_directory(
      directory,
      {dex},
      test::parse_json(R"({
        "package": "com.example.file",
        "activities": [
          {"name": ".FileActivity", "exported": true},
          {"name": ".UriActivity", "exported": true}
        ]
      })"));
}

/**
 * `LoopActivity` calls `loadUrl` before the extra is read, and jumps back
 * to the call once it is.
 */
void write_loop_application(const std::filesystem::path& directory) {
  using namespace test::bytecode;

  const std::string activity = "Lcom/example/loop/LoopActivity;";
  const std::string string_type = "Ljava/lang/String;";

  test::DexBuilder dex;
  auto get_intent =
      dex.method(activity, "getIntent", {}, "Landroid/content/Intent;");
  auto get_string_extra = dex.method(
      "Landroid/content/Intent;", "getStringExtra", {string_type}, string_type);
  auto load_url =
      dex.method("Landroid/webkit/WebView;", "loadUrl", {string_type}, "V");
  auto key = dex.string("url");

  dex.add_class(activity, "Landroid/app/Activity;")
      .add_method(
          activity,
          "onCreate",
          {"Landroid/os/Bundle;"},
          "V",
          access_flags::k_protected,
          concat({
              const_4(0, 0), // 0
              goto_(5), // 1
              invoke_virtual(load_url, {0, 1}), // 2
              return_void(), // 5
              invoke_virtual(get_intent, {3}), // 6
              move_result_object(1), // 9
              const_string(2, key), // 10
              invoke_virtual(get_string_extra, {1, 2}), // 12
              move_result_object(1), // 15
              goto_(-14), // 16
          }),
          /* registers_size */ 5,
          /* ins_size */ 2,
          /* outs_size */ 2);

  test::write_apk_directory(
      directory,
      {dex},
      test::parse_json(R"({
        "package": "com.example.loop",
        "activities": [{"name": ".LoopActivity", "exported": true}]
      })"));
}

} // namespace

TEST_F(DataFlowAnalyzerTest, FindWebViewFlows) {
  test::TemporaryDirectory directory;
  test::write_webview_application(directory.path());
  Analysis analysis(directory.path());
  auto analyzer = analysis.analyzer();

  auto flows = analyzer.find_webview_flows(/* max_depth */ 10);
  ASSERT_EQ(flows.size(), 2);

  EXPECT_EQ(flows[0].entry_point(), "com.example.app.MainActivity");
  EXPECT_EQ(flows[0].component_kind(), ComponentKind::Activity);
  EXPECT_EQ(
      flows[0].sink_method().show(),
      "android.webkit.WebView.loadUrl(java.lang.String):void");
  EXPECT_TRUE(flows[0].is_deeplink_handler());
  EXPECT_EQ(flows[0].path_count(), 1);
  EXPECT_EQ(flows[0].min_path_length(), 2);
  EXPECT_EQ(
      flows[0].shortest_path().show(),
      "com.example.app.MainActivity.onCreate(android.os.Bundle):void -> "
      "com.example.app.MainActivity.load(java.lang.String):void -> "
      "android.webkit.WebView.loadUrl(java.lang.String):void");
  ASSERT_EQ(flows[0].lifecycle_methods().size(), 1);
  EXPECT_EQ(flows[0].lifecycle_methods()[0].name(), "onCreate");

  EXPECT_EQ(flows[1].entry_point(), "com.example.app.StaticActivity");
  EXPECT_FALSE(flows[1].is_deeplink_handler());
  EXPECT_EQ(flows[1].min_path_length(), 1);

  auto short_flows = analyzer.find_webview_flows(/* max_depth */ 1);
  ASSERT_EQ(short_flows.size(), 1);
  EXPECT_EQ(short_flows[0].entry_point(), "com.example.app.StaticActivity");

  EXPECT_TRUE(analyzer.find_sql_flows(/* max_depth */ 10).empty());
  EXPECT_TRUE(analyzer.find_file_flows(/* max_depth */ 10).empty());
  EXPECT_TRUE(analyzer.find_network_flows(/* max_depth */ 10).empty());
}

TEST_F(DataFlowAnalyzerTest, FindFlowsTo) {
  test::TemporaryDirectory directory;
  test::write_webview_application(directory.path());
  Analysis analysis(directory.path());
  auto analyzer = analysis.analyzer();

  // Any method of the graph can be a sink.
  auto flows = analyzer.find_flows_to(
      {"MainActivity\\.load\\(", "getStringExtra"}, /* max_depth */ 10);
  ASSERT_EQ(flows.size(), 2);
  EXPECT_EQ(
      flows[0].sink_method().show(),
      "android.content.Intent.getStringExtra(java.lang.String)"
      ":java.lang.String");
  EXPECT_EQ(
      flows[1].sink_method().show(),
      "com.example.app.MainActivity.load(java.lang.String):void");
  EXPECT_EQ(flows[1].min_path_length(), 1);

  EXPECT_TRUE(analyzer.find_flows_to({}, /* max_depth */ 10).empty());
  EXPECT_TRUE(
      analyzer.find_flows_to({"UnusedService"}, /* max_depth */ 10).empty());

  auto deeplink_flows = analyzer.find_deeplink_flows(
      constants::get_webview_sink_patterns(), /* max_depth */ 10);
  ASSERT_EQ(deeplink_flows.size(), 1);
  EXPECT_EQ(deeplink_flows[0].entry_point(), "com.example.app.MainActivity");
}

TEST_F(DataFlowAnalyzerTest, AnalyzeDataFlows) {
  test::TemporaryDirectory directory;
  test::write_webview_application(directory.path());
  Analysis analysis(directory.path());
  auto analyzer = analysis.analyzer();

  auto flows = analyzer.find_webview_flows(/* max_depth */ 10);
  auto data_flows = analyzer.analyze_data_flows(flows);
  ASSERT_EQ(data_flows.size(), 2);

  const auto& deeplink = data_flows[0];
  EXPECT_EQ(deeplink.entry_point, "com.example.app.MainActivity");
  ASSERT_TRUE(deeplink.source.has_value());
  EXPECT_EQ(deeplink.source->name(), "getStringExtra");
  EXPECT_EQ(deeplink.sink, flows[0].sink_method());
  EXPECT_EQ(deeplink.flow_path, flows[0].shortest_path());
  EXPECT_DOUBLE_EQ(deeplink.confidence, 0.875);
  EXPECT_EQ(deeplink.level, ConfidenceLevel::High);
  EXPECT_THAT(
      deeplink.evidence,
      testing::Contains(testing::HasSubstr("is passed to")));
  EXPECT_THAT(
      deeplink.evidence,
      testing::Contains("Entry point handles deeplinks."));

  const auto& constant = data_flows[1];
  EXPECT_EQ(constant.entry_point, "com.example.app.StaticActivity");
  EXPECT_FALSE(constant.source.has_value());
  EXPECT_DOUBLE_EQ(constant.confidence, 0.175);
  EXPECT_EQ(constant.level, ConfidenceLevel::Low);
  EXPECT_THAT(
      constant.evidence, testing::Contains("Sink arguments are constants."));

  auto value = deeplink.to_json();
  EXPECT_EQ(value["level"], "high");
  EXPECT_EQ(
      value["source"],
      "android.content.Intent.getStringExtra(java.lang.String)"
      ":java.lang.String");
  EXPECT_EQ(value["flow_path"]["length"].asUInt(), 2);
  EXPECT_TRUE(constant.to_json()["source"].isNull());

  auto stats = analyzer.get_stats();
  EXPECT_EQ(stats.entry_points, 3);
  EXPECT_EQ(stats.deeplink_handlers, 1);
}

TEST_F(DataFlowAnalyzerTest, ResourceStrings) {
  test::TemporaryDirectory directory;
  write_resource_application(directory.path());
  Analysis analysis(directory.path());
  ASSERT_TRUE(analysis.apk.string_resources_path().has_value());
  auto resources =
      JsonStringResources::from_file(*analysis.apk.string_resources_path());

  auto without_resources = analysis.analyzer();
  auto flows = without_resources.find_webview_flows(/* max_depth */ 10);
  ASSERT_EQ(flows.size(), 2);
  EXPECT_EQ(flows[0].entry_point(), "com.example.res.ResourceActivity");
  EXPECT_EQ(flows[1].entry_point(), "com.example.res.UnlinkedActivity");

  // Resource identifiers are only constants once resolved.
  EXPECT_DOUBLE_EQ(
      without_resources.analyze_data_flow(flows[0]).confidence, 0.35);
  auto with_resources = analysis.analyzer(&resources);
  auto resource_flow = with_resources.analyze_data_flow(flows[0]);
  EXPECT_DOUBLE_EQ(resource_flow.confidence, 0.175);
  EXPECT_EQ(resource_flow.level, ConfidenceLevel::Low);

  // The extracted value is overwritten before the call.
  auto unlinked = with_resources.analyze_data_flow(flows[1]);
  ASSERT_TRUE(unlinked.source.has_value());
  EXPECT_EQ(unlinked.source->name(), "getStringExtra");
  EXPECT_DOUBLE_EQ(unlinked.confidence, 0.6);
  EXPECT_EQ(unlinked.level, ConfidenceLevel::Medium);
  EXPECT_THAT(
      unlinked.evidence,
      testing::Contains(testing::HasSubstr("Intent data is read by")));
}

TEST_F(DataFlowAnalyzerTest, SourcesMatchClassAndName) {
  test::TemporaryDirectory directory;
  write_file_application(directory.path());
  Analysis analysis(directory.path());
  auto analyzer = analysis.analyzer();

  auto flows = analyzer.find_file_flows(/* max_depth */ 10);
  ASSERT_EQ(flows.size(), 2);
  EXPECT_EQ(flows[0].entry_point(), "com.example.file.FileActivity");
  EXPECT_EQ(
      flows[0].sink_method().show(),
      "java.io.FileOutputStream.<init>(java.lang.String):void");
  EXPECT_EQ(flows[1].entry_point(), "com.example.file.UriActivity");

  // `File.getPath` shares its name with `Uri.getPath` but is not a source.
  auto file_flow = analyzer.analyze_data_flow(flows[0]);
  EXPECT_FALSE(file_flow.source.has_value());
  EXPECT_DOUBLE_EQ(file_flow.confidence, 0.35);
  EXPECT_EQ(file_flow.level, ConfidenceLevel::Low);

  auto uri_flow = analyzer.analyze_data_flow(flows[1]);
  ASSERT_TRUE(uri_flow.source.has_value());
  EXPECT_EQ(
      uri_flow.source->show(), "android.net.Uri.getPath():java.lang.String");
  EXPECT_DOUBLE_EQ(uri_flow.confidence, 0.85);
  EXPECT_EQ(uri_flow.level, ConfidenceLevel::High);
}

TEST_F(DataFlowAnalyzerTest, TaintFollowsBackwardBranches) {
  test::TemporaryDirectory directory;
  write_loop_application(directory.path());
  Analysis analysis(directory.path());
  auto analyzer = analysis.analyzer();

  auto flows = analyzer.find_webview_flows(/* max_depth */ 10);
  ASSERT_EQ(flows.size(), 1);
  EXPECT_EQ(flows[0].min_path_length(), 1);

  auto data_flow = analyzer.analyze_data_flow(flows[0]);
  ASSERT_TRUE(data_flow.source.has_value());
  EXPECT_EQ(data_flow.source->name(), "getStringExtra");
  EXPECT_DOUBLE_EQ(data_flow.confidence, 0.85);
  EXPECT_EQ(data_flow.level, ConfidenceLevel::High);
  EXPECT_THAT(
      data_flow.evidence,
      testing::Contains(testing::HasSubstr("is passed to")));
}

TEST_F(DataFlowAnalyzerTest, ComponentsOfTheSameClass) {
  test::TemporaryDirectory directory;
  test::write_webview_application(directory.path());
  {
    // The second declaration of `MainActivity` handles deeplinks.
    std::ofstream manifest(directory.path() / "AndroidManifest.json");
    manifest << R"({
      "package": "com.example.app",
      "activities": [
        {"name": ".MainActivity", "exported": true},
        {
          "name": ".MainActivity",
          "exported": true,
          "intent_filters": [{
            "actions": ["android.intent.action.VIEW"],
            "categories": [
              "android.intent.category.DEFAULT",
              "android.intent.category.BROWSABLE"
            ],
            "data": [{"scheme": "https", "host": "example.com"}]
          }]
        }
      ]
    })";
  }
  Analysis analysis(directory.path());
  auto analyzer = analysis.analyzer();

  auto flows = analyzer.find_webview_flows(/* max_depth */ 10);
  ASSERT_EQ(flows.size(), 1);
  EXPECT_EQ(flows[0].entry_point(), "com.example.app.MainActivity");
  EXPECT_TRUE(flows[0].is_deeplink_handler());
  EXPECT_DOUBLE_EQ(analyzer.analyze_data_flow(flows[0]).confidence, 0.875);
}

TEST_F(DataFlowAnalyzerTest, Cancellation) {
  test::TemporaryDirectory directory;
  test::write_webview_application(directory.path());
  Analysis analysis(directory.path());

  Cancellation cancellation;
  cancellation.cancel();
  auto analyzer = analysis.analyzer(/* resolver */ nullptr, &cancellation);
  EXPECT_THROW(
      analyzer.find_webview_flows(/* max_depth */ 10), AnalysisCancelled);
}

} // namespace droidflow

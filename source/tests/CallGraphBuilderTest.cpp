/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <droidflow/Apk.h>
#include <droidflow/CallGraphBuilder.h>
#include <droidflow/ClassExtractor.h>
#include <droidflow/tests/Test.h>

namespace droidflow {

class CallGraphBuilderTest : public test::Test {};

namespace {

MethodReference parse_method(const std::string& signature) {
  auto method = MethodReference::parse(signature);
  EXPECT_TRUE(method.has_value()) << "invalid signature: " << signature;
  return *method;
}

/* Callee signatures and call offsets of a method. */
std::vector<std::pair<std::string, std::vector<std::uint32_t>>>
resolved_successors(const CallGraph& graph, const MethodReference& method) {
  std::vector<std::pair<std::string, std::vector<std::uint32_t>>> result;
  for (const auto& edge : graph.successors(*graph.id(method))) {
    result.emplace_back(graph.signature(edge.callee), edge.offsets);
  }
  return result;
}

} // namespace

TEST_F(CallGraphBuilderTest, Build) {
  test::TemporaryDirectory directory;
  test::write_webview_application(directory.path());
  auto apk = Apk::load(directory.path());
  Diagnostics diagnostics;
  ClassTable classes(extract_classes(apk, /* parallel */ true, diagnostics));

  CallGraphBuilder builder(apk, classes);
  auto graph = builder.build(/* package_filter */ std::nullopt, diagnostics);
  EXPECT_TRUE(diagnostics.empty());

  auto stats = graph.get_stats();
  EXPECT_EQ(stats.total_methods, 7);
  EXPECT_EQ(stats.total_edges, 5);
  EXPECT_EQ(stats.caller_methods, 3);
  EXPECT_EQ(stats.leaf_methods, 4);

  auto on_create = parse_method(
      "com.example.app.MainActivity.onCreate(android.os.Bundle):void");
  auto load =
      parse_method("com.example.app.MainActivity.load(java.lang.String):void");
  auto load_url =
      parse_method("android.webkit.WebView.loadUrl(java.lang.String):void");

  EXPECT_THAT(
      graph.get_callees(on_create),
      testing::ElementsAre(
          parse_method(
              "android.content.Intent.getStringExtra(java.lang.String)"
              ":java.lang.String"),
          parse_method(
              "com.example.app.MainActivity.getIntent()"
              ":android.content.Intent"),
          load));
  EXPECT_THAT(
      graph.get_callers(load_url),
      testing::ElementsAre(
          load,
          parse_method("com.example.app.StaticActivity.onCreate"
                       "(android.os.Bundle):void")));

  // Methods without calls are still in the graph.
  EXPECT_TRUE(graph.contains(
      parse_method("com.example.app.UnusedService.onCreate():void")));

  const auto& edges = graph.successors(*graph.id(on_create));
  ASSERT_EQ(edges.size(), 3);
  EXPECT_EQ(edges[2].callee, *graph.id(load));
  EXPECT_EQ(edges[2].offsets, std::vector<std::uint32_t>{10});
}

TEST_F(CallGraphBuilderTest, PackageFilter) {
  test::TemporaryDirectory directory;
  test::write_webview_application(directory.path());
  auto apk = Apk::load(directory.path());
  Diagnostics diagnostics;
  ClassTable classes(extract_classes(apk, /* parallel */ true, diagnostics));
  CallGraphBuilder builder(apk, classes);

  auto graph = builder.build(
      std::vector<std::string>{"com.example.app.Main"}, diagnostics);
  EXPECT_EQ(graph.size(), 5);
  EXPECT_EQ(graph.get_stats().total_edges, 4);
  EXPECT_FALSE(graph.contains(parse_method(
      "com.example.app.StaticActivity.onCreate(android.os.Bundle):void")));

  auto empty = builder.build(std::vector<std::string>{"org."}, diagnostics);
  EXPECT_EQ(empty.size(), 0);

  auto nothing = builder.build(std::vector<std::string>{}, diagnostics);
  EXPECT_EQ(nothing.size(), 0);
}

TEST_F(CallGraphBuilderTest, Parallel) {
  test::TemporaryDirectory directory;
  test::write_webview_application(directory.path());
  auto apk = Apk::load(directory.path());
  Diagnostics diagnostics;
  ClassTable classes(extract_classes(apk, /* parallel */ true, diagnostics));
  CallGraphBuilder builder(apk, classes);

  std::vector<std::optional<std::vector<std::string>>> filters = {
      std::nullopt,
      std::vector<std::string>{"com.example.app.Main"},
      std::vector<std::string>{"org."},
  };
  for (const auto& filter : filters) {
    auto sequential = builder.build(filter, diagnostics);
    for (unsigned int threads : {1u, 2u, 8u}) {
      auto parallel = builder.build_parallel(filter, diagnostics, threads);
      EXPECT_EQ(parallel, sequential);
      EXPECT_EQ(parallel.to_json(), sequential.to_json());
    }
  }
}

TEST_F(CallGraphBuilderTest, PackageFilterKeepsCalls) {
  test::TemporaryDirectory directory;
  test::write_webview_application(directory.path());
  auto apk = Apk::load(directory.path());
  Diagnostics diagnostics;
  ClassTable classes(extract_classes(apk, /* parallel */ true, diagnostics));
  CallGraphBuilder builder(apk, classes);

  const std::string prefix = "com.example.app.Main";
  auto graph = builder.build(std::nullopt, diagnostics);
  auto filtered =
      builder.build(std::vector<std::string>{prefix}, diagnostics);

  // A caller in the filtered packages has the calls it has in the full graph.
  std::size_t callers = 0;
  for (MethodId id = 0; id < filtered.size(); id++) {
    const auto& method = filtered.method(id);
    if (method.class_name().rfind(prefix, 0) != 0) {
      continue;
    }
    ASSERT_TRUE(graph.contains(method)) << method.show();
    EXPECT_EQ(
        resolved_successors(filtered, method),
        resolved_successors(graph, method))
        << method.show();
    if (!filtered.successors(id).empty()) {
      callers++;
    }
  }
  EXPECT_EQ(callers, 2);
}

TEST_F(CallGraphBuilderTest, InvalidBytecode) {
  using namespace test::bytecode;

  test::TemporaryDirectory directory;
  const std::string klass = "Lcom/example/Broken;";

  test::DexBuilder dex;
  auto callee = dex.method(klass, "callee", {}, "V");
  dex.add_class(klass)
      .add_method(
          klass,
          "unresolved",
          {},
          "V",
          access_flags::k_static,
          concat({
              invoke_static(99, {}),
              invoke_static(callee, {}),
              return_void(),
          }),
          /* registers_size */ 0)
      .add_method(
          klass,
          "truncated",
          {},
          "V",
          access_flags::k_static,
          std::vector<std::uint16_t>{0x001a},
          /* registers_size */ 1)
      .add_method(
          klass,
          "unknown",
          {},
          "V",
          access_flags::k_static,
          concat({{0x003e}, invoke_static(callee, {}), return_void()}),
          /* registers_size */ 0)
      .add_method(
          klass,
          "callee",
          {},
          "V",
          access_flags::k_static,
          return_void(),
          /* registers_size */ 0);
  test::write_apk_directory(
      directory.path(),
      {dex},
      test::parse_json(R"({"package": "com.example"})"));

  auto apk = Apk::load(directory.path());
  Diagnostics diagnostics;
  ClassTable classes(extract_classes(apk, /* parallel */ false, diagnostics));
  ASSERT_TRUE(diagnostics.empty());

  CallGraphBuilder builder(apk, classes);
  auto graph = builder.build(std::nullopt, diagnostics);

  EXPECT_EQ(diagnostics.count(ErrorKind::UnresolvedMethod), 1);
  EXPECT_EQ(diagnostics.count(ErrorKind::MethodDecodeFailure), 1);
  EXPECT_EQ(diagnostics.count(ErrorKind::UnknownOpcode), 1);

  auto callee_method = parse_method("com.example.Broken.callee():void");
  EXPECT_THAT(
      graph.get_callers(callee_method),
      testing::ElementsAre(
          parse_method("com.example.Broken.unknown():void"),
          parse_method("com.example.Broken.unresolved():void")));
  EXPECT_TRUE(
      graph.get_callees(parse_method("com.example.Broken.truncated():void"))
          .empty());
}

} // namespace droidflow

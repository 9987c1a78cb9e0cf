/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <droidflow/Apk.h>
#include <droidflow/ClassExtractor.h>
#include <droidflow/ClassFilter.h>
#include <droidflow/ClassTable.h>
#include <droidflow/JsonValidation.h>
#include <droidflow/tests/Test.h>

namespace droidflow {

class ClassExtractorTest : public test::Test {};

namespace {

std::vector<std::string> class_names(const std::vector<DexClass>& classes) {
  std::vector<std::string> names;
  for (const auto& dex_class : classes) {
    names.push_back(dex_class.class_name());
  }
  return names;
}

std::vector<std::string> signatures(const DexClass& dex_class) {
  std::vector<std::string> result;
  for (const auto& method : dex_class.methods()) {
    result.push_back(method.signature());
  }
  return result;
}

} // namespace

TEST_F(ClassExtractorTest, ExtractClasses) {
  test::TemporaryDirectory directory;
  test::write_webview_application(directory.path());
  auto apk = Apk::load(directory.path());

  Diagnostics diagnostics;
  auto classes = extract_classes(apk, /* parallel */ false, diagnostics);
  EXPECT_TRUE(diagnostics.empty());
  EXPECT_THAT(
      class_names(classes),
      testing::ElementsAre(
          "com.example.app.MainActivity",
          "com.example.app.StaticActivity",
          "com.example.app.UnusedService"));

  const auto& main_activity = classes[0];
  EXPECT_EQ(main_activity.package_name(), "com.example.app");
  EXPECT_EQ(main_activity.simple_name(), "MainActivity");
  EXPECT_EQ(
      main_activity.superclass(),
      std::optional<std::string>("android.app.Activity"));
  EXPECT_THAT(
      signatures(main_activity),
      testing::ElementsAre(
          "com.example.app.MainActivity.load(java.lang.String):void",
          "com.example.app.MainActivity.onCreate(android.os.Bundle):void"));

  const auto* on_create = main_activity.find_method("onCreate");
  ASSERT_NE(on_create, nullptr);
  EXPECT_EQ(on_create->registers_size(), 4);
  EXPECT_EQ(on_create->ins_size(), 2);
  EXPECT_TRUE(on_create->is_protected());
  ASSERT_TRUE(on_create->bytecode().has_value());
  EXPECT_FALSE(on_create->bytecode()->empty());
  EXPECT_EQ(on_create->handle().dex_index, 0);
  EXPECT_EQ(
      apk.resolve_method(
             on_create->handle().dex_index, on_create->handle().method_index)
          .show(),
      on_create->signature());

  EXPECT_EQ(main_activity.find_method("missing"), nullptr);
}

TEST_F(ClassExtractorTest, ParallelExtraction) {
  test::TemporaryDirectory directory;
  test::write_webview_application(directory.path());
  auto apk = Apk::load(directory.path());

  Diagnostics sequential_diagnostics;
  auto sequential =
      extract_classes(apk, /* parallel */ false, sequential_diagnostics);
  Diagnostics parallel_diagnostics;
  auto parallel =
      extract_classes(apk, /* parallel */ true, parallel_diagnostics);

  EXPECT_EQ(class_names(sequential), class_names(parallel));
  ASSERT_EQ(sequential.size(), parallel.size());
  for (std::size_t i = 0; i < sequential.size(); i++) {
    EXPECT_EQ(signatures(sequential[i]), signatures(parallel[i]));
  }
  EXPECT_EQ(sequential_diagnostics.size(), parallel_diagnostics.size());
}

TEST_F(ClassExtractorTest, DuplicateClasses) {
  test::TemporaryDirectory directory;

  test::DexBuilder first;
  first.add_class("Lcom/example/Foo;")
      .add_method(
          "Lcom/example/Foo;",
          "first",
          {},
          "V",
          access_flags::k_public,
          test::bytecode::return_void(),
          /* registers_size */ 1,
          /* ins_size */ 1);
  test::DexBuilder second;
  second.add_class("Lcom/example/Bar;")
      .add_class("Lcom/example/Foo;")
      .add_method(
          "Lcom/example/Foo;",
          "second",
          {},
          "V",
          access_flags::k_public,
          test::bytecode::return_void(),
          /* registers_size */ 1,
          /* ins_size */ 1);
  test::write_apk_directory(
      directory.path(),
      {first, second},
      test::parse_json(R"({"package": "com.example"})"));

  auto apk = Apk::load(directory.path());
  Diagnostics diagnostics;
  auto classes = extract_classes(apk, /* parallel */ true, diagnostics);

  EXPECT_THAT(
      class_names(classes),
      testing::ElementsAre("com.example.Foo", "com.example.Bar"));
  EXPECT_EQ(classes[0].dex_index(), 0);
  EXPECT_NE(classes[0].find_method("first"), nullptr);
  EXPECT_EQ(classes[0].find_method("second"), nullptr);
  EXPECT_EQ(classes[1].dex_index(), 1);
  EXPECT_EQ(diagnostics.count(ErrorKind::DuplicateClass), 1);
}

TEST_F(ClassExtractorTest, InheritedMethods) {
  test::TemporaryDirectory directory;

  test::DexBuilder dex;
  dex.add_class("Lcom/example/Base;", "Landroid/app/Activity;")
      .add_method(
          "Lcom/example/Base;",
          "onCreate",
          {"Landroid/os/Bundle;"},
          "V",
          access_flags::k_protected,
          test::bytecode::return_void(),
          /* registers_size */ 2,
          /* ins_size */ 2)
      .add_class("Lcom/example/Middle;", "Lcom/example/Base;")
      .add_class("Lcom/example/Child;", "Lcom/example/Middle;")
      .add_method(
          "Lcom/example/Child;",
          "onResume",
          {},
          "V",
          access_flags::k_public,
          test::bytecode::return_void(),
          /* registers_size */ 1,
          /* ins_size */ 1);
  test::write_apk_directory(
      directory.path(),
      {dex},
      test::parse_json(R"({"package": "com.example"})"));

  auto apk = Apk::load(directory.path());
  Diagnostics diagnostics;
  ClassTable table(extract_classes(apk, /* parallel */ false, diagnostics));
  EXPECT_EQ(table.size(), 3);
  EXPECT_EQ(table.number_methods(), 2);
  EXPECT_TRUE(table.contains("com.example.Child"));
  EXPECT_FALSE(table.contains("android.app.Activity"));

  auto on_create =
      table.find_inherited_methods("com.example.Child", "onCreate");
  ASSERT_EQ(on_create.size(), 1);
  EXPECT_EQ(on_create[0]->class_name(), "com.example.Base");

  auto on_resume =
      table.find_inherited_methods("com.example.Child", "onResume");
  ASSERT_EQ(on_resume.size(), 1);
  EXPECT_EQ(on_resume[0]->class_name(), "com.example.Child");

  EXPECT_TRUE(
      table.find_inherited_methods("com.example.Middle", "onResume").empty());
  EXPECT_TRUE(
      table.find_inherited_methods("com.example.Missing", "onCreate").empty());

  EXPECT_NE(table.get_method(on_create[0]->reference()), nullptr);
}

TEST_F(ClassExtractorTest, Filters) {
  test::TemporaryDirectory directory;
  test::write_webview_application(directory.path());
  auto apk = Apk::load(directory.path());
  Diagnostics diagnostics;
  ClassTable table(extract_classes(apk, /* parallel */ true, diagnostics));

  auto activities = find_classes(
      table,
      ClassFilter::from_json(test::parse_json(
          R"({"packages": ["com.example"], "class-name": "Activity"})")));
  ASSERT_EQ(activities.size(), 2);
  EXPECT_EQ(activities[0]->class_name(), "com.example.app.MainActivity");
  EXPECT_EQ(activities[1]->class_name(), "com.example.app.StaticActivity");

  EXPECT_EQ(
      find_classes(
          table,
          ClassFilter::from_json(
              test::parse_json(R"({"class-name": "Activity"})")),
          /* limit */ 1)
          .size(),
      1);
  EXPECT_TRUE(
      find_classes(
          table,
          ClassFilter::from_json(
              test::parse_json(R"({"exclude-packages": "com.example"})")))
          .empty());

  auto methods = find_methods(
      table,
      ClassFilter{},
      MethodFilter::from_json(test::parse_json(R"({
        "name": "onCreate",
        "parameter-types": ["Bundle"],
        "modifiers": 4
      })")));
  ASSERT_EQ(methods.size(), 2);
  EXPECT_EQ(
      methods[0].second->signature(),
      "com.example.app.MainActivity.onCreate(android.os.Bundle):void");
  EXPECT_EQ(
      methods[1].second->signature(),
      "com.example.app.StaticActivity.onCreate(android.os.Bundle):void");

  auto no_parameters = find_methods(
      table,
      ClassFilter{},
      MethodFilter::from_json(test::parse_json(
          R"({"parameter-count": 0, "return-type": "void"})")));
  ASSERT_EQ(no_parameters.size(), 1);
  EXPECT_EQ(
      no_parameters[0].first->class_name(), "com.example.app.UnusedService");

  EXPECT_THROW(
      ClassFilter::from_json(test::parse_json(R"({"package": "com"})")),
      JsonValidationError);
}

} // namespace droidflow

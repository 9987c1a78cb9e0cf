/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fstream>

#include <gmock/gmock.h>

#include <droidflow/LifecycleMethods.h>
#include <droidflow/tests/Test.h>

namespace droidflow {

class LifecycleMethodsTest : public test::Test {};

TEST_F(LifecycleMethodsTest, Defaults) {
  LifecycleMethods lifecycle_methods;
  EXPECT_THAT(
      lifecycle_methods.methods(ComponentKind::Activity),
      testing::ElementsAre(
          "onCreate",
          "onStart",
          "onResume",
          "onNewIntent",
          "onActivityResult"));
  EXPECT_THAT(
      lifecycle_methods.methods(ComponentKind::Receiver),
      testing::ElementsAre("onReceive"));
  EXPECT_TRUE(
      lifecycle_methods.is_lifecycle_method(ComponentKind::Service, "onBind"));
  EXPECT_FALSE(
      lifecycle_methods.is_lifecycle_method(ComponentKind::Service, "onPause"));
  EXPECT_FALSE(lifecycle_methods.is_lifecycle_method(
      ComponentKind::Receiver, "onCreate"));
}

TEST_F(LifecycleMethodsTest, AddMethods) {
  LifecycleMethods lifecycle_methods;
  lifecycle_methods.add_methods_from_json(test::parse_json(R"([
    {"component": "activity", "methods": ["onPause", "onRestart"]},
    {"component": "receiver", "methods": ["goAsync"]}
  ])"));
  EXPECT_THAT(
      lifecycle_methods.methods(ComponentKind::Activity),
      testing::ElementsAre(
          "onCreate",
          "onStart",
          "onResume",
          "onNewIntent",
          "onActivityResult",
          "onPause",
          "onRestart"));
  EXPECT_TRUE(lifecycle_methods.is_lifecycle_method(
      ComponentKind::Receiver, "goAsync"));

  EXPECT_THROW(
      lifecycle_methods.add_methods_from_json(test::parse_json(
          R"([{"component": "activity", "methods": ["onPause"]}])")),
      LifecycleMethodsJsonError);
  EXPECT_THROW(
      lifecycle_methods.add_methods_from_json(test::parse_json(
          R"([{"component": "fragment", "methods": ["onAttach"]}])")),
      LifecycleMethodsJsonError);
  EXPECT_THROW(
      lifecycle_methods.add_methods_from_json(test::parse_json(
          R"([{"component": "service", "method": ["onAttach"]}])")),
      JsonValidationError);
}

TEST_F(LifecycleMethodsTest, FromFiles) {
  test::TemporaryDirectory directory;
  auto path = directory.path() / "lifecycles.json";
  {
    std::ofstream output(path);
    output << R"([{"component": "provider", "methods": ["call"]}])";
  }

  auto lifecycle_methods = LifecycleMethods::from_files({path});
  EXPECT_TRUE(lifecycle_methods.is_lifecycle_method(
      ComponentKind::Provider, "call"));
  EXPECT_TRUE(lifecycle_methods.is_lifecycle_method(
      ComponentKind::Provider, "query"));
}

} // namespace droidflow

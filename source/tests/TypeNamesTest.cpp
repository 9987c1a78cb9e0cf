/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <droidflow/TypeNames.h>
#include <droidflow/tests/Test.h>

namespace droidflow {

class TypeNamesTest : public test::Test {};

TEST_F(TypeNamesTest, JavaName) {
  EXPECT_EQ(type_names::java_name("V"), "void");
  EXPECT_EQ(type_names::java_name("Z"), "boolean");
  EXPECT_EQ(type_names::java_name("J"), "long");
  EXPECT_EQ(type_names::java_name("Ljava/lang/String;"), "java.lang.String");
  EXPECT_EQ(
      type_names::java_name("Lcom/example/Outer$Inner;"),
      "com.example.Outer$Inner");
  EXPECT_EQ(type_names::java_name("[I"), "int[]");
  EXPECT_EQ(
      type_names::java_name("[[Ljava/lang/Object;"), "java.lang.Object[][]");

  // Invalid descriptors are kept as is.
  EXPECT_EQ(type_names::java_name("Q"), "Q");
  EXPECT_EQ(type_names::java_name("java.lang.String"), "java.lang.String");
  EXPECT_EQ(type_names::java_name(""), "");
}

TEST_F(TypeNamesTest, PackageName) {
  EXPECT_EQ(
      type_names::package_name("com.example.app.Main"), "com.example.app");
  EXPECT_EQ(type_names::package_name("Main"), "");
  EXPECT_EQ(type_names::simple_name("com.example.app.Main"), "Main");
  EXPECT_EQ(type_names::simple_name("Main"), "Main");

  EXPECT_EQ(type_names::package_prefix("com.example.app.Main", 0), "");
  EXPECT_EQ(type_names::package_prefix("com.example.app.Main", 1), "com");
  EXPECT_EQ(
      type_names::package_prefix("com.example.app.Main", 2), "com.example");
  EXPECT_EQ(
      type_names::package_prefix("com.example.app.Main", 3),
      "com.example.app");
  EXPECT_EQ(
      type_names::package_prefix("com.example.app.Main", 8),
      "com.example.app");
  EXPECT_EQ(type_names::package_prefix("Main", 2), "");
}

} // namespace droidflow

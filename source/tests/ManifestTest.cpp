/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <droidflow/Errors.h>
#include <droidflow/Manifest.h>
#include <droidflow/tests/Test.h>

namespace droidflow {

class ManifestTest : public test::Test {};

TEST_F(ManifestTest, ResolveClassName) {
  EXPECT_EQ(
      Manifest::resolve_class_name("com.example", ".Main"),
      "com.example.Main");
  EXPECT_EQ(
      Manifest::resolve_class_name("com.example", "Main"), "com.example.Main");
  EXPECT_EQ(
      Manifest::resolve_class_name("com.example", "org.other.Main"),
      "org.other.Main");
  EXPECT_EQ(Manifest::resolve_class_name("", "Main"), "Main");
}

TEST_F(ManifestTest, FromJson) {
  auto manifest = Manifest::from_json(test::parse_json(R"({
    "package": "com.example",
    "version_code": 12,
    "version_name": "1.0",
    "min_sdk_version": 21,
    "target_sdk_version": "33",
    "permissions": ["android.permission.INTERNET"],
    "activities": [
      {
        "name": ".Main",
        "intent_filters": [
          {
            "actions": ["android.intent.action.VIEW"],
            "categories": ["android.intent.category.BROWSABLE"],
            "data": [{"scheme": "app", "host": "open", "port": 8080}]
          }
        ]
      }
    ],
    "services": [{"name": "Sync", "exported": false}],
    "receivers": [
      {"name": "org.other.Receiver", "permission": "com.example.SEND"}
    ],
    "providers": [{"name": ".Files", "exported": true}]
  })"));

  EXPECT_EQ(manifest.package_name(), "com.example");
  EXPECT_EQ(manifest.version_code(), std::optional<std::string>("12"));
  EXPECT_EQ(manifest.version_name(), std::optional<std::string>("1.0"));
  EXPECT_EQ(manifest.min_sdk_version(), std::optional<int>(21));
  EXPECT_EQ(manifest.target_sdk_version(), std::optional<int>(33));
  EXPECT_THAT(
      manifest.permissions(),
      testing::ElementsAre("android.permission.INTERNET"));

  const auto& components = manifest.components();
  ASSERT_EQ(components.size(), 4);

  EXPECT_EQ(components[0].class_name, "com.example.Main");
  EXPECT_EQ(components[0].kind, ComponentKind::Activity);
  EXPECT_EQ(components[0].exported, std::nullopt);
  ASSERT_EQ(components[0].intent_filters.size(), 1);
  const auto& filter = components[0].intent_filters[0];
  EXPECT_TRUE(filter.has_action("android.intent.action.VIEW"));
  EXPECT_TRUE(filter.has_category("android.intent.category.BROWSABLE"));
  EXPECT_FALSE(filter.has_category("android.intent.category.DEFAULT"));
  ASSERT_EQ(filter.data.size(), 1);
  EXPECT_EQ(filter.data[0].scheme, std::optional<std::string>("app"));
  EXPECT_EQ(filter.data[0].port, std::optional<std::string>("8080"));
  EXPECT_EQ(filter.data[0].path, std::nullopt);

  EXPECT_EQ(components[1].class_name, "com.example.Sync");
  EXPECT_EQ(components[1].kind, ComponentKind::Service);
  EXPECT_EQ(components[1].exported, std::optional<bool>(false));

  EXPECT_EQ(components[2].class_name, "org.other.Receiver");
  EXPECT_EQ(
      components[2].permission, std::optional<std::string>("com.example.SEND"));

  EXPECT_EQ(components[3].class_name, "com.example.Files");
  EXPECT_EQ(components[3].kind, ComponentKind::Provider);

  EXPECT_EQ(manifest.components(ComponentKind::Activity).size(), 1);
  EXPECT_EQ(manifest.components(ComponentKind::Receiver).size(), 1);
}

TEST_F(ManifestTest, ToJson) {
  auto manifest = Manifest::from_json(test::parse_json(R"({
    "package": "com.example",
    "activities": [{"name": ".Main", "exported": true}]
  })"));

  auto value = manifest.to_json();
  EXPECT_EQ(value["package"], "com.example");
  ASSERT_EQ(value["components"].size(), 1);
  EXPECT_EQ(
      value["components"][0],
      test::parse_json(R"({
        "class": "com.example.Main",
        "kind": "activity",
        "exported": true,
        "intent_filters": []
      })"));
}

TEST_F(ManifestTest, InvalidManifest) {
  EXPECT_THROW(
      Manifest::from_json(test::parse_json("[]")), ManifestError);
  EXPECT_THROW(
      Manifest::from_json(test::parse_json(R"({"activities": []})")),
      ManifestError);
  EXPECT_THROW(
      Manifest::from_json(test::parse_json(
          R"({"package": "com.example", "activities": [{"exported": true}]})")),
      ManifestError);
  EXPECT_THROW(
      Manifest::from_json(test::parse_json(
          R"({"package": "com.example", "activities": [{"name": ""}]})")),
      ManifestError);
  EXPECT_THROW(
      Manifest::from_json(test::parse_json(
          R"({"package": "com.example", "min_sdk_version": "lollipop"})")),
      ManifestError);
  EXPECT_THROW(
      Manifest::from_json(test::parse_json(
          R"({"package": "com.example", "services": {"name": ".Sync"}})")),
      ManifestError);
}

TEST_F(ManifestTest, FromFile) {
  test::TemporaryDirectory directory;
  EXPECT_THROW(
      Manifest::from_file(directory.path() / "AndroidManifest.json"),
      ManifestError);
}

} // namespace droidflow

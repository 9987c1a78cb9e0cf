/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <droidflow/Heuristics.h>
#include <droidflow/JsonValidation.h>
#include <droidflow/tests/Test.h>

namespace droidflow {

class HeuristicsTest : public test::Test {
 protected:
  void TearDown() override {
    Heuristics::reset();
  }
};

TEST_F(HeuristicsTest, Defaults) {
  const auto& heuristics = Heuristics::singleton();
  EXPECT_DOUBLE_EQ(heuristics.base_confidence(), 0.1);
  EXPECT_DOUBLE_EQ(heuristics.tainted_source_bonus(), 0.5);
  EXPECT_DOUBLE_EQ(heuristics.unlinked_source_bonus(), 0.25);
  EXPECT_DOUBLE_EQ(heuristics.path_length_weight(), 0.25);
  EXPECT_DOUBLE_EQ(heuristics.deeplink_bonus(), 0.15);
  EXPECT_DOUBLE_EQ(heuristics.constant_sink_factor(), 0.5);
  EXPECT_DOUBLE_EQ(heuristics.high_confidence_threshold(), 0.7);
  EXPECT_DOUBLE_EQ(heuristics.medium_confidence_threshold(), 0.4);
  EXPECT_EQ(heuristics.to_json().size(), 8);
}

TEST_F(HeuristicsTest, InitFromJson) {
  Heuristics::init_from_json(test::parse_json(R"({
    "base_confidence": 0.2,
    "deeplink_bonus": 0
  })"));
  const auto& heuristics = Heuristics::singleton();
  EXPECT_DOUBLE_EQ(heuristics.base_confidence(), 0.2);
  EXPECT_DOUBLE_EQ(heuristics.deeplink_bonus(), 0.0);
  EXPECT_DOUBLE_EQ(heuristics.tainted_source_bonus(), 0.5);
  EXPECT_DOUBLE_EQ(heuristics.to_json()["base_confidence"].asDouble(), 0.2);

  Heuristics::reset();
  EXPECT_DOUBLE_EQ(heuristics.base_confidence(), 0.1);
  EXPECT_DOUBLE_EQ(heuristics.deeplink_bonus(), 0.15);
}

TEST_F(HeuristicsTest, Consistency) {
  Heuristics::init_from_json(test::parse_json(R"({
    "high_confidence_threshold": 0.3
  })"));
  EXPECT_DOUBLE_EQ(Heuristics::singleton().high_confidence_threshold(), 0.3);
  EXPECT_DOUBLE_EQ(Heuristics::singleton().medium_confidence_threshold(), 0.3);
}

TEST_F(HeuristicsTest, InvalidHeuristics) {
  EXPECT_THROW(
      Heuristics::init_from_json(test::parse_json("[]")), JsonValidationError);
  EXPECT_THROW(
      Heuristics::init_from_json(
          test::parse_json(R"({"base_confidence": 1.5})")),
      JsonValidationError);
  EXPECT_THROW(
      Heuristics::init_from_json(
          test::parse_json(R"({"deeplink_bonus": "high"})")),
      JsonValidationError);
  EXPECT_THROW(
      Heuristics::init_from_json(test::parse_json(R"({"bonus": 0.5})")),
      JsonValidationError);
}

} // namespace droidflow

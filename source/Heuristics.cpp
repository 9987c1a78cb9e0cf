/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>

#include <droidflow/Heuristics.h>
#include <droidflow/JsonReaderWriter.h>
#include <droidflow/JsonValidation.h>
#include <droidflow/Log.h>

namespace droidflow {

namespace {

// Default values for heuristics parameters.
constexpr double base_confidence_default = 0.1;
constexpr double tainted_source_bonus_default = 0.5;
constexpr double unlinked_source_bonus_default = 0.25;
constexpr double path_length_weight_default = 0.25;
constexpr double deeplink_bonus_default = 0.15;
constexpr double constant_sink_factor_default = 0.5;
constexpr double high_confidence_threshold_default = 0.7;
constexpr double medium_confidence_threshold_default = 0.4;

Heuristics& get_mutable_singleton() {
  // Thread-safe global variable, initialized on first call.
  static Heuristics heuristics;
  return heuristics;
}

double probability(const Json::Value& value, const std::string& field) {
  double number = JsonValidation::number(value, field);
  if (number < 0.0 || number > 1.0) {
    throw JsonValidationError(value, field, "number between 0 and 1");
  }
  return number;
}

} // namespace

void Heuristics::enforce_heuristics_consistency() {
  if (medium_confidence_threshold_ > high_confidence_threshold_) {
    WARNING(
        1,
        "medium_confidence_threshold ({}) is greater than high_confidence_threshold ({}). "
        "Updating medium_confidence_threshold to high_confidence_threshold.",
        medium_confidence_threshold_,
        high_confidence_threshold_);
    medium_confidence_threshold_ = high_confidence_threshold_;
  }
}

Heuristics::Heuristics()
    : base_confidence_(base_confidence_default),
      tainted_source_bonus_(tainted_source_bonus_default),
      unlinked_source_bonus_(unlinked_source_bonus_default),
      path_length_weight_(path_length_weight_default),
      deeplink_bonus_(deeplink_bonus_default),
      constant_sink_factor_(constant_sink_factor_default),
      high_confidence_threshold_(high_confidence_threshold_default),
      medium_confidence_threshold_(medium_confidence_threshold_default) {
  enforce_heuristics_consistency();
}

void Heuristics::init_from_file(const std::filesystem::path& heuristics_path) {
  init_from_json(JsonReader::parse_json_file(heuristics_path));
}

void Heuristics::init_from_json(const Json::Value& value) {
  auto& heuristics = get_mutable_singleton();
  JsonValidation::validate_object(value);
  JsonValidation::check_unexpected_members(
      value,
      {"base_confidence",
       "tainted_source_bonus",
       "unlinked_source_bonus",
       "path_length_weight",
       "deeplink_bonus",
       "constant_sink_factor",
       "high_confidence_threshold",
       "medium_confidence_threshold"});

  // Set the heuristics parameters that are specified in the JSON document.

  if (JsonValidation::has_field(value, "base_confidence")) {
    heuristics.base_confidence_ = probability(value, "base_confidence");
  }

  if (JsonValidation::has_field(value, "tainted_source_bonus")) {
    heuristics.tainted_source_bonus_ =
        probability(value, "tainted_source_bonus");
  }

  if (JsonValidation::has_field(value, "unlinked_source_bonus")) {
    heuristics.unlinked_source_bonus_ =
        probability(value, "unlinked_source_bonus");
  }

  if (JsonValidation::has_field(value, "path_length_weight")) {
    heuristics.path_length_weight_ = probability(value, "path_length_weight");
  }

  if (JsonValidation::has_field(value, "deeplink_bonus")) {
    heuristics.deeplink_bonus_ = probability(value, "deeplink_bonus");
  }

  if (JsonValidation::has_field(value, "constant_sink_factor")) {
    heuristics.constant_sink_factor_ =
        probability(value, "constant_sink_factor");
  }

  if (JsonValidation::has_field(value, "high_confidence_threshold")) {
    heuristics.high_confidence_threshold_ =
        probability(value, "high_confidence_threshold");
  }

  if (JsonValidation::has_field(value, "medium_confidence_threshold")) {
    heuristics.medium_confidence_threshold_ =
        probability(value, "medium_confidence_threshold");
  }

  heuristics.enforce_heuristics_consistency();
}

void Heuristics::reset() {
  auto& heuristics = get_mutable_singleton();
  heuristics.base_confidence_ = base_confidence_default;
  heuristics.tainted_source_bonus_ = tainted_source_bonus_default;
  heuristics.unlinked_source_bonus_ = unlinked_source_bonus_default;
  heuristics.path_length_weight_ = path_length_weight_default;
  heuristics.deeplink_bonus_ = deeplink_bonus_default;
  heuristics.constant_sink_factor_ = constant_sink_factor_default;
  heuristics.high_confidence_threshold_ = high_confidence_threshold_default;
  heuristics.medium_confidence_threshold_ =
      medium_confidence_threshold_default;
}

const Heuristics& Heuristics::singleton() {
  return get_mutable_singleton();
}

Json::Value Heuristics::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["base_confidence"] = base_confidence_;
  value["tainted_source_bonus"] = tainted_source_bonus_;
  value["unlinked_source_bonus"] = unlinked_source_bonus_;
  value["path_length_weight"] = path_length_weight_;
  value["deeplink_bonus"] = deeplink_bonus_;
  value["constant_sink_factor"] = constant_sink_factor_;
  value["high_confidence_threshold"] = high_confidence_threshold_;
  value["medium_confidence_threshold"] = medium_confidence_threshold_;
  return value;
}

} // namespace droidflow

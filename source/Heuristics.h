/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <filesystem>

#include <json/json.h>

#include <droidflow/IncludeMacros.h>

namespace droidflow {

/**
 * Weights of the data flow confidence score.
 *
 * A score starts at `base_confidence`, gains source, path length and deeplink
 * bonuses, is scaled down when the sink only receives constants, and is
 * finally clamped to [0, 1].
 */
class Heuristics final {
 public:
  explicit Heuristics();

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Heuristics)

  static void init_from_file(const std::filesystem::path& heuristics_path);
  static void init_from_json(const Json::Value& value);

  /* Restore the default weights. */
  static void reset();

  static const Heuristics& singleton();

  double base_confidence() const {
    return base_confidence_;
  }

  /**
   * Bonus when a register holding data extracted from an intent is passed to
   * the next call on the path or to the sink.
   */
  double tainted_source_bonus() const {
    return tainted_source_bonus_;
  }

  /**
   * Bonus when an intent extraction call appears on the path, without a
   * register link to the next call.
   */
  double unlinked_source_bonus() const {
    return unlinked_source_bonus_;
  }

  /* Divided by the path length, so that short paths score higher. */
  double path_length_weight() const {
    return path_length_weight_;
  }

  double deeplink_bonus() const {
    return deeplink_bonus_;
  }

  /* Multiplier applied when every argument of the sink call is a constant. */
  double constant_sink_factor() const {
    return constant_sink_factor_;
  }

  /* Minimum confidence of a `high` data flow. */
  double high_confidence_threshold() const {
    return high_confidence_threshold_;
  }

  /* Minimum confidence of a `medium` data flow. */
  double medium_confidence_threshold() const {
    return medium_confidence_threshold_;
  }

  Json::Value to_json() const;

 private:
  void enforce_heuristics_consistency();

 private:
  double base_confidence_;
  double tainted_source_bonus_;
  double unlinked_source_bonus_;
  double path_length_weight_;
  double deeplink_bonus_;
  double constant_sink_factor_;
  double high_confidence_threshold_;
  double medium_confidence_threshold_;
};

} // namespace droidflow

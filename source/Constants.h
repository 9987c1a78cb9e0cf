/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace droidflow {
namespace constants {

constexpr std::string_view k_action_main = "android.intent.action.MAIN";
constexpr std::string_view k_action_view = "android.intent.action.VIEW";
constexpr std::string_view k_category_launcher =
    "android.intent.category.LAUNCHER";
constexpr std::string_view k_category_default =
    "android.intent.category.DEFAULT";
constexpr std::string_view k_category_browsable =
    "android.intent.category.BROWSABLE";

/**
 * Methods that extract externally controlled data from an `Intent`, a
 * `Bundle` or a `Uri`, as method names by class name.
 */
const std::unordered_map<std::string, std::unordered_set<std::string>>&
get_intent_source_methods();

/* Sink patterns of the predefined sink categories. */
const std::vector<std::string>& get_webview_sink_patterns();
const std::vector<std::string>& get_file_sink_patterns();
const std::vector<std::string>& get_network_sink_patterns();
const std::vector<std::string>& get_sql_sink_patterns();

} // namespace constants
} // namespace droidflow

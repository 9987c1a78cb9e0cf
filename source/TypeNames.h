/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace droidflow {
namespace type_names {

/**
 * Convert a type descriptor to its Java source name.
 *
 * For instance:
 * ```
 * >>> java_name("Lcom/example/Foo$Bar;")
 * <<< "com.example.Foo$Bar"
 * >>> java_name("[[I")
 * <<< "int[][]"
 * ```
 */
std::string java_name(std::string_view descriptor);

/* `com.example.Foo` -> `com.example` */
std::string package_name(std::string_view class_name);

/* `com.example.Foo` -> `Foo` */
std::string simple_name(std::string_view class_name);

/**
 * The first `depth` segments of the package of a class, e.g.
 * `package_prefix("com.example.app.ui.Main", 2) == "com.example"`. Returns
 * the whole package when it has fewer segments.
 */
std::string package_prefix(std::string_view class_name, std::size_t depth);

} // namespace type_names
} // namespace droidflow

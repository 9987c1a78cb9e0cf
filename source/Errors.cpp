/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>

#include <droidflow/Errors.h>

namespace droidflow {

ArchiveError::ArchiveError(const std::string& message)
    : std::runtime_error(fmt::format("Invalid archive: {}", message)) {}

ManifestError::ManifestError(const std::string& message)
    : std::runtime_error(fmt::format("Invalid manifest: {}", message)) {}

MalformedDexError::MalformedDexError(
    const std::string& location,
    const std::string& message)
    : std::runtime_error(
          fmt::format("Malformed dex file `{}`: {}", location, message)),
      location_(location) {}

NotFoundError::NotFoundError(const std::string& message)
    : std::out_of_range(message) {}

} // namespace droidflow

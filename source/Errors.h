/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace droidflow {

/* The package directory is missing or contains no usable bytecode. */
class ArchiveError : public std::runtime_error {
 public:
  explicit ArchiveError(const std::string& message);
};

/* The manifest is missing or cannot be read. */
class ManifestError : public std::runtime_error {
 public:
  explicit ManifestError(const std::string& message);
};

/* A bytecode file violates the container format. */
class MalformedDexError : public std::runtime_error {
 public:
  MalformedDexError(const std::string& location, const std::string& message);

  const std::string& location() const {
    return location_;
  }

 private:
  std::string location_;
};

/* An index or a name does not designate an existing element. */
class NotFoundError : public std::out_of_range {
 public:
  explicit NotFoundError(const std::string& message);
};

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include <droidflow/DexFile.h>
#include <droidflow/Diagnostics.h>
#include <droidflow/IncludeMacros.h>
#include <droidflow/Manifest.h>
#include <droidflow/MethodReference.h>

namespace droidflow {

/**
 * An unpacked application package: its bytecode files in load order, its
 * decoded manifest and the diagnostics collected while loading them.
 */
class Apk final {
 public:
  Apk(
      std::vector<DexFile> dex_files,
      Manifest manifest,
      Diagnostics diagnostics = {});

  MOVE_CONSTRUCTOR_ONLY(Apk)

  /**
   * Load an unpacked package directory.
   *
   * Bytecode files are read as `classes.dex`, `classes2.dex`, ... until the
   * next one is missing. A malformed file is recorded and skipped. Throws
   * `ArchiveError` if the directory does not exist or holds no valid
   * bytecode, and `ManifestError` if `AndroidManifest.json` is missing or
   * invalid.
   */
  static Apk load(const std::filesystem::path& directory);

  const std::vector<DexFile>& dex_files() const {
    return dex_files_;
  }

  const Manifest& manifest() const {
    return manifest_;
  }

  /* `strings.json` beside the bytecode, if present. */
  const std::optional<std::filesystem::path>& string_resources_path() const {
    return string_resources_path_;
  }

  /* Diagnostics of the loader and of every bytecode file. */
  const Diagnostics& diagnostics() const {
    return diagnostics_;
  }

  /* Throws `NotFoundError` for an invalid file or method index. */
  MethodReference resolve_method(
      std::size_t dex_index,
      std::uint32_t method_index) const;

  /**
   * Resolve a method index against the bytecode files in order, returning
   * the first that succeeds. Throws `NotFoundError` if none does.
   */
  MethodReference resolve_method(std::uint32_t method_index) const;

 private:
  std::vector<DexFile> dex_files_;
  Manifest manifest_;
  std::optional<std::filesystem::path> string_resources_path_;
  Diagnostics diagnostics_;
};

} // namespace droidflow

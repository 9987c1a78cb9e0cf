/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>

#include <droidflow/Apk.h>
#include <droidflow/Errors.h>
#include <droidflow/Log.h>
#include <droidflow/Timer.h>

namespace droidflow {

namespace {

std::string dex_file_name(std::size_t position) {
  if (position == 0) {
    return "classes.dex";
  }
  return fmt::format("classes{}.dex", position + 1);
}

} // namespace

Apk::Apk(
    std::vector<DexFile> dex_files,
    Manifest manifest,
    Diagnostics diagnostics)
    : dex_files_(std::move(dex_files)),
      manifest_(std::move(manifest)),
      diagnostics_(std::move(diagnostics)) {}

Apk Apk::load(const std::filesystem::path& directory) {
  Timer timer;

  if (!std::filesystem::is_directory(directory)) {
    throw ArchiveError(
        fmt::format("`{}` is not a directory", directory.string()));
  }

  Diagnostics diagnostics;
  std::vector<DexFile> dex_files;
  for (std::size_t position = 0;; position++) {
    auto path = directory / dex_file_name(position);
    if (!std::filesystem::exists(path)) {
      break;
    }
    try {
      auto dex_file = DexFile::read(path);
      diagnostics.extend(dex_file.diagnostics());
      dex_files.push_back(std::move(dex_file));
    } catch (const MalformedDexError& error) {
      WARNING(1, "Skipping `{}`: {}", path.string(), error.what());
      diagnostics.add(ErrorKind::MalformedDex, error.location(), error.what());
    }
  }

  if (dex_files.empty()) {
    throw ArchiveError(fmt::format(
        "no valid bytecode file in `{}`", directory.string()));
  }

  auto manifest_path = directory / "AndroidManifest.json";
  if (!std::filesystem::exists(manifest_path)) {
    throw ManifestError(
        fmt::format("no manifest found in `{}`", directory.string()));
  }
  auto manifest = Manifest::from_file(manifest_path);

  Apk apk(std::move(dex_files), std::move(manifest), std::move(diagnostics));

  auto strings_path = directory / "strings.json";
  if (std::filesystem::exists(strings_path)) {
    apk.string_resources_path_ = strings_path;
  }

  LOG(1,
      "Loaded {} bytecode files from `{}` in {:.2f}s.",
      apk.dex_files_.size(),
      directory.string(),
      timer.duration_in_seconds());
  return apk;
}

MethodReference Apk::resolve_method(
    std::size_t dex_index,
    std::uint32_t method_index) const {
  if (dex_index >= dex_files_.size()) {
    throw NotFoundError(fmt::format(
        "Bytecode file index {} is out of range ({} files)",
        dex_index,
        dex_files_.size()));
  }
  return dex_files_[dex_index].method_reference(method_index);
}

MethodReference Apk::resolve_method(std::uint32_t method_index) const {
  for (const auto& dex_file : dex_files_) {
    if (method_index < dex_file.method_ids_size()) {
      try {
        return dex_file.method_reference(method_index);
      } catch (const NotFoundError& error) {
        LOG(4,
            "Unable to resolve method {} in `{}`: {}",
            method_index,
            dex_file.location(),
            error.what());
      }
    }
  }
  throw NotFoundError(
      fmt::format("Method index {} is not in any bytecode file", method_index));
}

} // namespace droidflow

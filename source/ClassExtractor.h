/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <vector>

#include <droidflow/Apk.h>
#include <droidflow/DexClass.h>
#include <droidflow/Diagnostics.h>

namespace droidflow {

/* Build the class model of one class definition. Methods missing from the
 * method table are reported as `UnresolvedMethod` and skipped. */
DexClass extract_class(
    const DexFile& dex_file,
    std::size_t dex_index,
    const DexClassDefinition& class_definition,
    Diagnostics& diagnostics);

/**
 * Extract every class of every bytecode file, in load order.
 *
 * In parallel mode, each class definition is extracted by a worker into its
 * own slot and the slots are merged in order once all workers are done. The
 * result is identical to the sequential one. Only the first definition of a
 * class name is kept.
 */
std::vector<DexClass>
extract_classes(const Apk& apk, bool parallel, Diagnostics& diagnostics);

} // namespace droidflow

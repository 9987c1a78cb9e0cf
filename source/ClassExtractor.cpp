/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <unordered_set>

#include <fmt/format.h>
#include <sparta/WorkQueue.h>

#include <droidflow/ClassExtractor.h>
#include <droidflow/Errors.h>
#include <droidflow/Log.h>
#include <droidflow/Timer.h>

namespace droidflow {

namespace {

struct ClassSlot {
  std::optional<DexClass> dex_class;
  Diagnostics diagnostics;
};

void extract_methods(
    const DexFile& dex_file,
    std::size_t dex_index,
    const std::vector<DexMethodDefinition>& method_definitions,
    std::vector<DexMethod>& methods,
    Diagnostics& diagnostics) {
  for (const auto& definition : method_definitions) {
    try {
      auto reference = dex_file.method_reference(definition.method_index);
      const auto& code = definition.code;
      if (code) {
        methods.emplace_back(
            std::move(reference),
            definition.access_flags,
            code->instructions,
            code->registers_size,
            code->ins_size,
            code->outs_size,
            MethodHandle{dex_index, definition.method_index});
      } else {
        methods.emplace_back(
            std::move(reference),
            definition.access_flags,
            std::nullopt,
            /* registers_size */ 0,
            /* ins_size */ 0,
            /* outs_size */ 0,
            MethodHandle{dex_index, definition.method_index});
      }
    } catch (const NotFoundError& error) {
      diagnostics.add(
          ErrorKind::UnresolvedMethod,
          fmt::format(
              "{}:method@{}", dex_file.location(), definition.method_index),
          error.what());
    }
  }
}

} // namespace

DexClass extract_class(
    const DexFile& dex_file,
    std::size_t dex_index,
    const DexClassDefinition& class_definition,
    Diagnostics& diagnostics) {
  std::vector<DexField> fields;
  for (const auto& field : class_definition.fields) {
    fields.push_back(DexField{
        field.name,
        field.type,
        class_definition.class_name,
        field.access_flags});
  }

  std::vector<DexMethod> methods;
  extract_methods(
      dex_file, dex_index, class_definition.methods, methods, diagnostics);

  return DexClass(
      class_definition.class_name,
      class_definition.superclass,
      class_definition.interfaces,
      class_definition.access_flags,
      std::move(methods),
      std::move(fields),
      dex_index);
}

std::vector<DexClass>
extract_classes(const Apk& apk, bool parallel, Diagnostics& diagnostics) {
  Timer timer;

  // Flatten all class definitions so that each one gets its own slot.
  std::vector<std::pair<std::size_t, const DexClassDefinition*>> class_defs;
  const auto& dex_files = apk.dex_files();
  for (std::size_t dex_index = 0; dex_index < dex_files.size(); dex_index++) {
    for (const auto& class_definition : dex_files[dex_index].classes()) {
      class_defs.emplace_back(dex_index, &class_definition);
    }
  }

  std::vector<ClassSlot> slots(class_defs.size());
  auto extract_slot = [&](std::size_t position) {
    auto [dex_index, class_definition] = class_defs[position];
    auto& slot = slots[position];
    slot.dex_class = extract_class(
        dex_files[dex_index], dex_index, *class_definition, slot.diagnostics);
  };

  unsigned int threads = sparta::parallel::default_num_threads();
  if (!parallel) {
    threads = 1u;
  }
  auto queue = sparta::work_queue<std::size_t>(extract_slot, threads);
  for (std::size_t position = 0; position < class_defs.size(); position++) {
    queue.add_item(position);
  }
  queue.run_all();

  std::vector<DexClass> classes;
  std::unordered_set<std::string> seen;
  classes.reserve(slots.size());
  for (auto& slot : slots) {
    diagnostics.extend(std::move(slot.diagnostics));
    if (!slot.dex_class) {
      continue;
    }
    const auto& class_name = slot.dex_class->class_name();
    if (!seen.insert(class_name).second) {
      diagnostics.add(
          ErrorKind::DuplicateClass,
          class_name,
          fmt::format(
              "Class is also defined in bytecode file {}, keeping the first definition.",
              slot.dex_class->dex_index()));
      continue;
    }
    classes.push_back(std::move(*slot.dex_class));
  }

  LOG(1,
      "Extracted {} classes from {} bytecode files using {} threads in {:.2f}s.",
      classes.size(),
      dex_files.size(),
      threads,
      timer.duration_in_seconds());
  return classes;
}

} // namespace droidflow

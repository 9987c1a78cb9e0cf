/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <atomic>

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>
#include <sparta/WorkQueue.h>

#include <droidflow/BytecodeDecoder.h>
#include <droidflow/CallGraphBuilder.h>
#include <droidflow/Errors.h>
#include <droidflow/Log.h>
#include <droidflow/Timer.h>

namespace droidflow {

namespace {

struct ClassSlot {
  std::vector<MethodReference> callers;
  std::vector<Call> calls;
  Diagnostics diagnostics;
};

bool in_packages(
    const DexClass& dex_class,
    const std::optional<std::vector<std::string>>& package_filter) {
  if (!package_filter) {
    return true;
  }
  return std::any_of(
      package_filter->begin(),
      package_filter->end(),
      [&](const std::string& prefix) {
        return boost::starts_with(dex_class.class_name(), prefix);
      });
}

} // namespace

CallGraphBuilder::CallGraphBuilder(const Apk& apk, const ClassTable& classes)
    : apk_(apk), classes_(classes) {}

std::vector<Call> CallGraphBuilder::calls_of(
    const DexMethod& method,
    Diagnostics& diagnostics) const {
  const auto& bytecode = method.bytecode();
  if (!bytecode) {
    return {};
  }

  auto signature = method.signature();
  std::vector<Instruction> instructions;
  try {
    instructions = decode_bytecode(*bytecode, &diagnostics, signature);
  } catch (const DecodeError& error) {
    diagnostics.add(ErrorKind::MethodDecodeFailure, signature, error.what());
    return {};
  }

  std::vector<Call> calls;
  for (const auto& instruction : instructions) {
    auto method_index = instruction.method_index();
    if (!method_index) {
      continue;
    }
    try {
      calls.push_back(Call{
          method.reference(),
          apk_.resolve_method(method.handle().dex_index, *method_index),
          instruction.offset()});
    } catch (const NotFoundError& error) {
      diagnostics.add(
          ErrorKind::UnresolvedMethod,
          fmt::format("{}@{:04x}", signature, instruction.offset()),
          error.what());
    }
  }
  return calls;
}

CallGraph CallGraphBuilder::build(
    const std::optional<std::vector<std::string>>& package_filter,
    Diagnostics& diagnostics) const {
  return build_parallel(package_filter, diagnostics, /* threads */ 1u);
}

CallGraph CallGraphBuilder::build_parallel(
    const std::optional<std::vector<std::string>>& package_filter,
    Diagnostics& diagnostics,
    unsigned int threads) const {
  Timer timer;
  const auto& classes = classes_.classes();
  std::vector<ClassSlot> slots(classes.size());
  std::atomic<std::size_t> iteration(0);

  auto queue = sparta::work_queue<std::size_t>(
      [&](std::size_t position) {
        iteration++;
        if (iteration % 10000 == 0) {
          LOG_IF_INTERACTIVE(
              1, "Processed {}/{} classes.", iteration.load(), classes.size());
        }

        const auto& dex_class = classes[position];
        auto& slot = slots[position];
        for (const auto& method : dex_class.methods()) {
          if (!method.bytecode()) {
            continue;
          }
          slot.callers.push_back(method.reference());
          auto calls = calls_of(method, slot.diagnostics);
          slot.calls.insert(
              slot.calls.end(),
              std::make_move_iterator(calls.begin()),
              std::make_move_iterator(calls.end()));
        }
      },
      std::max(threads, 1u));

  std::size_t scanned_classes = 0;
  for (std::size_t position = 0; position < classes.size(); position++) {
    if (in_packages(classes[position], package_filter)) {
      queue.add_item(position);
      scanned_classes++;
    }
  }
  queue.run_all();

  std::vector<MethodReference> callers;
  std::vector<Call> calls;
  for (auto& slot : slots) {
    callers.insert(
        callers.end(),
        std::make_move_iterator(slot.callers.begin()),
        std::make_move_iterator(slot.callers.end()));
    calls.insert(
        calls.end(),
        std::make_move_iterator(slot.calls.begin()),
        std::make_move_iterator(slot.calls.end()));
    diagnostics.extend(std::move(slot.diagnostics));
  }

  CallGraph graph(std::move(callers), std::move(calls));
  auto stats = graph.get_stats();
  LOG(1,
      "Built call graph of {} methods and {} edges from {}/{} classes in {:.2f}s.",
      stats.total_methods,
      stats.total_edges,
      scanned_classes,
      classes.size(),
      timer.duration_in_seconds());
  return graph;
}

} // namespace droidflow

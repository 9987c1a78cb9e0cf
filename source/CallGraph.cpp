/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <deque>
#include <map>
#include <numeric>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <droidflow/Assert.h>
#include <droidflow/CallGraph.h>
#include <droidflow/Log.h>
#include <droidflow/RE2.h>

namespace droidflow {

CallPath::CallPath(std::vector<MethodReference> methods)
    : methods_(std::move(methods)) {
  df_assert(!methods_.empty());
}

std::string CallPath::show() const {
  std::vector<std::string> signatures;
  signatures.reserve(methods_.size());
  for (const auto& method : methods_) {
    signatures.push_back(method.show());
  }
  return fmt::format("{}", fmt::join(signatures, " -> "));
}

Json::Value CallPath::to_json() const {
  auto value = Json::Value(Json::objectValue);
  auto methods_value = Json::Value(Json::arrayValue);
  for (const auto& method : methods_) {
    methods_value.append(method.to_json());
  }
  value["methods"] = methods_value;
  value["length"] = Json::Value(static_cast<Json::UInt64>(length()));
  return value;
}

Json::Value CallGraph::Stats::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["total_methods"] =
      Json::Value(static_cast<Json::UInt64>(total_methods));
  value["total_edges"] = Json::Value(static_cast<Json::UInt64>(total_edges));
  value["caller_methods"] =
      Json::Value(static_cast<Json::UInt64>(caller_methods));
  value["leaf_methods"] = Json::Value(static_cast<Json::UInt64>(leaf_methods));
  return value;
}

CallGraph::CallGraph(
    std::vector<MethodReference> methods,
    std::vector<Call> calls) {
  for (const auto& call : calls) {
    methods.push_back(call.caller);
    methods.push_back(call.callee);
  }

  // Sort the arena by signature so that ids are stable.
  std::vector<std::string> signatures;
  signatures.reserve(methods.size());
  for (const auto& method : methods) {
    signatures.push_back(method.show());
  }
  std::vector<std::size_t> order(methods.size());
  std::iota(order.begin(), order.end(), 0);
  std::sort(
      order.begin(), order.end(), [&](std::size_t left, std::size_t right) {
        return signatures[left] < signatures[right];
      });

  for (auto position : order) {
    if (!signatures_.empty() && signatures_.back() == signatures[position]) {
      continue;
    }
    auto id = static_cast<MethodId>(methods_.size());
    ids_.emplace(methods[position], id);
    methods_.push_back(std::move(methods[position]));
    signatures_.push_back(std::move(signatures[position]));
  }

  std::vector<std::map<MethodId, std::vector<std::uint32_t>>> targets(
      methods_.size());
  for (const auto& call : calls) {
    auto caller = ids_.at(call.caller);
    auto callee = ids_.at(call.callee);
    targets[caller][callee].push_back(call.offset);
  }

  successors_.resize(methods_.size());
  predecessors_.resize(methods_.size());
  for (MethodId caller = 0; caller < targets.size(); caller++) {
    for (auto& [callee, offsets] : targets[caller]) {
      std::sort(offsets.begin(), offsets.end());
      offsets.erase(std::unique(offsets.begin(), offsets.end()), offsets.end());
      successors_[caller].push_back(CallEdge{callee, std::move(offsets)});
      // Callers are visited in increasing order.
      predecessors_[callee].push_back(caller);
    }
  }

  stats_.total_methods = methods_.size();
  for (const auto& edges : successors_) {
    stats_.total_edges += edges.size();
    if (edges.empty()) {
      stats_.leaf_methods++;
    } else {
      stats_.caller_methods++;
    }
  }
}

std::optional<MethodId> CallGraph::id(const MethodReference& method) const {
  auto found = ids_.find(method);
  if (found == ids_.end()) {
    return std::nullopt;
  }
  return found->second;
}

std::vector<MethodReference> CallGraph::to_references(
    const std::vector<MethodId>& ids) const {
  std::vector<MethodReference> references;
  references.reserve(ids.size());
  for (auto id : ids) {
    references.push_back(methods_[id]);
  }
  return references;
}

CallPath CallGraph::to_call_path(const std::vector<MethodId>& ids) const {
  return CallPath(to_references(ids));
}

std::vector<MethodReference> CallGraph::get_callees(
    const MethodReference& method) const {
  auto caller = id(method);
  if (!caller) {
    return {};
  }
  std::vector<MethodReference> callees;
  for (const auto& edge : successors_[*caller]) {
    callees.push_back(methods_[edge.callee]);
  }
  return callees;
}

std::vector<MethodReference> CallGraph::get_callers(
    const MethodReference& method) const {
  auto callee = id(method);
  if (!callee) {
    return {};
  }
  return to_references(predecessors_[*callee]);
}

std::vector<MethodReference> CallGraph::find_methods(
    const std::string& substring) const {
  std::vector<MethodReference> result;
  for (MethodId id = 0; id < methods_.size(); id++) {
    if (signatures_[id].find(substring) != std::string::npos) {
      result.push_back(methods_[id]);
    }
  }
  return result;
}

std::vector<MethodReference> CallGraph::find_methods_matching(
    const std::string& pattern) const {
  SignaturePattern signature_pattern(pattern);
  std::vector<MethodReference> result;
  for (MethodId id = 0; id < methods_.size(); id++) {
    if (signature_pattern.matches(signatures_[id])) {
      result.push_back(methods_[id]);
    }
  }
  return result;
}

std::vector<MethodReference> CallGraph::find_methods_by_name(
    const std::string& qualified_name) const {
  std::vector<MethodReference> result;
  for (const auto& method : methods_) {
    if (method.qualified_name() == qualified_name) {
      result.push_back(method);
    }
  }
  return result;
}

std::vector<std::size_t> CallGraph::distances_to(
    MethodId target,
    std::size_t max_depth) const {
  const std::size_t unreachable = max_depth + 1;
  std::vector<std::size_t> distances(methods_.size(), unreachable);
  distances[target] = 0;
  std::deque<MethodId> queue{target};
  while (!queue.empty()) {
    auto method = queue.front();
    queue.pop_front();
    if (distances[method] >= max_depth) {
      continue;
    }
    for (auto caller : predecessors_[method]) {
      if (distances[caller] == unreachable) {
        distances[caller] = distances[method] + 1;
        queue.push_back(caller);
      }
    }
  }
  return distances;
}

std::vector<std::vector<MethodId>> CallGraph::find_id_paths(
    MethodId source,
    MethodId target,
    std::size_t max_depth,
    const Cancellation* DF_NULLABLE cancellation) const {
  if (source == target) {
    return {std::vector<MethodId>{source}};
  }
  auto distances = distances_to(target, max_depth);
  if (distances[source] > max_depth) {
    return {};
  }

  struct Frame {
    MethodId method;
    std::size_t next_edge;
  };

  std::vector<std::vector<MethodId>> paths;
  std::vector<bool> on_path(methods_.size(), false);
  std::vector<Frame> stack{{source, 0}};
  on_path[source] = true;

  while (!stack.empty()) {
    if (cancellation != nullptr) {
      cancellation->check();
    }

    auto& frame = stack.back();
    const auto& edges = successors_[frame.method];
    if (frame.next_edge >= edges.size()) {
      on_path[frame.method] = false;
      stack.pop_back();
      continue;
    }
    auto callee = edges[frame.next_edge++].callee;

    // Number of calls on the path once `callee` is appended.
    std::size_t depth = stack.size();
    if (on_path[callee] || depth + distances[callee] > max_depth) {
      continue;
    }
    if (callee == target) {
      std::vector<MethodId> path;
      path.reserve(stack.size() + 1);
      for (const auto& element : stack) {
        path.push_back(element.method);
      }
      path.push_back(target);
      paths.push_back(std::move(path));
      continue;
    }
    on_path[callee] = true;
    stack.push_back(Frame{callee, 0});
  }

  std::sort(
      paths.begin(), paths.end(), [](const auto& left, const auto& right) {
        if (left.size() != right.size()) {
          return left.size() < right.size();
        }
        return left < right;
      });
  return paths;
}

std::vector<CallPath> CallGraph::find_paths(
    const MethodReference& source,
    const MethodReference& target,
    std::size_t max_depth,
    const Cancellation* DF_NULLABLE cancellation) const {
  auto source_id = id(source);
  auto target_id = id(target);
  if (!source_id || !target_id) {
    return {};
  }

  std::vector<CallPath> paths;
  for (const auto& ids :
       find_id_paths(*source_id, *target_id, max_depth, cancellation)) {
    paths.push_back(to_call_path(ids));
  }
  return paths;
}

std::optional<CallPath> CallGraph::find_shortest_path(
    const MethodReference& source,
    const MethodReference& target,
    std::size_t max_depth,
    const Cancellation* DF_NULLABLE cancellation) const {
  auto source_id = id(source);
  auto target_id = id(target);
  if (!source_id || !target_id) {
    return std::nullopt;
  }
  if (*source_id == *target_id) {
    return CallPath({source});
  }

  // Successors are sorted and each method keeps the parent that reached it
  // first, so the path found is the smallest shortest path.
  const auto no_parent = static_cast<MethodId>(methods_.size());
  std::vector<MethodId> parents(methods_.size(), no_parent);
  std::vector<std::size_t> depths(methods_.size(), 0);
  parents[*source_id] = *source_id;
  std::deque<MethodId> queue{*source_id};

  while (!queue.empty()) {
    if (cancellation != nullptr) {
      cancellation->check();
    }
    auto method = queue.front();
    queue.pop_front();
    if (depths[method] >= max_depth) {
      continue;
    }
    for (const auto& edge : successors_[method]) {
      if (parents[edge.callee] != no_parent) {
        continue;
      }
      parents[edge.callee] = method;
      depths[edge.callee] = depths[method] + 1;
      if (edge.callee == *target_id) {
        std::vector<MethodId> path{*target_id};
        while (path.back() != *source_id) {
          path.push_back(parents[path.back()]);
        }
        std::reverse(path.begin(), path.end());
        return to_call_path(path);
      }
      queue.push_back(edge.callee);
    }
  }
  return std::nullopt;
}

std::vector<CallPath> CallGraph::find_paths_from_name(
    const std::string& qualified_name,
    const MethodReference& target,
    std::size_t max_depth,
    const Cancellation* DF_NULLABLE cancellation) const {
  std::vector<CallPath> paths;
  for (const auto& source : find_methods_by_name(qualified_name)) {
    auto source_paths = find_paths(source, target, max_depth, cancellation);
    paths.insert(
        paths.end(),
        std::make_move_iterator(source_paths.begin()),
        std::make_move_iterator(source_paths.end()));
  }
  return paths;
}

Json::Value CallGraph::to_json() const {
  auto value = Json::Value(Json::objectValue);
  auto methods_value = Json::Value(Json::arrayValue);
  for (MethodId caller = 0; caller < methods_.size(); caller++) {
    auto method_value = Json::Value(Json::objectValue);
    method_value["method"] = signatures_[caller];
    auto callees_value = Json::Value(Json::arrayValue);
    for (const auto& edge : successors_[caller]) {
      auto edge_value = Json::Value(Json::objectValue);
      edge_value["callee"] = signatures_[edge.callee];
      auto offsets_value = Json::Value(Json::arrayValue);
      for (auto offset : edge.offsets) {
        offsets_value.append(Json::Value(offset));
      }
      edge_value["offsets"] = offsets_value;
      callees_value.append(edge_value);
    }
    method_value["callees"] = callees_value;
    methods_value.append(method_value);
  }
  value["methods"] = methods_value;
  value["stats"] = stats_.to_json();
  return value;
}

} // namespace droidflow

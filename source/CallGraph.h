/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <json/json.h>

#include <droidflow/Cancellation.h>
#include <droidflow/Compiler.h>
#include <droidflow/IncludeMacros.h>
#include <droidflow/MethodReference.h>

namespace droidflow {

/* Index of a method in the sorted method arena of a `CallGraph`. */
using MethodId = std::uint32_t;

/* One call found in the bytecode of `caller`, at `offset` code units. */
struct Call {
  MethodReference caller;
  MethodReference callee;
  std::uint32_t offset;
};

struct CallEdge {
  MethodId callee;
  /* Sorted, without duplicates. */
  std::vector<std::uint32_t> offsets;

  bool operator==(const CallEdge& other) const {
    return callee == other.callee && offsets == other.offsets;
  }
};

/* A sequence of methods, each calling the next one. */
class CallPath final {
 public:
  explicit CallPath(std::vector<MethodReference> methods);

  const std::vector<MethodReference>& methods() const {
    return methods_;
  }

  /* Number of calls along the path. */
  std::size_t length() const {
    return methods_.empty() ? 0 : methods_.size() - 1;
  }

  const MethodReference& source() const {
    return methods_.front();
  }

  const MethodReference& target() const {
    return methods_.back();
  }

  bool operator==(const CallPath& other) const {
    return methods_ == other.methods_;
  }

  std::string show() const;
  Json::Value to_json() const;

 private:
  std::vector<MethodReference> methods_;
};

/**
 * The interprocedural call graph of a package.
 *
 * Methods are stored in an arena sorted by signature, so a `MethodId` and
 * the order of successors do not depend on the order in which calls were
 * discovered. Methods that are not defined in the package (framework and
 * library methods) appear as leaves.
 *
 * The graph is immutable once built and can be queried concurrently.
 */
class CallGraph final {
 public:
  struct Stats {
    std::size_t total_methods = 0;
    std::size_t total_edges = 0;
    std::size_t caller_methods = 0;
    std::size_t leaf_methods = 0;

    bool operator==(const Stats& other) const {
      return total_methods == other.total_methods &&
          total_edges == other.total_edges &&
          caller_methods == other.caller_methods &&
          leaf_methods == other.leaf_methods;
    }

    Json::Value to_json() const;
  };

 public:
  CallGraph() = default;

  /**
   * Build the graph from the given methods and calls. Both ends of every
   * call become nodes. Duplicate calls at the same offset are merged.
   */
  CallGraph(std::vector<MethodReference> methods, std::vector<Call> calls);

  MOVE_CONSTRUCTOR_ONLY(CallGraph)

  std::size_t size() const {
    return methods_.size();
  }

  std::optional<MethodId> id(const MethodReference& method) const;

  const MethodReference& method(MethodId id) const {
    return methods_.at(id);
  }

  const std::string& signature(MethodId id) const {
    return signatures_.at(id);
  }

  const std::vector<CallEdge>& successors(MethodId id) const {
    return successors_.at(id);
  }

  /* Sorted, without duplicates. */
  const std::vector<MethodId>& predecessors(MethodId id) const {
    return predecessors_.at(id);
  }

  bool contains(const MethodReference& method) const {
    return id(method).has_value();
  }

  /* Direct callees, sorted by signature. Empty for an unknown method. */
  std::vector<MethodReference> get_callees(const MethodReference& method) const;

  /* Direct callers, sorted by signature. Empty for an unknown method. */
  std::vector<MethodReference> get_callers(const MethodReference& method) const;

  /* Methods whose signature contains `substring`, sorted by signature. */
  std::vector<MethodReference> find_methods(const std::string& substring) const;

  /**
   * Methods whose signature matches `pattern`. A plain literal is matched
   * as a substring, anything else as a regular expression.
   */
  std::vector<MethodReference> find_methods_matching(
      const std::string& pattern) const;

  /* Every overload of `class.method`. */
  std::vector<MethodReference> find_methods_by_name(
      const std::string& qualified_name) const;

  /**
   * All simple paths from `source` to `target` with at most `max_depth`
   * calls, ordered by length and then by the signatures along the path.
   *
   * Returns a single path of length 0 when `source == target`, and nothing
   * when either method is not in the graph. Throws `AnalysisCancelled` when
   * `cancellation` is set during the search.
   */
  std::vector<CallPath> find_paths(
      const MethodReference& source,
      const MethodReference& target,
      std::size_t max_depth,
      const Cancellation* DF_NULLABLE cancellation = nullptr) const;

  /* Same as the first element of `find_paths`, computed breadth-first. */
  std::optional<CallPath> find_shortest_path(
      const MethodReference& source,
      const MethodReference& target,
      std::size_t max_depth,
      const Cancellation* DF_NULLABLE cancellation = nullptr) const;

  /* Paths from every overload of `class.method` to `target`. */
  std::vector<CallPath> find_paths_from_name(
      const std::string& qualified_name,
      const MethodReference& target,
      std::size_t max_depth,
      const Cancellation* DF_NULLABLE cancellation = nullptr) const;

  /* Id-level variant of `find_paths`. */
  std::vector<std::vector<MethodId>> find_id_paths(
      MethodId source,
      MethodId target,
      std::size_t max_depth,
      const Cancellation* DF_NULLABLE cancellation = nullptr) const;

  CallPath to_call_path(const std::vector<MethodId>& ids) const;

  Stats get_stats() const {
    return stats_;
  }

  bool operator==(const CallGraph& other) const {
    return methods_ == other.methods_ && successors_ == other.successors_;
  }

  Json::Value to_json() const;

 private:
  std::vector<MethodReference> to_references(
      const std::vector<MethodId>& ids) const;

  /* Distance from every method to `target`, capped at `max_depth + 1`. */
  std::vector<std::size_t> distances_to(MethodId target, std::size_t max_depth)
      const;

 private:
  std::vector<MethodReference> methods_;
  std::vector<std::string> signatures_;
  std::unordered_map<MethodReference, MethodId> ids_;
  std::vector<std::vector<CallEdge>> successors_;
  std::vector<std::vector<MethodId>> predecessors_;
  Stats stats_;
};

} // namespace droidflow

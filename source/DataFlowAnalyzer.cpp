/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include <fmt/format.h>

#include <droidflow/BytecodeDecoder.h>
#include <droidflow/Constants.h>
#include <droidflow/DataFlowAnalyzer.h>
#include <droidflow/Errors.h>
#include <droidflow/Log.h>
#include <droidflow/RE2.h>
#include <droidflow/Timer.h>

namespace droidflow {

namespace {

using RegisterSet = std::unordered_set<Register>;

bool any_register_in(
    const std::vector<Register>& registers,
    const RegisterSet& set) {
  return std::any_of(registers.begin(), registers.end(), [&](Register reg) {
    return set.count(reg) != 0;
  });
}

/* Whether every argument of the invoke, except the receiver, is constant. */
bool constant_arguments(
    const Instruction& instruction,
    const RegisterSet& constants) {
  const auto& arguments = instruction.sources();
  std::size_t first = opcode::is_instance_invoke(instruction.opcode()) ? 1 : 0;
  if (arguments.size() <= first) {
    return false;
  }
  return std::all_of(
      arguments.begin() + first, arguments.end(), [&](Register reg) {
        return constants.count(reg) != 0;
      });
}

bool is_intent_source(const MethodReference& method) {
  const auto& sources = constants::get_intent_source_methods();
  auto found = sources.find(method.class_name());
  return found != sources.end() && found->second.count(method.name()) != 0;
}

bool compare_id_paths(
    const std::vector<MethodId>& left,
    const std::vector<MethodId>& right) {
  if (left.size() != right.size()) {
    return left.size() < right.size();
  }
  return left < right;
}

} // namespace

Json::Value DataFlowAnalyzer::Stats::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["entry_points"] = Json::Value(static_cast<Json::UInt64>(entry_points));
  value["deeplink_handlers"] =
      Json::Value(static_cast<Json::UInt64>(deeplink_handlers));
  return value;
}

DataFlowAnalyzer::DataFlowAnalyzer(
    const Apk& apk,
    const ClassTable& classes,
    const EntryPointAnalyzer& entry_points,
    const CallGraph& graph,
    const LifecycleMethods& lifecycle_methods,
    const Heuristics& heuristics,
    const ResourceResolver* DF_NULLABLE resolver,
    const Cancellation* DF_NULLABLE cancellation)
    : apk_(apk),
      classes_(classes),
      entry_points_(entry_points),
      graph_(graph),
      lifecycle_methods_(lifecycle_methods),
      heuristics_(heuristics),
      resolver_(resolver),
      cancellation_(cancellation) {}

void DataFlowAnalyzer::check_cancellation() const {
  if (cancellation_ != nullptr) {
    cancellation_->check();
  }
}

std::vector<Flow> DataFlowAnalyzer::find_flows_to(
    const std::vector<std::string>& sink_patterns,
    std::size_t max_depth) const {
  Timer timer;

  std::vector<SignaturePattern> patterns;
  patterns.reserve(sink_patterns.size());
  for (const auto& pattern : sink_patterns) {
    patterns.emplace_back(pattern);
  }

  std::vector<MethodId> sinks;
  for (MethodId id = 0; id < graph_.size(); id++) {
    const auto& signature = graph_.signature(id);
    if (std::any_of(patterns.begin(), patterns.end(), [&](const auto& p) {
          return p.matches(signature);
        })) {
      sinks.push_back(id);
    }
  }
  LOG(2,
      "Found {} sink methods for {} patterns.",
      sinks.size(),
      patterns.size());

  // Components declared on the same class are one entry point, which
  // handles deeplinks if any of them does.
  std::vector<const EntryPoint*> entry_points;
  std::unordered_map<std::string, bool> deeplink_handlers;
  for (const auto* entry_point : entry_points_.found_entry_points()) {
    auto [found, inserted] = deeplink_handlers.emplace(
        entry_point->class_name(), entry_point->is_deeplink_handler());
    if (inserted) {
      entry_points.push_back(entry_point);
    } else if (entry_point->is_deeplink_handler()) {
      found->second = true;
    }
  }

  std::vector<Flow> flows;
  for (const auto* entry_point : entry_points) {
    check_cancellation();

    std::vector<MethodId> sources;
    for (const auto& name : lifecycle_methods_.methods(entry_point->kind())) {
      for (const auto* method :
           classes_.find_inherited_methods(entry_point->class_name(), name)) {
        if (auto id = graph_.id(method->reference())) {
          sources.push_back(*id);
        }
      }
    }
    std::sort(sources.begin(), sources.end());
    sources.erase(std::unique(sources.begin(), sources.end()), sources.end());
    if (sources.empty()) {
      LOG(4,
          "No lifecycle method of `{}` in the call graph.",
          entry_point->class_name());
      continue;
    }

    for (auto sink : sinks) {
      std::vector<std::vector<MethodId>> id_paths;
      for (auto source : sources) {
        auto source_paths =
            graph_.find_id_paths(source, sink, max_depth, cancellation_);
        id_paths.insert(
            id_paths.end(),
            std::make_move_iterator(source_paths.begin()),
            std::make_move_iterator(source_paths.end()));
      }
      if (id_paths.empty()) {
        continue;
      }
      std::sort(id_paths.begin(), id_paths.end(), compare_id_paths);
      id_paths.erase(
          std::unique(id_paths.begin(), id_paths.end()), id_paths.end());

      std::vector<CallPath> paths;
      paths.reserve(id_paths.size());
      for (const auto& ids : id_paths) {
        paths.push_back(graph_.to_call_path(ids));
      }
      flows.emplace_back(
          entry_point->class_name(),
          entry_point->kind(),
          graph_.method(sink),
          std::move(paths),
          deeplink_handlers.at(entry_point->class_name()));
    }
  }

  std::sort(
      flows.begin(), flows.end(), [](const Flow& left, const Flow& right) {
        if (left.entry_point() != right.entry_point()) {
          return left.entry_point() < right.entry_point();
        }
        return left.sink_method().show() < right.sink_method().show();
      });

  LOG(1,
      "Found {} flows from {} entry points in {:.2f}s.",
      flows.size(),
      entry_points.size(),
      timer.duration_in_seconds());
  return flows;
}

std::vector<Flow> DataFlowAnalyzer::find_webview_flows(
    std::size_t max_depth) const {
  return find_flows_to(constants::get_webview_sink_patterns(), max_depth);
}

std::vector<Flow> DataFlowAnalyzer::find_file_flows(
    std::size_t max_depth) const {
  return find_flows_to(constants::get_file_sink_patterns(), max_depth);
}

std::vector<Flow> DataFlowAnalyzer::find_network_flows(
    std::size_t max_depth) const {
  return find_flows_to(constants::get_network_sink_patterns(), max_depth);
}

std::vector<Flow> DataFlowAnalyzer::find_sql_flows(
    std::size_t max_depth) const {
  return find_flows_to(constants::get_sql_sink_patterns(), max_depth);
}

std::vector<Flow> DataFlowAnalyzer::find_deeplink_flows(
    const std::vector<std::string>& sink_patterns,
    std::size_t max_depth) const {
  auto flows = find_flows_to(sink_patterns, max_depth);
  flows.erase(
      std::remove_if(
          flows.begin(),
          flows.end(),
          [](const Flow& flow) { return !flow.is_deeplink_handler(); }),
      flows.end());
  return flows;
}

DataFlowAnalyzer::PathEvidence DataFlowAnalyzer::analyze_path(
    const CallPath& path) const {
  const auto& methods = path.methods();

  PathEvidence evidence;
  // Registers of the current method tainted by the call from the previous
  // method on the path.
  RegisterSet incoming;

  for (std::size_t step = 0; step + 1 < methods.size(); step++) {
    const auto& next = methods[step + 1];
    bool sink_step = step + 2 == methods.size();
    RegisterSet outgoing;

    const auto* method = classes_.get_method(methods[step]);
    if (method == nullptr || !method->bytecode()) {
      incoming.clear();
      continue;
    }

    std::vector<Instruction> instructions;
    try {
      instructions = decode_bytecode(*method->bytecode());
    } catch (const DecodeError& error) {
      LOG(4, "Unable to decode `{}`: {}", method->signature(), error.what());
      incoming.clear();
      continue;
    }

    // Branches may lead back to earlier instructions: the pass is repeated
    // with the registers tainted at its end until nothing changes.
    RegisterSet entry = std::move(incoming);
    for (;;) {
      RegisterSet tainted = entry;
      RegisterSet constants;
      bool taint_result = false;
      auto outgoing_size = outgoing.size();

      for (const auto& instruction : instructions) {
        auto opcode = instruction.opcode();

        if (instruction.is_invoke()) {
          std::optional<MethodReference> callee;
          if (auto index = instruction.method_index()) {
            try {
              callee = apk_.resolve_method(method->handle().dex_index, *index);
            } catch (const NotFoundError&) {
              LOG(5, "Unresolved invoke in `{}`.", method->signature());
            }
          }

          bool tainted_arguments =
              any_register_in(instruction.sources(), tainted);
          taint_result = tainted_arguments;
          if (callee && is_intent_source(*callee)) {
            if (!evidence.source) {
              evidence.source = callee;
              evidence.source_caller = methods[step];
            }
            taint_result = true;
          }

          if (callee && *callee == next) {
            if (tainted_arguments && !evidence.linked_step) {
              evidence.linked_step = step;
            }
            if (tainted_arguments) {
              if (const auto* next_method = classes_.get_method(next)) {
                // Arguments land in the last `ins_size` registers of the
                // callee.
                Register first = static_cast<Register>(
                    next_method->registers_size() - next_method->ins_size());
                const auto& arguments = instruction.sources();
                for (std::size_t position = 0; position < arguments.size();
                     position++) {
                  if (tainted.count(arguments[position]) != 0) {
                    outgoing.insert(first + static_cast<Register>(position));
                  }
                }
              }
            }
            if (sink_step && constant_arguments(instruction, constants)) {
              evidence.constant_sink = true;
            }
          }
          continue;
        }

        auto destination = instruction.destination();
        if (opcode::is_move_result(opcode)) {
          if (taint_result) {
            tainted.insert(*destination);
          } else {
            tainted.erase(*destination);
          }
          constants.erase(*destination);
          taint_result = false;
          continue;
        }
        taint_result = false;

        if (!destination) {
          continue;
        }
        auto reg = *destination;

        if (instruction.family() == OpcodeFamily::Move &&
            !instruction.sources().empty()) {
          auto from = instruction.sources().front();
          if (tainted.count(from) != 0) {
            tainted.insert(reg);
          } else {
            tainted.erase(reg);
          }
          if (constants.count(from) != 0) {
            constants.insert(reg);
          } else {
            constants.erase(reg);
          }
          continue;
        }

        if (instruction.reads(reg)) {
          // `check-cast` and two-address operations keep the register.
          continue;
        }
        tainted.erase(reg);

        bool constant = false;
        const auto& index = instruction.index();
        if (index && index->kind == IndexKind::String) {
          constant = true;
        } else if (
            instruction.family() == OpcodeFamily::Const && !index &&
            instruction.literal() && resolver_ != nullptr &&
            ResourceResolver::is_resource_id(*instruction.literal())) {
          constant = resolver_
                         ->resolve_string(
                             static_cast<std::uint32_t>(*instruction.literal()))
                         .has_value();
        }
        if (constant) {
          constants.insert(reg);
        } else {
          constants.erase(reg);
        }
      }

      auto entry_size = entry.size();
      entry.insert(tainted.begin(), tainted.end());
      if (entry.size() == entry_size && outgoing.size() == outgoing_size) {
        break;
      }
    }

    incoming = std::move(outgoing);
  }

  return evidence;
}

DataFlow DataFlowAnalyzer::score_path(const Flow& flow, const CallPath& path)
    const {
  auto evidence = analyze_path(path);
  std::vector<std::string> notes;

  double confidence = heuristics_.base_confidence();
  notes.push_back(fmt::format("Base confidence {:.2f}.", confidence));

  if (evidence.source && evidence.linked_step) {
    confidence += heuristics_.tainted_source_bonus();
    notes.push_back(fmt::format(
        "Data from `{}` in `{}` is passed to `{}`.",
        evidence.source->show(),
        evidence.source_caller->show(),
        path.methods()[*evidence.linked_step + 1].show()));
  } else if (evidence.source) {
    confidence += heuristics_.unlinked_source_bonus();
    notes.push_back(fmt::format(
        "Intent data is read by `{}` in `{}`.",
        evidence.source->show(),
        evidence.source_caller->show()));
  } else {
    notes.push_back("No intent extraction call on the path.");
  }

  auto length = path.length();
  confidence += heuristics_.path_length_weight() /
      static_cast<double>(std::max<std::size_t>(length, 1));
  notes.push_back(fmt::format("Path of {} calls.", length));

  if (flow.is_deeplink_handler()) {
    confidence += heuristics_.deeplink_bonus();
    notes.push_back("Entry point handles deeplinks.");
  }

  if (evidence.constant_sink) {
    confidence *= heuristics_.constant_sink_factor();
    notes.push_back("Sink arguments are constants.");
  }

  confidence = std::min(1.0, std::max(0.0, confidence));

  auto level = ConfidenceLevel::Low;
  if (confidence >= heuristics_.high_confidence_threshold()) {
    level = ConfidenceLevel::High;
  } else if (confidence >= heuristics_.medium_confidence_threshold()) {
    level = ConfidenceLevel::Medium;
  }

  return DataFlow{
      flow.entry_point(),
      evidence.source,
      flow.sink_method(),
      path,
      confidence,
      level,
      std::move(notes),
  };
}

DataFlow DataFlowAnalyzer::analyze_data_flow(const Flow& flow) const {
  std::optional<DataFlow> best;
  for (const auto& path : flow.paths()) {
    check_cancellation();
    auto data_flow = score_path(flow, path);
    if (!best || data_flow.confidence > best->confidence) {
      best = std::move(data_flow);
    }
  }
  return std::move(*best);
}

std::vector<DataFlow> DataFlowAnalyzer::analyze_data_flows(
    const std::vector<Flow>& flows) const {
  Timer timer;
  std::vector<DataFlow> data_flows;
  data_flows.reserve(flows.size());
  for (const auto& flow : flows) {
    data_flows.push_back(analyze_data_flow(flow));
  }
  LOG(1,
      "Scored {} data flows in {:.2f}s.",
      data_flows.size(),
      timer.duration_in_seconds());
  return data_flows;
}

DataFlowAnalyzer::Stats DataFlowAnalyzer::get_stats() const {
  return Stats{
      entry_points_.found_entry_points().size(),
      entry_points_.get_deeplink_handlers().size(),
  };
}

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <droidflow/Instruction.h>

namespace droidflow {

Instruction::Instruction(
    Opcode opcode,
    std::uint32_t offset,
    std::optional<Register> destination,
    std::vector<Register> sources,
    std::optional<std::int64_t> literal,
    std::optional<std::int32_t> branch_offset,
    std::optional<IndexOperand> index,
    std::optional<std::uint32_t> proto_index)
    : opcode_(opcode),
      offset_(offset),
      destination_(destination),
      sources_(std::move(sources)),
      literal_(literal),
      branch_offset_(branch_offset),
      index_(index),
      proto_index_(proto_index) {}

std::optional<std::uint32_t> Instruction::method_index() const {
  if (!is_invoke() || !index_ || index_->kind != IndexKind::Method) {
    return std::nullopt;
  }
  return index_->value;
}

bool Instruction::reads(Register reg) const {
  return std::find(sources_.begin(), sources_.end(), reg) != sources_.end();
}

std::string Instruction::to_string() const {
  std::string result =
      fmt::format("{:04x}: {}", offset_, opcode::mnemonic(opcode_));

  std::vector<std::string> operands;
  if (destination_) {
    operands.push_back(fmt::format("v{}", *destination_));
  }
  if (is_invoke() ||
      opcode_ == DOPCODE_FILLED_NEW_ARRAY ||
      opcode_ == DOPCODE_FILLED_NEW_ARRAY_RANGE) {
    std::vector<std::string> arguments;
    for (auto reg : sources_) {
      arguments.push_back(fmt::format("v{}", reg));
    }
    operands.push_back(fmt::format("{{{}}}", fmt::join(arguments, ", ")));
  } else {
    for (auto reg : sources_) {
      if (destination_ && reg == *destination_ &&
          opcode::register_role(opcode_) == RegisterRole::DefUse) {
        continue;
      }
      operands.push_back(fmt::format("v{}", reg));
    }
  }
  if (literal_) {
    operands.push_back(fmt::format("#{}", *literal_));
  }
  if (branch_offset_) {
    operands.push_back(fmt::format("{:+}", *branch_offset_));
  }
  if (index_) {
    operands.push_back(fmt::format("{}@{}", show(index_->kind), index_->value));
  }
  if (proto_index_) {
    operands.push_back(fmt::format("proto@{}", *proto_index_));
  }

  if (!operands.empty()) {
    result += fmt::format(" {}", fmt::join(operands, ", "));
  }
  return result;
}

bool Instruction::operator==(const Instruction& other) const {
  return opcode_ == other.opcode_ && offset_ == other.offset_ &&
      destination_ == other.destination_ && sources_ == other.sources_ &&
      literal_ == other.literal_ && branch_offset_ == other.branch_offset_ &&
      index_ == other.index_ && proto_index_ == other.proto_index_;
}

std::ostream& operator<<(std::ostream& out, const Instruction& instruction) {
  return out << instruction.to_string();
}

} // namespace droidflow

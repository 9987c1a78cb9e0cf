/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <droidflow/Opcode.h>

namespace droidflow {

using Register = std::uint32_t;

/* A reference into one of the tables of the bytecode file. */
struct IndexOperand {
  IndexKind kind;
  std::uint32_t value;

  bool operator==(const IndexOperand& other) const {
    return kind == other.kind && value == other.value;
  }
};

/**
 * A decoded instruction.
 *
 * Register operands are split into the destination (written) register and the
 * ordered source registers. For invokes, the sources are the arguments in
 * call order, starting with the receiver for instance calls. A register that
 * is both read and written (`add-int/2addr`, `check-cast`) appears in both.
 */
class Instruction final {
 public:
  Instruction(
      Opcode opcode,
      std::uint32_t offset,
      std::optional<Register> destination,
      std::vector<Register> sources,
      std::optional<std::int64_t> literal = std::nullopt,
      std::optional<std::int32_t> branch_offset = std::nullopt,
      std::optional<IndexOperand> index = std::nullopt,
      std::optional<std::uint32_t> proto_index = std::nullopt);

  Opcode opcode() const {
    return opcode_;
  }

  OpcodeFamily family() const {
    return opcode::family(opcode_);
  }

  /* Position of the instruction in 16-bit code units from the method start. */
  std::uint32_t offset() const {
    return offset_;
  }

  const std::optional<Register>& destination() const {
    return destination_;
  }

  const std::vector<Register>& sources() const {
    return sources_;
  }

  const std::optional<std::int64_t>& literal() const {
    return literal_;
  }

  const std::optional<std::int32_t>& branch_offset() const {
    return branch_offset_;
  }

  const std::optional<IndexOperand>& index() const {
    return index_;
  }

  /* Prototype index of `invoke-polymorphic`. */
  const std::optional<std::uint32_t>& proto_index() const {
    return proto_index_;
  }

  bool is_invoke() const {
    return opcode::is_invoke(opcode_);
  }

  /* Method table index of a method invoke, or nothing. */
  std::optional<std::uint32_t> method_index() const;

  bool reads(Register reg) const;

  std::string to_string() const;

  bool operator==(const Instruction& other) const;

 private:
  Opcode opcode_;
  std::uint32_t offset_;
  std::optional<Register> destination_;
  std::vector<Register> sources_;
  std::optional<std::int64_t> literal_;
  std::optional<std::int32_t> branch_offset_;
  std::optional<IndexOperand> index_;
  std::optional<std::uint32_t> proto_index_;
};

std::ostream& operator<<(std::ostream& out, const Instruction& instruction);

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include <DexOpcode.h>

namespace droidflow {

/* Opcodes and operand formats are redex's `DexOpcode` and `OpcodeFormat`. */
using Opcode = DexOpcode;

enum class OpcodeFamily : std::uint8_t {
  Const,
  Invoke,
  Move,
  Branch,
  Return,
  Other,
};

/**
 * How the register operands are used:
 *   None   - no register operand.
 *   Def    - the first register is written, the others are read.
 *   Use    - every register is read.
 *   DefUse - the first register is read and written (`/2addr`, check-cast).
 */
enum class RegisterRole : std::uint8_t {
  None,
  Def,
  Use,
  DefUse,
};

enum class IndexKind : std::uint8_t {
  None,
  String,
  Type,
  Field,
  Method,
  CallSite,
};

std::string_view show(OpcodeFamily family);
std::string_view show(IndexKind kind);

namespace opcode {

/**
 * Returns the opcode for the given byte, or nothing for unused values and
 * for the optimized (`-quick`) opcodes, which are not valid in a Dalvik
 * executable.
 */
std::optional<Opcode> from_byte(std::uint8_t value);

std::string_view mnemonic(Opcode opcode);
OpcodeFormat format(Opcode opcode);
OpcodeFamily family(Opcode opcode);
RegisterRole register_role(Opcode opcode);
IndexKind index_kind(Opcode opcode);

/* Size of the format in 16-bit code units. */
std::size_t size(OpcodeFormat format);

/* Method invokes, including `invoke-polymorphic` and `invoke-custom`. */
bool is_invoke(Opcode opcode);

/* Invokes that pass the receiver as their first argument. */
bool is_instance_invoke(Opcode opcode);

bool is_invoke_range(Opcode opcode);

bool is_move_result(Opcode opcode);

} // namespace opcode

} // namespace droidflow

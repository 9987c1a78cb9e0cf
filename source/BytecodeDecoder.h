/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <droidflow/Compiler.h>
#include <droidflow/Diagnostics.h>
#include <droidflow/Instruction.h>

namespace droidflow {

/* The instruction stream of a method ends in the middle of an instruction. */
class DecodeError : public std::runtime_error {
 public:
  DecodeError(std::uint32_t offset, const std::string& message);

  std::uint32_t offset() const {
    return offset_;
  }

 private:
  std::uint32_t offset_;
};

/**
 * Decode the instruction stream of a method, given as 16-bit code units.
 *
 * Switch and array payloads embedded in the stream are skipped. An unused
 * opcode value is skipped one code unit at a time and reported in
 * `diagnostics` (under `location`) when it is provided. A truncated
 * instruction throws `DecodeError`.
 */
std::vector<Instruction> decode_bytecode(
    const std::vector<std::uint16_t>& code_units,
    Diagnostics* DF_NULLABLE diagnostics = nullptr,
    const std::string& location = "");

} // namespace droidflow

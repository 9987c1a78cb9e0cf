/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>

#include <droidflow/Assert.h>
#include <droidflow/BytecodeDecoder.h>
#include <droidflow/Log.h>

namespace droidflow {

DecodeError::DecodeError(std::uint32_t offset, const std::string& message)
    : std::runtime_error(fmt::format("at offset {:#x}: {}", offset, message)),
      offset_(offset) {}

namespace {

/* Sign-extend the `Width` low bits of `value`. */
template <unsigned Width>
std::int64_t signext(std::uint64_t value) {
  static_assert(Width > 0 && Width <= 64, "invalid width");
  return static_cast<std::int64_t>(value << (64 - Width)) >> (64 - Width);
}

class Decoder {
 public:
  Decoder(
      const std::vector<std::uint16_t>& code_units,
      Diagnostics* DF_NULLABLE diagnostics,
      const std::string& location)
      : code_units_(code_units),
        diagnostics_(diagnostics),
        location_(location) {}

  std::vector<Instruction> run() {
    std::vector<Instruction> instructions;
    std::size_t position = 0;
    while (position < code_units_.size()) {
      std::uint16_t first = code_units_[position];

      if (auto payload = payload_size(position)) {
        position += *payload;
        continue;
      }

      auto opcode = opcode::from_byte(first & 0xff);
      if (!opcode) {
        if (diagnostics_ != nullptr) {
          diagnostics_->add(
              ErrorKind::UnknownOpcode,
              location_,
              fmt::format(
                  "Unknown opcode {:#04x} at offset {:#x}",
                  first & 0xff,
                  position));
        }
        LOG(5,
            "Skipping unknown opcode {:#04x} in `{}`",
            first & 0xff,
            location_);
        position++;
        continue;
      }

      auto size = opcode::size(opcode::format(*opcode));
      if (position + size > code_units_.size()) {
        throw DecodeError(
            position,
            fmt::format(
                "truncated `{}` instruction: needs {} code units, {} left",
                opcode::mnemonic(*opcode),
                size,
                code_units_.size() - position));
      }

      instructions.push_back(decode(*opcode, position));
      position += size;
    }
    return instructions;
  }

 private:
  std::uint16_t unit(std::size_t position, std::size_t index) const {
    return code_units_[position + index];
  }

  std::uint32_t unit32(std::size_t position, std::size_t index) const {
    return static_cast<std::uint32_t>(unit(position, index)) |
        (static_cast<std::uint32_t>(unit(position, index + 1)) << 16);
  }

  /**
   * Size in code units of the payload starting at `position`, or nothing if
   * there is no payload there.
   */
  std::optional<std::size_t> payload_size(std::size_t position) const {
    std::uint16_t identifier = code_units_[position];
    if (identifier != FOPCODE_PACKED_SWITCH &&
        identifier != FOPCODE_SPARSE_SWITCH &&
        identifier != FOPCODE_FILLED_ARRAY) {
      return std::nullopt;
    }

    std::size_t header_size =
        identifier == FOPCODE_FILLED_ARRAY ? 4 : 2;
    if (position + header_size > code_units_.size()) {
      throw DecodeError(position, "truncated payload header");
    }

    std::size_t size = 0;
    if (identifier == FOPCODE_PACKED_SWITCH) {
      size = 4 + static_cast<std::size_t>(unit(position, 1)) * 2;
    } else if (identifier == FOPCODE_SPARSE_SWITCH) {
      size = 2 + static_cast<std::size_t>(unit(position, 1)) * 4;
    } else {
      std::uint64_t element_width = unit(position, 1);
      std::uint64_t element_count = unit32(position, 2);
      size = 4 + (element_count * element_width + 1) / 2;
    }

    if (position + size > code_units_.size()) {
      throw DecodeError(
          position,
          fmt::format(
              "truncated payload: needs {} code units, {} left",
              size,
              code_units_.size() - position));
    }
    return size;
  }

  Instruction decode(Opcode opcode, std::size_t position) const {
    std::uint16_t first = unit(position, 0);
    std::uint32_t high_byte = first >> 8;
    std::uint32_t nibble_a = (first >> 8) & 0xf;
    std::uint32_t nibble_b = first >> 12;

    std::vector<Register> registers;
    std::optional<std::int64_t> literal;
    std::optional<std::int32_t> branch_offset;
    std::optional<std::uint32_t> index;
    std::optional<std::uint32_t> proto_index;

    switch (opcode::format(opcode)) {
      case FMT_f10x:
        break;
      case FMT_f12x:
      case FMT_f12x_2:
        registers = {nibble_a, nibble_b};
        break;
      case FMT_f11n:
        registers = {nibble_a};
        literal = signext<4>(nibble_b);
        break;
      case FMT_f11x_d:
      case FMT_f11x_s:
        registers = {high_byte};
        break;
      case FMT_f10t:
        branch_offset = static_cast<std::int32_t>(signext<8>(high_byte));
        break;
      case FMT_f20t:
        branch_offset =
            static_cast<std::int32_t>(signext<16>(unit(position, 1)));
        break;
      case FMT_f22x:
        registers = {high_byte, unit(position, 1)};
        break;
      case FMT_f21t:
        registers = {high_byte};
        branch_offset =
            static_cast<std::int32_t>(signext<16>(unit(position, 1)));
        break;
      case FMT_f21s:
        registers = {high_byte};
        literal = signext<16>(unit(position, 1));
        break;
      case FMT_f21h: {
        registers = {high_byte};
        std::uint64_t bits = unit(position, 1);
        if (opcode == DOPCODE_CONST_WIDE_HIGH16) {
          literal = static_cast<std::int64_t>(bits << 48);
        } else {
          literal = signext<32>(bits << 16);
        }
        break;
      }
      case FMT_f21c_d:
      case FMT_f21c_s:
        registers = {high_byte};
        index = unit(position, 1);
        break;
      case FMT_f23x_d:
      case FMT_f23x_s: {
        std::uint16_t second = unit(position, 1);
        registers = {
            high_byte,
            static_cast<Register>(second & 0xff),
            static_cast<Register>(second >> 8)};
        break;
      }
      case FMT_f22b: {
        std::uint16_t second = unit(position, 1);
        registers = {high_byte, static_cast<Register>(second & 0xff)};
        literal = signext<8>(second >> 8);
        break;
      }
      case FMT_f22t:
        registers = {nibble_a, nibble_b};
        branch_offset =
            static_cast<std::int32_t>(signext<16>(unit(position, 1)));
        break;
      case FMT_f22s:
        registers = {nibble_a, nibble_b};
        literal = signext<16>(unit(position, 1));
        break;
      case FMT_f22c_d:
      case FMT_f22c_s:
        registers = {nibble_a, nibble_b};
        index = unit(position, 1);
        break;
      case FMT_f30t:
        branch_offset = static_cast<std::int32_t>(unit32(position, 1));
        break;
      case FMT_f32x:
        registers = {unit(position, 1), unit(position, 2)};
        break;
      case FMT_f31i:
        registers = {high_byte};
        literal = signext<32>(unit32(position, 1));
        break;
      case FMT_f31t:
        registers = {high_byte};
        branch_offset = static_cast<std::int32_t>(unit32(position, 1));
        break;
      case FMT_f31c:
        registers = {high_byte};
        index = unit32(position, 1);
        break;
      case FMT_f35c:
        registers = argument_list(opcode, position);
        index = unit(position, 1);
        break;
      case FMT_f45cc:
        registers = argument_list(opcode, position);
        index = unit(position, 1);
        proto_index = unit(position, 3);
        break;
      case FMT_f3rc:
        registers = argument_range(position);
        index = unit(position, 1);
        break;
      case FMT_f4rcc:
        registers = argument_range(position);
        index = unit(position, 1);
        proto_index = unit(position, 3);
        break;
      case FMT_f51l: {
        registers = {high_byte};
        std::uint64_t bits = static_cast<std::uint64_t>(unit32(position, 1)) |
            (static_cast<std::uint64_t>(unit32(position, 3)) << 32);
        literal = static_cast<std::int64_t>(bits);
        break;
      }
      default:
        df_unreachable();
    }

    std::optional<Register> destination;
    std::vector<Register> sources;
    switch (opcode::register_role(opcode)) {
      case RegisterRole::None:
        break;
      case RegisterRole::Def:
        df_assert(!registers.empty());
        destination = registers.front();
        sources.assign(registers.begin() + 1, registers.end());
        break;
      case RegisterRole::Use:
        sources = std::move(registers);
        break;
      case RegisterRole::DefUse:
        df_assert(!registers.empty());
        destination = registers.front();
        sources = std::move(registers);
        break;
    }

    std::optional<IndexOperand> index_operand;
    if (index) {
      index_operand = IndexOperand{opcode::index_kind(opcode), *index};
    }

    return Instruction(
        opcode,
        static_cast<std::uint32_t>(position),
        destination,
        std::move(sources),
        literal,
        branch_offset,
        index_operand,
        proto_index);
  }

  /* Registers of the `35c` and `45cc` formats: `A|G|op BBBB F|E|D|C`. */
  std::vector<Register> argument_list(Opcode opcode, std::size_t position)
      const {
    std::uint16_t first = unit(position, 0);
    std::uint32_t count = first >> 12;
    if (count > 5) {
      throw DecodeError(
          position,
          fmt::format(
              "`{}` with {} arguments, at most 5 are encodable",
              opcode::mnemonic(opcode),
              count));
    }

    std::uint16_t packed = unit(position, 2);
    const Register candidates[5] = {
        static_cast<Register>(packed & 0xf),
        static_cast<Register>((packed >> 4) & 0xf),
        static_cast<Register>((packed >> 8) & 0xf),
        static_cast<Register>(packed >> 12),
        static_cast<Register>((first >> 8) & 0xf),
    };
    return std::vector<Register>(candidates, candidates + count);
  }

  /* Registers of the `3rc` and `4rcc` formats: `AA|op BBBB CCCC`. */
  std::vector<Register> argument_range(std::size_t position) const {
    std::uint32_t count = unit(position, 0) >> 8;
    Register first_register = unit(position, 2);
    std::vector<Register> registers;
    registers.reserve(count);
    for (std::uint32_t i = 0; i < count; i++) {
      registers.push_back(first_register + i);
    }
    return registers;
  }

 private:
  const std::vector<std::uint16_t>& code_units_;
  Diagnostics* DF_NULLABLE diagnostics_;
  const std::string& location_;
};

} // namespace

std::vector<Instruction> decode_bytecode(
    const std::vector<std::uint16_t>& code_units,
    Diagnostics* DF_NULLABLE diagnostics,
    const std::string& location) {
  return Decoder(code_units, diagnostics, location).run();
}

} // namespace droidflow

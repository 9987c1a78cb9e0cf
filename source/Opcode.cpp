/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <droidflow/Assert.h>
#include <droidflow/Opcode.h>

namespace droidflow {

std::string_view show(OpcodeFamily family) {
  switch (family) {
    case OpcodeFamily::Const:
      return "const";
    case OpcodeFamily::Invoke:
      return "invoke";
    case OpcodeFamily::Move:
      return "move";
    case OpcodeFamily::Branch:
      return "branch";
    case OpcodeFamily::Return:
      return "return";
    case OpcodeFamily::Other:
      return "other";
  }
  df_unreachable();
}

std::string_view show(IndexKind kind) {
  switch (kind) {
    case IndexKind::None:
      return "none";
    case IndexKind::String:
      return "string";
    case IndexKind::Type:
      return "type";
    case IndexKind::Field:
      return "field";
    case IndexKind::Method:
      return "method";
    case IndexKind::CallSite:
      return "call_site";
  }
  df_unreachable();
}

namespace opcode {

std::optional<Opcode> from_byte(std::uint8_t value) {
  switch (value) {
#define OP(op, code, ...) \
  case code:              \
    return DOPCODE_##op;
    DOPS
#undef OP
    default:
      return std::nullopt;
  }
}

std::string_view mnemonic(Opcode opcode) {
  switch (opcode) {
#define OP(op, code, fmt, name) \
  case DOPCODE_##op:            \
    return name;
    DOPS
#undef OP
    case FOPCODE_PACKED_SWITCH:
      return "packed-switch-payload";
    case FOPCODE_SPARSE_SWITCH:
      return "sparse-switch-payload";
    case FOPCODE_FILLED_ARRAY:
      return "fill-array-data-payload";
    default:
      return "unknown";
  }
}

OpcodeFormat format(Opcode opcode) {
  df_assert_log(
      from_byte(static_cast<std::uint8_t>(opcode)) == opcode,
      "no format for opcode {:#x}",
      static_cast<unsigned>(opcode));
  return dex_opcode::format(opcode);
}

OpcodeFamily family(Opcode opcode) {
  if (is_invoke(opcode)) {
    return OpcodeFamily::Invoke;
  }
  if (dex_opcode::is_literal_const(opcode) || opcode == DOPCODE_CONST_STRING ||
      opcode == DOPCODE_CONST_STRING_JUMBO || opcode == DOPCODE_CONST_CLASS) {
    return OpcodeFamily::Const;
  }
  if (dex_opcode::is_move(opcode) || is_move_result(opcode) ||
      opcode == DOPCODE_MOVE_EXCEPTION) {
    return OpcodeFamily::Move;
  }
  if (dex_opcode::is_branch(opcode)) {
    return OpcodeFamily::Branch;
  }
  if (dex_opcode::is_return(opcode)) {
    return OpcodeFamily::Return;
  }
  return OpcodeFamily::Other;
}

RegisterRole register_role(Opcode opcode) {
  // The cast narrows the type of its register.
  if (opcode == DOPCODE_CHECK_CAST) {
    return RegisterRole::DefUse;
  }

  switch (format(opcode)) {
    case FMT_f10x:
    case FMT_f10t:
    case FMT_f20t:
    case FMT_f30t:
      return RegisterRole::None;
    case FMT_f12x_2:
      return RegisterRole::DefUse;
    case FMT_f11x_s:
    case FMT_f21c_s:
    case FMT_f23x_s:
    case FMT_f22c_s:
    case FMT_f21t:
    case FMT_f22t:
    case FMT_f31t:
    case FMT_f35c:
    case FMT_f3rc:
    case FMT_f45cc:
    case FMT_f4rcc:
      return RegisterRole::Use;
    default:
      return RegisterRole::Def;
  }
}

IndexKind index_kind(Opcode opcode) {
  if (dex_opcode::is_iget(opcode) || dex_opcode::is_iput(opcode) ||
      dex_opcode::is_sget(opcode) || dex_opcode::is_sput(opcode)) {
    return IndexKind::Field;
  }
  switch (opcode) {
    case DOPCODE_CONST_STRING:
    case DOPCODE_CONST_STRING_JUMBO:
      return IndexKind::String;
    case DOPCODE_CONST_CLASS:
    case DOPCODE_CHECK_CAST:
    case DOPCODE_INSTANCE_OF:
    case DOPCODE_NEW_INSTANCE:
    case DOPCODE_NEW_ARRAY:
    case DOPCODE_FILLED_NEW_ARRAY:
    case DOPCODE_FILLED_NEW_ARRAY_RANGE:
      return IndexKind::Type;
    case DOPCODE_INVOKE_CUSTOM:
    case DOPCODE_INVOKE_CUSTOM_RANGE:
      return IndexKind::CallSite;
    default:
      return is_invoke(opcode) ? IndexKind::Method : IndexKind::None;
  }
}

std::size_t size(OpcodeFormat format) {
  switch (format) {
    case FMT_f10x:
    case FMT_f12x:
    case FMT_f12x_2:
    case FMT_f11n:
    case FMT_f11x_d:
    case FMT_f11x_s:
    case FMT_f10t:
      return 1;
    case FMT_f20t:
    case FMT_f22x:
    case FMT_f21t:
    case FMT_f21s:
    case FMT_f21h:
    case FMT_f21c_d:
    case FMT_f21c_s:
    case FMT_f23x_d:
    case FMT_f23x_s:
    case FMT_f22b:
    case FMT_f22t:
    case FMT_f22s:
    case FMT_f22c_d:
    case FMT_f22c_s:
      return 2;
    case FMT_f30t:
    case FMT_f32x:
    case FMT_f31i:
    case FMT_f31t:
    case FMT_f31c:
    case FMT_f35c:
    case FMT_f3rc:
      return 3;
    case FMT_f45cc:
    case FMT_f4rcc:
      return 4;
    case FMT_f51l:
      return 5;
    default:
      df_unreachable();
  }
}

bool is_invoke(Opcode opcode) {
  return dex_opcode::is_invoke(opcode) || opcode == DOPCODE_INVOKE_POLYMORPHIC ||
      opcode == DOPCODE_INVOKE_POLYMORPHIC_RANGE ||
      opcode == DOPCODE_INVOKE_CUSTOM || opcode == DOPCODE_INVOKE_CUSTOM_RANGE;
}

bool is_instance_invoke(Opcode opcode) {
  switch (opcode) {
    case DOPCODE_INVOKE_VIRTUAL:
    case DOPCODE_INVOKE_SUPER:
    case DOPCODE_INVOKE_DIRECT:
    case DOPCODE_INVOKE_INTERFACE:
    case DOPCODE_INVOKE_VIRTUAL_RANGE:
    case DOPCODE_INVOKE_SUPER_RANGE:
    case DOPCODE_INVOKE_DIRECT_RANGE:
    case DOPCODE_INVOKE_INTERFACE_RANGE:
    case DOPCODE_INVOKE_POLYMORPHIC:
    case DOPCODE_INVOKE_POLYMORPHIC_RANGE:
      return true;
    default:
      return false;
  }
}

bool is_invoke_range(Opcode opcode) {
  return dex_opcode::is_invoke_range(opcode) ||
      opcode == DOPCODE_INVOKE_POLYMORPHIC_RANGE ||
      opcode == DOPCODE_INVOKE_CUSTOM_RANGE;
}

bool is_move_result(Opcode opcode) {
  return opcode == DOPCODE_MOVE_RESULT || opcode == DOPCODE_MOVE_RESULT_WIDE ||
      opcode == DOPCODE_MOVE_RESULT_OBJECT;
}

} // namespace opcode

} // namespace droidflow

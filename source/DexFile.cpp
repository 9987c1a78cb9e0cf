/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <cstring>
#include <fstream>
#include <iterator>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include <fmt/format.h>

#include <DexClass.h>
#include <DexDefs.h>
#include <DexEncoding.h>
#include <DexLoader.h>
#include <RedexException.h>

#include <droidflow/BytecodeDecoder.h>
#include <droidflow/DexFile.h>
#include <droidflow/Errors.h>
#include <droidflow/GlobalRedexContext.h>
#include <droidflow/Log.h>
#include <droidflow/TypeNames.h>

namespace droidflow {

namespace {

/* `g_redex` is process-wide: bytecode files are loaded one at a time. */
std::mutex redex_mutex;

/* A class or a method that redex would read out of bounds. */
class ScreeningError : public std::runtime_error {
 public:
  explicit ScreeningError(const std::string& message)
      : std::runtime_error(message) {}
};

template <typename T>
T read_struct(const std::vector<std::uint8_t>& bytes, std::size_t offset) {
  T value;
  std::memcpy(&value, bytes.data() + offset, sizeof(T));
  return value;
}

template <typename T>
void write_struct(
    std::vector<std::uint8_t>& bytes,
    std::size_t offset,
    const T& value) {
  std::memcpy(bytes.data() + offset, &value, sizeof(T));
}

/**
 * Redex trusts the offsets and indices of a bytecode file once its header
 * is valid. The screen checks what redex does not and produces the copy of
 * the file that redex loads:
 *   - a class with out-of-bounds data, or the second definition of a class,
 *     is removed from the class definitions;
 *   - a method whose code item is out of bounds loses its body;
 *   - a body that redex cannot decode (unknown or truncated instructions,
 *     call sites, out-of-range indices) is emptied in the copy, droidflow
 *     still decodes the original code units;
 *   - annotations, static values, try blocks and debug information, which
 *     droidflow does not model, are dropped.
 */
class Screen {
 public:
  Screen(const std::string& location, const std::vector<std::uint8_t>& bytes)
      : location_(location), bytes_(bytes) {}

  std::vector<std::uint8_t> run() {
    if (bytes_.size() < sizeof(dex_header)) {
      throw MalformedDexError(
          location_,
          fmt::format(
              "file size {} is smaller than the header", bytes_.size()));
    }
    header_ = read_struct<dex_header>(bytes_, 0);

    try {
      check_tables();
    } catch (const ScreeningError& error) {
      throw MalformedDexError(location_, error.what());
    }

    std::vector<std::uint8_t> screened = bytes_;
    std::vector<dex_class_def> accepted;
    std::unordered_set<std::uint32_t> class_types;
    for (std::uint32_t i = 0; i < header_.class_defs_size; i++) {
      auto class_def = read_struct<dex_class_def>(
          bytes_, header_.class_defs_off + i * sizeof(dex_class_def));
      try {
        check_class(class_def, screened);
      } catch (const ScreeningError& error) {
        diagnostics_.add(
            ErrorKind::MalformedDex,
            fmt::format("{}:class_def[{}]", location_, i),
            error.what());
        continue;
      }
      if (!class_types.insert(class_def.typeidx).second) {
        diagnostics_.add(
            ErrorKind::DuplicateClass,
            fmt::format("{}:class_def[{}]", location_, i),
            "Class is defined twice in the same bytecode file, keeping the first definition.");
        continue;
      }
      class_def.source_file_idx = DEX_NO_INDEX;
      class_def.annotations_off = 0;
      class_def.static_values_off = 0;
      accepted.push_back(class_def);
    }

    for (std::size_t i = 0; i < accepted.size(); i++) {
      write_struct(
          screened,
          header_.class_defs_off + i * sizeof(dex_class_def),
          accepted[i]);
    }
    auto header = header_;
    header.class_defs_size = static_cast<std::uint32_t>(accepted.size());
    write_struct(screened, 0, header);
    return screened;
  }

  std::unordered_map<std::uint32_t, DexCodeItem>& code_items() {
    return code_items_;
  }

  Diagnostics& diagnostics() {
    return diagnostics_;
  }

 private:
  void check(std::uint64_t offset, std::uint64_t length, const char* what)
      const {
    if (offset > bytes_.size() || length > bytes_.size() - offset) {
      throw ScreeningError(fmt::format(
          "{} at offset {:#x} (length {}) is out of bounds (file size {})",
          what,
          offset,
          length,
          bytes_.size()));
    }
  }

  void check_index(std::uint32_t index, std::uint32_t size, const char* what)
      const {
    if (index >= size) {
      throw ScreeningError(fmt::format(
          "{} index {} is out of range ({} entries)", what, index, size));
    }
  }

  std::uint32_t u32(std::size_t offset) const {
    check(offset, 4, "u32");
    return read_struct<std::uint32_t>(bytes_, offset);
  }

  std::uint16_t u16(std::size_t offset) const {
    check(offset, 2, "u16");
    return read_struct<std::uint16_t>(bytes_, offset);
  }

  /* Read an unsigned LEB128 value and advance `offset` past it. */
  std::uint32_t uleb128(std::size_t& offset) const {
    std::size_t length = 1;
    for (;; length++) {
      if (length > 5) {
        throw ScreeningError(
            fmt::format("uleb128 at offset {:#x} is too long", offset));
      }
      check(offset, length, "uleb128");
      if ((bytes_[offset + length - 1] & 0x80) == 0) {
        break;
      }
    }
    const std::uint8_t* data = bytes_.data() + offset;
    std::uint32_t value = read_uleb128(&data);
    offset += length;
    return value;
  }

  void check_type_list(std::uint32_t offset, const char* what) const {
    if (offset == 0) {
      return;
    }
    std::uint32_t size = u32(offset);
    check(offset + 4, static_cast<std::uint64_t>(size) * 2, what);
    for (std::uint32_t i = 0; i < size; i++) {
      check_index(u16(offset + 4 + i * 2), header_.type_ids_size, "type");
    }
  }

  /* The entries of the string, field, method and proto tables. */
  void check_tables() const {
    check(
        header_.class_defs_off,
        static_cast<std::uint64_t>(header_.class_defs_size) *
            sizeof(dex_class_def),
        "class definitions");

    check(
        header_.string_ids_off,
        static_cast<std::uint64_t>(header_.string_ids_size) * 4,
        "string ids");
    for (std::uint32_t i = 0; i < header_.string_ids_size; i++) {
      std::size_t offset = u32(header_.string_ids_off + i * 4);
      uleb128(offset); // utf16 size
      check(offset, 1, "string data");
      if (std::memchr(bytes_.data() + offset, 0, bytes_.size() - offset) ==
          nullptr) {
        throw ScreeningError(
            fmt::format("unterminated string at offset {:#x}", offset));
      }
    }

    check(
        header_.proto_ids_off,
        static_cast<std::uint64_t>(header_.proto_ids_size) *
            sizeof(dex_proto_id),
        "proto ids");
    for (std::uint32_t i = 0; i < header_.proto_ids_size; i++) {
      auto proto = read_struct<dex_proto_id>(
          bytes_, header_.proto_ids_off + i * sizeof(dex_proto_id));
      check_index(proto.shortyidx, header_.string_ids_size, "string");
      check_index(proto.rtypeidx, header_.type_ids_size, "type");
      check_type_list(proto.param_off, "parameter list");
    }

    check(
        header_.field_ids_off,
        static_cast<std::uint64_t>(header_.field_ids_size) *
            sizeof(dex_field_id),
        "field ids");
    for (std::uint32_t i = 0; i < header_.field_ids_size; i++) {
      auto field = read_struct<dex_field_id>(
          bytes_, header_.field_ids_off + i * sizeof(dex_field_id));
      check_index(field.classidx, header_.type_ids_size, "type");
      check_index(field.typeidx, header_.type_ids_size, "type");
      check_index(field.nameidx, header_.string_ids_size, "string");
    }

    check(
        header_.method_ids_off,
        static_cast<std::uint64_t>(header_.method_ids_size) *
            sizeof(dex_method_id),
        "method ids");
    for (std::uint32_t i = 0; i < header_.method_ids_size; i++) {
      auto method = read_struct<dex_method_id>(
          bytes_, header_.method_ids_off + i * sizeof(dex_method_id));
      check_index(method.classidx, header_.type_ids_size, "type");
      check_index(method.protoidx, header_.proto_ids_size, "proto");
      check_index(method.nameidx, header_.string_ids_size, "string");
    }
  }

  void check_class(
      const dex_class_def& class_def,
      std::vector<std::uint8_t>& screened) {
    check_index(class_def.typeidx, header_.type_ids_size, "class type");
    if (class_def.super_idx != DEX_NO_INDEX) {
      check_index(class_def.super_idx, header_.type_ids_size, "superclass");
    }
    check_type_list(class_def.interfaces_off, "interface list");
    if (class_def.class_data_offset == 0) {
      return;
    }

    std::size_t offset = class_def.class_data_offset;
    std::uint32_t static_fields_size = uleb128(offset);
    std::uint32_t instance_fields_size = uleb128(offset);
    std::uint32_t direct_methods_size = uleb128(offset);
    std::uint32_t virtual_methods_size = uleb128(offset);

    for (auto fields_size : {static_fields_size, instance_fields_size}) {
      std::uint32_t field_index = 0;
      for (std::uint32_t i = 0; i < fields_size; i++) {
        field_index += uleb128(offset);
        uleb128(offset); // access flags
        check_index(field_index, header_.field_ids_size, "field");
      }
    }

    std::unordered_set<std::uint32_t> method_indices;
    for (auto methods_size : {direct_methods_size, virtual_methods_size}) {
      std::uint32_t method_index = 0;
      for (std::uint32_t i = 0; i < methods_size; i++) {
        method_index += uleb128(offset);
        uleb128(offset); // access flags
        std::size_t code_offset_position = offset;
        std::uint32_t code_offset = uleb128(offset);
        check_index(method_index, header_.method_ids_size, "method");
        if (!method_indices.insert(method_index).second) {
          throw ScreeningError(
              fmt::format("method {} is defined twice", method_index));
        }
        if (code_offset != 0) {
          check_code(
              method_index,
              code_offset,
              code_offset_position,
              offset - code_offset_position,
              screened);
        }
      }
    }
  }

  void check_code(
      std::uint32_t method_index,
      std::uint32_t code_offset,
      std::size_t code_offset_position,
      std::size_t code_offset_width,
      std::vector<std::uint8_t>& screened) {
    dex_code_item item;
    try {
      check(code_offset, sizeof(dex_code_item), "code item");
      item = read_struct<dex_code_item>(bytes_, code_offset);
      check(
          code_offset + sizeof(dex_code_item),
          static_cast<std::uint64_t>(item.insns_size) * 2,
          "code item instructions");
    } catch (const ScreeningError& error) {
      diagnostics_.add(
          ErrorKind::MethodDecodeFailure,
          fmt::format("{}:method[{}]", location_, method_index),
          error.what());
      // A zero code offset of the same width, e.g. `80 80 00`.
      for (std::size_t i = 0; i < code_offset_width; i++) {
        screened[code_offset_position + i] =
            i + 1 < code_offset_width ? 0x80 : 0x00;
      }
      return;
    }

    DexCodeItem code;
    code.registers_size = item.registers_size;
    code.ins_size = item.ins_size;
    code.outs_size = item.outs_size;
    code.instructions.resize(item.insns_size);
    if (item.insns_size > 0) {
      std::memcpy(
          code.instructions.data(),
          bytes_.data() + code_offset + sizeof(dex_code_item),
          static_cast<std::size_t>(item.insns_size) * 2);
    }

    auto stripped = item;
    stripped.tries_size = 0;
    stripped.debug_info_off = 0;
    if (!redex_decodes(code.instructions)) {
      stripped.insns_size = 0;
    }
    write_struct(screened, code_offset, stripped);

    code_items_.emplace(method_index, std::move(code));
  }

  bool redex_decodes(const std::vector<std::uint16_t>& code_units) const {
    Diagnostics unknown_opcodes;
    std::vector<Instruction> instructions;
    try {
      instructions = decode_bytecode(code_units, &unknown_opcodes);
    } catch (const DecodeError&) {
      return false;
    }
    if (!unknown_opcodes.empty()) {
      return false;
    }

    for (const auto& instruction : instructions) {
      if (instruction.proto_index()) {
        return false;
      }
      const auto& index = instruction.index();
      if (!index) {
        continue;
      }
      std::uint32_t size = 0;
      switch (index->kind) {
        case IndexKind::String:
          size = header_.string_ids_size;
          break;
        case IndexKind::Type:
          size = header_.type_ids_size;
          break;
        case IndexKind::Field:
          size = header_.field_ids_size;
          break;
        case IndexKind::Method:
          size = header_.method_ids_size;
          break;
        case IndexKind::CallSite:
        case IndexKind::None:
          return false;
      }
      if (index->value >= size) {
        return false;
      }
    }
    return true;
  }

 private:
  const std::string& location_;
  const std::vector<std::uint8_t>& bytes_;
  dex_header header_{};
  std::unordered_map<std::uint32_t, DexCodeItem> code_items_;
  Diagnostics diagnostics_;
};

std::string java_name(const DexType* type) {
  return type_names::java_name(type->get_name()->str());
}

MethodReference to_method_reference(const DexMethodRef* method) {
  std::vector<std::string> parameter_types;
  const auto* arguments = method->get_proto()->get_args();
  if (arguments != nullptr) {
    for (const auto* type : *arguments) {
      parameter_types.push_back(java_name(type));
    }
  }
  return MethodReference(
      java_name(method->get_class()),
      method->get_name()->str(),
      std::move(parameter_types),
      java_name(method->get_proto()->get_rtype()));
}

void convert_fields(
    const std::vector<::DexField*>& redex_fields,
    std::vector<DexFieldDefinition>& fields) {
  for (const auto* field : redex_fields) {
    fields.push_back(DexFieldDefinition{
        field->get_name()->str(),
        java_name(field->get_type()),
        static_cast<std::uint32_t>(field->get_access())});
  }
}

void convert_methods(
    const std::vector<::DexMethod*>& redex_methods,
    const std::unordered_map<const DexMethodRef*, std::uint32_t>&
        method_indices,
    std::unordered_map<std::uint32_t, DexCodeItem>& code_items,
    std::vector<DexMethodDefinition>& methods) {
  for (const auto* method : redex_methods) {
    auto method_index = method_indices.at(method);
    DexMethodDefinition definition{
        method_index,
        static_cast<std::uint32_t>(method->get_access()),
        std::nullopt};
    auto code = code_items.find(method_index);
    if (code != code_items.end()) {
      definition.code = std::move(code->second);
      code_items.erase(code);
    }
    methods.push_back(std::move(definition));
  }
}

DexClassDefinition convert_class(
    const ::DexClass* redex_class,
    const std::unordered_map<const DexMethodRef*, std::uint32_t>&
        method_indices,
    std::unordered_map<std::uint32_t, DexCodeItem>& code_items) {
  DexClassDefinition definition;
  definition.class_name = java_name(redex_class->get_type());
  definition.access_flags =
      static_cast<std::uint32_t>(redex_class->get_access());
  if (const auto* superclass = redex_class->get_super_class()) {
    definition.superclass = java_name(superclass);
  }
  if (const auto* interfaces = redex_class->get_interfaces()) {
    for (const auto* interface : *interfaces) {
      definition.interfaces.push_back(java_name(interface));
    }
  }

  convert_fields(redex_class->get_sfields(), definition.fields);
  convert_fields(redex_class->get_ifields(), definition.fields);
  convert_methods(
      redex_class->get_dmethods(),
      method_indices,
      code_items,
      definition.methods);
  convert_methods(
      redex_class->get_vmethods(),
      method_indices,
      code_items,
      definition.methods);
  return definition;
}

} // namespace

DexFile::DexFile(
    std::string location,
    std::vector<MethodReference> method_references,
    std::vector<DexClassDefinition> classes,
    Diagnostics diagnostics)
    : location_(std::move(location)),
      method_references_(std::move(method_references)),
      classes_(std::move(classes)),
      diagnostics_(std::move(diagnostics)) {}

DexFile DexFile::parse(
    std::string location,
    const std::vector<std::uint8_t>& bytes) {
  Screen screen(location, bytes);
  auto screened = screen.run();

  std::lock_guard<std::mutex> lock(redex_mutex);
  GlobalRedexContext redex_context(/* allow_class_duplicates */ false);
  try {
    auto loader = DexLoader::create(
        DexLocation::make_location("dex", location),
        DexLoader::DataUPtr(screened.data(), [](const std::uint8_t*) {}),
        screened.size(),
        /* support_dex_version */ 39,
        DexLoader::Parallel::kNo);
    auto* index = loader.get_idx();

    std::vector<MethodReference> method_references;
    std::unordered_map<const DexMethodRef*, std::uint32_t> method_indices;
    method_references.reserve(index->get_method_ids_size());
    for (std::uint32_t i = 0; i < index->get_method_ids_size(); i++) {
      const auto* method = index->get_methodidx(i);
      method_indices.emplace(method, i);
      method_references.push_back(to_method_reference(method));
    }

    std::vector<DexClassDefinition> classes;
    for (const auto* redex_class : loader.get_classes()) {
      classes.push_back(
          convert_class(redex_class, method_indices, screen.code_items()));
    }

    return DexFile(
        std::move(location),
        std::move(method_references),
        std::move(classes),
        std::move(screen.diagnostics()));
  } catch (const RedexException& error) {
    throw MalformedDexError(location, error.what());
  }
}

DexFile DexFile::read(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios_base::binary);
  if (!file) {
    throw MalformedDexError(path.string(), "unable to open file");
  }
  std::vector<std::uint8_t> bytes(
      (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  LOG(3, "Read {} bytes from `{}`.", bytes.size(), path.string());
  return parse(path.filename().string(), bytes);
}

const MethodReference& DexFile::method_reference(
    std::uint32_t method_index) const {
  if (method_index >= method_references_.size()) {
    throw NotFoundError(fmt::format(
        "Method index {} is out of range in `{}` ({} methods)",
        method_index,
        location_,
        method_references_.size()));
  }
  return method_references_[method_index];
}

} // namespace droidflow

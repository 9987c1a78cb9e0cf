/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <droidflow/Diagnostics.h>
#include <droidflow/IncludeMacros.h>
#include <droidflow/MethodReference.h>

namespace droidflow {

/* A method body: its register counts and raw 16-bit code units. */
struct DexCodeItem {
  std::uint16_t registers_size = 0;
  std::uint16_t ins_size = 0;
  std::uint16_t outs_size = 0;
  std::vector<std::uint16_t> instructions;
};

struct DexFieldDefinition {
  std::string name;
  /* Java name of the field type. */
  std::string type;
  std::uint32_t access_flags = 0;
};

struct DexMethodDefinition {
  /* Index in the method table of the bytecode file. */
  std::uint32_t method_index;
  std::uint32_t access_flags = 0;
  /* Absent for abstract and native methods. */
  std::optional<DexCodeItem> code;
};

/* A class definition with every type given by its Java name. */
struct DexClassDefinition {
  std::string class_name;
  std::uint32_t access_flags = 0;
  std::optional<std::string> superclass;
  std::vector<std::string> interfaces;
  /* Static fields, then instance fields. */
  std::vector<DexFieldDefinition> fields;
  /* Direct methods, then virtual methods. */
  std::vector<DexMethodDefinition> methods;
};

/**
 * The classes and the method table of one Dalvik executable.
 *
 * The header, the tables and the class definitions are loaded by redex. A
 * violation throws `MalformedDexError`. Problems local to one class or one
 * method (a bad class data or code item offset, a second definition of a
 * class) are recorded in `diagnostics()` and only drop that class or that
 * method body.
 */
class DexFile final {
 public:
  DexFile(
      std::string location,
      std::vector<MethodReference> method_references,
      std::vector<DexClassDefinition> classes,
      Diagnostics diagnostics = {});

  MOVE_CONSTRUCTOR_ONLY(DexFile)

  static DexFile parse(
      std::string location,
      const std::vector<std::uint8_t>& bytes);
  static DexFile read(const std::filesystem::path& path);

  const std::string& location() const {
    return location_;
  }

  /* Resolve an entry of the method table. Throws `NotFoundError`. */
  const MethodReference& method_reference(std::uint32_t method_index) const;

  std::size_t method_ids_size() const {
    return method_references_.size();
  }

  /* Class definitions in file order. */
  const std::vector<DexClassDefinition>& classes() const {
    return classes_;
  }

  const Diagnostics& diagnostics() const {
    return diagnostics_;
  }

 private:
  std::string location_;
  std::vector<MethodReference> method_references_;
  std::vector<DexClassDefinition> classes_;
  Diagnostics diagnostics_;
};

} // namespace droidflow

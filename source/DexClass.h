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
#include <vector>

#include <json/json.h>

#include <droidflow/Compiler.h>
#include <droidflow/MethodReference.h>

namespace droidflow {

namespace access_flags {

constexpr std::uint32_t k_public = 0x1;
constexpr std::uint32_t k_private = 0x2;
constexpr std::uint32_t k_protected = 0x4;
constexpr std::uint32_t k_static = 0x8;
constexpr std::uint32_t k_final = 0x10;
constexpr std::uint32_t k_synchronized = 0x20;
constexpr std::uint32_t k_native = 0x100;
constexpr std::uint32_t k_interface = 0x200;
constexpr std::uint32_t k_abstract = 0x400;
constexpr std::uint32_t k_synthetic = 0x1000;
constexpr std::uint32_t k_enum = 0x4000;
constexpr std::uint32_t k_constructor = 0x10000;

} // namespace access_flags

struct DexField {
  std::string name;
  std::string type;
  std::string class_name;
  std::uint32_t access_flags;

  bool is_static() const {
    return (access_flags & access_flags::k_static) != 0;
  }

  Json::Value to_json() const;
};

/* Position of a method in the method table of one bytecode file. */
struct MethodHandle {
  std::size_t dex_index;
  std::uint32_t method_index;
};

/**
 * A method defined in the package.
 *
 * The bytecode is kept as raw code units. It is decoded on demand by the
 * analyses that need instructions, and never cached.
 */
class DexMethod final {
 public:
  DexMethod(
      MethodReference reference,
      std::uint32_t access_flags,
      std::optional<std::vector<std::uint16_t>> bytecode,
      std::uint16_t registers_size,
      std::uint16_t ins_size,
      std::uint16_t outs_size,
      MethodHandle handle);

  const MethodReference& reference() const {
    return reference_;
  }

  const std::string& name() const {
    return reference_.name();
  }

  const std::string& class_name() const {
    return reference_.class_name();
  }

  const std::vector<std::string>& parameter_types() const {
    return reference_.parameter_types();
  }

  const std::string& return_type() const {
    return reference_.return_type();
  }

  std::uint32_t access_flags() const {
    return access_flags_;
  }

  /* Absent for abstract and native methods. */
  const std::optional<std::vector<std::uint16_t>>& bytecode() const {
    return bytecode_;
  }

  std::uint16_t registers_size() const {
    return registers_size_;
  }

  std::uint16_t ins_size() const {
    return ins_size_;
  }

  std::uint16_t outs_size() const {
    return outs_size_;
  }

  const MethodHandle& handle() const {
    return handle_;
  }

  bool is_public() const {
    return (access_flags_ & access_flags::k_public) != 0;
  }
  bool is_private() const {
    return (access_flags_ & access_flags::k_private) != 0;
  }
  bool is_protected() const {
    return (access_flags_ & access_flags::k_protected) != 0;
  }
  bool is_static() const {
    return (access_flags_ & access_flags::k_static) != 0;
  }
  bool is_final() const {
    return (access_flags_ & access_flags::k_final) != 0;
  }
  bool is_abstract() const {
    return (access_flags_ & access_flags::k_abstract) != 0;
  }
  bool is_native() const {
    return (access_flags_ & access_flags::k_native) != 0;
  }
  bool is_constructor() const {
    return name() == "<init>";
  }
  bool is_static_initializer() const {
    return name() == "<clinit>";
  }

  /* `com.example.Foo.bar(int):void` */
  std::string signature() const {
    return reference_.show();
  }

  Json::Value to_json() const;

 private:
  MethodReference reference_;
  std::uint32_t access_flags_;
  std::optional<std::vector<std::uint16_t>> bytecode_;
  std::uint16_t registers_size_;
  std::uint16_t ins_size_;
  std::uint16_t outs_size_;
  MethodHandle handle_;
};

/* A class defined in the package. Immutable once extracted. */
class DexClass final {
 public:
  DexClass(
      std::string class_name,
      std::optional<std::string> superclass,
      std::vector<std::string> interfaces,
      std::uint32_t access_flags,
      std::vector<DexMethod> methods,
      std::vector<DexField> fields,
      std::size_t dex_index);

  const std::string& class_name() const {
    return class_name_;
  }

  std::string package_name() const;
  std::string simple_name() const;

  const std::optional<std::string>& superclass() const {
    return superclass_;
  }

  const std::vector<std::string>& interfaces() const {
    return interfaces_;
  }

  std::uint32_t access_flags() const {
    return access_flags_;
  }

  const std::vector<DexMethod>& methods() const {
    return methods_;
  }

  const std::vector<DexField>& fields() const {
    return fields_;
  }

  /* The bytecode file the class was read from. */
  std::size_t dex_index() const {
    return dex_index_;
  }

  bool is_public() const {
    return (access_flags_ & access_flags::k_public) != 0;
  }
  bool is_final() const {
    return (access_flags_ & access_flags::k_final) != 0;
  }
  bool is_abstract() const {
    return (access_flags_ & access_flags::k_abstract) != 0;
  }
  bool is_interface() const {
    return (access_flags_ & access_flags::k_interface) != 0;
  }
  bool is_enum() const {
    return (access_flags_ & access_flags::k_enum) != 0;
  }

  /* First method with the given name, in declaration order. */
  const DexMethod* DF_NULLABLE find_method(const std::string& name) const;

  /* Every overload with the given name, in declaration order. */
  std::vector<const DexMethod*> find_methods(const std::string& name) const;

  Json::Value to_json() const;

 private:
  std::string class_name_;
  std::optional<std::string> superclass_;
  std::vector<std::string> interfaces_;
  std::uint32_t access_flags_;
  std::vector<DexMethod> methods_;
  std::vector<DexField> fields_;
  std::size_t dex_index_;
};

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <droidflow/DexClass.h>
#include <droidflow/TypeNames.h>

namespace droidflow {

Json::Value DexField::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["name"] = name;
  value["type"] = type;
  value["access_flags"] = Json::Value(access_flags);
  return value;
}

DexMethod::DexMethod(
    MethodReference reference,
    std::uint32_t access_flags,
    std::optional<std::vector<std::uint16_t>> bytecode,
    std::uint16_t registers_size,
    std::uint16_t ins_size,
    std::uint16_t outs_size,
    MethodHandle handle)
    : reference_(std::move(reference)),
      access_flags_(access_flags),
      bytecode_(std::move(bytecode)),
      registers_size_(registers_size),
      ins_size_(ins_size),
      outs_size_(outs_size),
      handle_(handle) {}

Json::Value DexMethod::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["signature"] = signature();
  value["access_flags"] = Json::Value(access_flags_);
  if (bytecode_) {
    value["code_units"] =
        Json::Value(static_cast<Json::UInt>(bytecode_->size()));
    value["registers"] = Json::Value(registers_size_);
  }
  return value;
}

DexClass::DexClass(
    std::string class_name,
    std::optional<std::string> superclass,
    std::vector<std::string> interfaces,
    std::uint32_t access_flags,
    std::vector<DexMethod> methods,
    std::vector<DexField> fields,
    std::size_t dex_index)
    : class_name_(std::move(class_name)),
      superclass_(std::move(superclass)),
      interfaces_(std::move(interfaces)),
      access_flags_(access_flags),
      methods_(std::move(methods)),
      fields_(std::move(fields)),
      dex_index_(dex_index) {}

std::string DexClass::package_name() const {
  return type_names::package_name(class_name_);
}

std::string DexClass::simple_name() const {
  return type_names::simple_name(class_name_);
}

const DexMethod* DexClass::find_method(const std::string& name) const {
  for (const auto& method : methods_) {
    if (method.name() == name) {
      return &method;
    }
  }
  return nullptr;
}

std::vector<const DexMethod*> DexClass::find_methods(
    const std::string& name) const {
  std::vector<const DexMethod*> result;
  for (const auto& method : methods_) {
    if (method.name() == name) {
      result.push_back(&method);
    }
  }
  return result;
}

Json::Value DexClass::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["class"] = class_name_;
  if (superclass_) {
    value["superclass"] = *superclass_;
  }
  auto interfaces_value = Json::Value(Json::arrayValue);
  for (const auto& interface : interfaces_) {
    interfaces_value.append(interface);
  }
  value["interfaces"] = interfaces_value;
  value["access_flags"] = Json::Value(access_flags_);
  value["dex_index"] = Json::Value(static_cast<Json::UInt>(dex_index_));

  auto methods_value = Json::Value(Json::arrayValue);
  for (const auto& method : methods_) {
    methods_value.append(method.to_json());
  }
  value["methods"] = methods_value;

  auto fields_value = Json::Value(Json::arrayValue);
  for (const auto& field : fields_) {
    fields_value.append(field.to_json());
  }
  value["fields"] = fields_value;
  return value;
}

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <unordered_set>

#include <fmt/format.h>

#include <droidflow/ClassTable.h>
#include <droidflow/Log.h>

namespace droidflow {

ClassTable::ClassTable(
    std::vector<DexClass> classes,
    Diagnostics* DF_NULLABLE diagnostics) {
  classes_.reserve(classes.size());
  for (auto& dex_class : classes) {
    if (index_.count(dex_class.class_name()) != 0) {
      LOG(3,
          "Ignoring duplicate definition of `{}` in bytecode file {}.",
          dex_class.class_name(),
          dex_class.dex_index());
      if (diagnostics != nullptr) {
        diagnostics->add(
            ErrorKind::DuplicateClass,
            dex_class.class_name(),
            fmt::format(
                "Class is also defined in bytecode file {}, keeping the first definition.",
                dex_class.dex_index()));
      }
      continue;
    }
    index_.emplace(dex_class.class_name(), classes_.size());
    classes_.push_back(std::move(dex_class));
  }
}

const DexClass* ClassTable::get(const std::string& class_name) const {
  auto found = index_.find(class_name);
  if (found == index_.end()) {
    return nullptr;
  }
  return &classes_[found->second];
}

const DexMethod* ClassTable::get_method(
    const MethodReference& reference) const {
  const auto* dex_class = get(reference.class_name());
  if (dex_class == nullptr) {
    return nullptr;
  }
  for (const auto& method : dex_class->methods()) {
    if (method.name() == reference.name() &&
        method.parameter_types() == reference.parameter_types()) {
      return &method;
    }
  }
  return nullptr;
}

std::vector<const DexMethod*> ClassTable::find_inherited_methods(
    const std::string& class_name,
    const std::string& method_name) const {
  std::unordered_set<std::string> visited;
  const auto* dex_class = get(class_name);
  while (dex_class != nullptr &&
         visited.insert(dex_class->class_name()).second) {
    auto methods = dex_class->find_methods(method_name);
    if (!methods.empty()) {
      return methods;
    }
    if (!dex_class->superclass()) {
      break;
    }
    dex_class = get(*dex_class->superclass());
  }
  return {};
}

std::size_t ClassTable::number_methods() const {
  std::size_t result = 0;
  for (const auto& dex_class : classes_) {
    result += dex_class.methods().size();
  }
  return result;
}

Json::Value ClassTable::to_json() const {
  auto value = Json::Value(Json::arrayValue);
  for (const auto& dex_class : classes_) {
    value.append(dex_class.to_json());
  }
  return value;
}

} // namespace droidflow

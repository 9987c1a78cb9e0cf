/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <droidflow/Compiler.h>
#include <droidflow/DexClass.h>
#include <droidflow/Diagnostics.h>
#include <droidflow/IncludeMacros.h>
#include <droidflow/MethodReference.h>

namespace droidflow {

/**
 * The classes defined in a package, keyed by class name.
 *
 * Classes are stored in extraction order. When the same name appears twice,
 * the first occurrence is kept and the other is reported as a
 * `DuplicateClass` diagnostic.
 */
class ClassTable final {
 public:
  explicit ClassTable(
      std::vector<DexClass> classes,
      Diagnostics* DF_NULLABLE diagnostics = nullptr);

  MOVE_CONSTRUCTOR_ONLY(ClassTable)

  const DexClass* DF_NULLABLE get(const std::string& class_name) const;

  bool contains(const std::string& class_name) const {
    return index_.count(class_name) != 0;
  }

  /* Method with the same class, name and parameter types, if defined. */
  const DexMethod* DF_NULLABLE
  get_method(const MethodReference& reference) const;

  /**
   * Look a method up by name on the class, then on its superclasses defined
   * in the package. Returns every overload found on the closest class.
   */
  std::vector<const DexMethod*> find_inherited_methods(
      const std::string& class_name,
      const std::string& method_name) const;

  std::size_t size() const {
    return classes_.size();
  }

  std::size_t number_methods() const;

  auto begin() const {
    return classes_.cbegin();
  }

  auto end() const {
    return classes_.cend();
  }

  const std::vector<DexClass>& classes() const {
    return classes_;
  }

  Json::Value to_json() const;

 private:
  std::vector<DexClass> classes_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace droidflow

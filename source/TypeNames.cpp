/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <droidflow/TypeNames.h>

namespace droidflow {
namespace type_names {

std::string java_name(std::string_view descriptor) {
  std::size_t dimensions = 0;
  while (dimensions < descriptor.size() && descriptor[dimensions] == '[') {
    dimensions++;
  }
  auto element = descriptor.substr(dimensions);

  std::string name;
  if (element.size() >= 2 && element.front() == 'L' && element.back() == ';') {
    name = std::string(element.substr(1, element.size() - 2));
    std::replace(name.begin(), name.end(), '/', '.');
  } else if (element.size() == 1) {
    switch (element.front()) {
      case 'V':
        name = "void";
        break;
      case 'Z':
        name = "boolean";
        break;
      case 'B':
        name = "byte";
        break;
      case 'S':
        name = "short";
        break;
      case 'C':
        name = "char";
        break;
      case 'I':
        name = "int";
        break;
      case 'J':
        name = "long";
        break;
      case 'F':
        name = "float";
        break;
      case 'D':
        name = "double";
        break;
      default:
        name = std::string(element);
        break;
    }
  } else {
    // Not a descriptor, keep it as is.
    name = std::string(element);
  }

  for (std::size_t i = 0; i < dimensions; i++) {
    name += "[]";
  }
  return name;
}

std::string package_name(std::string_view class_name) {
  auto position = class_name.rfind('.');
  if (position == std::string_view::npos) {
    return "";
  }
  return std::string(class_name.substr(0, position));
}

std::string simple_name(std::string_view class_name) {
  auto position = class_name.rfind('.');
  if (position == std::string_view::npos) {
    return std::string(class_name);
  }
  return std::string(class_name.substr(position + 1));
}

std::string package_prefix(std::string_view class_name, std::size_t depth) {
  auto package = package_name(class_name);
  std::size_t position = 0;
  for (std::size_t segment = 0; segment < depth; segment++) {
    position = package.find('.', position);
    if (position == std::string::npos) {
      return package;
    }
    if (segment + 1 < depth) {
      position++;
    }
  }
  return package.substr(0, position);
}

} // namespace type_names
} // namespace droidflow

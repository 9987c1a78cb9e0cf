/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <iostream>
#include <string>

#include <droidflow/Log.h>

class ExitCode {
 private:
  enum class Code : int {
#define EXITCODE(NAME, VALUE) NAME = VALUE,
#include <droidflow/ExitCodes.def>
#undef EXITCODE
  };

 public:
#define EXITCODE(NAME, VALUE)                                \
  static int NAME() {                                        \
    return static_cast<int>(Code::NAME);                     \
  }                                                          \
                                                             \
  static int NAME(const std::string& message) {              \
    std::cerr << "error: " << message << std::endl;          \
    ERROR(1, "Exiting with `{}`: {}", #NAME, message);       \
    return NAME();                                           \
  }
#include <droidflow/ExitCodes.def>
#undef EXITCODE
};

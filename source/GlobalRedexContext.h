/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>

#include <RedexContext.h>

#include <droidflow/Assert.h>

namespace droidflow {

/**
 * RedexContexts are maintained via a single raw pointer called `g_redex`. This
 * class is an RAII object which manages the lifetime there and
 * prevents use-after-free.
 *
 * Redex owns every class it loads until the context is destroyed and refuses
 * to load a class twice in the same context, so each bytecode file is loaded
 * in a context of its own.
 */
class GlobalRedexContext {
 public:
  explicit GlobalRedexContext(bool allow_class_duplicates) {
    df_assert(g_redex == nullptr);
    redex_context_ = std::make_unique<RedexContext>(allow_class_duplicates);
    g_redex = redex_context_.get();
  }

  GlobalRedexContext(const GlobalRedexContext&) = delete;
  GlobalRedexContext& operator=(const GlobalRedexContext&) = delete;

  ~GlobalRedexContext() {
    g_redex = nullptr;
  }

 private:
  std::unique_ptr<RedexContext> redex_context_;
};

} // namespace droidflow

/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#ifndef __has_extension
#define DF_HAS_EXTENSION(x) 0
#else
#define DF_HAS_EXTENSION(x) __has_extension(x)
#endif

#if defined(__GNUC__) || defined(__clang__)
#define DF_PUSH_WARNING _Pragma("GCC diagnostic push")
#define DF_POP_WARNING _Pragma("GCC diagnostic pop")
#define DF_GNU_DISABLE_WARNING_INTERNAL2(warningName) #warningName
#define DF_GNU_DISABLE_WARNING(warningName) \
  _Pragma(DF_GNU_DISABLE_WARNING_INTERNAL2(GCC diagnostic ignored warningName))
#ifdef __clang__
#define DF_CLANG_DISABLE_WARNING(warningName) \
  DF_GNU_DISABLE_WARNING(warningName)
#else
#define DF_CLANG_DISABLE_WARNING(warningName)
#endif
#else
#define DF_PUSH_WARNING
#define DF_POP_WARNING
#define DF_GNU_DISABLE_WARNING(warningName)
#define DF_CLANG_DISABLE_WARNING(warningName)
#endif

/**
 * Nullable indicates that a return value or a parameter may be a `nullptr`,
 * e.g.
 *
 * const DexClass* DF_NULLABLE get(const std::string& class_name) const;
 *
 * Callers must check the result before dereferencing it.
 */
#if DF_HAS_EXTENSION(nullability)
#define DF_NULLABLE                                   \
  DF_PUSH_WARNING                                     \
  DF_CLANG_DISABLE_WARNING("-Wnullability-extension") \
  _Nullable DF_POP_WARNING
#else
#define DF_NULLABLE
#endif

// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_CORE_API_INTERNAL_P_H_INCLUDED
#define PSFONT_CORE_API_INTERNAL_P_H_INCLUDED

#include <psfont/core/api.h>

// C Headers
// =========

// NOTE: Some headers are already included by <api.h>. This should be useful for creating an overview of what
// psfont really needs globally to be included. None of them allocates.
#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <string.h>

// C++ Headers
// ===========

#include <limits>
#include <type_traits>

// Some intrinsics defined by MSVC compiler are used by support functions.
#ifdef _MSC_VER
  #include <intrin.h>
#endif

//! \cond INTERNAL
//! \addtogroup psf_globals
//! \{

// Build - Target Architecture
// ===========================

#if defined(_M_X64) || defined(__amd64) || defined(__amd64__) || defined(__x86_64) || defined(__x86_64__)
  #define PSF_TARGET_ARCH_X86 64
#elif defined(_M_IX86) || defined(__i386) || defined(__i386__)
  #define PSF_TARGET_ARCH_X86 32
#else
  #define PSF_TARGET_ARCH_X86 0
#endif

#if defined(__ARM64__) || defined(__aarch64__)
  #define PSF_TARGET_ARCH_ARM 64
#elif defined(_M_ARM) || defined(_M_ARMT) || defined(__arm__) || defined(__thumb__) || defined(__thumb2__)
  #define PSF_TARGET_ARCH_ARM 32
#else
  #define PSF_TARGET_ARCH_ARM 0
#endif

// Build - Byte Order
// ==================

#define PSF_BYTE_ORDER_LE 0
#define PSF_BYTE_ORDER_BE 1
#define PSF_BYTE_ORDER_NATIVE (PSF_BYTE_ORDER == 1234 ? PSF_BYTE_ORDER_LE : PSF_BYTE_ORDER_BE)

// C++ Compiler Support
// ====================

//! \def PSF_HIDDEN
//!
//! Decorates a function that is used across more than one source file, but should never be exported. Expands to
//! a compiler-specific code that affects the visibility.
#if defined(__GNUC__) && !defined(__MINGW32__)
  #define PSF_HIDDEN __attribute__((__visibility__("hidden")))
#else
  #define PSF_HIDDEN
#endif

//! \def PSF_NOINLINE
//!
//! Decorates a function that should never be inlined. Used by cold paths like table scans after a cache miss.
#if defined(__GNUC__)
  #define PSF_NOINLINE __attribute__((noinline))
#elif defined(_MSC_VER)
  #define PSF_NOINLINE __declspec(noinline)
#else
  #define PSF_NOINLINE
#endif

//! \def PSF_API_IMPL
//!
//! Decorator used to mark all functions and variables that are exported - it expands to "extern C", which ensures
//! that an exported function or variable can be implemented within a private namespace and it would still be exported
//! properly.
#define PSF_API_IMPL extern "C" PSF_API

#define PSF_STRINGIFY_WRAP(N) #N
#define PSF_STRINGIFY(N) PSF_STRINGIFY_WRAP(N)

#define PSF_STATIC_ASSERT(...) static_assert(__VA_ARGS__, "Failed PSF_STATIC_ASSERT(" #__VA_ARGS__ ")")

// Internal C++ Macros
// ===================

//! \def PSF_ASSERT(EXP)
//!
//! Run-time assertion executed in debug builds. Never used to validate input data, which is always checked and
//! reported as a `PSFResult` or as a failed lookup.
#if defined(PSF_BUILD_DEBUG)
  #define PSF_ASSERT(EXP)                                                     \
    do {                                                                      \
      if (PSF_UNLIKELY(!(EXP))) {                                             \
        psf_runtime_assertion_failure(__FILE__, __LINE__, #EXP);              \
      }                                                                       \
    } while (0)
#else
  #define PSF_ASSERT(EXP) ((void)0)
#endif

#define PSF_ARRAY_SIZE(X) uint32_t(sizeof(X) / sizeof(X[0]))

//! \def PSF_DEFINE_ENUM_FLAGS(T)
//!
//! Defines operations for enumeration flags.
#define PSF_DEFINE_ENUM_FLAGS(T)                                              \
  static PSF_INLINE_CONSTEXPR T operator~(T a) noexcept {                     \
    return T(~std::underlying_type_t<T>(a));                                  \
  }                                                                           \
                                                                              \
  static PSF_INLINE_CONSTEXPR T operator|(T a, T b) noexcept {                \
    return T(std::underlying_type_t<T>(a) | std::underlying_type_t<T>(b));    \
  }                                                                           \
  static PSF_INLINE_CONSTEXPR T operator&(T a, T b) noexcept {                \
    return T(std::underlying_type_t<T>(a) & std::underlying_type_t<T>(b));    \
  }                                                                           \
                                                                              \
  static PSF_INLINE_CONSTEXPR T& operator|=(T& a, T b) noexcept {             \
    a = T(std::underlying_type_t<T>(a) | std::underlying_type_t<T>(b));       \
    return a;                                                                 \
  }                                                                           \
  static PSF_INLINE_CONSTEXPR T& operator&=(T& a, T b) noexcept {             \
    a = T(std::underlying_type_t<T>(a) & std::underlying_type_t<T>(b));       \
    return a;                                                                 \
  }

// Internal Constants
// ==================

//! Internal result code that is never returned to the user, used to report "nothing more" from readers.
static constexpr PSFResult PSF_RESULT_NOTHING = 0xFFFFFFFFu;

// Internal Functions
// ==================

template<typename T>
static PSF_INLINE_CONSTEXPR bool psf_test_flag(const T& x, const T& y) noexcept {
  return (std::underlying_type_t<T>(x) & std::underlying_type_t<T>(y)) != 0;
}

template<typename T>
static PSF_INLINE_CONSTEXPR const T& psf_max(const T& a, const T& b) noexcept { return a < b ? b : a; }

template<typename... Args>
static PSF_INLINE_NODEBUG void psf_unused(Args&&...) noexcept {}

//! \}
//! \endcond

#endif // PSFONT_CORE_API_INTERNAL_P_H_INCLUDED

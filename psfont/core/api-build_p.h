// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each psfont source file. This means that any
// macros we might need to define to build 'psfont' can be defined here instead of passing them to the compiler
// through command line.

#ifndef PSFONT_CORE_API_BUILD_P_H_INCLUDED
#define PSFONT_CORE_API_BUILD_P_H_INCLUDED

// Build - Export
// ==============

//! \cond INTERNAL

//! Export mode is on when `PSF_BUILD_EXPORT` is defined - this MUST be defined before including any other header
//! as "api.h" uses `PSF_BUILD_EXPORT` to define a proper `PSF_API` decorator that is used by all exported functions.
#define PSF_BUILD_EXPORT

//! \endcond

// Build - Configuration
// =====================

// #define PSF_BUILD_NO_STDIO
// --------------------------
//
// Turns runtime message output into a no-op. Provided for freestanding targets (kernels, bootloaders) that link
// psfont without a C runtime that provides `stderr`. Set by CMakeLists.txt when PSFONT_NO_STDIO is ON.

// #define PSF_TRACE_PSF2_ALL       // Trace PSF2 parsing (all).
// #define PSF_TRACE_PSF2_HEADER    // Trace PSF2 header validation.
// #define PSF_TRACE_PSF2_UNICODE   // Trace PSF2 unicode table validation and lookups.
//
// psfont provides traces that can be enabled during development. Traces can help to understand how certain
// things work and can be used to track bugs.

// Build - Compiler Diagnostics
// ============================

//! \cond NEVER

#if defined(_MSC_VER)
  #pragma warning(disable: 4102) // Unreferenced label.
  #pragma warning(disable: 4127) // Conditional expression is constant.
  #pragma warning(disable: 4201) // Nameless struct/union.
  #pragma warning(disable: 4251) // Struct needs to have dll-interface.
  #pragma warning(disable: 4505) // Unreferenced local function has been removed.
#elif defined(__clang__)
  #pragma clang diagnostic ignored "-Wunused-function"
  #pragma clang diagnostic warning "-Wattributes"
#elif defined(__GNUC__)
  #pragma GCC diagnostic ignored "-Wunused-function"
  #pragma GCC diagnostic warning "-Wattributes"
#endif

// Turn off deprecation warnings when building 'psfont'. The runtime uses `vsnprintf()` correctly.
#if defined(_MSC_VER)
  #if !defined(_CRT_SECURE_NO_DEPRECATE)
    #define _CRT_SECURE_NO_DEPRECATE
  #endif
  #if !defined(_CRT_SECURE_NO_WARNINGS)
    #define _CRT_SECURE_NO_WARNINGS
  #endif
#endif

//! \endcond

// Build - Include API
// ===================

#include <psfont/core/api.h>
#include <psfont/core/api-internal_p.h>

#endif // PSFONT_CORE_API_BUILD_P_H_INCLUDED

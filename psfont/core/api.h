// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_CORE_API_H_INCLUDED
#define PSFONT_CORE_API_H_INCLUDED

// Public Headers
// ==============

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>

#if !defined(__cplusplus)
  #include <stdbool.h>
#endif

//! \addtogroup psf_globals
//! \{

// Version
// =======

//! \name Version Information
//! \{

//! Makes a version number representing a `MAJOR.MINOR.PATCH` combination.
#define PSF_MAKE_VERSION(MAJOR, MINOR, PATCH) (((MAJOR) << 16) | ((MINOR) << 8) | (PATCH))

//! psfont library version.
#define PSF_VERSION PSF_MAKE_VERSION(1, 0, 0)

//! \}

// Build Type
// ==========

//! \cond INTERNAL

// These definitions can be used to enable static library build. Embed is used when psfont's source code is embedded
// directly in another project, implies static build as well.
//
// #define PSF_STATIC                // psfont is a statically linked library.

// These definitions control the build mode and tracing support. The build mode should be auto-detected at compile
// time, but it's possible to override it in case that the auto-detection fails.
//
// #define PSF_BUILD_DEBUG           // Define to enable debug-mode.
// #define PSF_BUILD_RELEASE         // Define to enable release-mode.

// Detect PSF_BUILD_DEBUG and PSF_BUILD_RELEASE if not defined.
#if !defined(PSF_BUILD_DEBUG) && !defined(PSF_BUILD_RELEASE)
  #if !defined(NDEBUG)
    #define PSF_BUILD_DEBUG
  #else
    #define PSF_BUILD_RELEASE
  #endif
#endif

//! \endcond

// Public Macros
// =============

//! \name Target Information
//! \{

//! \def PSF_BYTE_ORDER
//!
//! A compile-time constant (macro) that defines byte-order of the target. It can be either `1234` for little-endian
//! targets or `4321` for big-endian targets. psfont uses this macro internally, but it's also available to end
//! users as sometimes it could be important for deciding between pixel formats or other important details.
#if (defined(__ARMEB__)) || (defined(__MIPSEB__)) || \
    (defined(__BYTE_ORDER__) && (__BYTE_ORDER__ == __ORDER_BIG_ENDIAN__))
  #define PSF_BYTE_ORDER 4321
#else
  #define PSF_BYTE_ORDER 1234
#endif

//! \}

//! \name Decorators
//! \{

//! \def PSF_API
//!
//! A base API decorator that marks functions and variables exported by psfont.
#if !defined(PSF_STATIC)
  #if defined(_WIN32) && (defined(_MSC_VER) || defined(__MINGW32__))
    #if defined(PSF_BUILD_EXPORT)
      #define PSF_API __declspec(dllexport)
    #else
      #define PSF_API __declspec(dllimport)
    #endif
  #elif defined(_WIN32) && defined(__GNUC__)
    #if defined(PSF_BUILD_EXPORT)
      #define PSF_API __attribute__((__dllexport__))
    #else
      #define PSF_API __attribute__((__dllimport__))
    #endif
  #elif defined(__GNUC__)
    #define PSF_API __attribute__((__visibility__("default")))
  #endif
#endif

#if !defined(PSF_API)
  #define PSF_API
#endif

//! \def PSF_CDECL
//!
//! Calling convention used by all exported functions and function callbacks. If you pass callbacks to psfont it's
//! strongly advised to decorate the callback explicitly as some compilers provide a way of overriding a global
//! calling convention (like __vectorcall on Windows platform), which would break the use of such callbacks.
#if defined(__GNUC__) && defined(__i386__) && !defined(__x86_64__)
  #define PSF_CDECL __attribute__((__cdecl__))
#elif defined(_MSC_VER)
  #define PSF_CDECL __cdecl
#else
  #define PSF_CDECL
#endif

//! \def PSF_INLINE
//!
//! Marks functions that should always be inlined.
#if defined(__GNUC__) && !defined(PSF_BUILD_DEBUG)
  #define PSF_INLINE inline __attribute__((__always_inline__))
#elif defined(_MSC_VER) && !defined(PSF_BUILD_DEBUG)
  #define PSF_INLINE __forceinline
#else
  #define PSF_INLINE inline
#endif

//! \def PSF_INLINE_NODEBUG
//!
//! The same as `PSF_INLINE` combined with `__attribute__((artificial))` or `__attribute__((nodebug))` if supported.
#if defined(__clang__)
  #define PSF_INLINE_NODEBUG inline __attribute__((__always_inline__, __nodebug__))
#elif defined(__GNUC__)
  #define PSF_INLINE_NODEBUG inline __attribute__((__always_inline__, __artificial__))
#else
  #define PSF_INLINE_NODEBUG PSF_INLINE
#endif

//! \def PSF_INLINE_CONSTEXPR
//!
//! The same as `PSF_INLINE_NODEBUG`, but having also `constexpr` property.
#define PSF_INLINE_CONSTEXPR constexpr PSF_INLINE_NODEBUG

//! \def PSF_NOEXCEPT_C
//!
//! Expands to `noexcept` when compiled by a C++ compiler, which is used by all C API functions.
#if defined(__cplusplus)
  #define PSF_NOEXCEPT_C noexcept
#else
  #define PSF_NOEXCEPT_C
#endif

//! \}

//! \name Assumptions
//! \{

//! \def PSF_LIKELY(EXP)
//!
//! A condition is likely.
#if defined(__GNUC__)
  #define PSF_LIKELY(...) __builtin_expect(!!(__VA_ARGS__), 1)
#else
  #define PSF_LIKELY(...) (__VA_ARGS__)
#endif

//! \def PSF_UNLIKELY(EXP)
//!
//! A condition is unlikely.
#if defined(__GNUC__)
  #define PSF_UNLIKELY(...) __builtin_expect(!!(__VA_ARGS__), 0)
#else
  #define PSF_UNLIKELY(...) (__VA_ARGS__)
#endif

//! \}

//! \name Utilities
//! \{

//! \def PSF_DEFINE_ENUM(NAME)
//!
//! Defines an enumeration used by psfont that is `uint32_t`.
#if defined(__cplusplus)
  #define PSF_DEFINE_ENUM(NAME) enum NAME : uint32_t
#else
  #define PSF_DEFINE_ENUM(NAME) typedef enum NAME NAME; enum NAME
#endif

//! \def PSF_FORCE_ENUM_UINT32(ENUM_VALUE_PREFIX)
//!
//! Forces an enumeration to be `uint32_t` when compiled by a C compiler.
#if defined(__cplusplus)
  #define PSF_FORCE_ENUM_UINT32(ENUM_VALUE_PREFIX)
#else
  #define PSF_FORCE_ENUM_UINT32(ENUM_VALUE_PREFIX) ,ENUM_VALUE_PREFIX##_FORCE_UINT = 0xFFFFFFFFu
#endif

#if defined(__cplusplus)
  #define PSF_BEGIN_C_DECLS extern "C" {
  #define PSF_END_C_DECLS } /* {ExternC} */
#else
  #define PSF_BEGIN_C_DECLS
  #define PSF_END_C_DECLS
#endif

//! \}

//! \}

// Result Code
// ===========

//! \addtogroup psf_globals
//! \{

//! \name Result Code
//! \{

//! Result code used by most psfont functions (32-bit unsigned integer).
//!
//! The `PSFResultCode` enumeration contains psfont result codes that contain psfont specific set of errors.
typedef uint32_t PSFResult;

//! Result code used by psfont API.
PSF_DEFINE_ENUM(PSFResultCode) {
  //! Successful result code.
  PSF_SUCCESS = 0,

  //! Start of psfont error codes.
  PSF_ERROR_START_INDEX = 0x00010000u,

  //! Invalid value or argument.
  PSF_ERROR_INVALID_VALUE = 0x00010000u,
  //! The data doesn't start with PSF2 magic bytes.
  PSF_ERROR_INVALID_MAGIC,
  //! The header specifies a PSF2 version that is not supported.
  PSF_ERROR_UNSUPPORTED_VERSION,
  //! The data ends before the end of the PSF2 header.
  PSF_ERROR_TRUNCATED_HEADER,
  //! The header contains inconsistent or zero geometry.
  PSF_ERROR_INVALID_HEADER,
  //! The data ends before the end of the glyph table.
  PSF_ERROR_TRUNCATED_GLYPH_TABLE,
  //! The unicode table is malformed (missing terminator or invalid UTF-8).
  PSF_ERROR_MALFORMED_UNICODE_TABLE,
  //! The data is too large to be addressed by 32-bit offsets.
  PSF_ERROR_DATA_TOO_LARGE,
  //! Invalid string (invalid UTF-8 sequence).
  PSF_ERROR_INVALID_STRING,
  //! The data ends in the middle of a sequence.
  PSF_ERROR_DATA_TRUNCATED,

  //! Last error code.
  PSF_ERROR_VALUE_LAST = PSF_ERROR_DATA_TRUNCATED

  PSF_FORCE_ENUM_UINT32(PSF_ERROR)
};

//! \}

//! \name Debugging Functionality
//! \{

//! Returns the `result` passed.
//!
//! Provided for debugging purposes. Putting a breakpoint inside `psf_make_error()` can help with tracing an origin of
//! errors reported / returned by psfont as each error goes through this function.
//!
//! It's a zero-cost solution that doesn't affect release builds in any way.
static inline PSFResult psf_make_error(PSFResult result) PSF_NOEXCEPT_C { return result; }

//! \}

//! \}

// Forward Declarations
// ====================

//! \cond INTERNAL

struct PSFFontCore;
struct PSFFontInfo;
struct PSFGlyphCacheData;
struct PSFGlyphCore;
struct PSFGlyphRowCore;
struct PSFRuntimeBuildInfo;

#if defined(__cplusplus)
class PSFFont;
class PSFGlyph;
class PSFGlyphRow;
#endif

//! \endcond

// Public API - Runtime
// ====================

//! \addtogroup psf_c_api
//! \{

PSF_BEGIN_C_DECLS

//! Reports an assertion failure and terminates the process. Only reachable from debug builds.
PSF_API void PSF_CDECL psf_runtime_assertion_failure(const char* file, int line, const char* msg) PSF_NOEXCEPT_C;

PSF_END_C_DECLS

//! \}

#endif // PSFONT_CORE_API_H_INCLUDED

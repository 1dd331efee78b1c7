// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_CORE_RUNTIME_H_INCLUDED
#define PSFONT_CORE_RUNTIME_H_INCLUDED

#include <psfont/core/api.h>

//! \addtogroup psf_runtime
//! \{

//! \name Runtime - Constants
//! \{

//! psfont runtime limits.
//!
//! \note These constants are not designed to be ABI stable. Use runtime to query the limits dynamically, see
//! `PSFRuntimeBuildInfo`.
PSF_DEFINE_ENUM(PSFRuntimeLimits) {
  //! Number of codepoint to glyph index associations cached by each font.
  PSF_RUNTIME_GLYPH_CACHE_CAPACITY = 64
};

//! Type of runtime information that can be queried through \ref psf_runtime_query_info().
PSF_DEFINE_ENUM(PSFRuntimeInfoType) {
  //! psfont build information.
  PSF_RUNTIME_INFO_TYPE_BUILD = 0,

  //! Count of runtime information types.
  PSF_RUNTIME_INFO_TYPE_MAX_VALUE = 0

  PSF_FORCE_ENUM_UINT32(PSF_RUNTIME_INFO_TYPE)
};

//! psfont runtime build type.
PSF_DEFINE_ENUM(PSFRuntimeBuildType) {
  //! Describes a psfont debug build.
  PSF_RUNTIME_BUILD_TYPE_DEBUG = 0,
  //! Describes a psfont release build.
  PSF_RUNTIME_BUILD_TYPE_RELEASE = 1

  PSF_FORCE_ENUM_UINT32(PSF_RUNTIME_BUILD_TYPE)
};

//! Build features that were enabled at compile-time.
PSF_DEFINE_ENUM(PSFRuntimeBuildFeatures) {
  //! No features.
  PSF_RUNTIME_BUILD_NO_FEATURES = 0u,
  //! Runtime messages are written to `stderr` (not set in freestanding builds).
  PSF_RUNTIME_BUILD_FEATURE_STDIO = 0x00000001u,
  //! PSF2 tracing is compiled in.
  PSF_RUNTIME_BUILD_FEATURE_TRACE = 0x00000002u

  PSF_FORCE_ENUM_UINT32(PSF_RUNTIME_BUILD_FEATURE)
};

//! \}

//! \name Runtime - Structs
//! \{

//! psfont build information.
struct PSFRuntimeBuildInfo {
  //! Major version number.
  uint32_t major_version;
  //! Minor version number.
  uint32_t minor_version;
  //! Patch version number.
  uint32_t patch_version;

  //! psfont build type, see \ref PSFRuntimeBuildType.
  uint32_t build_type;

  //! Build features, see \ref PSFRuntimeBuildFeatures.
  uint32_t build_features;

  //! Capacity of the glyph cache of each font, see \ref PSF_RUNTIME_GLYPH_CACHE_CAPACITY.
  uint32_t glyph_cache_capacity;

  //! Reserved, must be zero.
  uint32_t reserved[2];

  //! Identification of the C++ compiler used to build psfont.
  char compiler_info[32];

#ifdef __cplusplus
  PSF_INLINE_NODEBUG void reset() noexcept { *this = PSFRuntimeBuildInfo{}; }
#endif
};

//! \}
//! \}

//! \addtogroup psf_c_api
//! \{

//! \name PSFRuntime - C API
//! \{

PSF_BEGIN_C_DECLS

PSF_API PSFResult PSF_CDECL psf_runtime_query_info(PSFRuntimeInfoType info_type, void* info_out) PSF_NOEXCEPT_C;
PSF_API PSFResult PSF_CDECL psf_runtime_message_out(const char* msg) PSF_NOEXCEPT_C;
PSF_API PSFResult PSF_CDECL psf_runtime_message_fmt(const char* fmt, ...) PSF_NOEXCEPT_C;
PSF_API PSFResult PSF_CDECL psf_runtime_message_vfmt(const char* fmt, va_list ap) PSF_NOEXCEPT_C;

PSF_END_C_DECLS

//! \}
//! \}

//! \addtogroup psf_runtime
//! \{

//! \name Runtime - C++ API
//! \{
#ifdef __cplusplus

//! Interface to access psfont runtime (wraps C API).
namespace PSFRuntime {

static PSF_INLINE_NODEBUG PSFResult query_build_info(PSFRuntimeBuildInfo* out) noexcept {
  return psf_runtime_query_info(PSF_RUNTIME_INFO_TYPE_BUILD, out);
}

static PSF_INLINE_NODEBUG PSFResult message(const char* msg) noexcept {
  return psf_runtime_message_out(msg);
}

template<typename... Args>
static PSF_INLINE_NODEBUG PSFResult message(const char* fmt, Args&&... args) noexcept {
  return psf_runtime_message_fmt(fmt, static_cast<Args&&>(args)...);
}

} // {PSFRuntime}

#endif
//! \}

//! \}

#endif // PSFONT_CORE_RUNTIME_H_INCLUDED

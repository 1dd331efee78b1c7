// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <psfont/core/api-build_p.h>
#include <psfont/core/runtime.h>

#include <stdlib.h>

#if !defined(PSF_BUILD_NO_STDIO)
  #include <stdio.h>
#endif

// PSFRuntime - Build Information
// ==============================

static const PSFRuntimeBuildInfo psf_runtime_build_info = {
  // psfont major version.
  (PSF_VERSION >> 16),
  // psfont minor version.
  (PSF_VERSION >> 8) & 0xFF,
  // psfont patch version.
  (PSF_VERSION >> 0) & 0xFF,

  // Build Type.
#ifdef PSF_BUILD_DEBUG
  PSF_RUNTIME_BUILD_TYPE_DEBUG,
#else
  PSF_RUNTIME_BUILD_TYPE_RELEASE,
#endif

  // Build Features.
  0
#if !defined(PSF_BUILD_NO_STDIO)
  | PSF_RUNTIME_BUILD_FEATURE_STDIO
#endif
#if defined(PSF_TRACE_PSF2_ALL) || defined(PSF_TRACE_PSF2_HEADER) || defined(PSF_TRACE_PSF2_UNICODE)
  | PSF_RUNTIME_BUILD_FEATURE_TRACE
#endif
  ,

  // Glyph cache capacity.
  PSF_RUNTIME_GLYPH_CACHE_CAPACITY,

  // Reserved
  { 0 },

  // Compiler Info.
#if defined(__clang_minor__)
  "Clang " PSF_STRINGIFY(__clang_major__) "." PSF_STRINGIFY(__clang_minor__)
#elif defined(__GNUC_MINOR__)
  "GCC "  PSF_STRINGIFY(__GNUC__) "." PSF_STRINGIFY(__GNUC_MINOR__)
#elif defined(_MSC_VER)
  "MSC"
#else
  "Unknown"
#endif
};

// PSFRuntime - API - Query Info
// =============================

PSF_API_IMPL PSFResult psf_runtime_query_info(PSFRuntimeInfoType info_type, void* info_out) noexcept {
  if (PSF_UNLIKELY(!info_out))
    return psf_make_error(PSF_ERROR_INVALID_VALUE);

  switch (info_type) {
    case PSF_RUNTIME_INFO_TYPE_BUILD: {
      PSFRuntimeBuildInfo* build_info = static_cast<PSFRuntimeBuildInfo*>(info_out);
      memcpy(build_info, &psf_runtime_build_info, sizeof(PSFRuntimeBuildInfo));
      return PSF_SUCCESS;
    }

    default:
      return psf_make_error(PSF_ERROR_INVALID_VALUE);
  }
}

// PSFRuntime - API - Message
// ==========================

PSF_API_IMPL PSFResult psf_runtime_message_out(const char* msg) noexcept {
#if !defined(PSF_BUILD_NO_STDIO)
  fputs(msg, stderr);
#else
  psf_unused(msg);
#endif
  return PSF_SUCCESS;
}

PSF_API_IMPL PSFResult psf_runtime_message_fmt(const char* fmt, ...) noexcept {
  va_list ap;
  va_start(ap, fmt);
  PSFResult result = psf_runtime_message_vfmt(fmt, ap);
  va_end(ap);

  return result;
}

PSF_API_IMPL PSFResult psf_runtime_message_vfmt(const char* fmt, va_list ap) noexcept {
#if !defined(PSF_BUILD_NO_STDIO)
  char buf[1024];
  vsnprintf(buf, PSF_ARRAY_SIZE(buf), fmt, ap);
  return psf_runtime_message_out(buf);
#else
  psf_unused(fmt, ap);
  return PSF_SUCCESS;
#endif
}

// PSFRuntime - API - Failure
// ==========================

PSF_API_IMPL void psf_runtime_assertion_failure(const char* file, int line, const char* msg) noexcept {
  psf_runtime_message_fmt("[psfont] ASSERTION FAILURE: '%s' at '%s' [line %d]\n", msg, file, line);
  abort();
}

// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <psfont/core/api-build_test_p.h>
#if defined(PSF_TEST)

#include <psfont/core/runtime.h>

// PSFRuntime - Tests
// ==================

namespace psf::Tests {

TEST(PSFRuntime, build_info) {
  PSFRuntimeBuildInfo build_info;
  ASSERT_SUCCESS(PSFRuntime::query_build_info(&build_info));

  EXPECT_EQ(build_info.major_version, uint32_t(PSF_VERSION >> 16));
  EXPECT_EQ(build_info.minor_version, uint32_t((PSF_VERSION >> 8) & 0xFF));
  EXPECT_EQ(build_info.patch_version, uint32_t(PSF_VERSION & 0xFF));
  EXPECT_EQ(build_info.glyph_cache_capacity, uint32_t(PSF_RUNTIME_GLYPH_CACHE_CAPACITY));
  EXPECT_NE(build_info.compiler_info[0], '\0');
}

TEST(PSFRuntime, invalid_query) {
  PSFRuntimeBuildInfo build_info;

  EXPECT_EQ(psf_runtime_query_info(PSFRuntimeInfoType(0xFFu), &build_info), PSFResult(PSF_ERROR_INVALID_VALUE));
  EXPECT_EQ(psf_runtime_query_info(PSF_RUNTIME_INFO_TYPE_BUILD, nullptr), PSFResult(PSF_ERROR_INVALID_VALUE));
}

} // {psf::Tests}

#endif // PSF_TEST

// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <psfont/core/api-build_test_p.h>
#include <psfont/core/runtime.h>

int main(int argc, char* argv[]) {
  PSFRuntimeBuildInfo build_info;
  PSFRuntime::query_build_info(&build_info);

  INFO(
    "psfont Unit Tests [use --help for command line options]\n"
    "  Version    : %u.%u.%u\n"
    "  Build Type : %s\n"
    "  Glyph Cache: %u entries\n"
    "  Compiled By: %s\n",
    build_info.major_version,
    build_info.minor_version,
    build_info.patch_version,
    build_info.build_type == PSF_RUNTIME_BUILD_TYPE_DEBUG ? "Debug" : "Release",
    build_info.glyph_cache_capacity,
    build_info.compiler_info);

  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

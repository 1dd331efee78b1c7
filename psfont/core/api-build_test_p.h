// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each psfont test file.

#ifndef PSFONT_CORE_API_BUILD_TEST_P_H_INCLUDED
#define PSFONT_CORE_API_BUILD_TEST_P_H_INCLUDED

#include <psfont/core/api-build_p.h>

// psf::Build - Tests
// ==================

//! \cond NEVER
// Make sure '#ifdef'ed unit tests are not disabled by IDE.
#if !defined(PSF_TEST) && defined(__INTELLISENSE__)
  #define PSF_TEST
#endif
//! \endcond

// Include a unit testing package if this is a `psf_test_runner` build.
#if defined(PSF_TEST)

#include <gtest/gtest.h>

#include <stdio.h>

//! \cond INTERNAL
static inline void psf_test_info(const char* fmt, ...) noexcept {
  va_list ap;
  va_start(ap, fmt);
  vprintf(fmt, ap);
  va_end(ap);
  putchar('\n');
}

#define INFO(...) psf_test_info(__VA_ARGS__)
#define EXPECT_SUCCESS(...) EXPECT_EQ(PSFResult(__VA_ARGS__), PSFResult(PSF_SUCCESS))
#define ASSERT_SUCCESS(...) ASSERT_EQ(PSFResult(__VA_ARGS__), PSFResult(PSF_SUCCESS))
//! \endcond

#endif // PSF_TEST

#endif // PSFONT_CORE_API_BUILD_TEST_P_H_INCLUDED

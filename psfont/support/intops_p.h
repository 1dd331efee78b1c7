// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_SUPPORT_INTOPS_P_H_INCLUDED
#define PSFONT_SUPPORT_INTOPS_P_H_INCLUDED

#include <psfont/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup psf_internal
//! \{

namespace psf {

//! \name Types
//! \{

typedef unsigned char OverflowFlag;

//! \}

//! Utility functions and classes simplifying integer operations.
namespace IntOps {
namespace {

//! \name Byte Swap Operations
//! \{

template<typename T>
[[nodiscard]]
static PSF_INLINE T byteSwap32(const T& x) noexcept {
#if defined(__GNUC__)
  return T(uint32_t(__builtin_bswap32(uint32_t(x))));
#elif defined(_MSC_VER)
  return T(uint32_t(_byteswap_ulong(uint32_t(x))));
#else
  return T((uint32_t(x) << 24) | (uint32_t(x) >> 24) | ((uint32_t(x) << 8) & 0x00FF0000u) | ((uint32_t(x) >> 8) & 0x0000FF00));
#endif
}

//! \}

//! \name Bit Manipulation
//! \{

//! Returns `x << y` (shift left logical) by explicitly casting `x` to an unsigned type and back.
template<typename X, typename Y>
[[nodiscard]]
PSF_INLINE_CONSTEXPR X shl(const X& x, const Y& y) noexcept {
  using U = std::make_unsigned_t<X>;
  return X(U(x) << y);
}

//! \}

//! \name Alignment
//! \{

//! Returns `x / y` rounded up, `y` must be non-zero.
template<typename T>
[[nodiscard]]
static PSF_INLINE_CONSTEXPR T div_ceil(const T& x, const T& y) noexcept {
  return T(x / y + T((x % y) != 0));
}

//! \}

//! \name Arithmetic With Overflow Detection
//! \{

template<typename T>
PSF_INLINE T mul_overflow_fallback(T x, T y, OverflowFlag* of) noexcept {
  T result = T(x * y);
  *of = OverflowFlag(*of | OverflowFlag(y != 0 && std::numeric_limits<T>::max() / y < x));
  return result;
}

// Specialized below if the compiler provides overflow builtins.
template<typename T> PSF_INLINE T mul_overflow_impl(const T& x, const T& y, OverflowFlag* of) noexcept { return mul_overflow_fallback(x, y, of); }

#if defined(__GNUC__)
#define PSF_ARITH_OVERFLOW_SPECIALIZE(FUNC, T, RESULT_T, BUILTIN)                 \
  template<>                                                                      \
  PSF_INLINE_NODEBUG T FUNC(const T& x, const T& y, OverflowFlag* of) noexcept {  \
    RESULT_T result;                                                              \
    *of = OverflowFlag(*of | (BUILTIN((RESULT_T)x, (RESULT_T)y, &result)));       \
    return T(result);                                                             \
  }
PSF_ARITH_OVERFLOW_SPECIALIZE(mul_overflow_impl, uint32_t, unsigned int      , __builtin_umul_overflow  )
PSF_ARITH_OVERFLOW_SPECIALIZE(mul_overflow_impl, uint64_t, unsigned long long, __builtin_umulll_overflow)
#undef PSF_ARITH_OVERFLOW_SPECIALIZE
#endif

//! Multiplies `x` and `y` and sets `of` to non-zero if the result overflowed.
template<typename T>
static PSF_INLINE T mul_overflow(const T& x, const T& y, OverflowFlag* of) noexcept { return mul_overflow_impl(x, y, of); }

//! \}

} // {anonymous}
} // {IntOps}
} // {psf}

//! \}
//! \endcond

#endif // PSFONT_SUPPORT_INTOPS_P_H_INCLUDED

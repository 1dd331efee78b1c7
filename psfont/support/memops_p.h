// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_SUPPORT_MEMOPS_P_H_INCLUDED
#define PSFONT_SUPPORT_MEMOPS_P_H_INCLUDED

#include <psfont/core/api-internal_p.h>
#include <psfont/support/intops_p.h>

//! \cond INTERNAL
//! \addtogroup psf_internal
//! \{

namespace psf {
namespace MemOps {
namespace {

//! \name Unaligned Constants
//! \{

static const constexpr bool kUnalignedMem32 = (PSF_TARGET_ARCH_X86 != 0) || (PSF_TARGET_ARCH_ARM == 64);

//! \}

//! \name Unaligned Types
//! \{

#if defined(__GNUC__)
typedef __attribute__((__aligned__(1), __may_alias__)) uint32_t UnalignedU32;
#else
typedef uint32_t UnalignedU32;
#endif

//! \}

//! \name Memory Read
//! \{

[[nodiscard]]
static PSF_INLINE_NODEBUG uint32_t readU8(const void* p) noexcept { return uint32_t(static_cast<const uint8_t*>(p)[0]); }

template<uint32_t ByteOrder>
[[nodiscard]]
static PSF_INLINE_NODEBUG uint32_t readU16u(const void* p) noexcept {
  uint32_t hi = readU8(static_cast<const uint8_t*>(p) + (ByteOrder == PSF_BYTE_ORDER_LE ? 1 : 0));
  uint32_t lo = readU8(static_cast<const uint8_t*>(p) + (ByteOrder == PSF_BYTE_ORDER_LE ? 0 : 1));
  return IntOps::shl(hi, 8) | lo;
}

template<uint32_t ByteOrder>
[[nodiscard]]
static PSF_INLINE_NODEBUG uint32_t readU32u(const void* p) noexcept {
  if (kUnalignedMem32) {
    uint32_t x = static_cast<const UnalignedU32*>(p)[0];
    return ByteOrder == PSF_BYTE_ORDER_NATIVE ? x : IntOps::byteSwap32(x);
  }
  else {
    uint32_t hi = readU16u<ByteOrder>(static_cast<const uint8_t*>(p) + (ByteOrder == PSF_BYTE_ORDER_LE ? 2 : 0));
    uint32_t lo = readU16u<ByteOrder>(static_cast<const uint8_t*>(p) + (ByteOrder == PSF_BYTE_ORDER_LE ? 0 : 2));
    return IntOps::shl(hi, 16) | lo;
  }
}


//! \}

} // {anonymous}
} // {MemOps}
} // {psf}

//! \}
//! \endcond

#endif // PSFONT_SUPPORT_MEMOPS_P_H_INCLUDED

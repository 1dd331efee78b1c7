// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_UNICODE_UNICODE_P_H_INCLUDED
#define PSFONT_UNICODE_UNICODE_P_H_INCLUDED

#include <psfont/support/intops_p.h>
#include <psfont/support/memops_p.h>

//! \cond INTERNAL
//! \addtogroup psf_internal
//! \{

namespace psf::Unicode {

// psf::Unicode - Constants
// ========================

//! Special unicode characters.
enum CharCode : uint32_t {
  kCharMax                    = 0x10FFFFu,   //!< Last code-point.

  kCharSurrogateFirst         = 0x00D800u,   //!< First surrogate code-point.
  kCharSurrogateLast          = 0x00DFFFu    //!< Last surrogate code-point.
};

//! Flags that can be used to parametrize unicode I/O iterators.
enum class IOFlags : uint32_t {
  kNoFlags     = 0u,
  //! Refuse code-points that are not unicode scalar values (surrogates).
  kStrict      = 0x00000004u
};

PSF_DEFINE_ENUM_FLAGS(IOFlags)

[[nodiscard]]
static PSF_INLINE_CONSTEXPR bool is_surrogate(uint32_t uc) noexcept {
  return uc - kCharSurrogateFirst <= kCharSurrogateLast - kCharSurrogateFirst;
}

// psf::Unicode - UTF8 Reader
// ==========================

//! UTF-8 reader that validates every sequence it decodes.
//!
//! The reader never reads beyond `_end`, a sequence that would cross it is reported as `PSF_ERROR_DATA_TRUNCATED`.
//! On failure the reader position is not advanced so the caller can report where decoding stopped.
class Utf8Reader {
public:
  enum : uint32_t { kCharSize = 1 };

  //! Current pointer.
  const uint8_t* _ptr;
  //! End of input.
  const uint8_t* _end;

  PSF_INLINE Utf8Reader(const void* data, size_t byte_size) noexcept {
    reset(data, byte_size);
  }

  PSF_INLINE void reset(const void* data, size_t byte_size) noexcept {
    _ptr = static_cast<const uint8_t*>(data);
    _end = static_cast<const uint8_t*>(data) + byte_size;
  }

  [[nodiscard]]
  PSF_INLINE bool has_next() const noexcept { return _ptr != _end; }

  [[nodiscard]]
  PSF_INLINE size_t remaining_byte_size() const noexcept { return (size_t)(_end - _ptr); }

  template<IOFlags kFlags = IOFlags::kNoFlags>
  PSF_INLINE PSFResult next(uint32_t& uc) noexcept {
    size_t uc_size_in_bytes;
    return next<kFlags>(uc, uc_size_in_bytes);
  }

  template<IOFlags kFlags = IOFlags::kNoFlags>
  PSF_INLINE PSFResult next(uint32_t& uc, size_t& uc_size_in_bytes) noexcept {
    PSF_ASSERT(has_next());

    uc = MemOps::readU8(_ptr);
    uc_size_in_bytes = 1;

    if (uc < 0x80u) {
      // 1-Byte UTF-8 Sequence -> [0x00..0x7F].
      _ptr++;
      return PSF_SUCCESS;
    }

    // Start of MultiByte.
    const uint32_t kMultiByte = 0xC2u;
    size_t remaining = remaining_byte_size();

    uc -= kMultiByte;
    if (uc < 0xE0u - kMultiByte) {
      // 2-Byte UTF-8 Sequence -> [0x80-0x7FF].
      uc_size_in_bytes = 2;

      if (PSF_UNLIKELY(remaining < 2))
        goto TruncatedString;

      // All consecutive bytes must be '10xxxxxx'.
      uint32_t b1 = MemOps::readU8(_ptr + 1) ^ 0x80u;
      uc = ((uc + kMultiByte - 0xC0u) << 6) + b1;

      if (PSF_UNLIKELY(b1 > 0x3Fu))
        goto InvalidString;
    }
    else if (uc < 0xF0u - kMultiByte) {
      // 3-Byte UTF-8 Sequence -> [0x800-0xFFFF].
      uc_size_in_bytes = 3;

      if (PSF_UNLIKELY(remaining < 3))
        goto TruncatedString;

      uint32_t b1 = MemOps::readU8(_ptr + 1) ^ 0x80u;
      uint32_t b2 = MemOps::readU8(_ptr + 2) ^ 0x80u;
      uc = ((uc + kMultiByte - 0xE0u) << 12) + (b1 << 6) + b2;

      // 1. All consecutive bytes must be '10xxxxxx'.
      // 2. Refuse overlong UTF-8.
      if (PSF_UNLIKELY((b1 | b2) > 0x3Fu || uc < 0x800u))
        goto InvalidString;

      if (psf_test_flag(kFlags, IOFlags::kStrict) && PSF_UNLIKELY(is_surrogate(uc)))
        goto InvalidString;
    }
    else {
      // 4-Byte UTF-8 Sequence -> [0x010000-0x10FFFF].
      uc_size_in_bytes = 4;

      // Bytes [0x80..0xC1] (wrapped around by the subtraction) and [0xF5..0xFF] never start a sequence.
      if (PSF_UNLIKELY(uc >= 0xF5u - kMultiByte)) {
        uc_size_in_bytes = 1;
        goto InvalidString;
      }

      if (PSF_UNLIKELY(remaining < 4))
        goto TruncatedString;

      uint32_t b1 = MemOps::readU8(_ptr + 1) ^ 0x80u;
      uint32_t b2 = MemOps::readU8(_ptr + 2) ^ 0x80u;
      uint32_t b3 = MemOps::readU8(_ptr + 3) ^ 0x80u;
      uc = ((uc + kMultiByte - 0xF0u) << 18) + (b1 << 12) + (b2 << 6) + b3;

      // 1. All consecutive bytes must be '10xxxxxx'.
      // 2. Refuse overlong UTF-8.
      // 3. Make sure the final character is <= U+10FFFF.
      if (PSF_UNLIKELY((b1 | b2 | b3) > 0x3Fu || uc < 0x010000u || uc > kCharMax))
        goto InvalidString;
    }

    _ptr += uc_size_in_bytes;
    return PSF_SUCCESS;

InvalidString:
    return psf_make_error(PSF_ERROR_INVALID_STRING);

TruncatedString:
    return psf_make_error(PSF_ERROR_DATA_TRUNCATED);
  }
};

} // {psf::Unicode}

//! \}
//! \endcond

#endif // PSFONT_UNICODE_UNICODE_P_H_INCLUDED

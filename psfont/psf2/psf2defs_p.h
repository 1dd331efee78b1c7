// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_PSF2_PSF2DEFS_P_H_INCLUDED
#define PSFONT_PSF2_PSF2DEFS_P_H_INCLUDED

#include <psfont/core/api-internal_p.h>
#include <psfont/core/font.h>
#include <psfont/support/memops_p.h>

//! \cond INTERNAL
//! \addtogroup psf_psf2_impl
//! \{

//! \namespace psf::Psf2
//! Low-level PSF2 functionality, not exposed to users directly.

namespace psf::Psf2 {

//! A range that specifies offset and size of a data table or some part of it.
struct DataRange {
  uint32_t offset;
  uint32_t size;

  PSF_INLINE_NODEBUG void reset(uint32_t offset_, uint32_t size_) noexcept {
    this->offset = offset_;
    this->size = size_;
  }

  PSF_INLINE_NODEBUG uint32_t end() const noexcept { return offset + size; }
};

//! A read only data that represents a PSF2 table (glyph table or unicode table).
struct RawTable {
  //! \name Members
  //! \{

  //! Pointer to the beginning of the data interpreted as `uint8_t*`.
  const uint8_t* data;
  //! Size of `data` in bytes.
  uint32_t size;

  //! \}

  //! \name Construction & Destruction
  //! \{

  PSF_INLINE_NODEBUG RawTable() noexcept = default;
  PSF_INLINE_NODEBUG RawTable(const RawTable& other) noexcept = default;

  PSF_INLINE_NODEBUG RawTable(const uint8_t* data, uint32_t size) noexcept
    : data(data),
      size(size) {}

  PSF_INLINE_NODEBUG RawTable(const uint8_t* base, const DataRange& range) noexcept
    : data(base + range.offset),
      size(range.size) {}

  //! \}

  //! \name Overloaded Operators
  //! \{

  PSF_INLINE_NODEBUG RawTable& operator=(const RawTable& other) noexcept = default;

  //! \}
};

template<size_t Size>
struct DataAccess {};

template<>
struct DataAccess<4> {
  template<uint32_t ByteOrder>
  static PSF_INLINE_NODEBUG uint32_t read_value(const uint8_t* data) noexcept { return MemOps::readU32u<ByteOrder>(data); }
};

#pragma pack(push, 1)
template<typename T, uint32_t ByteOrder, size_t Size>
struct DataType {
  uint8_t data[Size];

  PSF_INLINE_NODEBUG DataType(const DataType& other) noexcept = default;

  PSF_INLINE_NODEBUG T value() const noexcept { return T(DataAccess<Size>::template read_value<ByteOrder>(data)); }

  PSF_INLINE_NODEBUG T operator()() const noexcept { return value(); }

  PSF_INLINE_NODEBUG DataType& operator=(const DataType& other) noexcept = default;
};
#pragma pack(pop)

// Everything in PSF2 is little-endian.
typedef DataType<uint32_t, PSF_BYTE_ORDER_LE, 4> UInt32;

//! PSF2 font header.
//!
//! External Resources:
//!   - https://www.win.tue.nl/~aeb/linux/kbd/font-formats-1.html
struct FontHeader {
  enum : uint32_t { kBaseSize = 32 };

  enum : uint8_t {
    kMagic0 = 0x72u,
    kMagic1 = 0xB5u,
    kMagic2 = 0x4Au,
    kMagic3 = 0x86u
  };

  //! PSF1 magic, only recognized to provide a better trace message.
  enum : uint8_t {
    kPsf1Magic0 = 0x36u,
    kPsf1Magic1 = 0x04u
  };

  enum Flags : uint32_t {
    kFlagHasUnicodeTable = 0x00000001u,
    kFlagKnownMask = kFlagHasUnicodeTable
  };

  uint8_t magic[4];
  UInt32 version;
  UInt32 header_size;
  UInt32 flags;
  UInt32 glyph_count;
  UInt32 bytes_per_glyph;
  UInt32 height;
  UInt32 width;
};

PSF_STATIC_ASSERT(sizeof(FontHeader) == FontHeader::kBaseSize);

//! PSF2 unicode table markers.
//!
//! Each glyph has a record of UTF-8 code-points, which can be followed by sequences each introduced by
//! `kStartSequence`. A record is terminated by `kSeparator`. Neither marker is a valid UTF-8 byte.
struct UnicodeTable {
  enum : uint32_t {
    kStartSequence = 0xFEu,
    kSeparator = 0xFFu
  };
};

} // {psf::Psf2}

//! \}
//! \endcond

#endif // PSFONT_PSF2_PSF2DEFS_P_H_INCLUDED

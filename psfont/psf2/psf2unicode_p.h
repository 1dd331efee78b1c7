// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_PSF2_PSF2UNICODE_P_H_INCLUDED
#define PSFONT_PSF2_PSF2UNICODE_P_H_INCLUDED

#include <psfont/psf2/psf2defs_p.h>
#include <psfont/unicode/unicode_p.h>

//! \cond INTERNAL
//! \addtogroup psf_psf2_impl
//! \{

namespace psf::Psf2 {

//! A single codepoint to glyph index association decoded from the unicode table.
struct UnicodeEntry {
  //! Decoded codepoint.
  uint32_t codepoint;
  //! Index of the record (and the glyph) the codepoint belongs to.
  uint32_t glyph_index;
  //! The codepoint is a part of a sequence (introduced by `UnicodeTable::kStartSequence`).
  bool in_sequence;
};

//! Forward-only reader of PSF2 unicode table records.
//!
//! The reader doesn't allocate, it decodes entries directly from the table data on each call to `next()` and stops
//! after `glyph_count` records, so the data that follows the last record is never interpreted.
class UnicodeTableReader {
public:
  const uint8_t* _ptr;
  const uint8_t* _end;
  uint32_t _glyph_index;
  uint32_t _glyph_count;
  bool _in_sequence;

  PSF_INLINE UnicodeTableReader(const RawTable& table, uint32_t glyph_count) noexcept
    : _ptr(table.data),
      _end(table.data + table.size),
      _glyph_index(0),
      _glyph_count(glyph_count),
      _in_sequence(false) {}

  //! Returns the index of the record being read.
  PSF_INLINE_NODEBUG uint32_t glyph_index() const noexcept { return _glyph_index; }

  //! Returns the number of bytes that were not consumed yet.
  PSF_INLINE_NODEBUG size_t remaining_size() const noexcept { return size_t(_end - _ptr); }

  //! Decodes the next entry.
  //!
  //! Returns `PSF_SUCCESS` if `entry_out` was filled, `PSF_RESULT_NOTHING` if all records were read, and
  //! `PSF_ERROR_MALFORMED_UNICODE_TABLE` if a record is not terminated or contains invalid UTF-8. The reader doesn't
  //! advance on failure, so each subsequent call returns the same error.
  PSFResult next(UnicodeEntry& entry_out) noexcept {
    while (_glyph_index < _glyph_count) {
      if (PSF_UNLIKELY(_ptr == _end))
        return psf_make_error(PSF_ERROR_MALFORMED_UNICODE_TABLE);

      uint32_t b = MemOps::readU8(_ptr);
      if (b == UnicodeTable::kSeparator) {
        _ptr++;
        _glyph_index++;
        _in_sequence = false;
        continue;
      }

      if (b == UnicodeTable::kStartSequence) {
        _ptr++;
        _in_sequence = true;
        continue;
      }

      Unicode::Utf8Reader reader(_ptr, remaining_size());
      uint32_t uc;
      size_t uc_size;

      if (PSF_UNLIKELY(reader.next<Unicode::IOFlags::kStrict>(uc, uc_size) != PSF_SUCCESS))
        return psf_make_error(PSF_ERROR_MALFORMED_UNICODE_TABLE);

      _ptr += uc_size;
      entry_out.codepoint = uc;
      entry_out.glyph_index = _glyph_index;
      entry_out.in_sequence = _in_sequence;
      return PSF_SUCCESS;
    }

    return PSF_RESULT_NOTHING;
  }
};

//! PSF2 unicode table validation and search.
namespace UnicodeImpl {

//! Validates all `glyph_count` records of the unicode `table`.
//!
//! Stores the number of bytes that follow the last record to `trailing_size_out`.
PSF_HIDDEN PSFResult validate(const RawTable& table, uint32_t glyph_count, uint32_t* trailing_size_out) noexcept;

//! Finds a glyph index that maps to codepoint `uc`.
//!
//! A codepoint that maps to a glyph directly has a priority over a codepoint that only appears in a sequence, in
//! that case the first sequence that contains it is used. The search ends at the first malformed record.
PSF_HIDDEN bool find_glyph(const RawTable& table, uint32_t glyph_count, uint32_t uc, uint32_t* glyph_index_out) noexcept;

} // {UnicodeImpl}

} // {psf::Psf2}

//! \}
//! \endcond

#endif // PSFONT_PSF2_PSF2UNICODE_P_H_INCLUDED

// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_PSF2_PSF2_TEST_P_H_INCLUDED
#define PSFONT_PSF2_PSF2_TEST_P_H_INCLUDED

#include <psfont/core/api-build_test_p.h>
#include <psfont/core/api-internal_p.h>
#include <psfont/psf2/psf2defs_p.h>
#include <psfont/support/intops_p.h>

#include <initializer_list>
#include <vector>

//! \cond NEVER

namespace psf::Psf2::Tests {
namespace {

// psf::Psf2 - Tests - Utilities
// =============================

static void append_utf8(std::vector<uint8_t>& out, uint32_t uc) {
  if (uc < 0x80u) {
    out.push_back(uint8_t(uc));
  }
  else if (uc < 0x800u) {
    out.push_back(uint8_t(0xC0u | (uc >> 6)));
    out.push_back(uint8_t(0x80u | (uc & 0x3Fu)));
  }
  else if (uc < 0x10000u) {
    out.push_back(uint8_t(0xE0u | (uc >> 12)));
    out.push_back(uint8_t(0x80u | ((uc >> 6) & 0x3Fu)));
    out.push_back(uint8_t(0x80u | (uc & 0x3Fu)));
  }
  else {
    out.push_back(uint8_t(0xF0u | (uc >> 18)));
    out.push_back(uint8_t(0x80u | ((uc >> 12) & 0x3Fu)));
    out.push_back(uint8_t(0x80u | ((uc >> 6) & 0x3Fu)));
    out.push_back(uint8_t(0x80u | (uc & 0x3Fu)));
  }
}

static void write_u32_le(uint8_t* p, uint32_t value) {
  for (uint32_t i = 0; i < 4; i++)
    p[i] = uint8_t(value >> (i * 8u));
}

// psf::Psf2 - Tests - Font Builder
// ================================

//! Builds synthetic PSF2 fonts used by unit tests.
//!
//! Header fields can be overridden to produce invalid fonts. Unicode records are stored without the terminating
//! `0xFF` byte, which is added by `build()` for each glyph.
class FontBuilder {
public:
  uint32_t _width;
  uint32_t _height;
  uint32_t _version = 0;
  uint32_t _header_size = FontHeader::kBaseSize;
  uint32_t _flags = 0;
  uint32_t _bytes_per_glyph;
  uint32_t _glyph_count_override = 0;
  bool _has_glyph_count_override = false;

  std::vector<std::vector<uint8_t>> _glyphs;
  std::vector<std::vector<uint8_t>> _records;
  std::vector<uint8_t> _trailing;

  FontBuilder(uint32_t width, uint32_t height)
    : _width(width),
      _height(height),
      _bytes_per_glyph(height * IntOps::div_ceil(width, 8u)) {}

  uint32_t bytes_per_row() const { return IntOps::div_ceil(_width, 8u); }
  uint32_t glyph_count() const { return uint32_t(_glyphs.size()); }

  FontBuilder& set_version(uint32_t version) { _version = version; return *this; }
  FontBuilder& set_header_size(uint32_t header_size) { _header_size = header_size; return *this; }
  FontBuilder& set_flags(uint32_t flags) { _flags = flags; return *this; }
  FontBuilder& set_bytes_per_glyph(uint32_t bytes_per_glyph) { _bytes_per_glyph = bytes_per_glyph; return *this; }

  FontBuilder& set_glyph_count(uint32_t glyph_count) {
    _glyph_count_override = glyph_count;
    _has_glyph_count_override = true;
    return *this;
  }

  FontBuilder& set_unicode_table(bool value) {
    if (value)
      _flags |= FontHeader::kFlagHasUnicodeTable;
    else
      _flags &= ~uint32_t(FontHeader::kFlagHasUnicodeTable);
    return *this;
  }

  //! Adds a glyph, `bitmap` is padded with zeros (or truncated) to bytes-per-glyph.
  uint32_t add_glyph(std::initializer_list<uint8_t> bitmap) {
    std::vector<uint8_t> glyph(bitmap);
    glyph.resize(_bytes_per_glyph, 0u);
    _glyphs.push_back(glyph);
    _records.emplace_back();
    return glyph_count() - 1u;
  }

  //! Adds `n` glyphs, each filled with its own index (truncated to 8 bits).
  FontBuilder& add_indexed_glyphs(uint32_t n) {
    for (uint32_t i = 0; i < n; i++) {
      _glyphs.emplace_back(_bytes_per_glyph, uint8_t(glyph_count()));
      _records.emplace_back();
    }
    return *this;
  }

  //! Maps a codepoint `uc` to `glyph_index`.
  FontBuilder& map(uint32_t glyph_index, uint32_t uc) {
    append_utf8(_records[glyph_index], uc);
    return *this;
  }

  //! Maps a sequence of codepoints to `glyph_index`.
  FontBuilder& map_sequence(uint32_t glyph_index, std::initializer_list<uint32_t> sequence) {
    _records[glyph_index].push_back(uint8_t(UnicodeTable::kStartSequence));
    for (uint32_t uc : sequence)
      append_utf8(_records[glyph_index], uc);
    return *this;
  }

  //! Appends raw bytes to the unicode record of `glyph_index`.
  FontBuilder& add_record_bytes(uint32_t glyph_index, std::initializer_list<uint8_t> bytes) {
    _records[glyph_index].insert(_records[glyph_index].end(), bytes);
    return *this;
  }

  FontBuilder& add_record_bytes(uint32_t glyph_index, const uint8_t* bytes, size_t size) {
    _records[glyph_index].insert(_records[glyph_index].end(), bytes, bytes + size);
    return *this;
  }

  FontBuilder& add_trailing_data(std::initializer_list<uint8_t> bytes) {
    _trailing.insert(_trailing.end(), bytes);
    return *this;
  }

  std::vector<uint8_t> build() const {
    std::vector<uint8_t> out(psf_max<size_t>(_header_size, FontHeader::kBaseSize), 0u);
    uint8_t* header = out.data();

    header[0] = FontHeader::kMagic0;
    header[1] = FontHeader::kMagic1;
    header[2] = FontHeader::kMagic2;
    header[3] = FontHeader::kMagic3;

    write_u32_le(header +  4, _version);
    write_u32_le(header +  8, _header_size);
    write_u32_le(header + 12, _flags);
    write_u32_le(header + 16, _has_glyph_count_override ? _glyph_count_override : glyph_count());
    write_u32_le(header + 20, _bytes_per_glyph);
    write_u32_le(header + 24, _height);
    write_u32_le(header + 28, _width);

    for (const std::vector<uint8_t>& glyph : _glyphs)
      out.insert(out.end(), glyph.begin(), glyph.end());

    if (_flags & FontHeader::kFlagHasUnicodeTable) {
      for (const std::vector<uint8_t>& record : _records) {
        out.insert(out.end(), record.begin(), record.end());
        out.push_back(uint8_t(UnicodeTable::kSeparator));
      }
    }

    out.insert(out.end(), _trailing.begin(), _trailing.end());
    return out;
  }
};

} // {anonymous}
} // {psf::Psf2::Tests}

//! \endcond

#endif // PSFONT_PSF2_PSF2_TEST_P_H_INCLUDED

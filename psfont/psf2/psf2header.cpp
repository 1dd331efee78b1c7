// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <psfont/core/api-build_p.h>
#include <psfont/core/trace_p.h>
#include <psfont/psf2/psf2header_p.h>
#include <psfont/support/intops_p.h>

namespace psf::Psf2 {
namespace HeaderImpl {

// psf::Psf2::HeaderImpl - Trace
// =============================

#if defined(PSF_TRACE_PSF2_ALL) || defined(PSF_TRACE_PSF2_HEADER)
#define Trace DebugTrace
#else
#define Trace DummyTrace
#endif

// psf::Psf2::HeaderImpl - Utilities
// =================================

static PSF_INLINE const char* string_from_bool(bool value) noexcept {
  static const char str[] = "False\0\0\0True";
  return str + (size_t(value) * 8u);
}

static PSF_INLINE bool is_psf2_magic(const uint8_t* data) noexcept {
  return data[0] == FontHeader::kMagic0 &&
         data[1] == FontHeader::kMagic1 &&
         data[2] == FontHeader::kMagic2 &&
         data[3] == FontHeader::kMagic3;
}

static PSF_INLINE bool is_psf1_magic(const uint8_t* data) noexcept {
  return data[0] == FontHeader::kPsf1Magic0 &&
         data[1] == FontHeader::kPsf1Magic1;
}

// psf::Psf2::HeaderImpl - Parse
// =============================

PSFResult parse(const uint8_t* data, size_t size, PSFFontInfo* info_out) noexcept {
  Trace trace;
  trace.info("psf::Psf2::HeaderImpl::parse [Size=%zu]\n", size);
  trace.indent();

  if (PSF_UNLIKELY(size < 4u)) {
    trace.fail("Data too small to contain PSF2 magic\n");
    return psf_make_error(PSF_ERROR_TRUNCATED_HEADER);
  }

  if (PSF_UNLIKELY(!is_psf2_magic(data))) {
    if (is_psf1_magic(data))
      trace.fail("PSF1 font detected, only PSF2 is supported\n");
    else
      trace.fail("Invalid magic [%02X %02X %02X %02X]\n", data[0], data[1], data[2], data[3]);
    return psf_make_error(PSF_ERROR_INVALID_MAGIC);
  }

  if (PSF_UNLIKELY(uint64_t(size) > uint64_t(0xFFFFFFFFu))) {
    trace.fail("Data too large [Size=%zu]\n", size);
    return psf_make_error(PSF_ERROR_DATA_TOO_LARGE);
  }

  if (PSF_UNLIKELY(size < FontHeader::kBaseSize)) {
    trace.fail("Data too small to contain PSF2 header [Size=%zu Required=%u]\n", size, unsigned(FontHeader::kBaseSize));
    return psf_make_error(PSF_ERROR_TRUNCATED_HEADER);
  }

  const FontHeader* header = reinterpret_cast<const FontHeader*>(data);

  uint32_t version = header->version();
  uint32_t header_size = header->header_size();
  uint32_t header_flags = header->flags();
  uint32_t glyph_count = header->glyph_count();
  uint32_t bytes_per_glyph = header->bytes_per_glyph();
  uint32_t width = header->width();
  uint32_t height = header->height();

  trace.info("Version: %u\n", version);
  trace.info("HeaderSize: %u\n", header_size);
  trace.info("HasUnicodeTable: %s\n", string_from_bool((header_flags & FontHeader::kFlagHasUnicodeTable) != 0));
  trace.info("GlyphCount: %u\n", glyph_count);
  trace.info("BytesPerGlyph: %u\n", bytes_per_glyph);
  trace.info("Size: [%u x %u]\n", width, height);

  if (PSF_UNLIKELY(version != 0u)) {
    trace.fail("Unsupported version [%u]\n", version);
    return psf_make_error(PSF_ERROR_UNSUPPORTED_VERSION);
  }

  if (PSF_UNLIKELY(header_size < FontHeader::kBaseSize)) {
    trace.fail("Header size [%u] is smaller than %u\n", header_size, unsigned(FontHeader::kBaseSize));
    return psf_make_error(PSF_ERROR_INVALID_HEADER);
  }

  if (PSF_UNLIKELY(!width || !height || !glyph_count)) {
    trace.fail("Width, height, and glyph count must be non-zero\n");
    return psf_make_error(PSF_ERROR_INVALID_HEADER);
  }

  OverflowFlag of{};
  uint32_t bytes_per_row = IntOps::div_ceil(width, 8u);
  uint32_t bitmap_size = IntOps::mul_overflow(height, bytes_per_row, &of);

  if (PSF_UNLIKELY(of || bytes_per_glyph < bitmap_size)) {
    trace.fail("BytesPerGlyph [%u] is too small to hold a [%u x %u] bitmap\n", bytes_per_glyph, width, height);
    return psf_make_error(PSF_ERROR_INVALID_HEADER);
  }

  if (PSF_UNLIKELY(size < header_size)) {
    trace.fail("Data too small to contain the declared header [Size=%zu HeaderSize=%u]\n", size, header_size);
    return psf_make_error(PSF_ERROR_TRUNCATED_HEADER);
  }

  uint64_t glyph_table_size = uint64_t(glyph_count) * bytes_per_glyph;
  uint64_t glyph_table_end = uint64_t(header_size) + glyph_table_size;

  if (PSF_UNLIKELY(glyph_table_end > uint64_t(size))) {
    trace.fail("Glyph table is truncated [Required=%llu Size=%zu]\n", (unsigned long long)glyph_table_end, size);
    return psf_make_error(PSF_ERROR_TRUNCATED_GLYPH_TABLE);
  }

  // Offsets fit into 32 bits from here as `size` was already checked.
  uint32_t data_size = uint32_t(size);
  uint32_t font_flags = PSF_FONT_NO_FLAGS;
  uint32_t diag_flags = PSF_FONT_DIAG_NO_FLAGS;

  DataRange glyph_table {header_size, uint32_t(glyph_table_size)};
  DataRange unicode_table {0u, 0u};

  if (header_flags & FontHeader::kFlagHasUnicodeTable) {
    font_flags |= PSF_FONT_FLAG_HAS_UNICODE_TABLE;
    unicode_table.reset(glyph_table.end(), data_size - glyph_table.end());
    trace.info("UnicodeTable: [Offset=%u Size=%u]\n", unicode_table.offset, unicode_table.size);
  }
  else if (glyph_table.end() < data_size) {
    diag_flags |= PSF_FONT_DIAG_TRAILING_DATA;
    trace.warn("Trailing data after glyph table [%u bytes]\n", data_size - glyph_table.end());
  }

  if (header_flags & ~uint32_t(FontHeader::kFlagKnownMask)) {
    diag_flags |= PSF_FONT_DIAG_UNKNOWN_HEADER_FLAGS;
    trace.warn("Unknown header flags [0x%08X]\n", header_flags);
  }

  if (header_size > FontHeader::kBaseSize) {
    diag_flags |= PSF_FONT_DIAG_EXTENDED_HEADER;
    trace.warn("Extended header [%u bytes skipped]\n", header_size - uint32_t(FontHeader::kBaseSize));
  }

  if (bytes_per_glyph > bitmap_size) {
    diag_flags |= PSF_FONT_DIAG_GLYPH_PADDING;
    trace.warn("Glyphs are padded [%u bytes]\n", bytes_per_glyph - bitmap_size);
  }

  info_out->version = version;
  info_out->header_size = header_size;
  info_out->header_flags = header_flags;
  info_out->glyph_count = glyph_count;
  info_out->bytes_per_glyph = bytes_per_glyph;
  info_out->width = width;
  info_out->height = height;
  info_out->bytes_per_row = bytes_per_row;
  info_out->glyph_table_offset = glyph_table.offset;
  info_out->glyph_table_size = glyph_table.size;
  info_out->unicode_table_offset = unicode_table.offset;
  info_out->unicode_table_size = unicode_table.size;
  info_out->font_flags = font_flags;
  info_out->diag_flags = diag_flags;

  return PSF_SUCCESS;
}

} // {HeaderImpl}
} // {psf::Psf2}

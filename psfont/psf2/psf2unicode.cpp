// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <psfont/core/api-build_p.h>
#include <psfont/core/trace_p.h>
#include <psfont/psf2/psf2unicode_p.h>

namespace psf::Psf2 {
namespace UnicodeImpl {

// psf::Psf2::UnicodeImpl - Trace
// ==============================

#if defined(PSF_TRACE_PSF2_ALL) || defined(PSF_TRACE_PSF2_UNICODE)
#define Trace DebugTrace
#else
#define Trace DummyTrace
#endif

// psf::Psf2::UnicodeImpl - Validate
// =================================

PSFResult validate(const RawTable& table, uint32_t glyph_count, uint32_t* trailing_size_out) noexcept {
  Trace trace;
  trace.info("psf::Psf2::UnicodeImpl::validate [Size=%u GlyphCount=%u]\n", table.size, glyph_count);
  trace.indent();

  UnicodeTableReader reader(table, glyph_count);
  UnicodeEntry entry;

  uint32_t entry_count = 0;
  uint32_t sequence_entry_count = 0;

  for (;;) {
    PSFResult result = reader.next(entry);
    if (result == PSF_RESULT_NOTHING)
      break;

    if (PSF_UNLIKELY(result != PSF_SUCCESS)) {
      if (reader.remaining_size() == 0)
        trace.fail("Record #%u is not terminated\n", reader.glyph_index());
      else
        trace.fail("Record #%u contains invalid UTF-8 at offset %zu\n", reader.glyph_index(), size_t(table.size) - reader.remaining_size());
      return result;
    }

    entry_count++;
    sequence_entry_count += uint32_t(entry.in_sequence);
  }

  uint32_t trailing_size = uint32_t(reader.remaining_size());
  trace.info("Entries: %u (%u in sequences)\n", entry_count, sequence_entry_count);

  if (trailing_size)
    trace.warn("Trailing data after the last record [%u bytes]\n", trailing_size);

  *trailing_size_out = trailing_size;
  return PSF_SUCCESS;
}

// psf::Psf2::UnicodeImpl - Find Glyph
// ===================================

bool find_glyph(const RawTable& table, uint32_t glyph_count, uint32_t uc, uint32_t* glyph_index_out) noexcept {
  UnicodeTableReader reader(table, glyph_count);
  UnicodeEntry entry;

  bool has_sequence_match = false;
  uint32_t sequence_match = 0;

  while (reader.next(entry) == PSF_SUCCESS) {
    if (entry.codepoint != uc)
      continue;

    if (!entry.in_sequence) {
      *glyph_index_out = entry.glyph_index;
      return true;
    }

    if (!has_sequence_match) {
      has_sequence_match = true;
      sequence_match = entry.glyph_index;
    }
  }

  if (has_sequence_match) {
    *glyph_index_out = sequence_match;
    return true;
  }

  return false;
}

} // {UnicodeImpl}
} // {psf::Psf2}

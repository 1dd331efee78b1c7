// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_CORE_FONT_H_INCLUDED
#define PSFONT_CORE_FONT_H_INCLUDED

#include <psfont/core/glyph.h>
#include <psfont/core/runtime.h>

//! \addtogroup psf_font
//! \{

//! \name PSFFont - Constants
//! \{

//! Flags that can be passed to \ref psf_font_create_from_data().
PSF_DEFINE_ENUM(PSFFontCreateFlags) {
  //! No flags.
  PSF_FONT_CREATE_NO_FLAGS = 0u,

  //! Don't validate the unicode table when creating the font.
  //!
  //! The unicode table is still parsed on demand by unicode lookups, which stop at the first malformed record. Useful
  //! when the font comes from a trusted source and the creation must not depend on the size of the unicode table.
  PSF_FONT_CREATE_FLAG_NO_UNICODE_VALIDATION = 0x00000001u

  PSF_FORCE_ENUM_UINT32(PSF_FONT_CREATE)
};

//! Font flags, describe properties of a created font.
PSF_DEFINE_ENUM(PSFFontFlags) {
  //! No flags.
  PSF_FONT_NO_FLAGS = 0u,
  //! The font has a unicode table.
  PSF_FONT_FLAG_HAS_UNICODE_TABLE = 0x00000001u,
  //! The unicode table was validated during font creation.
  PSF_FONT_FLAG_UNICODE_TABLE_VALIDATED = 0x00000002u

  PSF_FORCE_ENUM_UINT32(PSF_FONT_FLAG)
};

//! Diagnostic flags offered by \ref PSFFontInfo.
//!
//! These flags describe irregularities in the font data that were tolerated by the decoder.
PSF_DEFINE_ENUM(PSFFontDiagFlags) {
  //! No diagnostic flags.
  PSF_FONT_DIAG_NO_FLAGS = 0u,
  //! The header contains flags that are not known to psfont (ignored).
  PSF_FONT_DIAG_UNKNOWN_HEADER_FLAGS = 0x00000001u,
  //! The header size is greater than 32 bytes (extra header data skipped).
  PSF_FONT_DIAG_EXTENDED_HEADER = 0x00000002u,
  //! Bytes per glyph is greater than `height * bytes_per_row` (glyphs are padded).
  PSF_FONT_DIAG_GLYPH_PADDING = 0x00000004u,
  //! There is data after the glyph table (no unicode table) or after the last unicode table record.
  PSF_FONT_DIAG_TRAILING_DATA = 0x00000008u

  PSF_FORCE_ENUM_UINT32(PSF_FONT_DIAG)
};

//! \}

//! \name PSFFont - Structs
//! \{

//! Information about a font, filled by \ref psf_font_create_from_data().
struct PSFFontInfo {
  //! PSF2 version stored in the header (always 0).
  uint32_t version;
  //! Header size stored in the header (offset of the glyph table).
  uint32_t header_size;
  //! Raw header flags.
  uint32_t header_flags;

  //! Number of glyphs in the glyph table.
  uint32_t glyph_count;
  //! Size of a single glyph in bytes.
  uint32_t bytes_per_glyph;
  //! Glyph width in pixels.
  uint32_t width;
  //! Glyph height in pixels.
  uint32_t height;
  //! Size of a single glyph row in bytes, always `(width + 7) / 8`.
  uint32_t bytes_per_row;

  //! Offset of the glyph table (relative to the beginning of font data).
  uint32_t glyph_table_offset;
  //! Size of the glyph table in bytes.
  uint32_t glyph_table_size;
  //! Offset of the unicode table (zero if the font has no unicode table).
  uint32_t unicode_table_offset;
  //! Size of the unicode table in bytes (zero if the font has no unicode table).
  uint32_t unicode_table_size;

  //! Font flags, see \ref PSFFontFlags.
  uint32_t font_flags;
  //! Diagnostic flags, see \ref PSFFontDiagFlags.
  uint32_t diag_flags;

#ifdef __cplusplus
  PSF_INLINE_NODEBUG void reset() noexcept { *this = PSFFontInfo{}; }
#endif
};

//! Glyph cache data (ring of codepoint to glyph index associations).
//!
//! Entries are inserted at `cursor`, which wraps around when the cache is full, so the oldest entry is always the
//! one replaced. A codepoint is never stored twice.
struct PSFGlyphCacheData {
  uint32_t codepoints[PSF_RUNTIME_GLYPH_CACHE_CAPACITY];
  uint32_t glyph_indexes[PSF_RUNTIME_GLYPH_CACHE_CAPACITY];
  //! Number of valid entries.
  uint32_t size;
  //! Index where the next entry will be inserted.
  uint32_t cursor;
};

//! Font [C API].
struct PSFFontCore {
  //! Font data (borrowed, never copied or modified).
  const uint8_t* data;
  //! Font data size in bytes.
  size_t size;
  //! Font information.
  PSFFontInfo info;
  //! Glyph cache used by unicode lookups.
  PSFGlyphCacheData cache;
};

//! \}
//! \}

//! \addtogroup psf_c_api
//! \{

//! \name PSFFont - C API
//! \{

PSF_BEGIN_C_DECLS

PSF_API PSFResult PSF_CDECL psf_font_init(PSFFontCore* self) PSF_NOEXCEPT_C;
PSF_API PSFResult PSF_CDECL psf_font_reset(PSFFontCore* self) PSF_NOEXCEPT_C;
PSF_API PSFResult PSF_CDECL psf_font_create_from_data(PSFFontCore* self, const void* data, size_t size, PSFFontCreateFlags create_flags) PSF_NOEXCEPT_C;
PSF_API PSFResult PSF_CDECL psf_font_get_info(const PSFFontCore* self, PSFFontInfo* info_out) PSF_NOEXCEPT_C;

PSF_API bool PSF_CDECL psf_font_glyph_for_index(const PSFFontCore* self, uint32_t glyph_index, PSFGlyphCore* glyph_out) PSF_NOEXCEPT_C;
PSF_API bool PSF_CDECL psf_font_glyph_for_ascii(const PSFFontCore* self, uint32_t c, PSFGlyphCore* glyph_out) PSF_NOEXCEPT_C;
PSF_API bool PSF_CDECL psf_font_glyph_for_codepoint(PSFFontCore* self, uint32_t uc, PSFGlyphCore* glyph_out) PSF_NOEXCEPT_C;
PSF_API bool PSF_CDECL psf_font_glyph_for_utf8(PSFFontCore* self, const char* text, size_t size, size_t* consumed_out, PSFGlyphCore* glyph_out) PSF_NOEXCEPT_C;

PSF_END_C_DECLS

//! \}
//! \}

//! \addtogroup psf_font
//! \{

//! \name PSFFont - C++ API
//! \{

#ifdef __cplusplus

//! PSF2 font [C++ API].
//!
//! Font is a view of PSF2 data provided by the user. The data is validated by \ref create_from_data() and must
//! outlive the font and all glyphs returned by it. Lookups never fail with an error, a glyph that is not found is
//! reported by returning `false`.
//!
//! Unicode lookups (\ref glyph_for_codepoint() and \ref glyph_for_utf8()) modify the glyph cache, thus a single
//! font instance must not be used by multiple threads at the same time. Copying a font copies its cache as well,
//! so each thread can use its own copy.
class PSFFont final : public PSFFontCore {
public:
  //! \name Construction & Destruction
  //! \{

  PSF_INLINE_NODEBUG PSFFont() noexcept { psf_font_init(this); }
  PSF_INLINE_NODEBUG PSFFont(const PSFFont& other) noexcept = default;

  PSF_INLINE_NODEBUG PSFFont& operator=(const PSFFont& other) noexcept = default;

  //! \}

  //! \name Common Functionality
  //! \{

  //! Resets the font to a default constructed state.
  PSF_INLINE_NODEBUG PSFResult reset() noexcept { return psf_font_reset(this); }

  //! Tests whether the font is empty (default constructed, reset, or a failed creation).
  [[nodiscard]]
  PSF_INLINE_NODEBUG bool is_empty() const noexcept { return data == nullptr; }

  //! Tests whether the font is valid (has been successfully created).
  [[nodiscard]]
  PSF_INLINE_NODEBUG bool is_valid() const noexcept { return data != nullptr; }

  //! \}

  //! \name Create Functionality
  //! \{

  //! Creates the font from PSF2 `data` of the given `size`.
  //!
  //! The data is borrowed. If the creation fails the font is left empty and an error is returned.
  PSF_INLINE_NODEBUG PSFResult create_from_data(const void* data_, size_t size_, PSFFontCreateFlags create_flags = PSF_FONT_CREATE_NO_FLAGS) noexcept {
    return psf_font_create_from_data(this, data_, size_, create_flags);
  }

  //! \}

  //! \name Accessors
  //! \{

  [[nodiscard]]
  PSF_INLINE_NODEBUG const PSFFontInfo& font_info() const noexcept { return info; }

  [[nodiscard]]
  PSF_INLINE_NODEBUG uint32_t glyph_count() const noexcept { return info.glyph_count; }

  [[nodiscard]]
  PSF_INLINE_NODEBUG uint32_t width() const noexcept { return info.width; }

  [[nodiscard]]
  PSF_INLINE_NODEBUG uint32_t height() const noexcept { return info.height; }

  [[nodiscard]]
  PSF_INLINE_NODEBUG uint32_t bytes_per_row() const noexcept { return info.bytes_per_row; }

  [[nodiscard]]
  PSF_INLINE_NODEBUG uint32_t bytes_per_glyph() const noexcept { return info.bytes_per_glyph; }

  [[nodiscard]]
  PSF_INLINE_NODEBUG uint32_t font_flags() const noexcept { return info.font_flags; }

  [[nodiscard]]
  PSF_INLINE_NODEBUG uint32_t diag_flags() const noexcept { return info.diag_flags; }

  [[nodiscard]]
  PSF_INLINE_NODEBUG bool has_unicode_table() const noexcept { return (info.font_flags & PSF_FONT_FLAG_HAS_UNICODE_TABLE) != 0; }

  //! \}

  //! \name Glyph Lookup
  //! \{

  //! Retrieves a glyph at `glyph_index`, returns `false` if the index is out of range.
  PSF_INLINE_NODEBUG bool glyph_for_index(uint32_t glyph_index, PSFGlyph& glyph_out) const noexcept {
    return psf_font_glyph_for_index(this, glyph_index, &glyph_out);
  }

  //! Retrieves a glyph of an ASCII character `c`, which maps to the same glyph index.
  //!
  //! Returns `false` if `c` is not ASCII (greater than 127) or if the font doesn't have enough glyphs.
  PSF_INLINE_NODEBUG bool glyph_for_ascii(uint32_t c, PSFGlyph& glyph_out) const noexcept {
    return psf_font_glyph_for_ascii(this, c, &glyph_out);
  }

  //! Retrieves a glyph of a unicode codepoint `uc`.
  //!
  //! ASCII codepoints use the ASCII path, other codepoints are resolved through the glyph cache and the unicode
  //! table. Returns `false` if the codepoint has no glyph.
  PSF_INLINE_NODEBUG bool glyph_for_codepoint(uint32_t uc, PSFGlyph& glyph_out) noexcept {
    return psf_font_glyph_for_codepoint(this, uc, &glyph_out);
  }

  //! Retrieves a glyph of the first codepoint of UTF-8 `text` (null terminated).
  PSF_INLINE_NODEBUG bool glyph_for_utf8(const char* text, PSFGlyph& glyph_out) noexcept {
    return psf_font_glyph_for_utf8(this, text, SIZE_MAX, nullptr, &glyph_out);
  }

  //! Retrieves a glyph of the first codepoint of UTF-8 `text` of the given `size`.
  //!
  //! Returns `false` if the text is empty, if it doesn't start with a valid UTF-8 sequence, or if the codepoint has
  //! no glyph.
  PSF_INLINE_NODEBUG bool glyph_for_utf8(const char* text, size_t size_, PSFGlyph& glyph_out) noexcept {
    return psf_font_glyph_for_utf8(this, text, size_, nullptr, &glyph_out);
  }

  //! \overload
  //!
  //! Also stores the number of bytes of the decoded codepoint to `consumed_out`, which is set even when the codepoint
  //! has no glyph so the caller can advance to the next one. It's zero if the text doesn't start with a valid UTF-8
  //! sequence.
  PSF_INLINE_NODEBUG bool glyph_for_utf8(const char* text, size_t size_, size_t& consumed_out, PSFGlyph& glyph_out) noexcept {
    return psf_font_glyph_for_utf8(this, text, size_, &consumed_out, &glyph_out);
  }

  //! \}
};

#endif

//! \}
//! \}

#endif // PSFONT_CORE_FONT_H_INCLUDED

// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <psfont/core/api-build_p.h>
#include <psfont/core/font.h>
#include <psfont/core/glyphcache_p.h>
#include <psfont/psf2/psf2header_p.h>
#include <psfont/psf2/psf2unicode_p.h>
#include <psfont/unicode/unicode_p.h>

namespace psf {
namespace FontInternal {

// psf::Font - Constants
// =====================

static constexpr uint32_t kAsciiCount = 128u;

// Longest UTF-8 sequence, used to bound the decoding of null terminated input.
static constexpr size_t kMaxUtf8Size = 4u;

// psf::Font - Utilities
// =====================

static PSF_INLINE void init_core(PSFFontCore* self) noexcept {
  self->data = nullptr;
  self->size = 0;
  self->info.reset();
  GlyphCache::reset(&self->cache);
}

static PSF_INLINE bool glyph_not_found(PSFGlyphCore* glyph_out) noexcept {
  *glyph_out = PSFGlyphCore{};
  return false;
}

static PSF_INLINE size_t utf8_size_of_null_terminated(const char* text) noexcept {
  size_t n = 0;
  while (n < kMaxUtf8Size && text[n] != '\0')
    n++;
  return n;
}

// Scans the unicode table, only called after a glyph cache miss.
static PSF_NOINLINE bool find_glyph_index(const PSFFontCore* self, uint32_t uc, uint32_t* glyph_index_out) noexcept {
  Psf2::DataRange range {self->info.unicode_table_offset, self->info.unicode_table_size};
  Psf2::RawTable table(self->data, range);
  return Psf2::UnicodeImpl::find_glyph(table, self->info.glyph_count, uc, glyph_index_out);
}

} // {FontInternal}
} // {psf}

// psf::Font - API - Init & Reset
// ==============================

PSF_API_IMPL PSFResult psf_font_init(PSFFontCore* self) noexcept {
  psf::FontInternal::init_core(self);
  return PSF_SUCCESS;
}

PSF_API_IMPL PSFResult psf_font_reset(PSFFontCore* self) noexcept {
  psf::FontInternal::init_core(self);
  return PSF_SUCCESS;
}

// psf::Font - API - Create
// ========================

PSF_API_IMPL PSFResult psf_font_create_from_data(PSFFontCore* self, const void* data, size_t size, PSFFontCreateFlags create_flags) noexcept {
  using namespace psf;

  constexpr uint32_t kKnownCreateFlags = PSF_FONT_CREATE_FLAG_NO_UNICODE_VALIDATION;

  if (PSF_UNLIKELY((create_flags & ~kKnownCreateFlags) != 0 || (!data && size))) {
    FontInternal::init_core(self);
    return psf_make_error(PSF_ERROR_INVALID_VALUE);
  }

  const uint8_t* bytes = static_cast<const uint8_t*>(data);

  PSFFontInfo info {};
  PSFResult result = Psf2::HeaderImpl::parse(bytes, size, &info);

  if (result == PSF_SUCCESS && (info.font_flags & PSF_FONT_FLAG_HAS_UNICODE_TABLE) != 0 &&
      (create_flags & PSF_FONT_CREATE_FLAG_NO_UNICODE_VALIDATION) == 0) {
    Psf2::DataRange range {info.unicode_table_offset, info.unicode_table_size};
    uint32_t trailing_size = 0;

    result = Psf2::UnicodeImpl::validate(Psf2::RawTable(bytes, range), info.glyph_count, &trailing_size);
    if (result == PSF_SUCCESS) {
      info.font_flags |= PSF_FONT_FLAG_UNICODE_TABLE_VALIDATED;
      if (trailing_size)
        info.diag_flags |= PSF_FONT_DIAG_TRAILING_DATA;
    }
  }

  FontInternal::init_core(self);
  if (PSF_UNLIKELY(result != PSF_SUCCESS))
    return result;

  self->data = bytes;
  self->size = size;
  self->info = info;
  return PSF_SUCCESS;
}

// psf::Font - API - Accessors
// ===========================

PSF_API_IMPL PSFResult psf_font_get_info(const PSFFontCore* self, PSFFontInfo* info_out) noexcept {
  *info_out = self->info;
  return PSF_SUCCESS;
}

// psf::Font - API - Glyph Lookup
// ==============================

PSF_API_IMPL bool psf_font_glyph_for_index(const PSFFontCore* self, uint32_t glyph_index, PSFGlyphCore* glyph_out) noexcept {
  using namespace psf;

  const PSFFontInfo& info = self->info;
  if (PSF_UNLIKELY(glyph_index >= info.glyph_count))
    return FontInternal::glyph_not_found(glyph_out);

  glyph_out->data = self->data + info.glyph_table_offset + size_t(glyph_index) * info.bytes_per_glyph;
  glyph_out->size = info.bytes_per_glyph;
  glyph_out->index = glyph_index;
  glyph_out->width = info.width;
  glyph_out->height = info.height;
  glyph_out->bytes_per_row = info.bytes_per_row;
  return true;
}

PSF_API_IMPL bool psf_font_glyph_for_ascii(const PSFFontCore* self, uint32_t c, PSFGlyphCore* glyph_out) noexcept {
  using namespace psf;

  if (PSF_UNLIKELY(c >= FontInternal::kAsciiCount))
    return FontInternal::glyph_not_found(glyph_out);

  return psf_font_glyph_for_index(self, c, glyph_out);
}

PSF_API_IMPL bool psf_font_glyph_for_codepoint(PSFFontCore* self, uint32_t uc, PSFGlyphCore* glyph_out) noexcept {
  using namespace psf;

  if (uc < FontInternal::kAsciiCount)
    return psf_font_glyph_for_ascii(self, uc, glyph_out);

  if (!(self->info.font_flags & PSF_FONT_FLAG_HAS_UNICODE_TABLE) || uc > Unicode::kCharMax)
    return FontInternal::glyph_not_found(glyph_out);

  uint32_t glyph_index;
  if (!GlyphCache::lookup(&self->cache, uc, &glyph_index)) {
    if (!FontInternal::find_glyph_index(self, uc, &glyph_index))
      return FontInternal::glyph_not_found(glyph_out);
    GlyphCache::insert(&self->cache, uc, glyph_index);
  }

  return psf_font_glyph_for_index(self, glyph_index, glyph_out);
}

PSF_API_IMPL bool psf_font_glyph_for_utf8(PSFFontCore* self, const char* text, size_t size, size_t* consumed_out, PSFGlyphCore* glyph_out) noexcept {
  using namespace psf;

  if (consumed_out)
    *consumed_out = 0;

  if (!text)
    return FontInternal::glyph_not_found(glyph_out);

  if (size == SIZE_MAX)
    size = FontInternal::utf8_size_of_null_terminated(text);

  if (!size)
    return FontInternal::glyph_not_found(glyph_out);

  Unicode::Utf8Reader reader(text, size);
  uint32_t uc;
  size_t uc_size;

  if (reader.next<Unicode::IOFlags::kStrict>(uc, uc_size) != PSF_SUCCESS)
    return FontInternal::glyph_not_found(glyph_out);

  if (consumed_out)
    *consumed_out = uc_size;

  return psf_font_glyph_for_codepoint(self, uc, glyph_out);
}

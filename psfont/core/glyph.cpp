// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <psfont/core/api-build_p.h>
#include <psfont/core/glyph.h>

// psf::Glyph - API
// ================

PSF_API_IMPL bool psf_glyph_get_row(const PSFGlyphCore* self, uint32_t y, PSFGlyphRowCore* row_out) noexcept {
  if (PSF_UNLIKELY(y >= self->height)) {
    *row_out = PSFGlyphRowCore{};
    return false;
  }

  row_out->data = self->data + size_t(y) * self->bytes_per_row;
  row_out->width = self->width;
  row_out->bytes_per_row = self->bytes_per_row;
  return true;
}

PSF_API_IMPL bool psf_glyph_get_pixel(const PSFGlyphCore* self, uint32_t x, uint32_t y) noexcept {
  PSFGlyphRowCore row;
  return psf_glyph_get_row(self, y, &row) && psf_glyph_row_get_pixel(&row, x);
}

PSF_API_IMPL bool psf_glyph_row_get_pixel(const PSFGlyphRowCore* self, uint32_t x) noexcept {
  if (PSF_UNLIKELY(x >= self->width))
    return false;

  uint32_t b = self->data[x >> 3];
  return ((b >> (7u - (x & 7u))) & 1u) != 0;
}

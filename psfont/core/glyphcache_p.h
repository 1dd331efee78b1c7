// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_CORE_GLYPHCACHE_P_H_INCLUDED
#define PSFONT_CORE_GLYPHCACHE_P_H_INCLUDED

#include <psfont/core/api-internal_p.h>
#include <psfont/core/font.h>

//! \cond INTERNAL
//! \addtogroup psf_internal
//! \{

namespace psf {
namespace GlyphCache {

// psf::GlyphCache - Constants
// ===========================

static constexpr uint32_t kCapacity = PSF_RUNTIME_GLYPH_CACHE_CAPACITY;

// psf::GlyphCache - Operations
// ============================

//! Empties the cache and zeroes all slots.
static PSF_INLINE void reset(PSFGlyphCacheData* cache) noexcept {
  memset(cache, 0, sizeof(PSFGlyphCacheData));
}

//! Looks up a glyph index of `uc`, stores it to `glyph_index_out` and returns `true` if it's cached.
[[nodiscard]]
static PSF_INLINE bool lookup(const PSFGlyphCacheData* cache, uint32_t uc, uint32_t* glyph_index_out) noexcept {
  uint32_t n = cache->size;

  for (uint32_t i = 0; i < n; i++) {
    if (cache->codepoints[i] == uc) {
      *glyph_index_out = cache->glyph_indexes[i];
      return true;
    }
  }

  return false;
}

//! Inserts `uc` to `glyph_index` association into the cache.
//!
//! Does nothing if `uc` is already cached. When the cache is full the oldest entry is replaced.
static PSF_INLINE void insert(PSFGlyphCacheData* cache, uint32_t uc, uint32_t glyph_index) noexcept {
  uint32_t existing;
  if (lookup(cache, uc, &existing))
    return;

  uint32_t i = cache->cursor;
  PSF_ASSERT(i < kCapacity);

  cache->codepoints[i] = uc;
  cache->glyph_indexes[i] = glyph_index;

  if (cache->size < kCapacity)
    cache->size++;

  i++;
  cache->cursor = i == kCapacity ? 0u : i;
}

} // {GlyphCache}
} // {psf}

//! \}
//! \endcond

#endif // PSFONT_CORE_GLYPHCACHE_P_H_INCLUDED

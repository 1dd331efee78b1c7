// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <psfont/core/api-build_test_p.h>
#if defined(PSF_TEST)

#include <psfont/core/font.h>
#include <psfont/core/glyphcache_p.h>
#include <psfont/psf2/psf2_test_p.h>

#include <random>

// psf::Font - Tests
// =================

namespace psf::Tests {

using Psf2::Tests::FontBuilder;

static constexpr uint32_t kCjkBase = 0x4E00u;

// 8x16 font having 512 glyphs, glyphs [128, 512) are mapped to `kCjkBase + glyph_index`.
static std::vector<uint8_t> make_cjk_font() {
  FontBuilder builder(8, 16);
  builder.add_indexed_glyphs(512);
  builder.set_unicode_table(true);

  for (uint32_t i = 0; i < 128; i++)
    builder.map(i, i);

  for (uint32_t i = 128; i < 512; i++)
    builder.map(i, kCjkBase + i);

  return builder.build();
}

static std::vector<uint8_t> make_sample_font() {
  FontBuilder builder(8, 8);
  builder.add_indexed_glyphs(256);
  builder.set_unicode_table(true);

  builder.map(0x41, 0x0041u);
  builder.map(0x41, 0x0391u);       // Greek Alpha shares the glyph with Latin A.
  builder.map(0xC9, 0x00C9u);
  builder.map(0xE9, 0x00E9u);
  builder.map_sequence(0xE9, { 0x0065u, 0x0301u });
  builder.map(0xDB, 0x2588u);
  builder.map(0xFE, 0x1F600u);

  return builder.build();
}

TEST(PSFFont, alternating_bits) {
  FontBuilder builder(8, 1);
  builder.add_glyph({ 0xAAu });
  builder.add_glyph({ 0x55u });

  std::vector<uint8_t> data = builder.build();
  PSFFont font;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));
  EXPECT_EQ(font.glyph_count(), 2u);
  EXPECT_EQ(font.width(), 8u);
  EXPECT_EQ(font.height(), 1u);
  EXPECT_EQ(font.bytes_per_row(), 1u);
  EXPECT_EQ(font.bytes_per_glyph(), 1u);

  static const bool expected0[] = { true, false, true, false, true, false, true, false };
  static const bool expected1[] = { false, true, false, true, false, true, false, true };

  PSFGlyph glyph;
  ASSERT_TRUE(font.glyph_for_ascii(0, glyph));
  ASSERT_EQ(glyph.row_count(), 1u);

  uint32_t x = 0;
  for (bool pixel : glyph.row_at(0))
    EXPECT_EQ(pixel, expected0[x++]);
  EXPECT_EQ(x, 8u);

  ASSERT_TRUE(font.glyph_for_ascii(1, glyph));
  x = 0;
  for (bool pixel : glyph.row_at(0))
    EXPECT_EQ(pixel, expected1[x++]);
  EXPECT_EQ(x, 8u);

  EXPECT_FALSE(font.glyph_for_ascii(2, glyph));
  EXPECT_TRUE(glyph.is_empty());
}

TEST(PSFFont, invalid_magic_leaves_font_empty) {
  FontBuilder builder(8, 1);
  builder.add_glyph({ 0xAAu });
  builder.add_glyph({ 0x55u });

  std::vector<uint8_t> data = builder.build();
  data[0] = 0;
  data[1] = 0;
  data[2] = 0;
  data[3] = 0;

  PSFFont font;
  EXPECT_EQ(font.create_from_data(data.data(), data.size()), PSFResult(PSF_ERROR_INVALID_MAGIC));
  EXPECT_TRUE(font.is_empty());
  EXPECT_FALSE(font.is_valid());
  EXPECT_EQ(font.glyph_count(), 0u);
  EXPECT_EQ(font.size, 0u);

  PSFGlyph glyph;
  EXPECT_FALSE(font.glyph_for_ascii(0, glyph));
  EXPECT_FALSE(font.glyph_for_index(0, glyph));
  EXPECT_FALSE(font.glyph_for_utf8("A", glyph));
}

TEST(PSFFont, failed_create_resets_font) {
  std::vector<uint8_t> data = make_sample_font();
  PSFFont font;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));
  EXPECT_TRUE(font.is_valid());

  EXPECT_EQ(font.create_from_data(data.data(), 16), PSFResult(PSF_ERROR_TRUNCATED_HEADER));
  EXPECT_TRUE(font.is_empty());
  EXPECT_EQ(font.font_flags(), uint32_t(PSF_FONT_NO_FLAGS));
}

TEST(PSFFont, invalid_arguments) {
  std::vector<uint8_t> data = make_sample_font();
  PSFFont font;

  EXPECT_EQ(font.create_from_data(nullptr, 100), PSFResult(PSF_ERROR_INVALID_VALUE));
  EXPECT_EQ(font.create_from_data(nullptr, 0), PSFResult(PSF_ERROR_TRUNCATED_HEADER));
  EXPECT_EQ(font.create_from_data(data.data(), data.size(), PSFFontCreateFlags(0x80000000u)), PSFResult(PSF_ERROR_INVALID_VALUE));
  EXPECT_TRUE(font.is_empty());
}

TEST(PSFFont, font_info) {
  std::vector<uint8_t> data = make_sample_font();
  PSFFont font;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));
  EXPECT_TRUE(font.has_unicode_table());

  PSFFontInfo info;
  EXPECT_SUCCESS(psf_font_get_info(&font, &info));

  EXPECT_EQ(info.version, 0u);
  EXPECT_EQ(info.header_size, 32u);
  EXPECT_EQ(info.header_flags, 1u);
  EXPECT_EQ(info.glyph_count, 256u);
  EXPECT_EQ(info.width, 8u);
  EXPECT_EQ(info.height, 8u);
  EXPECT_EQ(info.bytes_per_row, 1u);
  EXPECT_EQ(info.bytes_per_glyph, 8u);
  EXPECT_EQ(info.glyph_table_offset, 32u);
  EXPECT_EQ(info.glyph_table_size, 256u * 8u);
  EXPECT_EQ(info.unicode_table_offset, 32u + 256u * 8u);
  EXPECT_EQ(info.unicode_table_offset + info.unicode_table_size, uint32_t(data.size()));
  EXPECT_EQ(info.font_flags, uint32_t(PSF_FONT_FLAG_HAS_UNICODE_TABLE | PSF_FONT_FLAG_UNICODE_TABLE_VALIDATED));
  EXPECT_EQ(info.diag_flags, uint32_t(PSF_FONT_DIAG_NO_FLAGS));
  EXPECT_LE(uint64_t(info.header_size) + uint64_t(info.glyph_count) * info.bytes_per_glyph, uint64_t(data.size()));
}

TEST(PSFFont, glyph_for_index) {
  std::vector<uint8_t> data = make_sample_font();
  PSFFont font;
  PSFGlyph glyph;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));

  for (uint32_t i = 0; i < 256; i++) {
    ASSERT_TRUE(font.glyph_for_index(i, glyph));
    EXPECT_EQ(glyph.index, i);
    EXPECT_EQ(glyph.size, 8u);
    EXPECT_EQ(glyph.data, data.data() + 32u + i * 8u);
    EXPECT_EQ(glyph.data[0], uint8_t(i));
  }

  EXPECT_FALSE(font.glyph_for_index(256, glyph));
  EXPECT_FALSE(font.glyph_for_index(0xFFFFFFFFu, glyph));
  EXPECT_TRUE(glyph.is_empty());
}

TEST(PSFFont, ascii_matches_utf8) {
  std::vector<uint8_t> data = make_sample_font();
  PSFFont font;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));

  for (uint32_t c = 0; c < 128; c++) {
    char text[1] = { char(c) };

    PSFGlyph a;
    PSFGlyph b;

    ASSERT_TRUE(font.glyph_for_ascii(c, a));
    ASSERT_TRUE(font.glyph_for_utf8(text, 1, b));

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.index, c);
    EXPECT_EQ(memcmp(a.data, b.data, a.size), 0);
  }

  // ASCII lookups never use the cache.
  EXPECT_EQ(font.cache.size, 0u);

  PSFGlyph glyph;
  EXPECT_FALSE(font.glyph_for_ascii(128, glyph));
  EXPECT_FALSE(font.glyph_for_ascii(0xE9, glyph));
}

TEST(PSFFont, ascii_out_of_range) {
  FontBuilder builder(8, 8);
  builder.add_indexed_glyphs(32);

  std::vector<uint8_t> data = builder.build();
  PSFFont font;
  PSFGlyph glyph;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));
  EXPECT_TRUE(font.glyph_for_ascii(31, glyph));
  EXPECT_FALSE(font.glyph_for_ascii(32, glyph));
  EXPECT_FALSE(font.glyph_for_ascii('A', glyph));
  EXPECT_FALSE(font.glyph_for_utf8("A", glyph));
}

TEST(PSFFont, glyph_for_utf8) {
  std::vector<uint8_t> data = make_sample_font();
  PSFFont font;
  PSFGlyph glyph;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));

  EXPECT_TRUE(font.glyph_for_utf8("\xC3\xA9", glyph));
  EXPECT_EQ(glyph.index, 0xE9u);

  EXPECT_TRUE(font.glyph_for_utf8("\xC3\x89", glyph));
  EXPECT_EQ(glyph.index, 0xC9u);

  EXPECT_TRUE(font.glyph_for_utf8("\xCE\x91", glyph));
  EXPECT_EQ(glyph.index, 0x41u);

  EXPECT_TRUE(font.glyph_for_utf8("\xE2\x96\x88", glyph));
  EXPECT_EQ(glyph.index, 0xDBu);

  EXPECT_TRUE(font.glyph_for_utf8("\xF0\x9F\x98\x80", glyph));
  EXPECT_EQ(glyph.index, 0xFEu);

  // Combining mark only appears in a sequence, it resolves to the glyph of that sequence.
  EXPECT_TRUE(font.glyph_for_utf8("\xCC\x81", glyph));
  EXPECT_EQ(glyph.index, 0xE9u);

  // Only the first codepoint is used.
  EXPECT_TRUE(font.glyph_for_utf8("\xC3\xA9X", glyph));
  EXPECT_EQ(glyph.index, 0xE9u);

  // Not mapped.
  EXPECT_FALSE(font.glyph_for_utf8("\xE4\xB8\x80", glyph));
  EXPECT_TRUE(glyph.is_empty());

  // Invalid, truncated, and empty input.
  EXPECT_FALSE(font.glyph_for_utf8("\x80", glyph));
  EXPECT_FALSE(font.glyph_for_utf8("\xC3", glyph));
  EXPECT_FALSE(font.glyph_for_utf8("\xC3\xA9", 1, glyph));
  EXPECT_FALSE(font.glyph_for_utf8("\xED\xA0\x80", glyph));
  EXPECT_FALSE(font.glyph_for_utf8("", glyph));
  EXPECT_FALSE(font.glyph_for_utf8("A", 0, glyph));
  EXPECT_FALSE(font.glyph_for_utf8(nullptr, glyph));
}

TEST(PSFFont, glyph_for_utf8_consumed) {
  std::vector<uint8_t> data = make_sample_font();
  PSFFont font;
  PSFGlyph glyph;
  size_t consumed = 0xFFFFu;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));

  const char text[] = "A\xC3\xA9\xE4\xB8\x80\xF0\x9F\x98\x80\x80";
  size_t size = sizeof(text) - 1u;
  size_t i = 0;

  static const struct {
    bool found;
    uint32_t glyph_index;
    size_t consumed;
  } expected[] = {
    { true , 0x41u, 1 },
    { true , 0xE9u, 2 },
    { false, 0x00u, 3 },
    { true , 0xFEu, 4 },
    { false, 0x00u, 0 }
  };

  for (size_t n = 0; n < PSF_ARRAY_SIZE(expected); n++) {
    bool found = font.glyph_for_utf8(text + i, size - i, consumed, glyph);
    EXPECT_EQ(found, expected[n].found);
    EXPECT_EQ(consumed, expected[n].consumed);
    if (found)
      EXPECT_EQ(glyph.index, expected[n].glyph_index);
    i += consumed;
  }

  EXPECT_EQ(i, size - 1u);

  size_t consumed_c = 0;
  PSFGlyphCore glyph_c;
  EXPECT_TRUE(psf_font_glyph_for_utf8(&font, "\xC3\xA9", SIZE_MAX, &consumed_c, &glyph_c));
  EXPECT_EQ(consumed_c, 2u);
  EXPECT_EQ(glyph_c.index, 0xE9u);
}

TEST(PSFFont, glyph_for_codepoint) {
  std::vector<uint8_t> data = make_sample_font();
  PSFFont font;
  PSFGlyph glyph;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));

  EXPECT_TRUE(font.glyph_for_codepoint('A', glyph));
  EXPECT_EQ(glyph.index, 0x41u);

  EXPECT_TRUE(font.glyph_for_codepoint(0x00E9u, glyph));
  EXPECT_EQ(glyph.index, 0xE9u);

  EXPECT_FALSE(font.glyph_for_codepoint(0x4E00u, glyph));
  EXPECT_FALSE(font.glyph_for_codepoint(0x110000u, glyph));
  EXPECT_FALSE(font.glyph_for_codepoint(0xFFFFFFFFu, glyph));
}

TEST(PSFFont, no_unicode_table) {
  FontBuilder builder(8, 8);
  builder.add_indexed_glyphs(256);

  std::vector<uint8_t> data = builder.build();
  PSFFont font;
  PSFGlyph glyph;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));
  EXPECT_FALSE(font.has_unicode_table());

  EXPECT_TRUE(font.glyph_for_utf8("A", glyph));
  EXPECT_EQ(glyph.index, 0x41u);

  // Without a unicode table non-ASCII codepoints don't map to anything.
  EXPECT_FALSE(font.glyph_for_utf8("\xC3\xA9", glyph));
  EXPECT_FALSE(font.glyph_for_codepoint(0xE9u, glyph));
  EXPECT_EQ(font.cache.size, 0u);
}

TEST(PSFFont, cache_determinism) {
  std::vector<uint8_t> data = make_cjk_font();
  PSFFont font;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));

  uint32_t first_indexes[PSF_RUNTIME_GLYPH_CACHE_CAPACITY];
  PSFGlyph first_glyphs[PSF_RUNTIME_GLYPH_CACHE_CAPACITY];

  for (uint32_t i = 0; i < PSF_RUNTIME_GLYPH_CACHE_CAPACITY; i++) {
    PSFGlyph glyph;
    ASSERT_TRUE(font.glyph_for_codepoint(kCjkBase + 128u + i, glyph));
    first_indexes[i] = glyph.index;
    first_glyphs[i] = glyph;
    EXPECT_EQ(glyph.index, 128u + i);
  }

  EXPECT_EQ(font.cache.size, uint32_t(PSF_RUNTIME_GLYPH_CACHE_CAPACITY));
  EXPECT_EQ(font.cache.cursor, 0u);

  for (uint32_t pass = 0; pass < 3; pass++) {
    for (uint32_t i = 0; i < PSF_RUNTIME_GLYPH_CACHE_CAPACITY; i++) {
      PSFGlyph glyph;
      ASSERT_TRUE(font.glyph_for_codepoint(kCjkBase + 128u + i, glyph));
      EXPECT_EQ(glyph.index, first_indexes[i]);
      EXPECT_EQ(glyph, first_glyphs[i]);
    }
  }

  // Cache hits don't change the cache.
  EXPECT_EQ(font.cache.size, uint32_t(PSF_RUNTIME_GLYPH_CACHE_CAPACITY));
  EXPECT_EQ(font.cache.cursor, 0u);
}

TEST(PSFFont, cache_eviction) {
  std::vector<uint8_t> data = make_cjk_font();
  PSFFont font;
  PSFGlyph glyph;
  uint32_t cached_index;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));

  uint32_t first = kCjkBase + 128u;
  uint32_t second = kCjkBase + 129u;

  for (uint32_t i = 0; i < PSF_RUNTIME_GLYPH_CACHE_CAPACITY; i++)
    ASSERT_TRUE(font.glyph_for_codepoint(first + i, glyph));

  EXPECT_TRUE(GlyphCache::lookup(&font.cache, first, &cached_index));

  // 65th distinct codepoint evicts exactly the first one.
  ASSERT_TRUE(font.glyph_for_codepoint(first + PSF_RUNTIME_GLYPH_CACHE_CAPACITY, glyph));
  EXPECT_EQ(glyph.index, 128u + PSF_RUNTIME_GLYPH_CACHE_CAPACITY);

  EXPECT_FALSE(GlyphCache::lookup(&font.cache, first, &cached_index));
  for (uint32_t i = 1; i <= PSF_RUNTIME_GLYPH_CACHE_CAPACITY; i++)
    EXPECT_TRUE(GlyphCache::lookup(&font.cache, first + i, &cached_index));

  // The evicted codepoint still resolves correctly by scanning the table again.
  ASSERT_TRUE(font.glyph_for_codepoint(first, glyph));
  EXPECT_EQ(glyph.index, 128u);

  EXPECT_TRUE(GlyphCache::lookup(&font.cache, first, &cached_index));
  EXPECT_EQ(cached_index, 128u);
  EXPECT_FALSE(GlyphCache::lookup(&font.cache, second, &cached_index));
}

TEST(PSFFont, cache_ignores_misses) {
  std::vector<uint8_t> data = make_sample_font();
  PSFFont font;
  PSFGlyph glyph;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));

  EXPECT_FALSE(font.glyph_for_codepoint(0x4E00u, glyph));
  EXPECT_FALSE(font.glyph_for_codepoint(0x4E01u, glyph));
  EXPECT_EQ(font.cache.size, 0u);

  EXPECT_TRUE(font.glyph_for_codepoint(0x00E9u, glyph));
  EXPECT_TRUE(font.glyph_for_codepoint(0x00E9u, glyph));
  EXPECT_EQ(font.cache.size, 1u);
}

TEST(PSFFont, copy_has_independent_cache) {
  std::vector<uint8_t> data = make_sample_font();
  PSFFont font;
  PSFGlyph glyph;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));
  EXPECT_TRUE(font.glyph_for_codepoint(0x00E9u, glyph));

  PSFFont copy(font);
  EXPECT_EQ(copy.cache.size, 1u);

  EXPECT_TRUE(copy.glyph_for_codepoint(0x2588u, glyph));
  EXPECT_EQ(copy.cache.size, 2u);
  EXPECT_EQ(font.cache.size, 1u);

  PSFGlyph a;
  PSFGlyph b;
  EXPECT_TRUE(font.glyph_for_codepoint(0x1F600u, a));
  EXPECT_TRUE(copy.glyph_for_codepoint(0x1F600u, b));
  EXPECT_EQ(a, b);

  EXPECT_SUCCESS(font.reset());
  EXPECT_TRUE(font.is_empty());
  EXPECT_EQ(font.cache.size, 0u);
  EXPECT_TRUE(copy.is_valid());
}

TEST(PSFFont, diagnostics) {
  FontBuilder builder(8, 8);
  builder.add_indexed_glyphs(4);
  builder.set_unicode_table(true);
  builder.map(1, 0x00E9u);
  builder.add_trailing_data({ 0x00, 0x01 });

  std::vector<uint8_t> data = builder.build();
  PSFFont font;

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size()));
  EXPECT_EQ(font.diag_flags(), uint32_t(PSF_FONT_DIAG_TRAILING_DATA));
  EXPECT_EQ(font.font_flags(), uint32_t(PSF_FONT_FLAG_HAS_UNICODE_TABLE | PSF_FONT_FLAG_UNICODE_TABLE_VALIDATED));
}

TEST(PSFFont, truncated) {
  std::vector<uint8_t> data = make_sample_font();
  const uint32_t glyph_table_end = 32u + 256u * 8u;

  for (size_t size = 0; size < data.size(); size++) {
    PSFFont font;
    PSFResult result = font.create_from_data(data.data(), size);

    if (size < 32u)
      EXPECT_EQ(result, PSFResult(PSF_ERROR_TRUNCATED_HEADER)) << "Size=" << size;
    else if (size < glyph_table_end)
      EXPECT_EQ(result, PSFResult(PSF_ERROR_TRUNCATED_GLYPH_TABLE)) << "Size=" << size;
    else
      EXPECT_EQ(result, PSFResult(PSF_ERROR_MALFORMED_UNICODE_TABLE)) << "Size=" << size;

    EXPECT_TRUE(font.is_empty());
  }
}

TEST(PSFFont, no_unicode_validation) {
  FontBuilder builder(8, 8);
  builder.add_indexed_glyphs(4);
  builder.set_unicode_table(true);
  builder.map(1, 0x00E9u);
  builder.add_record_bytes(2, { 0xC0, 0x80 });
  builder.map(3, 0x00C1u);

  std::vector<uint8_t> data = builder.build();
  PSFFont font;
  PSFGlyph glyph;

  EXPECT_EQ(font.create_from_data(data.data(), data.size()), PSFResult(PSF_ERROR_MALFORMED_UNICODE_TABLE));

  ASSERT_SUCCESS(font.create_from_data(data.data(), data.size(), PSF_FONT_CREATE_FLAG_NO_UNICODE_VALIDATION));
  EXPECT_EQ(font.font_flags(), uint32_t(PSF_FONT_FLAG_HAS_UNICODE_TABLE));

  // Records before the malformed one are still usable.
  EXPECT_TRUE(font.glyph_for_codepoint(0x00E9u, glyph));
  EXPECT_EQ(glyph.index, 1u);
  EXPECT_FALSE(font.glyph_for_codepoint(0x00C1u, glyph));
}

TEST(PSFFont, random_corruption) {
  std::vector<uint8_t> original = make_sample_font();
  std::minstd_rand rng(0x1234u);

  for (uint32_t iter = 0; iter < 2000; iter++) {
    std::vector<uint8_t> data = original;

    uint32_t corruption_count = 1u + uint32_t(rng() % 8u);
    for (uint32_t i = 0; i < corruption_count; i++) {
      // Corrupt the header more often as it's much smaller than the rest of the font.
      size_t offset = (rng() & 1u) ? size_t(rng() % 32u) : size_t(rng() % data.size());
      data[offset] = uint8_t(rng());
    }

    size_t size = (iter & 3u) == 0 ? size_t(rng() % (data.size() + 1u)) : data.size();
    PSFFontCreateFlags create_flags = (iter & 4u) ? PSF_FONT_CREATE_FLAG_NO_UNICODE_VALIDATION : PSF_FONT_CREATE_NO_FLAGS;

    PSFFont font;
    PSFResult result = font.create_from_data(data.data(), size, create_flags);

    if (result != PSF_SUCCESS) {
      EXPECT_GE(result, PSFResult(PSF_ERROR_START_INDEX));
      EXPECT_LE(result, PSFResult(PSF_ERROR_VALUE_LAST));
      EXPECT_TRUE(font.is_empty());
      continue;
    }

    const PSFFontInfo& info = font.font_info();
    EXPECT_LE(uint64_t(info.header_size) + uint64_t(info.glyph_count) * info.bytes_per_glyph, uint64_t(size));

    for (uint32_t i = 0; i < 32; i++) {
      PSFGlyph glyph;
      uint32_t uc = (i & 1u) ? uint32_t(rng() % 0x110000u) : uint32_t(rng() % 0x300u);

      if (font.glyph_for_codepoint(uc, glyph)) {
        ASSERT_LT(glyph.index, info.glyph_count);
        ASSERT_GE(glyph.data, data.data());
        ASSERT_LE(glyph.data + glyph.size, data.data() + size);

        uint32_t pixel_count = 0;
        for (PSFGlyphRow row : glyph)
          for (bool pixel : row)
            pixel_count += uint32_t(pixel);
        EXPECT_LE(pixel_count, glyph.width * glyph.height);
      }
    }
  }
}

TEST(PSFFont, c_api) {
  std::vector<uint8_t> data = make_sample_font();

  PSFFontCore font;
  PSFGlyphCore glyph;

  EXPECT_SUCCESS(psf_font_init(&font));
  EXPECT_EQ(font.data, nullptr);
  EXPECT_FALSE(psf_font_glyph_for_ascii(&font, 'A', &glyph));

  EXPECT_SUCCESS(psf_font_create_from_data(&font, data.data(), data.size(), PSF_FONT_CREATE_NO_FLAGS));
  EXPECT_TRUE(psf_font_glyph_for_ascii(&font, 'A', &glyph));
  EXPECT_EQ(glyph.index, 0x41u);

  EXPECT_TRUE(psf_font_glyph_for_codepoint(&font, 0x0391u, &glyph));
  EXPECT_EQ(glyph.index, 0x41u);

  EXPECT_TRUE(psf_font_glyph_for_index(&font, 255, &glyph));
  EXPECT_EQ(glyph.index, 255u);

  PSFGlyphRowCore row;
  EXPECT_TRUE(psf_glyph_get_row(&glyph, 7, &row));
  EXPECT_EQ(row.data[0], 0xFFu);
  EXPECT_TRUE(psf_glyph_row_get_pixel(&row, 0));

  EXPECT_SUCCESS(psf_font_reset(&font));
  EXPECT_EQ(font.data, nullptr);
  EXPECT_EQ(font.info.glyph_count, 0u);
  EXPECT_EQ(font.cache.size, 0u);
}

} // {psf::Tests}

#endif // PSF_TEST

// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <psfont/psfont.h>

#include <stdio.h>
#include <string.h>

#include <vector>

#include "../commons/cmdline.h"

static bool read_file(const char* file_name, std::vector<uint8_t>& out) {
  FILE* f = fopen(file_name, "rb");
  if (!f)
    return false;

  uint8_t buffer[4096];
  size_t n;

  while ((n = fread(buffer, 1, sizeof(buffer), f)) != 0)
    out.insert(out.end(), buffer, buffer + n);

  bool ok = ferror(f) == 0;
  fclose(f);
  return ok;
}

static void print_usage() {
  printf("Usage:\n");
  printf("  psf_sample_render [--font=]<file.psf> [--text=<utf8>] [--scale=1..8] [--fg=#] [--bg=.] [--info]\n");
}

static void print_info(const PSFFont& font) {
  const PSFFontInfo& info = font.font_info();

  printf("Font:\n");
  printf("  Glyphs       : %u\n", info.glyph_count);
  printf("  Size         : %ux%u\n", info.width, info.height);
  printf("  BytesPerRow  : %u\n", info.bytes_per_row);
  printf("  BytesPerGlyph: %u\n", info.bytes_per_glyph);
  printf("  HeaderSize   : %u\n", info.header_size);
  printf("  UnicodeTable : %s\n", font.has_unicode_table() ? "yes" : "no");
  printf("  DiagFlags    : 0x%08X\n", info.diag_flags);
}

static const char* const flag_list[] = { "--info", "--help", nullptr };

int main(int argc, char* argv[]) {
  CmdLine cmd_line(argc, argv, flag_list);

  const char* font_file = cmd_line.value_of("--font", cmd_line.positional(0));
  const char* text = cmd_line.value_of("--text", "psfont");
  const char* fg = cmd_line.value_of("--fg", "#");
  const char* bg = cmd_line.value_of("--bg", ".");
  unsigned scale = cmd_line.value_as_uint("--scale", 1u, 1u, 8u);

  if (!font_file || cmd_line.has_arg("--help")) {
    print_usage();
    return font_file ? 0 : 1;
  }

  std::vector<uint8_t> data;
  if (!read_file(font_file, data)) {
    printf("Failed to read '%s'\n", font_file);
    return 1;
  }

  PSFFont font;
  PSFResult result = font.create_from_data(data.data(), data.size());

  if (result != PSF_SUCCESS) {
    printf("Failed to load '%s' (err=0x%08X)\n", font_file, result);
    return 1;
  }

  if (cmd_line.has_arg("--info"))
    print_info(font);

  size_t size = strlen(text);
  size_t i = 0;

  while (i < size) {
    PSFGlyph glyph;
    size_t consumed = 0;

    bool found = font.glyph_for_utf8(text + i, size - i, consumed, glyph);
    i += consumed ? consumed : 1u;

    // Missing glyphs are replaced by '?' if the font has it.
    if (!found && !font.glyph_for_ascii('?', glyph))
      continue;

    for (PSFGlyphRow row : glyph) {
      for (bool pixel : row) {
        for (unsigned n = 0; n < scale; n++)
          fputs(pixel ? fg : bg, stdout);
      }
      putchar('\n');
    }
    putchar('\n');
  }

  return 0;
}

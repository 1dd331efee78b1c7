// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_CORE_GLYPH_H_INCLUDED
#define PSFONT_CORE_GLYPH_H_INCLUDED

#include <psfont/core/api.h>

//! \addtogroup psf_c_api
//! \{

//! \name PSFGlyph - C API
//! \{

//! A single scan-line of a glyph bitmap [C API].
//!
//! Borrows `bytes_per_row` bytes from the font data. Bit 7 of the first byte is the leftmost pixel. Bits past
//! `width` are padding and never reported as pixels.
struct PSFGlyphRowCore {
  //! Row data (borrowed from the font data).
  const uint8_t* data;
  //! Row width in pixels.
  uint32_t width;
  //! Row size in bytes, always `(width + 7) / 8`.
  uint32_t bytes_per_row;
};

//! A glyph bitmap [C API].
//!
//! Borrows exactly `size` (bytes-per-glyph) bytes from the font data, so its lifetime is tied to the data passed to
//! \ref psf_font_create_from_data() and not to the font instance that produced it.
struct PSFGlyphCore {
  //! Glyph data (borrowed from the font data).
  const uint8_t* data;
  //! Glyph data size in bytes (bytes-per-glyph).
  uint32_t size;
  //! Index of the glyph in the glyph table.
  uint32_t index;
  //! Glyph width in pixels.
  uint32_t width;
  //! Glyph height in pixels (number of rows).
  uint32_t height;
  //! Row stride in bytes.
  uint32_t bytes_per_row;
};

PSF_BEGIN_C_DECLS

PSF_API bool PSF_CDECL psf_glyph_get_row(const PSFGlyphCore* self, uint32_t y, PSFGlyphRowCore* row_out) PSF_NOEXCEPT_C;
PSF_API bool PSF_CDECL psf_glyph_get_pixel(const PSFGlyphCore* self, uint32_t x, uint32_t y) PSF_NOEXCEPT_C;
PSF_API bool PSF_CDECL psf_glyph_row_get_pixel(const PSFGlyphRowCore* self, uint32_t x) PSF_NOEXCEPT_C;

PSF_END_C_DECLS

//! \}
//! \}

//! \addtogroup psf_glyph
//! \{

//! \name PSFGlyph - C++ API
//! \{

#ifdef __cplusplus

//! A single scan-line of a glyph bitmap [C++ API].
//!
//! Iterating a row yields `bool` values, one per pixel from left to right, `true` describing a foreground pixel.
//! Iteration is restartable as each `begin()` starts again from the first pixel.
class PSFGlyphRow final : public PSFGlyphRowCore {
public:
  //! Iterates pixels of a row.
  class Iterator {
  public:
    const uint8_t* _data;
    uint32_t _x;

    PSF_INLINE_NODEBUG Iterator(const uint8_t* data, uint32_t x) noexcept
      : _data(data),
        _x(x) {}

    PSF_INLINE_NODEBUG bool operator*() const noexcept {
      return ((_data[_x >> 3] >> (7u - (_x & 7u))) & 1u) != 0;
    }

    PSF_INLINE_NODEBUG Iterator& operator++() noexcept { _x++; return *this; }
    PSF_INLINE_NODEBUG Iterator operator++(int) noexcept { Iterator tmp(*this); _x++; return tmp; }

    PSF_INLINE_NODEBUG bool operator==(const Iterator& other) const noexcept { return _x == other._x; }
    PSF_INLINE_NODEBUG bool operator!=(const Iterator& other) const noexcept { return _x != other._x; }
  };

  //! \name Construction & Destruction
  //! \{

  PSF_INLINE_NODEBUG PSFGlyphRow() noexcept { reset(); }
  PSF_INLINE_NODEBUG PSFGlyphRow(const PSFGlyphRow& other) noexcept = default;

  PSF_INLINE_NODEBUG explicit PSFGlyphRow(const PSFGlyphRowCore& core) noexcept
    : PSFGlyphRowCore(core) {}

  PSF_INLINE_NODEBUG PSFGlyphRow(const uint8_t* data_, uint32_t width_, uint32_t bytes_per_row_) noexcept {
    data = data_;
    width = width_;
    bytes_per_row = bytes_per_row_;
  }

  PSF_INLINE_NODEBUG PSFGlyphRow& operator=(const PSFGlyphRow& other) noexcept = default;

  //! \}

  //! \name Common Functionality
  //! \{

  PSF_INLINE_NODEBUG void reset() noexcept {
    data = nullptr;
    width = 0;
    bytes_per_row = 0;
  }

  //! Tests whether the row is empty (default constructed or returned by an out of range access).
  PSF_INLINE_NODEBUG bool is_empty() const noexcept { return width == 0; }

  //! \}

  //! \name Accessors
  //! \{

  //! Returns the number of pixels in the row.
  PSF_INLINE_NODEBUG uint32_t size() const noexcept { return width; }

  //! Returns whether the pixel at `x` is a foreground pixel, `false` if `x` is out of range.
  PSF_INLINE_NODEBUG bool pixel_at(uint32_t x) const noexcept {
    return x < width && ((data[x >> 3] >> (7u - (x & 7u))) & 1u) != 0;
  }

  //! \}

  //! \name Iterator Compatibility
  //! \{

  PSF_INLINE_NODEBUG Iterator begin() const noexcept { return Iterator(data, 0); }
  PSF_INLINE_NODEBUG Iterator end() const noexcept { return Iterator(data, width); }

  //! \}
};

//! A glyph bitmap [C++ API].
//!
//! A lightweight view that borrows the font data. Iterating a glyph yields \ref PSFGlyphRow values from top to bottom,
//! `reversed_rows()` provides the same rows from bottom to top.
class PSFGlyph final : public PSFGlyphCore {
public:
  //! Iterates rows of a glyph from top to bottom.
  //!
  //! Holds a copy of the bitmap view, so it stays valid when the glyph it came from is reassigned.
  class RowIterator {
  public:
    const uint8_t* _data;
    uint32_t _width;
    uint32_t _bytes_per_row;
    uint32_t _y;

    PSF_INLINE_NODEBUG RowIterator(const uint8_t* data, uint32_t width, uint32_t bytes_per_row, uint32_t y) noexcept
      : _data(data),
        _width(width),
        _bytes_per_row(bytes_per_row),
        _y(y) {}

    PSF_INLINE_NODEBUG PSFGlyphRow operator*() const noexcept {
      return PSFGlyphRow(_data + size_t(_y) * _bytes_per_row, _width, _bytes_per_row);
    }

    PSF_INLINE_NODEBUG RowIterator& operator++() noexcept { _y++; return *this; }
    PSF_INLINE_NODEBUG RowIterator& operator--() noexcept { _y--; return *this; }
    PSF_INLINE_NODEBUG RowIterator operator++(int) noexcept { RowIterator tmp(*this); _y++; return tmp; }
    PSF_INLINE_NODEBUG RowIterator operator--(int) noexcept { RowIterator tmp(*this); _y--; return tmp; }

    PSF_INLINE_NODEBUG bool operator==(const RowIterator& other) const noexcept { return _y == other._y; }
    PSF_INLINE_NODEBUG bool operator!=(const RowIterator& other) const noexcept { return _y != other._y; }
  };

  //! Iterates rows of a glyph from bottom to top.
  class ReverseRowIterator {
  public:
    const uint8_t* _data;
    uint32_t _width;
    uint32_t _bytes_per_row;
    //! Number of rows not visited yet, the current row is `_remaining - 1`.
    uint32_t _remaining;

    PSF_INLINE_NODEBUG ReverseRowIterator(const uint8_t* data, uint32_t width, uint32_t bytes_per_row, uint32_t remaining) noexcept
      : _data(data),
        _width(width),
        _bytes_per_row(bytes_per_row),
        _remaining(remaining) {}

    PSF_INLINE_NODEBUG PSFGlyphRow operator*() const noexcept {
      return PSFGlyphRow(_data + size_t(_remaining - 1u) * _bytes_per_row, _width, _bytes_per_row);
    }

    PSF_INLINE_NODEBUG ReverseRowIterator& operator++() noexcept { _remaining--; return *this; }
    PSF_INLINE_NODEBUG ReverseRowIterator operator++(int) noexcept { ReverseRowIterator tmp(*this); _remaining--; return tmp; }

    PSF_INLINE_NODEBUG bool operator==(const ReverseRowIterator& other) const noexcept { return _remaining == other._remaining; }
    PSF_INLINE_NODEBUG bool operator!=(const ReverseRowIterator& other) const noexcept { return _remaining != other._remaining; }
  };

  //! Range adaptor returned by \ref PSFGlyph::reversed_rows().
  class ReversedRows {
  public:
    const uint8_t* _data;
    uint32_t _width;
    uint32_t _height;
    uint32_t _bytes_per_row;

    PSF_INLINE_NODEBUG explicit ReversedRows(const PSFGlyphCore& glyph) noexcept
      : _data(glyph.data),
        _width(glyph.width),
        _height(glyph.height),
        _bytes_per_row(glyph.bytes_per_row) {}

    PSF_INLINE_NODEBUG ReverseRowIterator begin() const noexcept { return ReverseRowIterator(_data, _width, _bytes_per_row, _height); }
    PSF_INLINE_NODEBUG ReverseRowIterator end() const noexcept { return ReverseRowIterator(_data, _width, _bytes_per_row, 0); }
  };

  //! \name Construction & Destruction
  //! \{

  PSF_INLINE_NODEBUG PSFGlyph() noexcept { reset(); }
  PSF_INLINE_NODEBUG PSFGlyph(const PSFGlyph& other) noexcept = default;

  PSF_INLINE_NODEBUG explicit PSFGlyph(const PSFGlyphCore& core) noexcept
    : PSFGlyphCore(core) {}

  PSF_INLINE_NODEBUG PSFGlyph& operator=(const PSFGlyph& other) noexcept = default;

  //! \}

  //! \name Common Functionality
  //! \{

  PSF_INLINE_NODEBUG void reset() noexcept {
    data = nullptr;
    size = 0;
    index = 0;
    width = 0;
    height = 0;
    bytes_per_row = 0;
  }

  //! Tests whether the glyph is empty (default constructed or reset after a failed lookup).
  PSF_INLINE_NODEBUG bool is_empty() const noexcept { return data == nullptr; }

  //! Tests whether two glyphs reference the same bitmap.
  PSF_INLINE_NODEBUG bool equals(const PSFGlyph& other) const noexcept {
    return data == other.data && size == other.size && width == other.width && height == other.height;
  }

  PSF_INLINE_NODEBUG bool operator==(const PSFGlyph& other) const noexcept { return  equals(other); }
  PSF_INLINE_NODEBUG bool operator!=(const PSFGlyph& other) const noexcept { return !equals(other); }

  //! \}

  //! \name Accessors
  //! \{

  //! Returns the number of rows, which is the same as `height`.
  PSF_INLINE_NODEBUG uint32_t row_count() const noexcept { return height; }

  //! Returns a row at `y` or an empty row if `y` is out of range.
  PSF_INLINE_NODEBUG PSFGlyphRow row_at(uint32_t y) const noexcept {
    if (y >= height)
      return PSFGlyphRow();
    return *RowIterator(data, width, bytes_per_row, y);
  }

  //! Returns whether the pixel at [x, y] is a foreground pixel, `false` if out of range.
  PSF_INLINE_NODEBUG bool pixel_at(uint32_t x, uint32_t y) const noexcept { return row_at(y).pixel_at(x); }

  //! \}

  //! \name Iterator Compatibility
  //! \{

  PSF_INLINE_NODEBUG RowIterator begin() const noexcept { return RowIterator(data, width, bytes_per_row, 0); }
  PSF_INLINE_NODEBUG RowIterator end() const noexcept { return RowIterator(data, width, bytes_per_row, height); }

  PSF_INLINE_NODEBUG ReversedRows reversed_rows() const noexcept { return ReversedRows(*this); }

  //! \}
};

#endif

//! \}
//! \}

#endif // PSFONT_CORE_GLYPH_H_INCLUDED

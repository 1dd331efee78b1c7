// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_PSF2_PSF2HEADER_P_H_INCLUDED
#define PSFONT_PSF2_PSF2HEADER_P_H_INCLUDED

#include <psfont/psf2/psf2defs_p.h>

//! \cond INTERNAL
//! \addtogroup psf_psf2_impl
//! \{

namespace psf::Psf2 {

//! PSF2 header parsing.
namespace HeaderImpl {

//! Validates the PSF2 header and the glyph table of `data` and fills `info_out`.
//!
//! Only geometry and table ranges are computed, the unicode table is not read. `info_out` is only modified on
//! success. All offsets stored in `info_out` are guaranteed to be within `size`.
PSF_HIDDEN PSFResult parse(const uint8_t* data, size_t size, PSFFontInfo* info_out) noexcept;

} // {HeaderImpl}

} // {psf::Psf2}

//! \}
//! \endcond

#endif // PSFONT_PSF2_PSF2HEADER_P_H_INCLUDED

// This file is part of psfont project
//
// SPDX-License-Identifier: Zlib
//
// Copyright (c) 2024 The psfont Authors
//
// This software is provided 'as-is', without any express or implied
// warranty. In no event will the authors be held liable for any damages
// arising from the use of this software.
//
// Permission is granted to anyone to use this software for any purpose,
// including commercial applications, and to alter it and redistribute it
// freely, subject to the following restrictions:
//
// 1. The origin of this software must not be misrepresented; you must not
//    claim that you wrote the original software. If you use this software
//    in a product, an acknowledgment in the product documentation would be
//    appreciated but is not required.
// 2. Altered source versions must be plainly marked as such, and must not be
//    misrepresented as being the original software.
// 3. This notice may not be removed or altered from any source distribution.

// ----------------------------------------------------------------------------
// This is a public header file designed to be used by psfont users. It
// includes all the necessary files required to use psfont library from both
// C and C++ and it's the only header that is guaranteed to always be provided.
//
// Never include directly header files placed in "psfont/" subdirectories. Headers
// that end with "_p" suffix are private and should never be included - they
// are not part of the public API.
// ----------------------------------------------------------------------------

#ifndef PSFONT_H_INCLUDED
#define PSFONT_H_INCLUDED

#if defined(_MSC_VER)
  #pragma warning(push)
  #pragma warning(disable: 4201) // Nameless struct/union.
#endif

#include <psfont/core/api.h>
#include <psfont/core/font.h>
#include <psfont/core/glyph.h>
#include <psfont/core/runtime.h>

#if defined(_MSC_VER)
  #pragma warning(pop)
#endif

#endif // PSFONT_H_INCLUDED

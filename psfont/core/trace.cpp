// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <psfont/core/api-build_p.h>
#include <psfont/core/runtime.h>
#include <psfont/core/trace_p.h>

namespace psf {

// psf::DebugTrace - Log
// =====================

void DebugTrace::log(uint32_t severity, uint32_t indentation, const char* fmt, ...) noexcept {
  const char* prefix = "";
  if (indentation < 0xFFFFFFFFu) {
    switch (severity) {
      case 1: prefix = "[WARN] "; break;
      case 2: prefix = "[FAIL] "; break;
    }
    psf_runtime_message_fmt("%*s%s", int(indentation * 2), "", prefix);
  }

  va_list ap;
  va_start(ap, fmt);
  psf_runtime_message_vfmt(fmt, ap);
  va_end(ap);
}

} // {psf}

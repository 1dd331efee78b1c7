// This file is part of psfont project
//
// See psfont.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef PSFONT_CORE_TRACE_P_H_INCLUDED
#define PSFONT_CORE_TRACE_P_H_INCLUDED

#include <psfont/core/api-internal_p.h>

#include <utility>

//! \cond INTERNAL
//! \addtogroup psf_internal
//! \{

namespace psf {

// psf::DummyTrace
// ===============

//! Dummy trace - no tracing, no runtime overhead.
class DummyTrace {
public:
  PSF_INLINE_NODEBUG bool enabled() const noexcept { return false; };
  PSF_INLINE_NODEBUG void indent() noexcept {}
  PSF_INLINE_NODEBUG void deindent() noexcept {}

  template<typename... Args>
  PSF_INLINE_NODEBUG void out(Args&&...) noexcept {}

  template<typename... Args>
  PSF_INLINE_NODEBUG void info(Args&&...) noexcept {}

  template<typename... Args>
  PSF_INLINE_NODEBUG bool warn(Args&&...) noexcept { return false; }

  template<typename... Args>
  PSF_INLINE_NODEBUG bool fail(Args&&...) noexcept { return false; }
};

// psf::DebugTrace
// ===============

//! Debug trace - active / enabled trace that can be useful during debugging.
class DebugTrace {
public:
  PSF_INLINE DebugTrace() noexcept
    : indentation(0) {}
  PSF_INLINE DebugTrace(const DebugTrace& other) noexcept
    : indentation(other.indentation) {}

  PSF_INLINE bool enabled() const noexcept { return true; };
  PSF_INLINE void indent() noexcept { indentation++; }
  PSF_INLINE void deindent() noexcept { indentation--; }

  template<typename... Args>
  PSF_INLINE void out(Args&&... args) noexcept { log(0, 0xFFFFFFFFu, std::forward<Args>(args)...); }

  template<typename... Args>
  PSF_INLINE void info(Args&&... args) noexcept { log(0, indentation, std::forward<Args>(args)...); }

  template<typename... Args>
  PSF_INLINE bool warn(Args&&... args) noexcept { log(1, indentation, std::forward<Args>(args)...); return false; }

  template<typename... Args>
  PSF_INLINE bool fail(Args&&... args) noexcept { log(2, indentation, std::forward<Args>(args)...); return false; }

  PSF_HIDDEN static void log(uint32_t severity, uint32_t indentation, const char* fmt, ...) noexcept;

  uint32_t indentation;
};

} // {psf}

//! \}
//! \endcond

#endif // PSFONT_CORE_TRACE_P_H_INCLUDED

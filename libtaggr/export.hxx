// file      : libtaggr/export.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

// Normally we don't export class templates (but do complete specializations),
// inline functions, and classes with only inline member functions. Exporting
// classes that inherit from non-exported/imported bases (e.g., std::string)
// will end up badly. The only known workarounds are to not inherit or to not
// export.

#if defined(LIBTAGGR_STATIC)         // Using static.
#  define LIBTAGGR_SYMEXPORT
#elif defined(LIBTAGGR_STATIC_BUILD) // Building static.
#  define LIBTAGGR_SYMEXPORT
#elif defined(LIBTAGGR_SHARED)       // Using shared.
#  define LIBTAGGR_SYMEXPORT __attribute__((visibility("default")))
#elif defined(LIBTAGGR_SHARED_BUILD) // Building shared.
#  define LIBTAGGR_SYMEXPORT __attribute__((visibility("default")))
#else
// If none of the above macros are defined, then we assume we are being used
// by some third-party build system that cannot/doesn't signal the library
// type.
//
#  define LIBTAGGR_SYMEXPORT         // Using static or shared.
#endif

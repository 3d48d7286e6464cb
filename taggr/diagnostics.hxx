// file      : taggr/diagnostics.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <cstdint>   // uint16_t
#include <exception>

#include <libtaggr/diagnostics.hxx>

namespace taggr
{
  // Exception thrown after the diagnostics has been issued with the fail
  // mark (see below). Its handler should simply exit with a non-zero code.
  //
  struct failed: std::exception {};

  // Verbosity level.
  //
  // 0 - disabled (only errors)
  // 1 - normal
  // 2 - debug (-d)
  // 3 - more debug (-d -d)
  //
  extern std::uint16_t verb;

  inline bool l2 () {return verb >= 2;}
  inline bool l3 () {return verb >= 3;}

  extern const diag_mark error;
  extern const diag_mark warn;
  extern const diag_mark info;
  extern const diag_mark text;

  // Write the record as an error and throw failed.
  //
  extern const diag_mark fail;

  // Trace mark with the name of the function, for example:
  //
  // tracer trace ("main");
  // if (l2 ())
  //   trace << "git version " << v;
  //
  struct tracer: diag_mark
  {
    explicit
    tracer (const char* name): diag_mark ("trace", name) {}
  };
}

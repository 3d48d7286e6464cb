// file      : taggr/options.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <string>
#include <cstdint>  // uint16_t
#include <ostream>
#include <optional>

#include <libtaggr/version-bump.hxx> // bump_kind

namespace taggr
{
  // Command line options.
  //
  struct options
  {
    std::uint16_t debug = 0;   // Number of -d|--debug occurrences.
    bool quiet = false;
    bool force = false;
    std::optional<bump_kind> bump;
    bool yes = false;
    bool dry_run = false;
    std::string initial = "0.1.0";
    bool help = false;
    bool version = false;

    std::string dir; // Empty if unspecified (current directory).
  };

  // Parse the command line arguments. Issue diagnostics and throw failed on
  // the usage error.
  //
  options
  parse_options (int argc, char* argv[]);

  void
  print_usage (std::ostream&);
}

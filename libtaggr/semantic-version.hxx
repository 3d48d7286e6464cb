// file      : libtaggr/semantic-version.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <string>
#include <vector>
#include <cstddef>  // size_t
#include <cstdint>  // uint*_t
#include <utility>  // move()
#include <ostream>
#include <optional>

#include <libtaggr/export.hxx>

// Older glibc and FreeBSD define these macros in their <sys/types.h>.
//
#ifdef major
#  undef major
#endif

#ifdef minor
#  undef minor
#endif

namespace taggr
{
  // Semantic version.
  //
  // <major>.<minor>.<patch>[-<pre-release>][+<build>]
  //
  // The <pre-release> and <build> components are dot-separated lists of
  // non-empty identifiers that consist of ASCII alphanumerics and hyphens.
  // The numeric components as well as numeric pre-release identifiers may
  // not have leading zeros.
  //
  // Note that the version can be preceded with a prefix (as in v1.2.3) but
  // only if requested (see below). The prefix is not part of the version and
  // is not stored (see version_tag if you need to keep it).
  //
  struct LIBTAGGR_SYMEXPORT semantic_version
  {
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;
    std::vector<std::string> pre_release; // Empty for a release version.
    std::vector<std::string> build;       // Empty if no build metadata.

    semantic_version () = default;

    semantic_version (std::uint64_t major,
                      std::uint64_t minor,
                      std::uint64_t patch,
                      std::vector<std::string> pre_release = {},
                      std::vector<std::string> build = {});

    enum flags
    {
      none         = 0,    // Exact form, nothing before or after.
      allow_prefix = 0x01, // Skip leading non-digit characters (v1.2.3).
      allow_suffix = 0x02  // Ignore anything that cannot continue the
                           // version (2.16.1.windows.1).
    };

    // Parse the semantic version from the string. Throw
    // std::invalid_argument if the format is not recognizable or components
    // are invalid. The exception description is the failure reason.
    //
    explicit
    semantic_version (const std::string&, flags = none);

    // As above but parse from the specified position until the end of the
    // string.
    //
    semantic_version (const std::string&, std::size_t pos, flags = none);

    std::string
    string (bool ignore_build = false) const;

    bool
    release () const {return pre_release.empty ();}

    // Compare the versions according to the semantic versioning precedence
    // rules returning a negative value, zero, or a positive value if this
    // version precedes, is equal to, or follows the specified version. The
    // build metadata is ignored.
    //
    int
    compare (const semantic_version&) const;
  };

  // Try to parse a string as a semantic version returning nullopt if
  // invalid.
  //
  std::optional<semantic_version>
  parse_semantic_version (const std::string&,
                          semantic_version::flags = semantic_version::none);

  std::optional<semantic_version>
  parse_semantic_version (const std::string&,
                          std::size_t pos,
                          semantic_version::flags = semantic_version::none);

  // NOTE: comparison operators ignore the build component, so two versions
  // that only differ in build metadata are equal.
  //
  inline bool
  operator< (const semantic_version& x, const semantic_version& y)
  {
    return x.compare (y) < 0;
  }

  inline bool
  operator> (const semantic_version& x, const semantic_version& y)
  {
    return x.compare (y) > 0;
  }

  inline bool
  operator== (const semantic_version& x, const semantic_version& y)
  {
    return x.compare (y) == 0;
  }

  inline bool
  operator<= (const semantic_version& x, const semantic_version& y)
  {
    return x.compare (y) <= 0;
  }

  inline bool
  operator>= (const semantic_version& x, const semantic_version& y)
  {
    return x.compare (y) >= 0;
  }

  inline bool
  operator!= (const semantic_version& x, const semantic_version& y)
  {
    return !(x == y);
  }

  inline std::ostream&
  operator<< (std::ostream& o, const semantic_version& x)
  {
    return o << x.string ();
  }

  semantic_version::flags
  operator& (semantic_version::flags, semantic_version::flags);

  semantic_version::flags
  operator| (semantic_version::flags, semantic_version::flags);

  semantic_version::flags
  operator&= (semantic_version::flags&, semantic_version::flags);

  semantic_version::flags
  operator|= (semantic_version::flags&, semantic_version::flags);
}

#include <libtaggr/semantic-version.ixx>

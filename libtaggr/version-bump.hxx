// file      : libtaggr/version-bump.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <stdexcept>  // overflow_error
#include <functional>

#include <libtaggr/version-tag.hxx>
#include <libtaggr/semantic-version.hxx>

#include <libtaggr/export.hxx>

namespace taggr
{
  enum class bump_kind
  {
    major,
    minor,
    patch
  };

  // Return the bump kind name (major, minor, or patch).
  //
  LIBTAGGR_SYMEXPORT std::string
  to_string (bump_kind);

  // Parse the bump kind name (case-insensitively). Throw
  // std::invalid_argument if unknown.
  //
  LIBTAGGR_SYMEXPORT bump_kind
  to_bump_kind (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, bump_kind k)
  {
    return o << to_string (k);
  }

  // Thrown by bump_version() if the incremented component doesn't fit.
  //
  struct LIBTAGGR_SYMEXPORT version_overflow: std::overflow_error
  {
    explicit
    version_overflow (const std::string& d): std::overflow_error (d) {}
  };

  // Return the version that follows the specified one for the bump kind:
  //
  // major  <major+1>.0.0
  // minor  <major>.<minor+1>.0
  // patch  <major>.<minor>.<patch+1>
  //
  // The result is always a release version without build metadata. Throw
  // version_overflow if the incremented component is already at its maximum.
  //
  LIBTAGGR_SYMEXPORT semantic_version
  bump_version (const semantic_version&, bump_kind);

  // Select the latest version tag (see latest_version_tag() for details),
  // ask for the bump kind, and return the tag for the bumped version that
  // follows the latest tag naming convention. Propagate no_version_tags and
  // version_overflow.
  //
  using bump_kind_function = bump_kind (const version_tag& latest);

  LIBTAGGR_SYMEXPORT version_tag
  next_version_tag (
    const std::vector<std::string>& tags,
    const std::function<bump_kind_function>& ask,
    const std::function<version_tag_skip_function>& skipped = nullptr);
}

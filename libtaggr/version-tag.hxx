// file      : libtaggr/version-tag.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <optional>
#include <stdexcept>  // runtime_error
#include <functional>

#include <libtaggr/semantic-version.hxx>

#include <libtaggr/export.hxx>

namespace taggr
{
  // Repository tag that encodes a semantic version, for example:
  //
  // v1.2.3
  // release-2.0.0-rc.1
  // 0.1.0
  //
  // The prefix is the (potentially empty) leading run of non-digit
  // characters.
  //
  struct LIBTAGGR_SYMEXPORT version_tag
  {
    std::string name;
    std::string prefix;
    semantic_version version;

    version_tag () = default;

    // Parse the tag name. Throw std::invalid_argument if it doesn't encode a
    // semantic version. The exception description is the failure reason.
    //
    explicit
    version_tag (std::string name);
  };

  // Try to parse a tag name returning nullopt if it doesn't encode a
  // semantic version.
  //
  LIBTAGGR_SYMEXPORT std::optional<version_tag>
  parse_version_tag (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, const version_tag& t)
  {
    return o << t.name;
  }

  // Thrown by latest_version_tag() if none of the tags encodes a semantic
  // version.
  //
  struct LIBTAGGR_SYMEXPORT no_version_tags: std::runtime_error
  {
    no_version_tags (): std::runtime_error ("no version tags found") {}
  };

  // Called for each tag that is skipped during the scan with the tag name
  // and the reason.
  //
  using version_tag_skip_function = void (const std::string&,
                                          const std::string&);

  // Select the tag with the highest semantic version precedence among the
  // tags that encode semantic versions, ignoring the rest. If several tags
  // have equal precedence (v1.0.0 and 1.0.0, 1.0.0+a and 1.0.0+b), then
  // select the first one in the list order.
  //
  // Throw no_version_tags if there are no such tags.
  //
  LIBTAGGR_SYMEXPORT version_tag
  latest_version_tag (
    const std::vector<std::string>& tags,
    const std::function<version_tag_skip_function>& skipped = nullptr);

  // As above but return nullopt if there are no version tags.
  //
  LIBTAGGR_SYMEXPORT std::optional<version_tag>
  find_latest_version_tag (
    const std::vector<std::string>& tags,
    const std::function<version_tag_skip_function>& skipped = nullptr);

  // Return the leading run of non-digit characters of a tag name.
  //
  LIBTAGGR_SYMEXPORT std::string
  version_tag_prefix (const std::string&);

  // Produce a tag name for the version using the naming convention of the
  // template tag name. Specifically, reproduce the template's prefix, if
  // any, followed by <major>.<minor>.<patch>. Note that the pre-release and
  // build components are never included.
  //
  LIBTAGGR_SYMEXPORT std::string
  format_version_tag (const std::string& template_name,
                      const semantic_version&);
}

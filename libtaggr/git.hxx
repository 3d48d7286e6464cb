// file      : libtaggr/git.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept> // runtime_error

#include <libtaggr/semantic-version.hxx>

#include <libtaggr/export.hxx>

namespace taggr
{
  // Thrown if git exits with a non-zero code or its output cannot be
  // interpreted. Note that git normally prints its own diagnostics to stderr
  // before exiting. Failure to start git is reported with process_error.
  //
  struct git_error: std::runtime_error
  {
    explicit
    git_error (const std::string& d): runtime_error (d) {}
  };

  // Return true if the specified directory is a git repository root (contains
  // the .git filesystem entry).
  //
  LIBTAGGR_SYMEXPORT bool
  git_repository (const std::string& dir);

  // Try to parse the line printed by the 'git --version' command. Return git
  // version if succeed, nullopt otherwise.
  //
  LIBTAGGR_SYMEXPORT std::optional<semantic_version>
  git_version (const std::string&);

  // Run 'git --version' and return the parsed version.
  //
  LIBTAGGR_SYMEXPORT semantic_version
  query_git_version ();

  // Return the names of tags reachable from HEAD in the order git lists
  // them. Requires git 2.7.0 or later.
  //
  LIBTAGGR_SYMEXPORT std::vector<std::string>
  git_tags (const std::string& dir);

  // Return the short name of the checked out branch or nullopt if HEAD is
  // detached.
  //
  LIBTAGGR_SYMEXPORT std::optional<std::string>
  git_branch (const std::string& dir);

  // Create an annotated tag that points to HEAD.
  //
  LIBTAGGR_SYMEXPORT void
  git_create_tag (const std::string& dir,
                  const std::string& name,
                  const std::string& message);
}

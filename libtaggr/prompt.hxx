// file      : libtaggr/prompt.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <string>
#include <vector>
#include <cstddef>  // size_t
#include <optional>

#include <libtaggr/export.hxx>

namespace taggr
{
  // The Y/N prompt. The def argument, if specified, should be either 'y' or
  // 'n'. It is used as the default answer, in case the user just hits enter.
  //
  // Write the prompt to diag_stream. Throw ios_base::failure if no answer
  // could be extracted from stdin (for example, because it was closed).
  //
  // Note that the implementation accepts both lower and upper case y/n as
  // valid answers (apparently the capitalized default answer confuses some
  // users into answering with capital letters).
  //
  LIBTAGGR_SYMEXPORT bool
  yn_prompt (const std::string&, char def = '\0');

  // The choice prompt. Write the prompt followed by the numbered list of
  // choices to diag_stream, for example:
  //
  // which version to bump?
  //   1) major
  //   2) minor
  //   3) patch
  // [1-3]:
  //
  // Accept either the choice number or the choice text itself (case-
  // insensitively) and return the choice index (0-based). The def argument,
  // if specified, is the index of the choice to return in case the user
  // just hits enter. Repeat the question on an invalid answer.
  //
  // Throw ios_base::failure if no answer could be extracted from stdin.
  //
  LIBTAGGR_SYMEXPORT std::size_t
  choice_prompt (const std::string&,
                 const std::vector<std::string>& choices,
                 std::optional<std::size_t> def = std::nullopt);
}

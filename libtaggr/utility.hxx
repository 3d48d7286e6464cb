// file      : libtaggr/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <string>
#include <cstddef> // size_t
#include <utility> // move()
#include <ostream>
#include <exception>

#include <libtaggr/export.hxx>

namespace taggr
{
  // Throw std::ios::failure with the specified description and, if it is
  // derived from std::system_error (as it should), error code.
  //
  [[noreturn]] LIBTAGGR_SYMEXPORT void
  throw_generic_ios_failure (int errno_code, const char* what = nullptr);

  // ASCII character classification. Unlike the <cctype> functions these are
  // locale-independent, which is what the semantic version grammar assumes.
  //
  bool digit (char);
  bool alpha (char);
  bool alnum (char);

  // Convert ASCII character to lower case. If there is no lower case
  // counterpart, leave the character unchanged.
  //
  char lcase (char);

  // Compare ASCII strings ignoring case. Return a negative value, zero, or a
  // positive value if the first string is less than, equal to, or greater
  // than the second one.
  //
  LIBTAGGR_SYMEXPORT int
  icasecmp (const std::string&, const std::string&);

  // Remove leading and trailing whitespaces.
  //
  LIBTAGGR_SYMEXPORT std::string&
  trim (std::string&);

  inline std::string
  trim (std::string&& s)
  {
    return std::move (trim (s));
  }
}

namespace std
{
  // Sanitize the exception description before printing. This includes:
  //
  // - stripping leading colons and spaces (see fdstream.cxx)
  // - stripping trailing newlines, periods, and spaces
  // - stripping the ': iostream error' suffix appended by libstdc++
  // - lower-case the first letter if the beginning looks like a word
  //
  LIBTAGGR_SYMEXPORT ostream&
  operator<< (ostream&, const exception&);
}

#include <libtaggr/utility.ixx>

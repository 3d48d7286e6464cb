// file      : libtaggr/utility.ixx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace taggr
{
  inline bool
  digit (char c)
  {
    return c >= '0' && c <= '9';
  }

  inline bool
  alpha (char c)
  {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
  }

  inline bool
  alnum (char c)
  {
    return alpha (c) || digit (c);
  }

  inline char
  lcase (char c)
  {
    return c >= 'A' && c <= 'Z' ? static_cast<char> (c - 'A' + 'a') : c;
  }
}

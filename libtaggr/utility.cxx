// file      : libtaggr/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libtaggr/utility.hxx>

#include <ios>          // ios_base::failure
#include <string>
#include <cstring>      // strlen(), strncmp()
#include <system_error>

using namespace std;

namespace taggr
{
  [[noreturn]] void
  throw_generic_ios_failure (int errno_code, const char* w)
  {
    // Note that the custom message, if absent, cannot be just omitted: with
    // libstdc++ passing an empty string results in a description like this
    // (note the ': ' prefix):
    //
    // : No such file or directory
    //
    // Our operator<<(ostream, exception) strips this prefix.
    //
    error_code ec (errno_code, generic_category ());
    throw ios_base::failure (w != nullptr ? w : "", ec);
  }

  int
  icasecmp (const string& x, const string& y)
  {
    size_t n (x.size () < y.size () ? x.size () : y.size ());

    for (size_t i (0); i != n; ++i)
    {
      char cx (lcase (x[i]));
      char cy (lcase (y[i]));

      if (cx != cy)
        return cx < cy ? -1 : 1;
    }

    return x.size () == y.size () ? 0 : (x.size () < y.size () ? -1 : 1);
  }

  string&
  trim (string& l)
  {
    auto ws = [] (char c)
    {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    };

    size_t i (0), n (l.size ());

    for (; i != n && ws (l[i]);     ++i) ;
    for (; n != i && ws (l[n - 1]); --n) ;

    if (n != l.size ()) l.resize (n);
    if (i != 0)         l.erase (0, i);

    return l;
  }
}

namespace std
{
  using namespace taggr;

  ostream&
  operator<< (ostream& o, const exception& e)
  {
    const char* d (e.what ());
    const char* s (d);

    // Strip the leading junk (colons and spaces).
    //
    for (; *s == ' ' || *s == ':'; ++s) ;

    // Strip the trailing junk (periods, spaces, newlines).
    //
    size_t n (strlen (s));
    for (; n != 0; --n)
    {
      switch (s[n - 1])
      {
      case '\r':
      case '\n':
      case '.':
      case ' ': continue;
      }

      break;
    }

    // Strip the error category description that libstdc++ appends to the
    // ios_base::failure description (for example, 'unable to read y/n answer
    // from stdin: iostream error'), as well as the description of the
    // success code.
    //
    // Return the suffix length if the description ends with it and 0
    // otherwise.
    //
    auto suffix = [s, &n] (const char* v) -> size_t
    {
      size_t nv (strlen (v));
      return n >= nv && strncmp (s + n - nv, v, nv) == 0 ? nv : 0;
    };

    for (size_t ns; (ns = suffix (": iostream error")) ||
                    (ns = suffix (": Success")); )
    {
      for (n -= ns; n != 0 && (s[n - 1] == '.' || s[n - 1] == ' '); --n) ;
    }

    // Lower-case the first letter if the beginning looks like a word (the
    // second character is the lower-case letter or space).
    //
    char c;
    bool lc (n != 0 && alpha (c = s[0]) && c != lcase (c) &&
             (n == 1 || (alpha (c = s[1]) && c == lcase (c)) || c == ' '));

    // Print the description as is if no adjustment is required.
    //
    if (!lc && s == d && s[n] == '\0')
      o << d;
    else
    {
      // Produce the resulting description and then write it with a single
      // formatted output operation.
      //
      string r (s, n);

      if (lc)
        r[0] = lcase (r[0]);

      o << r;
    }

    return o;
  }
}

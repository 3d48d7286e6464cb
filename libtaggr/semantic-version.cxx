// file      : libtaggr/semantic-version.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libtaggr/semantic-version.hxx>

#include <cerrno>    // errno, ERANGE
#include <cstdlib>   // strtoull()
#include <utility>   // move()
#include <stdexcept> // invalid_argument

#include <libtaggr/utility.hxx> // digit(), alnum()

using namespace std;

namespace taggr
{
  string semantic_version::
  string (bool ib) const
  {
    std::string r;
    r  = std::to_string (major);
    r += '.';
    r += std::to_string (minor);
    r += '.';
    r += std::to_string (patch);

    auto append = [&r] (char sep, const vector<std::string>& ids)
    {
      for (size_t i (0); i != ids.size (); ++i)
      {
        r += i == 0 ? sep : '.';
        r += ids[i];
      }
    };

    append ('-', pre_release);

    if (!ib)
      append ('+', build);

    return r;
  }

  static inline bool
  numeric (const string& s)
  {
    if (s.empty ())
      return false;

    for (char c: s)
    {
      if (!digit (c))
        return false;
    }

    return true;
  }

  // Compare two pre-release identifiers. Numeric identifiers are compared
  // numerically and have lower precedence than alphanumeric ones which are
  // compared lexically in ASCII sort order.
  //
  static int
  compare_identifier (const string& x, const string& y)
  {
    bool nx (numeric (x));
    bool ny (numeric (y));

    if (nx != ny)
      return nx ? -1 : 1;

    if (nx)
    {
      // Compare without conversion so that identifiers of any length are
      // ordered properly. Leading zeros are rejected by the parser but can
      // still be specified programmatically, so skip them.
      //
      size_t bx (x.find_first_not_of ('0'));
      size_t by (y.find_first_not_of ('0'));

      if (bx == string::npos) bx = x.size ();
      if (by == string::npos) by = y.size ();

      size_t lx (x.size () - bx);
      size_t ly (y.size () - by);

      if (lx != ly)
        return lx < ly ? -1 : 1;

      int r (x.compare (bx, lx, y, by, ly));
      return r < 0 ? -1 : r > 0 ? 1 : 0;
    }

    int r (x.compare (y));
    return r < 0 ? -1 : r > 0 ? 1 : 0;
  }

  int semantic_version::
  compare (const semantic_version& v) const
  {
    if (major != v.major) return major < v.major ? -1 : 1;
    if (minor != v.minor) return minor < v.minor ? -1 : 1;
    if (patch != v.patch) return patch < v.patch ? -1 : 1;

    // Pre-release precedes the release.
    //
    bool r (release ());
    bool vr (v.release ());

    if (r || vr)
      return r == vr ? 0 : (r ? 1 : -1);

    const vector<std::string>& x (pre_release);
    const vector<std::string>& y (v.pre_release);

    for (size_t i (0); i != x.size () && i != y.size (); ++i)
    {
      if (int c = compare_identifier (x[i], y[i]))
        return c;
    }

    // Shorter sequence that is a prefix of a longer one precedes it.
    //
    return x.size () == y.size () ? 0 : (x.size () < y.size () ? -1 : 1);
  }

  semantic_version::
  semantic_version (const std::string& s, size_t p, flags fs)
  {
    semantic_version_result r (parse_semantic_version_impl (s, p, fs));

    if (r.version)
      *this = move (*r.version);
    else
      throw invalid_argument (r.failure_reason);
  }

  // Parse the numeric version component advancing the position past it. On
  // failure return false and set the failure reason.
  //
  static bool
  parse_component (const string& s, size_t& p,
                   uint64_t& r,
                   const char* what,
                   string& e)
  {
    size_t b (p);
    for (size_t n (s.size ()); p != n && digit (s[p]); ++p) ;

    if (p == b)
    {
      e = string ("invalid ") + what + " version";
      return false;
    }

    if (s[b] == '0' && p - b != 1)
    {
      e = string ("leading zero in ") + what + " version";
      return false;
    }

    // Only digits so strtoull() stops exactly at p.
    //
    errno = 0; // We must clear it according to POSIX.
    uint64_t v (strtoull (s.c_str () + b, nullptr, 10)); // Can't throw.

    if (errno == ERANGE)
    {
      e = string (what) + " version is out of range";
      return false;
    }

    r = v;
    return true;
  }

  // Parse the dot-separated list of pre-release or build identifiers
  // advancing the position past it. On failure return false and set the
  // failure reason.
  //
  static bool
  parse_identifiers (const string& s, size_t& p,
                     vector<string>& r,
                     bool pre_release,
                     string& e)
  {
    const char* what (pre_release ? "pre-release" : "build");

    for (size_t n (s.size ());; ++p) // Skip the dot.
    {
      size_t b (p);
      for (; p != n && (alnum (s[p]) || s[p] == '-'); ++p) ;

      if (p == b)
      {
        e = string ("empty ") + what + " identifier";
        return false;
      }

      string id (s, b, p - b);

      if (pre_release && id.size () != 1 && id[0] == '0' && numeric (id))
      {
        e = "leading zero in numeric pre-release identifier '" + id + "'";
        return false;
      }

      r.push_back (move (id));

      if (p == n || s[p] != '.')
        break;
    }

    return true;
  }

  semantic_version_result
  parse_semantic_version_impl (const string& s, size_t p,
                               semantic_version::flags fs)
  {
    bool allow_prefix ((fs & semantic_version::allow_prefix) != 0);
    bool allow_suffix ((fs & semantic_version::allow_suffix) != 0);

    auto bail = [] (string m)
    {
      return semantic_version_result {nullopt, move (m)};
    };

    size_t n (s.size ());

    if (p > n)
      return bail ("invalid position");

    if (allow_prefix)
      for (; p != n && !digit (s[p]); ++p) ;

    semantic_version r;
    string e; // Failure reason.

    if (!parse_component (s, p, r.major, "major", e))
      return bail (move (e));

    if (p == n || s[p] != '.')
      return bail ("'.' expected after major version");

    if (!parse_component (s, ++p, r.minor, "minor", e))
      return bail (move (e));

    if (p == n || s[p] != '.')
      return bail ("'.' expected after minor version");

    if (!parse_component (s, ++p, r.patch, "patch", e))
      return bail (move (e));

    if (p != n && s[p] == '-' &&
        !parse_identifiers (s, ++p, r.pre_release, true /* pre_release */, e))
      return bail (move (e));

    if (p != n && s[p] == '+' &&
        !parse_identifiers (s, ++p, r.build, false /* pre_release */, e))
      return bail (move (e));

    if (p != n && !allow_suffix)
      return bail ("junk after version");

    return semantic_version_result {move (r), string ()};
  }
}

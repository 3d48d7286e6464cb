// file      : libtaggr/version-bump.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libtaggr/version-bump.hxx>

#include <limits>    // numeric_limits
#include <cassert>
#include <cstdint>   // uint64_t
#include <utility>   // move()
#include <stdexcept> // invalid_argument

#include <libtaggr/utility.hxx> // icasecmp()

using namespace std;

namespace taggr
{
  string
  to_string (bump_kind k)
  {
    switch (k)
    {
    case bump_kind::major: return "major";
    case bump_kind::minor: return "minor";
    case bump_kind::patch: return "patch";
    }

    assert (false); // Can't be here.
    return string ();
  }

  bump_kind
  to_bump_kind (const string& s)
  {
         if (icasecmp (s, "major") == 0) return bump_kind::major;
    else if (icasecmp (s, "minor") == 0) return bump_kind::minor;
    else if (icasecmp (s, "patch") == 0) return bump_kind::patch;

    throw invalid_argument ("invalid bump kind '" + s + '\'');
  }

  semantic_version
  bump_version (const semantic_version& v, bump_kind k)
  {
    auto inc = [k] (uint64_t n) -> uint64_t
    {
      if (n == numeric_limits<uint64_t>::max ())
        throw version_overflow (to_string (k) + " version " +
                                std::to_string (n) + " cannot be incremented");
      return n + 1;
    };

    // Note: pre-release and build are dropped.
    //
    switch (k)
    {
    case bump_kind::major: return semantic_version (inc (v.major), 0, 0);
    case bump_kind::minor: return semantic_version (v.major, inc (v.minor), 0);
    case bump_kind::patch: return semantic_version (v.major, v.minor, inc (v.patch));
    }

    assert (false); // Can't be here.
    return semantic_version ();
  }

  version_tag
  next_version_tag (const vector<string>& tags,
                    const function<bump_kind_function>& ask,
                    const function<version_tag_skip_function>& skipped)
  {
    assert (ask);

    version_tag l (latest_version_tag (tags, skipped));
    semantic_version v (bump_version (l.version, ask (l)));

    version_tag r;
    r.name = format_version_tag (l.name, v);
    r.prefix = move (l.prefix);
    r.version = move (v);
    return r;
  }
}

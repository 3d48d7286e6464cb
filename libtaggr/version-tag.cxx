// file      : libtaggr/version-tag.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libtaggr/version-tag.hxx>

#include <utility>   // move()
#include <stdexcept> // invalid_argument

#include <libtaggr/utility.hxx> // digit()

using namespace std;

namespace taggr
{
  version_tag::
  version_tag (string n)
      : name (move (n)),
        prefix (version_tag_prefix (name)),
        version (name, prefix.size ())
  {
  }

  optional<version_tag>
  parse_version_tag (const string& n)
  {
    string p (version_tag_prefix (n));

    if (optional<semantic_version> v = parse_semantic_version (n, p.size ()))
    {
      version_tag r;
      r.name = n;
      r.prefix = move (p);
      r.version = move (*v);
      return r;
    }

    return nullopt;
  }

  optional<version_tag>
  find_latest_version_tag (const vector<string>& tags,
                           const function<version_tag_skip_function>& skipped)
  {
    optional<version_tag> r;

    for (const string& t: tags)
    {
      string p (version_tag_prefix (t));
      semantic_version_result v (
        parse_semantic_version_impl (t, p.size (), semantic_version::none));

      if (!v.version)
      {
        if (skipped)
          skipped (t, v.failure_reason);

        continue;
      }

      // Only replace on the strictly greater precedence so that the first
      // one wins among equals.
      //
      if (!r || *v.version > r->version)
      {
        if (!r)
          r = version_tag ();

        r->name = t;
        r->prefix = move (p);
        r->version = move (*v.version);
      }
    }

    return r;
  }

  version_tag
  latest_version_tag (const vector<string>& tags,
                      const function<version_tag_skip_function>& skipped)
  {
    if (optional<version_tag> r = find_latest_version_tag (tags, skipped))
      return move (*r);

    throw no_version_tags ();
  }

  string
  version_tag_prefix (const string& n)
  {
    size_t i (0);
    for (; i != n.size () && !digit (n[i]); ++i) ;
    return string (n, 0, i);
  }

  string
  format_version_tag (const string& t, const semantic_version& v)
  {
    string r (version_tag_prefix (t));
    r += std::to_string (v.major);
    r += '.';
    r += std::to_string (v.minor);
    r += '.';
    r += std::to_string (v.patch);
    return r;
  }
}

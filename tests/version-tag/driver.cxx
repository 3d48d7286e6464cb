// file      : tests/version-tag/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <string>
#include <vector>
#include <utility>   // pair
#include <sstream>
#include <optional>
#include <stdexcept> // invalid_argument

#include <libtaggr/version-tag.hxx>
#include <libtaggr/semantic-version.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace taggr;

using strings = vector<string>;

static string
latest (const strings& ts)
{
  return latest_version_tag (ts).name;
}

int
main ()
{
  using semver = semantic_version;

  // Parsing.
  //
  {
    version_tag t ("v1.2.3");
    assert (t.name == "v1.2.3");
    assert (t.prefix == "v");
    assert (t.version == semver (1, 2, 3));

    ostringstream os;
    os << t;
    assert (os.str () == "v1.2.3");
  }
  {
    version_tag t ("1.0.0-beta+exp");
    assert (t.prefix.empty ());
    assert (t.version.pre_release == strings {"beta"});
    assert (t.version.build == strings {"exp"});
  }
  {
    version_tag t ("release-2.0.1");
    assert (t.prefix == "release-" && t.version == semver (2, 0, 1));
  }

  try
  {
    version_tag t ("release-7");
    assert (false);
  }
  catch (const invalid_argument&) {}

  assert (!parse_version_tag ("release-7"));
  assert (!parse_version_tag ("latest"));
  assert (!parse_version_tag (""));
  assert (!parse_version_tag ("v1.2"));
  assert (!parse_version_tag ("v01.2.3"));
  assert (!parse_version_tag ("v1.2.3 "));
  assert (parse_version_tag ("v1.2.3")->version == semver (1, 2, 3));

  // Prefix.
  //
  assert (version_tag_prefix ("v1.2.3") == "v");
  assert (version_tag_prefix ("1.2.3") == "");
  assert (version_tag_prefix ("ver-1.2.3") == "ver-");
  assert (version_tag_prefix ("latest") == "latest");

  // Latest tag.
  //
  assert (latest ({"v1.0.0", "v1.2.0", "v1.1.5"}) == "v1.2.0");
  assert (latest ({"v1.0.0-beta", "v1.0.0"}) == "v1.0.0");
  assert (latest ({"v1.0.0", "v1.0.0-beta"}) == "v1.0.0");
  assert (latest ({"v1.9.0", "v1.10.0"}) == "v1.10.0");
  assert (latest ({"v1.0.0-rc.1", "v1.0.0-beta.11"}) == "v1.0.0-rc.1");
  assert (latest ({"foo", "v0.1.0", "release-7", "bar-1.x"}) == "v0.1.0");

  // Mixed prefixes are compared by version only.
  //
  assert (latest ({"v1.0.0", "2.0.0", "release-1.5.0"}) == "2.0.0");

  // First encountered wins among equal versions, including the ones that
  // only differ in build metadata.
  //
  assert (latest ({"v1.2.0", "1.2.0"}) == "v1.2.0");
  assert (latest ({"1.2.0", "v1.2.0"}) == "1.2.0");
  assert (latest ({"1.2.0+b", "1.2.0+a"}) == "1.2.0+b");
  assert (latest ({"v1.0.0", "v1.0.0", "v0.9.0"}) == "v1.0.0");

  // No version tags.
  //
  try
  {
    latest_version_tag (strings ());
    assert (false);
  }
  catch (const no_version_tags& e)
  {
    assert (string (e.what ()) == "no version tags found");
  }

  try
  {
    latest_version_tag ({"release-7"});
    assert (false);
  }
  catch (const no_version_tags&) {}

  assert (!find_latest_version_tag (strings ()));
  assert (!find_latest_version_tag ({"release-7", "latest"}));

  // Skipped tags are reported in order with the reason.
  //
  {
    vector<pair<string, string>> sk;
    optional<version_tag> t (
      find_latest_version_tag (
        {"release-7", "v1.0.0", "v1.0", "latest"},
        [&sk] (const string& n, const string& r) {sk.emplace_back (n, r);}));

    assert (t && t->name == "v1.0.0");
    assert (sk.size () == 3);
    assert (sk[0].first == "release-7" &&
            sk[0].second == "'.' expected after major version");
    assert (sk[1].first == "v1.0" &&
            sk[1].second == "'.' expected after minor version");
    assert (sk[2].first == "latest" &&
            sk[2].second == "invalid major version");
  }

  // Formatting.
  //
  assert (format_version_tag ("v1.2.0", semver (1, 3, 0)) == "v1.3.0");
  assert (format_version_tag ("1.2.0", semver (1, 2, 1)) == "1.2.1");
  assert (format_version_tag ("release-1.0.0", semver (2, 0, 0)) ==
          "release-2.0.0");
  assert (format_version_tag ("v1.0.0-rc.1+b",
                              semver (1, 0, 0, {"rc", "1"}, {"b"})) ==
          "v1.0.0");

  // Formatting the parsed tag reproduces the normalized tag.
  //
  for (const char* n: {"v1.2.3", "0.0.1", "ver9.10.11", "v1.2.3-rc.1+b.2"})
  {
    version_tag t (n);
    string f (format_version_tag (t.name, t.version));
    version_tag r (f);

    assert (r.prefix == t.prefix);
    assert (r.version.major == t.version.major &&
            r.version.minor == t.version.minor &&
            r.version.patch == t.version.patch);
    assert (r.version.release () && r.version.build.empty ());
  }
}

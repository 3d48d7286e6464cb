// file      : tests/git/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <stdlib.h> // mkdtemp()

#include <string>
#include <vector>
#include <utility>  // move()
#include <optional>
#include <iostream>

#include <libtaggr/git.hxx>
#include <libtaggr/utility.hxx> // trim()
#include <libtaggr/process.hxx>
#include <libtaggr/fdstream.hxx>
#include <libtaggr/semantic-version.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace taggr;

using strings = vector<string>;
using cstrings = vector<const char*>;

// Run git in the directory and return its stdout. Fail if git exits with a
// non-zero code.
//
static string
git (const string& d, cstrings args)
{
  args.insert (args.begin (), {"git", "-C", d.c_str ()});
  args.push_back (nullptr);

  process pr (args, -2, -1, 2);

  ifdstream is (move (pr.in_ofd));
  string r (is.read_text ());
  is.close ();

  assert (pr.wait ());
  return trim (move (r));
}

static void
commit (const string& d, const char* m)
{
  git (d, {"commit", "--quiet", "--allow-empty", "--message", m});
}

int
main ()
{
  using semver = semantic_version;

  // Version parsing.
  //
  assert (git_version ("git version 2.14.3") == semver (2, 14, 3));
  assert (git_version ("git version 2.10.1 (Apple Git-78)") ==
          semver (2, 10, 1));
  assert (git_version ("git version 2.16.1.windows.1") == semver (2, 16, 1));
  assert (git_version ("git version 2.45.0-rc1") ==
          semver (2, 45, 0, {"rc1"}));
  assert (!git_version ("git version 2.16"));
  assert (!git_version ("version 2.16.1"));
  assert (!git_version (""));

  // Skip the repository tests if git is not available.
  //
  try
  {
    semver v (query_git_version ());

    if (v < semver (2, 7, 0))
    {
      cerr << "git " << v << " is too old, skipping" << endl;
      return 0;
    }
  }
  catch (const process_error& e)
  {
    cerr << "git is not available (" << e.what () << "), skipping" << endl;
    return 0;
  }

  char t[] = "/tmp/taggr-git-XXXXXX";
  assert (mkdtemp (t) != nullptr);
  string d (t);

  assert (!git_repository (d));

  git (d, {"init", "--quiet"});
  git (d, {"symbolic-ref", "HEAD", "refs/heads/master"});
  git (d, {"config", "user.name", "Taggr Test"});
  git (d, {"config", "user.email", "test@example.org"});
  git (d, {"config", "tag.gpgSign", "false"});
  git (d, {"config", "commit.gpgSign", "false"});
  git (d, {"config", "tag.sort", "refname"});

  assert (git_repository (d));

  // No commits yet.
  //
  try
  {
    git_tags (d);
    assert (false);
  }
  catch (const git_error&) {}

  commit (d, "initial");

  assert (git_branch (d) == string ("master"));
  assert (git_tags (d).empty ());

  // Tag creation.
  //
  git_create_tag (d, "v1.0.0", "Tag created by taggr");
  git_create_tag (d, "release-7", "Tag created by taggr");

  assert (git (d, {"cat-file", "-t", "v1.0.0"}) == "tag");
  assert (git (d, {"tag", "--list", "--format=%(contents)", "v1.0.0"}) ==
          "Tag created by taggr");
  assert (git (d, {"tag", "--list", "--format=%(taggername)", "v1.0.0"}) ==
          "Taggr Test");

  try
  {
    git_create_tag (d, "v1.0.0", "Tag created by taggr");
    assert (false);
  }
  catch (const git_error&) {}

  commit (d, "second");
  git_create_tag (d, "v1.1.0", "Tag created by taggr");

  assert (git_tags (d) == (strings {"release-7", "v1.0.0", "v1.1.0"}));

  // Only tags reachable from HEAD are listed.
  //
  git (d, {"checkout", "--quiet", "-b", "feature"});
  commit (d, "feature");
  git_create_tag (d, "v2.0.0", "Tag created by taggr");

  assert (git_branch (d) == string ("feature"));
  assert (git_tags (d) ==
          (strings {"release-7", "v1.0.0", "v1.1.0", "v2.0.0"}));

  git (d, {"checkout", "--quiet", "master"});
  assert (git_tags (d) == (strings {"release-7", "v1.0.0", "v1.1.0"}));

  // Detached HEAD.
  //
  git (d, {"checkout", "--quiet", "--detach", "v1.0.0"});
  assert (!git_branch (d));
  assert (git_tags (d) == (strings {"release-7", "v1.0.0"}));

  // Not a repository.
  //
  {
    string s (d + "/.git/objects");
    assert (!git_repository (s));
  }

  process pr ({"rm", "-rf", t, nullptr});
  assert (pr.wait ());
}

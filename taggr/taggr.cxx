// file      : taggr/taggr.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <string>
#include <vector>
#include <cstddef>   // size_t
#include <optional>
#include <iostream>
#include <exception>

#include <libtaggr/git.hxx>
#include <libtaggr/prompt.hxx>
#include <libtaggr/utility.hxx>          // operator<<(ostream, exception)
#include <libtaggr/version.hxx>
#include <libtaggr/version-tag.hxx>
#include <libtaggr/version-bump.hxx>
#include <libtaggr/semantic-version.hxx>

#include <taggr/options.hxx>
#include <taggr/diagnostics.hxx>

using namespace std;
using namespace taggr;

static const char* const tag_message ("Tag created by taggr");

// Fail unless the checked out branch is master or main. If forced, only warn.
//
static void
check_branch (const string& dir, bool force)
{
  optional<string> b (git_branch (dir));

  if (b && (*b == "master" || *b == "main"))
    return;

  diag_record dr;

  if (force)
    dr << warn;
  else
    dr << fail;

  if (!b)
    dr << "HEAD is detached";
  else
    dr << "branch '" << *b << "' is checked out instead of master or main";

  if (!force)
    dr << info << "use --force to tag anyway";
}

// Ask the user which version component to bump.
//
static bump_kind
ask_bump_kind (const version_tag& latest)
{
  static const vector<string> kinds {"major", "minor", "patch"};

  size_t i (choice_prompt ("which version of " + latest.name + " to bump?",
                           kinds));

  return to_bump_kind (kinds[i]);
}

int
main (int argc, char* argv[])
try
{
  tracer trace ("main");

  options ops (parse_options (argc, argv));

  if (ops.help)
  {
    print_usage (cout);
    return 0;
  }

  if (ops.version)
  {
    cout << "taggr " << LIBTAGGR_VERSION_STR << endl;
    return 0;
  }

  if (ops.quiet)
    verb = 0;
  else if (ops.debug != 0)
    verb = ops.debug > 1 ? 3 : 2;

  const string& dir (ops.dir);
  const string& d (dir.empty () ? string (".") : dir); // For diagnostics.

  if (!git_repository (dir))
    fail << "no git repository at " << d;

  if (l2 ())
    trace << "repository location: " << d;

  semantic_version gv (query_git_version ());

  if (l2 ())
    trace << "git version " << gv;

  if (gv < semantic_version (2, 7, 0))
    fail << "unsupported git version " << gv <<
      info << "minimum supported version is 2.7.0";

  check_branch (dir, ops.force);

  vector<string> tags (git_tags (dir));

  if (l2 ())
    trace << tags.size () << " tag(s) reachable from HEAD";

  auto skipped = [&trace] (const string& t, const string& r)
  {
    if (l3 ())
      trace << "skipping tag " << t << ": " << r;
  };

  auto ask = [&ops, &trace] (const version_tag& l) -> bump_kind
  {
    if (verb != 0)
      info << "latest version tag " << l;

    bump_kind k (ops.bump ? *ops.bump : ask_bump_kind (l));

    if (l2 ())
      trace << "bumping " << k << " version of " << l.version;

    return k;
  };

  version_tag nt;
  try
  {
    nt = next_version_tag (tags, ask, skipped);
  }
  catch (const no_version_tags& e)
  {
    if (verb != 0)
      info << e <<
        info << "using initial version tag " << ops.initial;

    nt = version_tag (ops.initial);
  }

  if (ops.dry_run)
  {
    cout << nt << endl;
    return 0;
  }

  if (!ops.yes && !yn_prompt ("create new tag " + nt.name + "? [Y/n]", 'y'))
  {
    if (verb != 0)
      text << "aborting";

    return 0;
  }

  git_create_tag (dir, nt.name, tag_message);

  if (verb != 0)
    text << "created annotated tag " << nt;

  return 0;
}
catch (const failed&)
{
  return 1; // Diagnostics has already been issued.
}
catch (const exception& e)
{
  error << e;
  return 1;
}

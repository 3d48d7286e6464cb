// file      : libtaggr/git.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libtaggr/git.hxx>

#include <sys/stat.h> // stat()

#include <sstream>
#include <utility>          // move()
#include <initializer_list>

#include <libtaggr/utility.hxx>  // trim()
#include <libtaggr/process.hxx>
#include <libtaggr/fdstream.hxx> // ifdstream

using namespace std;

namespace taggr
{
  bool
  git_repository (const string& d)
  {
    // .git can be either a directory or a file in case of a submodule or a
    // separate working tree.
    //
    string p (d.empty () ? string (".git") : d + "/.git");

    struct stat s;
    return stat (p.c_str (), &s) == 0;
  }

  optional<semantic_version>
  git_version (const string& s)
  {
    // There is some variety across platforms in the version
    // representation.
    //
    // Linux:  git version 2.14.3
    // MacOS:  git version 2.10.1 (Apple Git-78)
    // MinGit: git version 2.16.1.windows.1
    //
    if (s.compare (0, 12, "git version ") == 0)
      return parse_semantic_version (s, 12, semantic_version::allow_suffix);

    return nullopt;
  }

  // Run git in the specified directory (unless empty) with stdin redirected
  // to the null device. If out is not NULL, then capture stdout into it.
  // Otherwise, redirect stdout to stderr so that our own stdout stays clean.
  //
  static process_exit
  run_git (const string& dir,
           initializer_list<const char*> args,
           string* out = nullptr)
  {
    vector<const char*> cmd {"git"};

    if (!dir.empty ())
    {
      cmd.push_back ("-C");
      cmd.push_back (dir.c_str ());
    }

    cmd.insert (cmd.end (), args);
    cmd.push_back (nullptr);

    process pr (cmd, -2 /* in */, out != nullptr ? -1 : 2 /* out */);

    if (out != nullptr)
    {
      ifdstream is (move (pr.in_ofd));
      *out = is.read_text ();
    }

    pr.wait ();
    return *pr.exit;
  }

  [[noreturn]] static void
  throw_git_error (const char* what, const process_exit& pe)
  {
    ostringstream os;
    os << "unable to " << what << ": git " << pe;
    throw git_error (os.str ());
  }

  semantic_version
  query_git_version ()
  {
    string o;
    process_exit pe (run_git (string (), {"--version"}, &o));

    if (!pe)
      throw_git_error ("query version", pe);

    trim (o);

    if (optional<semantic_version> v = git_version (o))
      return move (*v);

    throw git_error ("unable to parse git version from '" + o + "'");
  }

  vector<string>
  git_tags (const string& dir)
  {
    string o;
    process_exit pe (
      run_git (dir, {"tag", "--list", "--merged", "HEAD"}, &o));

    if (!pe)
      throw_git_error ("list tags", pe);

    vector<string> r;

    istringstream is (o);
    for (string l; getline (is, l); )
    {
      if (!trim (l).empty ())
        r.push_back (move (l));
    }

    return r;
  }

  optional<string>
  git_branch (const string& dir)
  {
    string o;
    process_exit pe (
      run_git (dir, {"symbolic-ref", "--quiet", "--short", "HEAD"}, &o));

    // With --quiet symbolic-ref exits with 1 and prints nothing if HEAD is
    // not a symbolic ref (detached).
    //
    if (pe.normal () && pe.code () == 1)
      return nullopt;

    if (!pe)
      throw_git_error ("query current branch", pe);

    if (trim (o).empty ())
      throw git_error ("unable to query current branch: empty git output");

    return o;
  }

  void
  git_create_tag (const string& dir, const string& name, const string& msg)
  {
    process_exit pe (
      run_git (dir,
               {"tag", "--annotate", "--message", msg.c_str (), "--",
                name.c_str ()}));

    if (!pe)
      throw_git_error (("create tag '" + name + "'").c_str (), pe);
  }
}

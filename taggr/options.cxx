// file      : taggr/options.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <taggr/options.hxx>

#include <stdexcept> // invalid_argument

#include <libtaggr/utility.hxx>     // operator<<(ostream, exception)
#include <libtaggr/version-tag.hxx>

#include <taggr/diagnostics.hxx>

using namespace std;

namespace taggr
{
  options
  parse_options (int argc, char* argv[])
  {
    options r;

    // Return the option value advancing the argument index.
    //
    auto value = [argc, argv] (int& i) -> string
    {
      const char* o (argv[i]);

      if (++i == argc)
        fail << "missing value for option " << o <<
          info << "run 'taggr --help' for more information";

      return argv[i];
    };

    bool opts (true); // Still parsing options.

    for (int i (1); i != argc; ++i)
    {
      string a (argv[i]);

      if (opts && a == "--")
      {
        opts = false;
      }
      else if (opts && (a == "-d" || a == "--debug"))
      {
        ++r.debug;
      }
      else if (opts && (a == "-q" || a == "--quiet"))
      {
        r.quiet = true;
      }
      else if (opts && (a == "-f" || a == "--force"))
      {
        r.force = true;
      }
      else if (opts && (a == "-b" || a == "--bump"))
      {
        string v (value (i));

        try
        {
          r.bump = to_bump_kind (v);
        }
        catch (const invalid_argument& e)
        {
          fail << e <<
            info << "valid kinds are major, minor, and patch";
        }
      }
      else if (opts && (a == "-y" || a == "--yes"))
      {
        r.yes = true;
      }
      else if (opts && (a == "-n" || a == "--dry-run"))
      {
        r.dry_run = true;
      }
      else if (opts && a == "--initial")
      {
        r.initial = value (i);

        if (!parse_version_tag (r.initial))
          fail << "invalid --initial value '" << r.initial << "': not a "
               << "version tag";
      }
      else if (opts && (a == "-h" || a == "--help"))
      {
        r.help = true;
      }
      else if (opts && a == "--version")
      {
        r.version = true;
      }
      else if (opts && a.size () > 1 && a[0] == '-')
      {
        fail << "unknown option '" << a << "'" <<
          info << "run 'taggr --help' for more information";
      }
      else if (r.dir.empty ())
      {
        if (a.empty ())
          fail << "empty repository directory";

        r.dir = move (a);
      }
      else
        fail << "unexpected argument '" << a << "'" <<
          info << "run 'taggr --help' for more information";
    }

    if (r.quiet && r.debug != 0)
      fail << "both --quiet and --debug specified";

    return r;
  }

  void
  print_usage (ostream& o)
  {
    o << "usage: taggr [<options>] [<dir>]" << endl
      << endl
      << "Create the next semantic version tag in the git repository <dir>"
      << endl
      << "(current directory by default)." << endl
      << endl
      << "options:" << endl
      << "  -d, --debug         increase verbosity (can be repeated)" << endl
      << "  -q, --quiet         only print errors" << endl
      << "  -f, --force         allow branches other than master and main"
      << endl
      << "  -b, --bump <kind>   bump kind (major, minor, or patch) instead of"
      << endl
      << "                      asking" << endl
      << "  -y, --yes           create the tag without confirmation" << endl
      << "  -n, --dry-run       print the new tag but do not create it" << endl
      << "  --initial <tag>     tag to create if there are no version tags"
      << endl
      << "                      (0.1.0 by default)" << endl
      << "  -h, --help          print this help and exit" << endl
      << "  --version           print version and exit" << endl;
  }
}

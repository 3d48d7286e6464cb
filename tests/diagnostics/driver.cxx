// file      : tests/diagnostics/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <string>
#include <sstream>
#include <utility>   // move()
#include <exception>

#include <libtaggr/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace taggr;

struct aborted: exception {};

static void
abort_epilogue (const diag_record& r, diag_writer* w)
{
  r.flush (w);
  throw aborted ();
}

int
main ()
{
  ostringstream out;
  diag_stream = &out;

  const diag_mark error ("error");
  const diag_mark info ("info");
  const diag_mark trace ("trace", "main");
  const diag_mark text (nullptr);
  const diag_mark fatal ("error", nullptr, &abort_epilogue);

  // Prefixes and continuation lines.
  //
  error << "no git repository at " << "/tmp/x";
  trace << "git version " << 2;
  text << "aborting";
  error << "unknown option '-x'" <<
    info << "run 'taggr --help' for more information";

  assert (out.str () ==
          "error: no git repository at /tmp/x\n"
          "trace: main: git version 2\n"
          "aborting\n"
          "error: unknown option '-x'\n"
          "  info: run 'taggr --help' for more information\n");

  // Record started with the mark later.
  //
  out.str (string ());
  {
    diag_record dr;
    assert (dr.empty ());

    dr << error;
    assert (!dr.empty ());

    dr << "branch 'feature' is checked out";
  }
  assert (out.str () == "error: branch 'feature' is checked out\n");

  // Appending to the moved record continues its text.
  //
  out.str (string ());
  {
    diag_record r (error);
    r << "first";

    diag_record m (move (r));
    assert (r.empty () && !m.empty ());

    m << " second";
    assert (m.os.str () == "error: first second");
  }
  assert (out.str () == "error: first second\n");

  // The epilogue writes the record and throws.
  //
  out.str (string ());
  try
  {
    fatal << "unable to list tags" <<
      info << "git exited with code 128";
    assert (false);
  }
  catch (const aborted&) {}

  assert (out.str () ==
          "error: unable to list tags\n"
          "  info: git exited with code 128\n");

  // The record is not written during the stack unwinding.
  //
  out.str (string ());
  try
  {
    diag_record dr (error);
    dr << "never written";
    throw aborted ();
  }
  catch (const aborted&) {}

  assert (out.str ().empty ());

  // Custom writer.
  //
  {
    diag_record dr (info);
    dr << "latest version tag v1.2.0";
    dr.flush ([] (const diag_record& r)
              {
                *diag_stream << '[' << r.os.str () << ']';
              });
    assert (dr.empty ());
  }
  assert (out.str () == "[info: latest version tag v1.2.0]");
}

// file      : taggr/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <taggr/diagnostics.hxx>

using namespace std;

namespace taggr
{
  uint16_t verb = 1;

  [[noreturn]] static void
  fail_epilogue (const diag_record& r, diag_writer* w)
  {
    r.flush (w);
    throw failed ();
  }

  const diag_mark error ("error");
  const diag_mark warn  ("warning");
  const diag_mark info  ("info");
  const diag_mark text  (nullptr);
  const diag_mark fail  ("error", nullptr, &fail_epilogue);
}

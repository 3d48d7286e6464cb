// file      : libtaggr/prompt.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libtaggr/prompt.hxx>

#include <cassert>
#include <iostream>

#include <libtaggr/utility.hxx>     // trim(), icasecmp()
#include <libtaggr/diagnostics.hxx> // diag_stream

using namespace std;

namespace taggr
{
  // Read the answer line from stdin into the string. Return true if we have
  // reached eof before seeing the newline.
  //
  static bool
  read_answer (string& a, const char* what)
  {
    // getline() will set the failbit if it failed to extract anything,
    // not even the delimiter and eofbit if it reached eof before seeing
    // the delimiter.
    //
    getline (cin, a);

    bool f (cin.fail ());
    bool e (cin.eof ());

    if (f || e)
      *diag_stream << endl; // Assume no delimiter (newline).

    if (f)
      throw ios_base::failure (string ("unable to read ") + what +
                               " answer from stdin");

    return e;
  }

  bool
  yn_prompt (const string& prompt, char def)
  {
    // Writing a robust Y/N prompt is more difficult than one would expect.
    //
    string a;
    do
    {
      *diag_stream << prompt << ' ';

      bool e (read_answer (a, "y/n"));

      if (a.empty () && def != '\0')
      {
        // Don't treat eof as the default answer. We need to see the actual
        // newline.
        //
        if (!e)
          a = def;
      }
    } while (a != "y" && a != "Y" && a != "n" && a != "N");

    return a == "y" || a == "Y";
  }

  size_t
  choice_prompt (const string& prompt,
                 const vector<string>& cs,
                 optional<size_t> def)
  {
    assert (!cs.empty () && (!def || *def < cs.size ()));

    size_t n (cs.size ());

    for (;;)
    {
      *diag_stream << prompt << '\n';

      for (size_t i (0); i != n; ++i)
        *diag_stream << "  " << i + 1 << ") " << cs[i] << '\n';

      *diag_stream << "[1-" << n << ']';

      if (def)
        *diag_stream << " (" << *def + 1 << ')';

      *diag_stream << ": ";

      string a;
      bool e (read_answer (a, "choice"));

      trim (a);

      if (a.empty ())
      {
        // As in yn_prompt(), eof is not the default answer.
        //
        if (def && !e)
          return *def;

        continue;
      }

      // The choice number.
      //
      if (a.size () <= 9 &&
          a.find_first_not_of ("0123456789") == string::npos)
      {
        size_t i (stoul (a));

        if (i != 0 && i <= n)
          return i - 1;

        continue;
      }

      // The choice text.
      //
      for (size_t i (0); i != n; ++i)
      {
        if (icasecmp (a, cs[i]) == 0)
          return i;
      }
    }
  }
}

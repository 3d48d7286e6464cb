// file      : tests/utility/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <ios>          // ios_base::failure
#include <cerrno>       // EBADF
#include <string>
#include <sstream>
#include <stdexcept>    // invalid_argument, runtime_error
#include <system_error> // generic_category()

#include <libtaggr/utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace taggr;

template <typename E>
static string
print (const E& e)
{
  ostringstream os;
  os << e;
  return os.str ();
}

int
main ()
{
  // Exception descriptions.
  //
  assert (print (invalid_argument ("invalid bump kind 'micro'")) ==
          "invalid bump kind 'micro'");
  assert (print (runtime_error ("No version tags found.\n")) ==
          "no version tags found");
  assert (print (runtime_error ("HEAD is detached")) == "HEAD is detached");
  assert (print (runtime_error (": broken pipe")) == "broken pipe");

  // The closed stdin failure as thrown by the prompts.
  //
  assert (print (ios_base::failure ("unable to read choice answer from stdin")) ==
          "unable to read choice answer from stdin");

  try
  {
    throw_generic_ios_failure (EBADF, "unable to read");
    assert (false);
  }
  catch (const ios_base::failure& e)
  {
    assert (e.code ().category () == generic_category ());
    assert (e.code ().value () == EBADF);

    string s (print (e));
    assert (s.compare (0, 15, "unable to read:") == 0);
  }

  // Character classification and case.
  //
  assert (digit ('0') && digit ('9') && !digit ('a'));
  assert (alpha ('a') && alpha ('Z') && !alpha ('1') && !alpha ('-'));
  assert (alnum ('x') && alnum ('7') && !alnum ('.'));
  assert (lcase ('A') == 'a' && lcase ('a') == 'a' && lcase ('1') == '1');

  assert (icasecmp ("Minor", "minor") == 0);
  assert (icasecmp ("major", "minor") < 0);
  assert (icasecmp ("patch", "PAT") > 0);

  // Trimming.
  //
  {
    string s ("  v1.2.0\r\n");
    assert (trim (s) == "v1.2.0" && s == "v1.2.0");
    assert (trim (string (" \t\n")).empty ());
    assert (trim (string ("master")) == "master");
  }
}

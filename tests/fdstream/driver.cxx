// file      : tests/fdstream/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <fcntl.h>  // fcntl(), FD_CLOEXEC
#include <unistd.h> // write()

#include <ios>
#include <string>
#include <utility>  // move()

#include <libtaggr/fdstream.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace taggr;

// Write the string to the pipe and close its write end.
//
static void
write_close (fdpipe& p, const string& s)
{
  const char* d (s.c_str ());
  for (size_t n (s.size ()); n != 0; )
  {
    ssize_t r (write (p.out.get (), d, n));
    assert (r > 0);

    d += r;
    n -= r;
  }

  p.out.close ();
}

int
main ()
{
  // auto_fd.
  //
  {
    auto_fd fd;
    assert (fd == nullfd && fd.get () == -1);

    fdpipe p (fdopen_pipe ());
    assert (p.in != nullfd && p.out != nullfd);

    // Both ends are not inherited by the child processes.
    //
    assert ((fcntl (p.in.get (), F_GETFD) & FD_CLOEXEC) != 0);
    assert ((fcntl (p.out.get (), F_GETFD) & FD_CLOEXEC) != 0);

    int i (p.in.get ());
    fd = move (p.in);
    assert (fd.get () == i && p.in == nullfd);

    int r (fd.release ());
    assert (r == i && fd == nullfd);
    assert (fdclose (r));
    assert (!fdclose (r)); // Already closed.

    p.out.close ();
    assert (p.out == nullfd);
    p.out.close (); // Noop.
  }

  // Read the text.
  //
  {
    fdpipe p (fdopen_pipe ());
    write_close (p, "abc\ndef\n");

    ifdstream is (move (p.in));
    assert (is.is_open ());
    assert (is.read_text () == "abc\ndef\n");
    assert (is.eof ());
    assert (is.read_text () == "");

    is.close ();
    assert (!is.is_open ());
  }

  // Read the lines.
  //
  {
    fdpipe p (fdopen_pipe ());
    write_close (p, "v1.0.0\nv1.1.0\nlast");

    ifdstream is (move (p.in));

    string l;
    assert (getline (is, l) && l == "v1.0.0");
    assert (getline (is, l) && l == "v1.1.0");
    assert (getline (is, l) && l == "last");
    assert (!getline (is, l));
  }

  // Read more than the buffer holds.
  //
  {
    fdpipe p (fdopen_pipe ());

    string s (fdstreambuf::buffer_size + 10, 'x');
    s.back () = 'y';

    // Note that the data fits into the pipe capacity so we can write it
    // before reading.
    //
    write_close (p, s);

    ifdstream is (move (p.in));
    assert (is.read_text () == s);
  }

  // Empty stream.
  //
  {
    fdpipe p (fdopen_pipe ());
    p.out.close ();

    ifdstream is (move (p.in));
    assert (is.read_text ().empty ());
  }

  // Read error.
  //
  {
    ifdstream is (auto_fd (1000)); // Hopefully not an open descriptor.

    try
    {
      is.read_text ();
      assert (false);
    }
    catch (const ios_base::failure&) {}
  }
}

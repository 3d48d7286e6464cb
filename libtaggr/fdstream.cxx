// file      : libtaggr/fdstream.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libtaggr/fdstream.hxx>

#include <errno.h>  // errno, E*
#include <fcntl.h>  // fcntl(), FD_CLOEXEC
#include <unistd.h> // close(), read(), pipe()

#include <ios>      // ios_base::failure
#include <iterator> // istreambuf_iterator

#include <libtaggr/utility.hxx> // throw_generic_ios_failure()

using namespace std;

namespace taggr
{
  // auto_fd
  //
  void auto_fd::
  close ()
  {
    if (fd_ >= 0)
    {
      bool r (fdclose (fd_));

      // If fdclose() failed then no reason to expect it to succeed the next
      // time.
      //
      fd_ = -1;

      if (!r)
        throw_generic_ios_failure (errno);
    }
  }

  // fdstreambuf
  //
  fdstreambuf::int_type fdstreambuf::
  underflow ()
  {
    int_type r (traits_type::eof ());

    if (is_open () && (gptr () < egptr () || load ()))
      r = traits_type::to_int_type (*gptr ());

    return r;
  }

  bool fdstreambuf::
  load ()
  {
    ptrdiff_t n (fdread (fd_.get (), buf_, sizeof (buf_)));

    if (n == -1)
      throw_generic_ios_failure (errno);

    setg (buf_, buf_, buf_ + n);
    return n != 0;
  }

  // ifdstream
  //
  string ifdstream::
  read_text ()
  {
    string r;

    // Note that the read errors are thrown by the buffer as ios::failure
    // directly, bypassing the stream exception mask.
    //
    if (!eof ())
    {
      r.assign (istreambuf_iterator<char> (*this),
                istreambuf_iterator<char> ());
      setstate (eofbit);
    }

    return r;
  }

  // Utility functions.
  //
  bool
  fdclose (int fd) noexcept
  {
    return ::close (fd) == 0;
  }

  ptrdiff_t
  fdread (int fd, void* buf, size_t n)
  {
    ssize_t r;
    while ((r = ::read (fd, buf, n)) == -1 && errno == EINTR) ;
    return r;
  }

  fdpipe
  fdopen_pipe ()
  {
    int pd[2];
    if (pipe (pd) == -1)
      throw_generic_ios_failure (errno);

    fdpipe r {auto_fd (pd[0]), auto_fd (pd[1])};

    for (size_t i (0); i < 2; ++i)
    {
      int f (fcntl (pd[i], F_GETFD));
      if (f == -1 || fcntl (pd[i], F_SETFD, f | FD_CLOEXEC) == -1)
        throw_generic_ios_failure (errno);
    }

    return r;
  }
}

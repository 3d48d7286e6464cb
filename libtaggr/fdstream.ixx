// file      : libtaggr/fdstream.ixx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <utility> // move()

namespace taggr
{
  // auto_fd
  //
  inline void auto_fd::
  reset (int fd) noexcept
  {
    if (fd_ >= 0)
      fdclose (fd_); // Don't check for an error as not much we can do here.

    fd_ = fd;
  }

  inline auto_fd& auto_fd::
  operator= (auto_fd&& fd) noexcept
  {
    reset (fd.release ());
    return *this;
  }

  inline auto_fd::
  ~auto_fd () noexcept
  {
    reset ();
  }

  // fdstreambuf
  //
  inline fdstreambuf::
  fdstreambuf (auto_fd&& fd)
      : fd_ (std::move (fd))
  {
    setg (buf_, buf_, buf_);
  }

  // ifdstream
  //
  inline ifdstream::
  ifdstream (auto_fd&& fd, iostate e)
      : std::istream (nullptr), buf_ (std::move (fd))
  {
    rdbuf (&buf_);
    exceptions (e);
  }
}

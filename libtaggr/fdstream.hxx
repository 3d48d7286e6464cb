// file      : libtaggr/fdstream.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <string>
#include <istream>
#include <cstddef>  // size_t
#include <cstdint>  // uint64_t
#include <streambuf>

#include <libtaggr/export.hxx>

namespace taggr
{
  // RAII type for file descriptors. Note that failure to close the
  // descriptor is silently ignored by both the destructor and reset().
  //
  // The descriptor can be negative. Such a descriptor is treated as unopened
  // and is not closed.
  //
  struct nullfd_t
  {
    constexpr explicit nullfd_t (int) {}
    constexpr operator int () const {return -1;}
  };

  constexpr nullfd_t nullfd (-1);

  class LIBTAGGR_SYMEXPORT auto_fd
  {
  public:
    auto_fd (nullfd_t = nullfd) noexcept: fd_ (-1) {}

    explicit
    auto_fd (int fd) noexcept: fd_ (fd) {}

    auto_fd (auto_fd&& fd) noexcept: fd_ (fd.release ()) {}
    auto_fd& operator= (auto_fd&&) noexcept;

    auto_fd (const auto_fd&) = delete;
    auto_fd& operator= (const auto_fd&) = delete;

    ~auto_fd () noexcept;

    int
    get () const noexcept {return fd_;}

    void
    reset (int fd = -1) noexcept;

    int
    release () noexcept
    {
      int r (fd_);
      fd_ = -1;
      return r;
    }

    // Close an open file descriptor. Throw ios::failure on the underlying OS
    // error. Reset the descriptor to -1 whether the exception is thrown or
    // not.
    //
    void
    close ();

  private:
    int fd_;
  };

  inline bool
  operator== (const auto_fd& x, nullfd_t)
  {
    return x.get () == -1;
  }

  inline bool
  operator!= (const auto_fd& x, nullfd_t y)
  {
    return !(x == y);
  }

  // Input stream buffer over a file descriptor. Throw ios::failure on the
  // underlying OS read error.
  //
  class LIBTAGGR_SYMEXPORT fdstreambuf: public std::streambuf
  {
  public:
    static const std::size_t buffer_size = 8192;

    fdstreambuf () = default;

    explicit
    fdstreambuf (auto_fd&&);

    void
    close () {fd_.close ();}

    bool
    is_open () const {return fd_.get () >= 0;}

  protected:
    virtual int_type
    underflow () override;

  private:
    bool
    load ();

  private:
    auto_fd fd_;
    char buf_[buffer_size];
  };

  // An istream that reads from a file descriptor it owns, normally the read
  // end of a pipe connected to a child process stdout (see process). Unlike
  // the standard streams, by default it enables exceptions on badbit so
  // that the read errors are not silently ignored. Note that failbit is not
  // included to allow the usual getline() loops.
  //
  class LIBTAGGR_SYMEXPORT ifdstream: public std::istream
  {
  public:
    explicit
    ifdstream (auto_fd&&, iostate e = badbit);

    // Read the rest of the stream into the string.
    //
    std::string
    read_text ();

    void
    close () {buf_.close ();}

    bool
    is_open () const {return buf_.is_open ();}

  private:
    fdstreambuf buf_;
  };

  // Pipe as a pair of the read and write ends.
  //
  struct fdpipe
  {
    auto_fd in;
    auto_fd out;
  };

  // Create a pipe. Throw ios::failure on the underlying OS error. Note that
  // the FD_CLOEXEC flag is set for both ends, so they get automatically
  // closed by the child process to prevent undesired behaviors (such as
  // child deadlock on read from a pipe due to the write-end leakage into the
  // child process). The process class resets it for the end being passed to
  // the child as one of its standard streams.
  //
  LIBTAGGR_SYMEXPORT fdpipe
  fdopen_pipe ();

  // Close the file descriptor. Return true on success, set errno and return
  // false otherwise.
  //
  LIBTAGGR_SYMEXPORT bool
  fdclose (int) noexcept;

  // Read up to n bytes into the buffer, retrying on EINTR. Return the
  // number of bytes read, 0 on eof, and -1 on error (errno is set).
  //
  LIBTAGGR_SYMEXPORT std::ptrdiff_t
  fdread (int, void*, std::size_t);
}

#include <libtaggr/fdstream.ixx>

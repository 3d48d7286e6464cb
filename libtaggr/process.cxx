// file      : libtaggr/process.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libtaggr/process.hxx>

#include <errno.h>
#include <fcntl.h>     // open(), O_*
#include <signal.h>    // SIG*
#include <unistd.h>    // execvp, fork, dup2, write, _exit, *_FILENO
#include <sys/wait.h>  // waitpid

#include <ios>         // ios_base::failure
#include <cassert>
#include <utility>     // move()

using namespace std;

namespace taggr
{
  // Translate the ios::failure thrown by the fdstream functions into
  // process_error.
  //
  [[noreturn]] static void
  throw_process_error (const ios_base::failure& e)
  {
    const system_error* se (dynamic_cast<const system_error*> (&e));
    throw process_error (se != nullptr ? se->code ().value () : EIO);
  }

  static fdpipe
  open_pipe ()
  {
    try
    {
      return fdopen_pipe ();
    }
    catch (const ios_base::failure& e)
    {
      throw_process_error (e);
    }
  }

  static auto_fd
  open_null ()
  {
    int fd (open ("/dev/null", O_RDWR | O_CLOEXEC));

    if (fd == -1)
      throw process_error (errno);

    return auto_fd (fd);
  }

  process::
  process (const char* const* args, int in, int out, int err)
  {
    assert (args != nullptr && args[0] != nullptr);

    fdpipe out_fd;
    fdpipe in_ofd;
    fdpipe in_efd;

    // If we are asked to open null (-2) then open "half-pipe".
    //
    if (in == -1)
      out_fd = open_pipe ();
    else if (in == -2)
      out_fd.in = open_null ();

    if (out == -1)
      in_ofd = open_pipe ();
    else if (out == -2)
      in_ofd.out = open_null ();

    if (err == -1)
      in_efd = open_pipe ();
    else if (err == -2)
      in_efd.out = open_null ();

    // The child reports the exec() failure by writing errno to this pipe.
    // On success the write end is closed by exec() (FD_CLOEXEC) and the
    // parent reads eof.
    //
    fdpipe ep (open_pipe ());

    handle = fork ();

    if (handle == -1)
    {
      handle = 0;
      throw process_error (errno);
    }

    if (handle == 0)
    {
      // Child.
      //
      // NOTE: make sure not to call anything that may acquire a mutex that
      //       could be already acquired in another thread, most notably
      //       malloc().
      //
      auto fail = [&ep] ()
      {
        int e (errno);
        if (write (ep.out.get (), &e, sizeof (e))) {} // Suppress warning.
        _exit (127);
      };

      // Duplicate the user-supplied (fd > -1) or the created pipe descriptor
      // to the standard stream descriptor (read end for STDIN_FILENO, write
      // end otherwise). Close the pipe afterwards.
      //
      auto duplicate = [&fail] (int sd, int fd, fdpipe& pd)
      {
        if (fd == -1 || fd == -2)
          fd = (sd == STDIN_FILENO ? pd.in : pd.out).get ();

        if (dup2 (fd, sd) == -1)
          fail ();

        pd.in.reset ();  // Silently close.
        pd.out.reset (); // Silently close.
      };

      if (in != STDIN_FILENO)
        duplicate (STDIN_FILENO, in, out_fd);

      // If stdout is redirected to stderr (out == 2) we need to duplicate it
      // after duplicating stderr to pickup the proper fd. Otherwise keep the
      // "natual" order of duplicate() calls, so if stderr is redirected to
      // stdout it picks up the proper fd as well.
      //
      if (out == STDERR_FILENO)
      {
        if (err != STDERR_FILENO)
          duplicate (STDERR_FILENO, err, in_efd);

        duplicate (STDOUT_FILENO, out, in_ofd);
      }
      else
      {
        if (out != STDOUT_FILENO)
          duplicate (STDOUT_FILENO, out, in_ofd);

        if (err != STDERR_FILENO)
          duplicate (STDERR_FILENO, err, in_efd);
      }

      execvp (args[0], const_cast<char* const*> (&args[0]));
      fail ();
    }

    // Parent.
    //
    ep.out.reset ();

    // Note that the errno value is written atomically (it is much less than
    // PIPE_BUF), so the partial read is treated as an error as well.
    //
    int e;
    ptrdiff_t n (fdread (ep.in.get (), &e, sizeof (e)));

    if (n != 0)
    {
      if (n == -1)
        e = errno;
      else if (n != sizeof (e))
        e = EIO;

      int es;
      while (waitpid (handle, &es, 0) == -1 && errno == EINTR) ;
      handle = 0;

      throw process_error (e);
    }

    this->out_fd = move (out_fd.out);
    this->in_ofd = move (in_ofd.in);
    this->in_efd = move (in_efd.in);
  }

  process::
  process (process&& p) noexcept
      : handle (p.handle),
        exit (move (p.exit)),
        out_fd (move (p.out_fd)),
        in_ofd (move (p.in_ofd)),
        in_efd (move (p.in_efd))
  {
    p.handle = 0;
  }

  bool process::
  wait (bool ie)
  {
    if (handle != 0)
    {
      // First close any open pipe ends for good measure but ignore any
      // errors.
      //
      out_fd.reset ();
      in_ofd.reset ();
      in_efd.reset ();

      int es;
      int r;
      while ((r = waitpid (handle, &es, 0)) == -1 && errno == EINTR) ;
      handle = 0; // We have tried.

      if (r == -1)
      {
        // If ignore errors then just leave exit nullopt, so it has "no exit
        // information available" semantics.
        //
        if (!ie)
          throw process_error (errno);
      }
      else
        exit = process_exit (es, process_exit::as_status);
    }

    return exit && exit->normal () && exit->code () == 0;
  }

  // process_exit
  //
  process_exit::
  process_exit (code_type c)
      //
      // Note that such an initialization is not portable as POSIX doesn't
      // specify the bits layout for the value returned by waitpid(). However
      // for the major POSIX systems (Linux, FreeBSD, MacOS) it is the
      // following:
      //
      // [0,  7) - terminating signal
      // [7,  8) - coredump flag
      // [8, 16) - program exit code
      //
      : status (c << 8)
  {
  }

  bool process_exit::
  normal () const
  {
    return WIFEXITED (status);
  }

  process_exit::code_type process_exit::
  code () const
  {
    assert (normal ());
    return WEXITSTATUS (status);
  }

  int process_exit::
  signal () const
  {
    assert (!normal ());

    // WEXITSTATUS() and WIFSIGNALED() can both return false for the same
    // status, so we have neither exit code nor signal. We return zero for
    // such a case.
    //
    return WIFSIGNALED (status) ? WTERMSIG (status) : 0;
  }

  bool process_exit::
  core () const
  {
    assert (!normal ());

#ifdef WCOREDUMP
    return WIFSIGNALED (status) && WCOREDUMP (status);
#else
    return false;
#endif
  }

  string process_exit::
  description () const
  {
    assert (!normal ());

    // Note that strsignal() is not thread-safe, so map the signals that we
    // are likely to see ourselves.
    //
    switch (signal ())
    {
    case SIGHUP:    return "hangup (SIGHUP)";
    case SIGINT:    return "interrupt (SIGINT)";
    case SIGQUIT:   return "quit (SIGQUIT)";
    case SIGABRT:   return "aborted (SIGABRT)";
    case SIGKILL:   return "killed (SIGKILL)";
    case SIGSEGV:   return "segmentation fault (SIGSEGV)";
    case SIGPIPE:   return "broken pipe (SIGPIPE)";
    case SIGTERM:   return "terminated (SIGTERM)";
    case 0:         return "status unknown";
    default:        return "unknown signal " + std::to_string (signal ());
    }
  }

  string
  to_string (process_exit pe)
  {
    string r;

    if (pe.normal ())
    {
      r = "exited with code ";
      r += std::to_string (pe.code ());
    }
    else
    {
      r = "terminated abnormally: ";
      r += pe.description ();

      if (pe.core ())
        r += " (core dumped)";
    }

    return r;
  }
}

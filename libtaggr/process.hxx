// file      : libtaggr/process.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <sys/types.h> // pid_t

#include <string>
#include <vector>
#include <cstdint>      // uint8_t
#include <ostream>
#include <optional>
#include <system_error>

#include <libtaggr/fdstream.hxx> // auto_fd

#include <libtaggr/export.hxx>

namespace taggr
{
  struct process_error: std::system_error
  {
    explicit
    process_error (int e): system_error (e, std::generic_category ()) {}
  };

  // Process exit information.
  //
  struct LIBTAGGR_SYMEXPORT process_exit
  {
    // Status type is the raw exit value as returned by waitpid(). Code type
    // is the return value if the process exited normally.
    //
    using status_type = int;
    using code_type = std::uint8_t;

    status_type status;

    process_exit () = default;

    explicit
    process_exit (code_type);

    enum as_status_type {as_status};
    process_exit (status_type s, as_status_type): status (s) {}

    // Return false if the process exited abnormally.
    //
    bool
    normal () const;

    // Note that POSIX only makes the least significant 8 bits of the exit
    // code available from waitpid().
    //
    code_type
    code () const;

    explicit operator bool () const {return normal () && code () == 0;}

    // Abnormal termination information.
    //

    // Return the signal number that caused the termination or 0 if no such
    // information is available.
    //
    int
    signal () const;

    // Return true if the core file was generated.
    //
    bool
    core () const;

    // Return a description of the signal that caused the process to
    // terminate abnormally.
    //
    std::string
    description () const;
  };

  // Canonical exit status description:
  //
  // "terminated abnormally: <...> (core dumped)"
  // "exited with code <...>"
  //
  // So you would normally do:
  //
  // cerr << "process " << args[0] << " " << *pr.exit << endl;
  //
  LIBTAGGR_SYMEXPORT std::string
  to_string (process_exit);

  inline std::ostream&
  operator<< (std::ostream& os, process_exit pe)
  {
    return os << to_string (pe);
  }

  class LIBTAGGR_SYMEXPORT process
  {
  public:
    using handle_type = pid_t;
    using id_type = pid_t;

    // Start another process using the specified command line. The first
    // argument is the program name that is searched for in PATH (unless it
    // contains a directory separator) and the last argument must be NULL.
    //
    // The default values of the in, out and err arguments indicate that the
    // child process should inherit the parent process stdin, stdout, and
    // stderr, respectively. If -1 is passed instead, then the corresponding
    // child process descriptor is connected (via a pipe) to out_fd for stdin,
    // in_ofd for stdout, and in_efd for stderr (see data members below). If
    // -2 is passed, then the corresponding child process descriptor is
    // replaced with the null device descriptor. You can also pass your own
    // descriptors (they are not closed by the parent). For example, to
    // redirect the child process stdout to stderr:
    //
    // process pr (args, 0, 2);
    //
    // Note that the streams created from out_fd/in_ofd/in_efd must be
    // destroyed before the process instance so that all our pipe ends are
    // closed before we wait for the process exit (which happens in the
    // process destructor). For example:
    //
    // process pr (args, 0, -1, 2);
    // ifdstream is (move (pr.in_ofd));
    //
    // Throw process_error if anything goes wrong, including the failure to
    // execute the program (in which case the child's errno is reported).
    //
    process (const char* const* args, int in = 0, int out = 1, int err = 2);

    process (const std::vector<const char*>& args,
             int in = 0, int out = 1, int err = 2)
        : process (args.data (), in, out, err) {}

    // Wait for the process to terminate. Return true if the process
    // terminated normally and with the zero exit code. Unless ignore_error
    // is true, throw process_error if anything goes wrong. This function can
    // be called multiple times with subsequent calls simply returning the
    // status.
    //
    bool
    wait (bool ignore_errors = false);

    id_type
    id () const {return handle;}

    // Moveable-only type.
    //
    process (process&&) noexcept;

    process& operator= (process&&) = delete;
    process (const process&) = delete;
    process& operator= (const process&) = delete;

    ~process () {if (handle != 0) wait (true);}

  public:
    handle_type handle = 0;

    // Absence means that the exit information is not (yet) known. This can
    // be because you haven't called wait() yet or because wait() failed.
    //
    std::optional<process_exit> exit;

    auto_fd out_fd; // Write to it to send to stdin.
    auto_fd in_ofd; // Read from it to receive from stdout.
    auto_fd in_efd; // Read from it to receive from stderr.
  };
}

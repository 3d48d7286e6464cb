// file      : libtaggr/diagnostics.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#pragma once

#include <ostream>
#include <sstream>
#include <exception> // uncaught_exceptions()

#include <libtaggr/export.hxx>

namespace taggr
{
  // Diagnostics destination stream (std::cerr by default). The prompts
  // write here as well, so stdout only carries the result. Note that its
  // modification is not MT-safe.
  //
  LIBTAGGR_SYMEXPORT extern std::ostream* diag_stream;

  struct diag_record;
  struct diag_mark;

  // The writer outputs the complete record text. The epilogue, if set by the
  // mark that started the record, is called instead of the writer and is
  // responsible for writing the record (by calling flush() with the writer)
  // and then doing whatever else it needs, normally throwing.
  //
  using diag_writer = void (const diag_record&);
  using diag_epilogue = void (const diag_record&, diag_writer*);

  // Diagnostics record. The text is accumulated in the string stream and is
  // written as a whole when the record is destroyed, unless it is destroyed
  // during the stack unwinding.
  //
  // The record is normally started with a mark, for example:
  //
  // error << "no git repository at " << d <<
  //   info << "run 'taggr --help' for more information";
  //
  // A mark in the middle of a record starts an indented continuation line.
  //
  struct LIBTAGGR_SYMEXPORT diag_record
  {
    diag_record (): uncaught_ (std::uncaught_exceptions ()) {}

    explicit
    diag_record (const diag_mark& m): diag_record () {*this << m;}

    ~diag_record () noexcept (false);

    template <typename T>
    const diag_record&
    operator<< (const T& x) const
    {
      os << x;
      return *this;
    }

    const diag_record&
    operator<< (const diag_mark&) const;

    bool
    empty () const {return empty_;}

    // Write the record and make it empty. If the record has an epilogue,
    // then call it instead (which can throw).
    //
    void
    flush (diag_writer* = nullptr) const;

    // Move constructible-only type.
    //
    diag_record (diag_record&&);

    diag_record& operator= (diag_record&&) = delete;
    diag_record (const diag_record&) = delete;
    diag_record& operator= (const diag_record&) = delete;

    // The default writer appends the newline and writes the record text to
    // diag_stream under a mutex. If NULL, then the record text is ignored.
    //
    static diag_writer* writer;

  private:
    const int uncaught_;
    mutable bool empty_ = true;
    mutable diag_epilogue* epilogue_ = nullptr;

  public:
    mutable std::ostringstream os;
  };

  // Diagnostics mark. Starts the record with the "<type>: <name>: " prefix,
  // where either part can be absent.
  //
  struct diag_mark
  {
    const char* type;
    const char* name;
    diag_epilogue* epilogue;

    explicit
    diag_mark (const char* t,
               const char* n = nullptr,
               diag_epilogue* e = nullptr)
        : type (t), name (n), epilogue (e) {}

    template <typename T>
    diag_record
    operator<< (const T& x) const
    {
      diag_record r (*this);
      r << x;
      return r;
    }
  };
}

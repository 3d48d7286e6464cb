// file      : libtaggr/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libtaggr/diagnostics.hxx>

#include <mutex>
#include <iostream> // cerr

using namespace std;

namespace taggr
{
  ostream* diag_stream = &cerr;

  static mutex diag_mutex;

  static void
  default_writer (const diag_record& r)
  {
    string s (r.os.str ());
    s += '\n';

    lock_guard<mutex> l (diag_mutex);
    *diag_stream << s;
    diag_stream->flush ();
  }

  diag_writer* diag_record::writer = &default_writer;

  const diag_record& diag_record::
  operator<< (const diag_mark& m) const
  {
    if (empty_)
    {
      empty_ = false;
      epilogue_ = m.epilogue;
    }
    else
      os << "\n  ";

    if (m.type != nullptr)
      os << m.type << ": ";

    if (m.name != nullptr)
      os << m.name << ": ";

    return *this;
  }

  void diag_record::
  flush (diag_writer* w) const
  {
    if (empty_)
      return;

    if (diag_epilogue* e = epilogue_)
    {
      // Reset the epilogue first since it calls us back to write the text.
      //
      epilogue_ = nullptr;
      e (*this, w);
    }

    // Still not empty if there is no epilogue or it has returned without
    // flushing.
    //
    if (!empty_)
    {
      if (w != nullptr || (w = writer) != nullptr)
        w (*this);

      empty_ = true;
    }
  }

  diag_record::
  ~diag_record () noexcept (false)
  {
    if (uncaught_ == uncaught_exceptions ())
      flush ();
  }

  // Note that we don't move the string stream since an older libstdc++
  // doesn't support it. Append the text instead to keep the put position at
  // its end.
  //
  diag_record::
  diag_record (diag_record&& r)
      : uncaught_ (r.uncaught_),
        empty_ (r.empty_),
        epilogue_ (r.epilogue_)
  {
    if (!empty_)
    {
      os << r.os.str ();

      r.empty_ = true;
      r.epilogue_ = nullptr;
    }
  }
}

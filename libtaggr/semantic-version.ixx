// file      : libtaggr/semantic-version.ixx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace taggr
{
  inline semantic_version::
  semantic_version (std::uint64_t mj,
                    std::uint64_t mi,
                    std::uint64_t p,
                    std::vector<std::string> pr,
                    std::vector<std::string> b)
      : major (mj),
        minor (mi),
        patch (p),
        pre_release (std::move (pr)),
        build (std::move (b))
  {
  }

  inline semantic_version::
  semantic_version (const std::string& s, flags fs)
      : semantic_version (s, 0, fs)
  {
  }

  struct semantic_version_result
  {
    std::optional<semantic_version> version;
    std::string failure_reason;
  };

  LIBTAGGR_SYMEXPORT semantic_version_result
  parse_semantic_version_impl (const std::string&,
                               std::size_t,
                               semantic_version::flags);

  inline std::optional<semantic_version>
  parse_semantic_version (const std::string& s, semantic_version::flags fs)
  {
    return parse_semantic_version_impl (s, 0, fs).version;
  }

  inline std::optional<semantic_version>
  parse_semantic_version (const std::string& s,
                          std::size_t p,
                          semantic_version::flags fs)
  {
    return parse_semantic_version_impl (s, p, fs).version;
  }

  inline semantic_version::flags
  operator&= (semantic_version::flags& x, semantic_version::flags y)
  {
    return x = static_cast<semantic_version::flags> (
      static_cast<std::uint16_t> (x) &
      static_cast<std::uint16_t> (y));
  }

  inline semantic_version::flags
  operator|= (semantic_version::flags& x, semantic_version::flags y)
  {
    return x = static_cast<semantic_version::flags> (
      static_cast<std::uint16_t> (x) |
      static_cast<std::uint16_t> (y));
  }

  inline semantic_version::flags
  operator& (semantic_version::flags x, semantic_version::flags y)
  {
    return x &= y;
  }

  inline semantic_version::flags
  operator| (semantic_version::flags x, semantic_version::flags y)
  {
    return x |= y;
  }
}

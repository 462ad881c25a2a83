#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace protonexec
{
  // Proton release version as it appears in installation directory names.
  //
  // Format: <major>.<minor>[.<patch>][-<revision>]
  //
  // Examples:
  //   9.0      - Proton 9.0
  //   7.0.6    - three-component releases from older branches
  //   8.0-5    - hotfix revision (only ever seen in version overrides, Steam
  //              keeps the directory name at "Proton 8.0")
  //
  // Missing components compare as zero, so 9.0 == 9.0.0 == 9.0.0-0.
  //
  struct proton_version
  {
    std::uint32_t major = 0;
    std::uint32_t minor = 0;
    std::uint32_t patch = 0;
    std::uint32_t revision = 0;

    // Whether the patch component was spelled out. Only affects string(), so
    // that we print back what we were given.
    //
    bool has_patch = false;

    proton_version () = default;

    proton_version (std::uint32_t mj,
                    std::uint32_t mi,
                    std::uint32_t pa = 0,
                    std::uint32_t rv = 0)
      : major (mj),
        minor (mi),
        patch (pa),
        revision (rv),
        has_patch (pa != 0)
    {
    }

    // Compare versions. Returns negative if this < other, positive if this >
    // other, zero if equal.
    //
    int
    compare (const proton_version& v) const noexcept;

    // String representation (e.g., "8.0-5").
    //
    std::string
    string () const;
  };

  inline bool
  operator< (const proton_version& x, const proton_version& y)
  {
    return x.compare (y) < 0;
  }

  inline bool
  operator> (const proton_version& x, const proton_version& y)
  {
    return x.compare (y) > 0;
  }

  inline bool
  operator== (const proton_version& x, const proton_version& y)
  {
    return x.compare (y) == 0;
  }

  inline bool
  operator!= (const proton_version& x, const proton_version& y)
  {
    return !(x == y);
  }

  inline bool
  operator<= (const proton_version& x, const proton_version& y)
  {
    return x.compare (y) <= 0;
  }

  inline bool
  operator>= (const proton_version& x, const proton_version& y)
  {
    return x.compare (y) >= 0;
  }

  inline std::ostream&
  operator<< (std::ostream& os, const proton_version& v)
  {
    return os << v.string ();
  }

  // Parse a version token. The whole string must be consumed. Returns nullopt
  // if parsing fails.
  //
  // If revision is false, the -<revision> suffix is rejected. That is what
  // directory classification wants: "Proton 8.0-5" is not a name Steam ever
  // installs, so we don't want to treat it as stable.
  //
  std::optional<proton_version>
  parse_proton_version (const std::string& s, bool revision = true);
}

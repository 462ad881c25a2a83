#include <protonexec/proton/proton-version.hxx>

#include <cctype>
#include <limits>
#include <sstream>

using namespace std;

namespace protonexec
{
  // Parse a decimal component. Return nullopt if we are at the end, looking
  // at garbage, or the value doesn't fit.
  //
  static optional<uint32_t>
  parse_u32 (const string& s, size_t& p)
  {
    if (p >= s.size () || !isdigit (static_cast<unsigned char> (s[p])))
      return nullopt;

    uint64_t r (0);
    while (p < s.size () && isdigit (static_cast<unsigned char> (s[p])))
    {
      r = r * 10 + (s[p] - '0');

      if (r > numeric_limits<uint32_t>::max ())
        return nullopt;

      ++p;
    }
    return static_cast<uint32_t> (r);
  }

  // Check if the current char matches c and advance if it does.
  //
  static bool
  parse_c (const string& s, size_t& p, char c)
  {
    if (p < s.size () && s[p] == c)
    {
      ++p;
      return true;
    }
    return false;
  }

  int proton_version::
  compare (const proton_version& v) const noexcept
  {
    if (major != v.major)       return major < v.major ? -1 : 1;
    if (minor != v.minor)       return minor < v.minor ? -1 : 1;
    if (patch != v.patch)       return patch < v.patch ? -1 : 1;
    if (revision != v.revision) return revision < v.revision ? -1 : 1;

    return 0;
  }

  string proton_version::
  string () const
  {
    ostringstream o;
    o << major << '.' << minor;

    if (has_patch || patch != 0)
      o << '.' << patch;

    if (revision != 0)
      o << '-' << revision;

    return o.str ();
  }

  optional<proton_version>
  parse_proton_version (const std::string& s, bool rev)
  {
    size_t p (0);

    // At least X.Y is required. Valve never ships a bare major.
    //
    auto mj (parse_u32 (s, p));
    if (!mj || !parse_c (s, p, '.')) return nullopt;

    auto mi (parse_u32 (s, p));
    if (!mi) return nullopt;

    proton_version v (*mj, *mi);

    if (parse_c (s, p, '.'))
    {
      auto pa (parse_u32 (s, p));
      if (!pa) return nullopt;

      v.patch = *pa;
      v.has_patch = true;
    }

    if (rev && parse_c (s, p, '-'))
    {
      auto rv (parse_u32 (s, p));
      if (!rv) return nullopt;

      v.revision = *rv;
    }

    // Trailing garbage ("9.0 (Beta)", "9.0b") means this is not a version we
    // are prepared to order.
    //
    if (p != s.size ())
      return nullopt;

    return v;
  }
}

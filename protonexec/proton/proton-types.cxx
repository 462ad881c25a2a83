#include <protonexec/proton/proton-types.hxx>

using namespace std;

namespace protonexec
{
  string
  to_string (proton_channel c)
  {
    switch (c)
    {
      case proton_channel::stable:       return "stable";
      case proton_channel::experimental: return "experimental";
    }

    return "unknown";
  }

  string
  to_string (resolve_errc c)
  {
    switch (c)
    {
      case resolve_errc::not_found:      return "not-found";
      case resolve_errc::not_executable: return "not-executable";
    }

    return "unknown";
  }
}

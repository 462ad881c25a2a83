#pragma once

#include <protonexec/proton/proton-version.hxx>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace protonexec
{
  namespace fs = std::filesystem;

  // Proton release channel, derived from the installation directory name.
  //
  enum class proton_channel
  {
    stable,       // "Proton 9.0", "Proton 7.0.6"
    experimental  // "Proton - Experimental", "Proton Experimental"
  };

  std::string
  to_string (proton_channel);

  // Candidate Proton installation.
  //
  struct proton_candidate
  {
    fs::path path;                          // Installation directory
    std::string name;                       // Directory name
    proton_channel channel;                 // Stable or experimental
    std::optional<proton_version> version;  // Set for stable entries only

    proton_candidate ()
      : channel (proton_channel::stable) {}

    proton_candidate (fs::path p, std::string n, proton_channel c)
      : path (std::move (p)), name (std::move (n)), channel (c) {}

    bool
    experimental () const noexcept
    {
      return channel == proton_channel::experimental;
    }
  };

  // Outcome of resolution: the chosen installation (if resolution went
  // through one) and the binary to hand off to.
  //
  struct proton_resolution
  {
    std::optional<proton_candidate> candidate;
    fs::path binary;
  };

  // Resolution failure categories.
  //
  enum class resolve_errc
  {
    not_found,      // No candidate installation matched.
    not_executable  // Resolved binary is missing or not executable.
  };

  std::string
  to_string (resolve_errc);

  class resolve_error: public std::runtime_error
  {
  public:
    resolve_error (resolve_errc c, const std::string& what)
      : std::runtime_error (what), code_ (c) {}

    resolve_errc
    code () const noexcept
    {
      return code_;
    }

  private:
    resolve_errc code_;
  };
}

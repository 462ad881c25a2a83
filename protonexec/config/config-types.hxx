#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace protonexec
{
  namespace fs = std::filesystem;

  // Snapshot of the process environment. We read it once at startup and pass
  // it around explicitly instead of calling getenv() all over the place.
  //
  using environment_map = std::map<std::string, std::string>;

  // Setting names. These are both the environment variables and the keys
  // accepted in the config file.
  //
  namespace config_keys
  {
    constexpr const char* config       = "PROTONEXEC_CONFIG";
    constexpr const char* config_home  = "PROTONEXEC_CONFIG_HOME";
    constexpr const char* data_home    = "PROTONEXEC_DATA_HOME";
    constexpr const char* debug        = "PROTONEXEC_DEBUG";
    constexpr const char* steam_root   = "PROTONEXEC_STEAM_ROOT";
    constexpr const char* search_path  = "PROTONEXEC_SEARCH_PATH";
    constexpr const char* version      = "PROTONEXEC_VERSION";
    constexpr const char* binary       = "PROTONEXEC_BINARY";
    constexpr const char* binary_name  = "PROTONEXEC_BINARY_NAME";
    constexpr const char* experimental = "PROTONEXEC_EXPERIMENTAL";
    constexpr const char* prefix       = "PROTONEXEC_PREFIX";
    constexpr const char* verb         = "PROTONEXEC_VERB";
  }

  // Launch configuration.
  //
  // Precedence is command line > environment > config file > default. The
  // first three are merged by load_config() and main(); defaults live here.
  //
  struct launch_config
  {
    fs::path config_file;                   // Config file we read (or would have)
    fs::path config_home;                   // Per-user config directory
    fs::path data_home;                     // Per-user data directory (prefixes)
    bool debug = false;                     // Verbose diagnostics
    fs::path steam_root;                    // Install root (empty = detect)
    std::optional<std::string> search_path; // Colon-separated candidate list
    std::optional<std::string> version;     // Version override
    std::optional<fs::path> binary;         // Binary path override
    std::string binary_name = "proton";     // Binary inside an installation
    bool experimental = false;              // Include experimental versions
    std::optional<std::string> prefix;      // Fixed application prefix name
    std::string verb = "run";               // Proton verb

    // Environment the launched binary inherits.
    //
    environment_map environment;
  };

  // Malformed configuration (bad config file line, bad boolean, etc).
  //
  class config_error: public std::runtime_error
  {
  public:
    explicit
    config_error (const std::string& what)
      : std::runtime_error (what), line_ (0) {}

    config_error (const fs::path& f, std::size_t l, const std::string& what)
      : std::runtime_error (f.string () + ':' + std::to_string (l) + ": " +
                            what),
        file_ (f),
        line_ (l) {}

    const fs::path&
    file () const noexcept
    {
      return file_;
    }

    std::size_t
    line () const noexcept
    {
      return line_;
    }

  private:
    fs::path file_;
    std::size_t line_;
  };
}

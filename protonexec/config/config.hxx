#pragma once

#include <protonexec/config/config-types.hxx>

#include <istream>
#include <map>
#include <optional>
#include <string>

namespace protonexec
{
  // Parsed config file: key -> value, later lines win.
  //
  using config_entries = std::map<std::string, std::string>;

  // Capture the current process environment.
  //
  environment_map
  current_environment ();

  // Look up a non-empty environment variable. An empty value counts as unset,
  // the same way ${VAR:-default} treats it in the shell.
  //
  std::optional<std::string>
  lookup_env (const environment_map& env, const std::string& name);

  // Parse a boolean setting: 1/0, true/false, yes/no, on/off (any case).
  //
  std::optional<bool>
  parse_bool (const std::string& v);

  // Parse the restricted KEY=value config format.
  //
  // The file is only ever read as data. Blank lines and lines starting with
  // '#' are ignored, a leading "export " is tolerated so that an existing
  // shell-style file keeps working, and one level of matching quotes is
  // stripped from the value. Anything else without a '=' is an error. The
  // name is only used in diagnostics.
  //
  config_entries
  parse_config (std::istream& is, const fs::path& name);

  config_entries
  parse_config_file (const fs::path& file);

  // Assemble the configuration from the environment and the config file.
  //
  // If file is specified it must exist. Otherwise the file named by
  // PROTONEXEC_CONFIG must exist, while the default one is optional.
  //
  launch_config
  load_config (const environment_map& env,
               const std::optional<fs::path>& file = std::nullopt);
}

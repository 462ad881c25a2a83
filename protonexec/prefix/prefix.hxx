#pragma once

#include <protonexec/config/config-types.hxx>

#include <cstddef>
#include <random>
#include <string>

namespace protonexec
{
  // Application prefixes.
  //
  // Every launch gets a private working directory that Proton turns into a
  // Wine prefix (STEAM_COMPAT_DATA_PATH). They live under
  // <data_home>/prefixes and are either named by the user or random.
  //

  // Maximum number of random names we try before giving up.
  //
  constexpr std::size_t prefix_attempts = 64;

  // Directory holding all the prefixes.
  //
  fs::path
  prefix_root (const launch_config& c);

  // Generate a random prefix name (pfx-XXXXXXXX, lowercase alphanumerics).
  //
  std::string
  generate_prefix_name (std::mt19937& g);

  // Create the prefix directory under root (creating root as necessary).
  //
  // If name is not empty, the prefix is <root>/<name>, reused if it already
  // exists. The name must be a single path component. Otherwise, random
  // names are tried until one is created that did not exist before.
  //
  // Throws std::invalid_argument for a bad name and std::system_error on
  // filesystem errors or if no unused name could be found.
  //
  fs::path
  create_prefix (const fs::path& root, const std::string& name = {});

  fs::path
  create_prefix (const fs::path& root, const std::string& name, std::mt19937& g);
}

#pragma once

#include <protonexec/config/config-types.hxx>

#include <filesystem>
#include <string>
#include <vector>

namespace protonexec
{
  namespace fs = std::filesystem;

  // Proton environment configuration.
  //
  struct proton_environment
  {
    fs::path steam_root;       // STEAM_COMPAT_CLIENT_INSTALL_PATH
    fs::path compatdata_path;  // STEAM_COMPAT_DATA_PATH
    bool enable_logging;       // Enable Proton logging
    fs::path log_dir;          // Log directory (if logging enabled)

    proton_environment ()
      : enable_logging (false) {}

    // Overlay our variables on top of the inherited environment.
    //
    environment_map
    build_env_map (const environment_map& base) const;
  };

  // Complete description of the process we turn into.
  //
  struct proton_invocation
  {
    fs::path binary;
    std::vector<std::string> arguments;  // Not including argv[0]
    environment_map environment;
  };

  // Assemble `<binary> <verb> <target> <args...>`. The target and its
  // arguments are passed through untouched.
  //
  proton_invocation
  build_invocation (const fs::path& binary,
                    const std::string& verb,
                    const fs::path& target,
                    const std::vector<std::string>& args,
                    environment_map env);

  // Replace the current process image with the invocation.
  //
  // There is no coming back from this: on success the process we were is
  // gone. If execve() itself fails we throw std::system_error.
  //
  [[noreturn]] void
  replace_process (const proton_invocation& i);
}

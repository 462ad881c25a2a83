#pragma once

#include <filesystem>
#include <utility>

namespace protonexec
{
  namespace fs = std::filesystem;

  // Steam library folder. Only its location matters to us: that's where
  // Steam installs Proton along with the games.
  //
  struct steam_library
  {
    fs::path path; // Absolute path to library folder

    steam_library () = default;

    explicit
    steam_library (fs::path p)
        : path (std::move (p)) {}

    // Directory holding installed tools and games (and thus Proton).
    //
    fs::path
    common () const
    {
      return path / "steamapps" / "common";
    }
  };

  // Steam configuration paths.
  //
  struct steam_config_paths
  {
    fs::path steam_root;         // Main Steam installation directory
    fs::path libraryfolders_vdf; // libraryfolders.vdf location
    fs::path steamapps;          // steamapps directory

    steam_config_paths () = default;
  };
}

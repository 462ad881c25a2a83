#pragma once

#include <protonexec/config/config-types.hxx>
#include <protonexec/steam/steam-types.hxx>
#include <protonexec/steam/steam-parser.hxx>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <optional>
#include <vector>

namespace protonexec
{
  namespace asio = boost::asio;

  class steam_library_manager
  {
  public:
    // The environment is used to find the home and XDG directories.
    //
    steam_library_manager (asio::io_context& ioc, const environment_map& env);

    steam_library_manager (const steam_library_manager&) = delete;
    steam_library_manager& operator= (const steam_library_manager&) = delete;

    // Use the specified Steam root instead of detecting one.
    //
    void
    set_steam_path (fs::path p);

    // Detect Steam installation path.
    //
    // Returns the main Steam installation directory, or std::nullopt if
    // Steam is not installed or cannot be found.
    //
    asio::awaitable<std::optional<fs::path>>
    detect_steam_path ();

    // Get Steam configuration paths.
    //
    // Detects the Steam path first unless it is already known. All members
    // are empty if Steam cannot be found.
    //
    asio::awaitable<steam_config_paths>
    get_config_paths ();

    // Load all Steam library folders.
    //
    // Reads and parses the libraryfolders.vdf file to get all configured
    // Steam library locations.
    //
    asio::awaitable<std::vector<steam_library>>
    load_libraries ();

    // Directories to scan for Proton installations.
    //
    // This is steamapps/common of the Steam root followed by that of every
    // other library, in libraryfolders.vdf order, with duplicates removed.
    // A broken libraryfolders.vdf is reported as a warning and we fall back
    // to the root library alone.
    //
    asio::awaitable<std::vector<fs::path>>
    search_roots ();

    // Validate that a path is a valid Steam library.
    //
    // Checks if the specified path contains the expected Steam library
    // structure (steamapps directory).
    //
    static bool
    validate_library_path (const fs::path& path);

  private:
    // Candidate Steam roots in the order we try them.
    //
    std::vector<fs::path>
    candidate_paths () const;

    asio::io_context& ioc_;
    const environment_map& env_;

    std::optional<fs::path> steam_path_;

    std::vector<steam_library> libraries_;
    bool libraries_loaded_;
  };
}

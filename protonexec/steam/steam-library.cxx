#include <protonexec/steam/steam-library.hxx>

#include <protonexec/config/config.hxx>

#include <algorithm>
#include <iostream>
#include <system_error>

using namespace std;

namespace protonexec
{
  steam_library_manager::
  steam_library_manager (asio::io_context& ioc, const environment_map& env)
    : ioc_ (ioc),
      env_ (env),
      libraries_loaded_ (false)
  {
  }

  void steam_library_manager::
  set_steam_path (fs::path p)
  {
    steam_path_ = move (p);
    libraries_.clear ();
    libraries_loaded_ = false;
  }

  // Steam is typically installed in the user's home directory, either under
  // .steam or .local. However, we also need to check the Flatpak sandbox data
  // directory and the system-wide locations used by distribution packages.
  //
  vector<fs::path> steam_library_manager::
  candidate_paths () const
  {
    vector<fs::path> r;

    if (auto h = lookup_env (env_, "HOME"))
    {
      fs::path hp (*h);

      r.push_back (hp / ".steam" / "steam");
      r.push_back (hp / ".local" / "share" / "Steam");
      r.push_back (
        hp / ".var" / "app" / "com.valvesoftware.Steam" / "data" / "Steam");
    }

    if (auto x = lookup_env (env_, "XDG_DATA_HOME"))
      r.push_back (fs::path (*x) / "Steam");

    r.push_back ("/usr/share/steam");
    r.push_back ("/usr/local/share/steam");

    return r;
  }

  asio::awaitable<optional<fs::path>> steam_library_manager::
  detect_steam_path ()
  {
    if (steam_path_)
      co_return steam_path_;

    for (const auto& p : candidate_paths ())
    {
      // We are looking for a directory that looks like a Steam root. The
      // presence of the 'steamapps' subdirectory is a good indicator.
      //
      if (validate_library_path (p))
      {
        steam_path_ = p;
        co_return p;
      }
    }

    co_return nullopt;
  }

  asio::awaitable<steam_config_paths> steam_library_manager::
  get_config_paths ()
  {
    if (!steam_path_)
      co_await detect_steam_path ();

    steam_config_paths paths;

    if (steam_path_)
    {
      paths.steam_root = *steam_path_;
      paths.steamapps = *steam_path_ / "steamapps";
      paths.libraryfolders_vdf = paths.steamapps / "libraryfolders.vdf";
    }

    co_return paths;
  }

  asio::awaitable<vector<steam_library>> steam_library_manager::
  load_libraries ()
  {
    if (libraries_loaded_)
      co_return libraries_;

    auto paths (co_await get_config_paths ());

    error_code ec;
    if (paths.libraryfolders_vdf.empty () ||
        !fs::exists (paths.libraryfolders_vdf, ec))
      co_return vector<steam_library> ();

    libraries_ = co_await parse_library_folders (ioc_,
                                                 paths.libraryfolders_vdf);
    libraries_loaded_ = true;

    co_return libraries_;
  }

  asio::awaitable<vector<fs::path>> steam_library_manager::
  search_roots ()
  {
    vector<fs::path> r;

    auto root (co_await detect_steam_path ());

    if (!root)
      co_return r;

    auto add ([&r] (const fs::path& p)
    {
      fs::path n (p.lexically_normal ());

      if (find (r.begin (), r.end (), n) == r.end ())
        r.push_back (move (n));
    });

    add (steam_library (*root).common ());

    vector<steam_library> libs;

    try
    {
      libs = co_await load_libraries ();
    }
    catch (const exception& e)
    {
      // The root library is still usable, so carry on without the rest.
      //
      cerr << "warning: unable to read Steam library folders: " << e.what ()
           << endl;
    }

    // The root library usually lists itself as entry "0", but through the
    // ~/.steam/steam symlink rather than the real path. Compare canonical
    // paths where we can so we don't scan the same directory twice.
    //
    auto canonical ([] (const fs::path& p)
    {
      error_code ec;
      fs::path c (fs::weakly_canonical (p, ec));
      return ec ? p.lexically_normal () : c;
    });

    vector<fs::path> seen {canonical (r.front ())};

    for (const auto& l : libs)
    {
      fs::path c (l.common ());
      fs::path cc (canonical (c));

      if (find (seen.begin (), seen.end (), cc) != seen.end ())
        continue;

      seen.push_back (cc);
      add (c);
    }

    co_return r;
  }

  bool steam_library_manager::
  validate_library_path (const fs::path& p)
  {
    error_code ec;

    if (!fs::is_directory (p, ec))
      return false;

    // A valid Steam library must contain a 'steamapps' subdirectory.
    //
    return fs::is_directory (p / "steamapps", ec);
  }
}

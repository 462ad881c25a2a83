#include <protonexec/protonexec-launch.hxx>

#include <protonexec/config/config.hxx>
#include <protonexec/prefix/prefix.hxx>

#include <iostream>

using namespace std;

namespace protonexec
{
  exit_status
  to_exit_status (resolve_errc c)
  {
    switch (c)
    {
      case resolve_errc::not_found:      return exit_status::not_found;
      case resolve_errc::not_executable: return exit_status::not_executable;
    }

    return exit_status::failure;
  }

  launch_coordinator::
  launch_coordinator (asio::io_context& ioc, const launch_config& c)
    : launch_coordinator (ioc, c, &replace_process)
  {
  }

  launch_coordinator::
  launch_coordinator (asio::io_context& ioc,
                      const launch_config& c,
                      exec_function x)
    : config_ (c),
      exec_ (move (x)),
      steam_ (ioc, c.environment),
      verbose_ (c.debug)
  {
    if (!config_.steam_root.empty ())
      steam_.set_steam_path (config_.steam_root);
  }

  asio::awaitable<fs::path> launch_coordinator::
  steam_root ()
  {
    auto p (co_await steam_.detect_steam_path ());
    co_return p ? *p : fs::path ();
  }

  asio::awaitable<vector<fs::path>> launch_coordinator::
  search_roots (bool required)
  {
    // Neither an explicit binary nor an explicit search path needs us to
    // know where Steam keeps its libraries.
    //
    if (config_.binary || config_.search_path)
      co_return vector<fs::path> ();

    auto r (co_await steam_.search_roots ());

    if (r.empty () && required)
      throw resolve_error (resolve_errc::not_found,
                           "Steam installation not found (set " +
                           string (config_keys::steam_root) + ")");

    if (verbose_)
    {
      for (const auto& p : r)
        cout << "search root: " << p.string () << "\n";
    }

    co_return r;
  }

  asio::awaitable<vector<proton_candidate>> launch_coordinator::
  detect_versions ()
  {
    resolver_type r (config_, co_await search_roots (false));
    co_return r.candidates ();
  }

  asio::awaitable<proton_resolution> launch_coordinator::
  resolve ()
  {
    resolver_type r (config_, co_await search_roots (true));

    if (verbose_ && !config_.binary && !config_.version)
    {
      auto cs (r.candidates ());

      for (const auto& c : cs)
        cout << "candidate: " << c.name << " (" << to_string (c.channel)
             << ", " << c.path.string () << ")" << "\n";
    }

    co_return r.resolve ();
  }

  fs::path launch_coordinator::
  prepare_prefix ()
  {
    if (auto v = lookup_env (config_.environment, "STEAM_COMPAT_DATA_PATH"))
    {
      if (verbose_)
        cout << "using inherited STEAM_COMPAT_DATA_PATH" << "\n";

      return fs::path (*v);
    }

    return create_prefix (prefix_root (config_), config_.prefix.value_or (""));
  }

  asio::awaitable<exit_status> launch_coordinator::
  complete_launch (const vector<string>& as)
  {
    // Check the cheap things first: there is no point in hunting for Proton
    // if we have nothing to run with it.
    //
    if (as.empty ())
    {
      cerr << "error: no target program specified" << endl;
      co_return exit_status::no_target;
    }

    fs::path target (as.front ());
    vector<string> args (as.begin () + 1, as.end ());

    proton_resolution r;

    try
    {
      r = co_await resolve ();
    }
    catch (const resolve_error& e)
    {
      cerr << "error: " << e.what () << endl;
      co_return to_exit_status (e.code ());
    }

    if (r.candidate)
      cout << "protonexec: using " << r.candidate->name << " ("
           << r.binary.string () << ")" << endl;
    else
      cout << "protonexec: using " << r.binary.string () << endl;

    fs::path pfx (prepare_prefix ());
    cout << "protonexec: prefix " << pfx.string () << endl;

    environment_type env;
    env.steam_root = co_await steam_root ();
    env.compatdata_path = pfx;
    env.enable_logging = config_.debug;
    env.log_dir = pfx;

    if (env.steam_root.empty ())
      cerr << "warning: Steam installation not found, "
           << "STEAM_COMPAT_CLIENT_INSTALL_PATH left as is" << endl;

    invocation_type i (
      build_invocation (r.binary,
                        config_.verb,
                        target,
                        args,
                        env.build_env_map (config_.environment)));

    if (verbose_)
    {
      cout << "executing: " << i.binary.string ();
      for (const auto& a : i.arguments) cout << " " << a;
      cout << "\n";
    }

    exec_ (i);

    co_return exit_status::success;
  }
}

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <protonexec/config/config.hxx>
#include <protonexec/protonexec-launch.hxx>
#include <protonexec/protonexec-options.hxx>
#include <protonexec/proton/proton-resolver.hxx>

#include <protonexec/version.hxx>

using namespace std;

namespace protonexec
{
  // Apply the command line on top of the environment and config file.
  //
  static void
  apply_options (const options& o, launch_config& c)
  {
    if (o.verbose ())
      c.debug = true;

    if (o.experimental ())
      c.experimental = true;

    if (o.steam_root_specified ())
      c.steam_root = o.steam_root ();

    if (o.proton_specified ())
      c.version = o.proton ();

    if (o.prefix_specified ())
      c.prefix = o.prefix ();

    if (o.verb_specified ())
      c.verb = o.verb ();
  }

  // Run a coroutine to completion on the context, rethrowing whatever it
  // throws.
  //
  template <typename T>
  static T
  run (asio::io_context& ioc, asio::awaitable<T> a)
  {
    optional<T> r;
    exception_ptr ex;

    asio::co_spawn (
      ioc,
      move (a),
      [&r, &ex] (exception_ptr e, T v)
      {
        if (e)
          ex = e;
        else
          r = move (v);
      });

    ioc.restart ();
    ioc.run ();

    if (ex)
      rethrow_exception (ex);

    return move (*r);
  }
}

int
main (int argc, char* argv[])
{
  using namespace protonexec;

  try
  {
    // Options stop at the first argument (or after --): that is the target
    // and everything after it belongs to the target.
    //
    int end (0);
    options opt (argc, argv, end);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "protonexec " << PROTONEXEC_VERSION_ID << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: protonexec [options] [--] <target> [args...]" << "\n"
        << "options:"                                           << "\n";

      opt.print_usage (o);

      return 0;
    }

    vector<string> args (argv + end, argv + argc);

    // Having nothing to run trumps whatever else may be wrong, like a broken
    // config file.
    //
    if (args.empty () && !opt.list ())
    {
      cerr << "error: no target program specified" << endl;
      return static_cast<int> (exit_status::no_target);
    }

    launch_config cfg (
      load_config (current_environment (),
                   opt.config_specified ()
                   ? optional<fs::path> (opt.config ())
                   : nullopt));

    apply_options (opt, cfg);

    asio::io_context ioc;
    launch_coordinator lc (ioc, cfg);

    // Handle --list.
    //
    if (opt.list ())
    {
      auto cs (run (ioc, lc.detect_versions ()));

      if (cs.empty ())
      {
        cerr << "error: no Proton installation found" << endl;
        return static_cast<int> (exit_status::not_found);
      }

      cout << join_path_list (cs, "\n") << endl;
      return 0;
    }

    // On success this doesn't come back.
    //
    return static_cast<int> (run (ioc, lc.complete_launch (args)));
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return static_cast<int> (exit_status::failure);
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return static_cast<int> (exit_status::failure);
  }
}

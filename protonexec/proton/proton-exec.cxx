#include <protonexec/proton/proton-exec.hxx>

#include <cerrno>
#include <iostream>
#include <system_error>

#include <unistd.h>

using namespace std;

namespace protonexec
{
  environment_map proton_environment::
  build_env_map (const environment_map& base) const
  {
    environment_map env (base);

    // These are the magic environment variables Proton needs to know where
    // to put its fake Windows C: drive and where to look for Steam libraries.
    //
    // If we don't know one of them, leave whatever the caller had in place.
    //
    if (!compatdata_path.empty ())
      env["STEAM_COMPAT_DATA_PATH"] = compatdata_path.string ();

    if (!steam_root.empty ())
      env["STEAM_COMPAT_CLIENT_INSTALL_PATH"] = steam_root.string ();

    if (enable_logging)
    {
      env["PROTON_LOG"] = "1";
      env["PROTON_LOG_DIR"] = log_dir.string ();
    }

    return env;
  }

  proton_invocation
  build_invocation (const fs::path& b,
                    const string& verb,
                    const fs::path& t,
                    const vector<string>& as,
                    environment_map env)
  {
    proton_invocation r;
    r.binary = b;
    r.environment = move (env);

    r.arguments.reserve (as.size () + 2);
    r.arguments.push_back (verb);
    r.arguments.push_back (t.string ());

    for (const auto& a : as)
      r.arguments.push_back (a);

    return r;
  }

  void
  replace_process (const proton_invocation& i)
  {
    // execve() wants mutable, NULL-terminated arrays. The strings only need
    // to outlive the call, which on success is forever.
    //
    string b (i.binary.string ());

    vector<char*> argv;
    argv.reserve (i.arguments.size () + 2);
    argv.push_back (const_cast<char*> (b.c_str ()));

    for (const auto& a : i.arguments)
      argv.push_back (const_cast<char*> (a.c_str ()));

    argv.push_back (nullptr);

    vector<string> ev;
    ev.reserve (i.environment.size ());

    for (const auto& [k, v] : i.environment)
      ev.push_back (k + '=' + v);

    vector<char*> envp;
    envp.reserve (ev.size () + 1);

    for (auto& e : ev)
      envp.push_back (e.data ());

    envp.push_back (nullptr);

    // Whatever we logged must make it out before the buffers vanish.
    //
    cout.flush ();
    cerr.flush ();

    ::execve (b.c_str (), argv.data (), envp.data ());

    throw system_error (errno, generic_category (),
                        "unable to execute " + b);
  }
}

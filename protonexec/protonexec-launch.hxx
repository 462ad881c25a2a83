#pragma once

#include <protonexec/config/config-types.hxx>
#include <protonexec/proton/proton-exec.hxx>
#include <protonexec/proton/proton-resolver.hxx>
#include <protonexec/proton/proton-types.hxx>
#include <protonexec/steam/steam-library.hxx>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <functional>
#include <string>
#include <vector>

namespace protonexec
{
  namespace asio = boost::asio;

  // Process exit statuses. Each failure category gets its own so that
  // scripts wrapping us can tell them apart.
  //
  enum class exit_status: int
  {
    success        = 0,
    failure        = 1, // Options, config, filesystem, exec failure.
    no_target      = 2, // No target program specified.
    not_found      = 3, // No Proton installation found.
    not_executable = 4  // Resolved binary is not executable.
  };

  exit_status
  to_exit_status (resolve_errc);

  class launch_coordinator
  {
  public:
    using resolver_type = proton_resolver;
    using environment_type = proton_environment;
    using invocation_type = proton_invocation;

    // The terminal step. In production this is replace_process() and never
    // returns.
    //
    using exec_function = std::function<void (const invocation_type&)>;

    launch_coordinator (asio::io_context& ioc, const launch_config& c);

    launch_coordinator (asio::io_context& ioc,
                        const launch_config& c,
                        exec_function exec);

    launch_coordinator (const launch_coordinator&) = delete;
    launch_coordinator& operator= (const launch_coordinator&) = delete;

    // Steam root, configured or detected. Empty if there is none.
    //
    asio::awaitable<fs::path>
    steam_root ();

    // Detect all Proton installations, ordered best first.
    //
    asio::awaitable<std::vector<proton_candidate>>
    detect_versions ();

    // Resolve the binary to launch. Throws resolve_error.
    //
    asio::awaitable<proton_resolution>
    resolve ();

    // Prepare the application prefix.
    //
    // If the caller already has STEAM_COMPAT_DATA_PATH set we use that and
    // don't create anything.
    //
    fs::path
    prepare_prefix ();

    // Complete launch workflow.
    //
    // The first argument is the target program, the rest are passed through.
    // On success this does not return (unless the exec function does, which
    // only test doubles do); otherwise returns the exit status to use.
    // Errors other than resolution failures are thrown.
    //
    asio::awaitable<exit_status>
    complete_launch (const std::vector<std::string>& args);

  private:
    // Search roots unless the configuration makes them unnecessary.
    //
    asio::awaitable<std::vector<fs::path>>
    search_roots (bool required);

    const launch_config& config_;
    exec_function exec_;
    steam_library_manager steam_;
    bool verbose_;
  };
}

#pragma once

#include <protonexec/config/config-types.hxx>
#include <protonexec/proton/proton-types.hxx>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace protonexec
{
  // Classify an installation directory name.
  //
  // Stable installations match "Proton MAJOR.MINOR[.PATCH]" exactly,
  // experimental ones "Proton*Experimental". Anything else is not ours to
  // pick and yields nullopt.
  //
  std::optional<proton_channel>
  classify_proton (const std::string& name);

  // Make a candidate from an installation directory, or nullopt if its name
  // doesn't classify.
  //
  std::optional<proton_candidate>
  make_candidate (const fs::path& dir);

  // Filter and sort candidates, best first.
  //
  // Experimental entries are dropped unless include_experimental is true, in
  // which case they rank above every stable one. Stable entries are ordered
  // by version, highest first. Ties are broken by directory name and then by
  // full path, both ascending, so the result doesn't depend on directory
  // iteration order. Duplicate paths are removed.
  //
  std::vector<proton_candidate>
  order_candidates (std::vector<proton_candidate> cs,
                    bool include_experimental);

  // Pick the default installation from an ordered list (i.e., its front).
  // Throws resolve_error (not_found) if the list is empty.
  //
  const proton_candidate&
  select_default (const std::vector<proton_candidate>& ordered);

  // Join candidate paths into a path list. Use ":" for PATH-like lists and
  // "\n" for display.
  //
  std::string
  join_path_list (const std::vector<proton_candidate>& cs,
                  const std::string& separator = ":");

  // Split a colon-separated path list, skipping empty entries.
  //
  std::vector<fs::path>
  split_path_list (const std::string& s);

  // Expand version override shorthands: "9.0" is "Proton 9.0" and
  // "experimental" is "Proton - Experimental". Anything else is taken to be
  // a directory name and returned as is.
  //
  std::string
  expand_version (const std::string& v);

  // Whether the path is a regular file we are allowed to execute.
  //
  bool
  is_executable (const fs::path& p);

  // Locate Proton installations and resolve the binary to launch.
  //
  class proton_resolver
  {
  public:
    // The search roots are the steamapps/common directories to scan. They
    // are not used when the configuration supplies a search path.
    //
    proton_resolver (const launch_config& c, std::vector<fs::path> roots);

    proton_resolver (const proton_resolver&) = delete;
    proton_resolver& operator= (const proton_resolver&) = delete;

    // Scan the immediate subdirectories of a search root. A root that is
    // missing or unreadable is reported as a warning and yields nothing.
    //
    std::vector<proton_candidate>
    scan (const fs::path& root);

    // Collect candidates from the search path override or, if there is
    // none, by scanning every search root. Not filtered or ordered. The
    // result is remembered so the roots are only scanned once.
    //
    std::vector<proton_candidate>
    discover ();

    // Discover and order according to the configuration.
    //
    std::vector<proton_candidate>
    candidates ();

    // Resolve the binary to launch.
    //
    // An explicit binary override wins outright. Otherwise an explicit
    // version override names the installation directly; we never look for a
    // default in that case. Otherwise we take the default candidate.
    //
    // Throws resolve_error.
    //
    proton_resolution
    resolve ();

    // Number of directories scanned so far.
    //
    std::size_t
    scan_count () const noexcept
    {
      return scans_;
    }

    const std::vector<fs::path>&
    roots () const noexcept
    {
      return roots_;
    }

  private:
    proton_candidate
    resolve_version (const std::string& v) const;

    fs::path
    resolve_binary (const fs::path& b) const;

    const launch_config& config_;
    std::vector<fs::path> roots_;
    std::optional<std::vector<proton_candidate>> discovered_;
    std::size_t scans_;
  };
}

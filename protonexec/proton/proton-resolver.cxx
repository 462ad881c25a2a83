#include <protonexec/proton/proton-resolver.hxx>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <system_error>

#include <unistd.h>

#include <boost/process/search_path.hpp>

using namespace std;

namespace protonexec
{
  namespace bp = boost::process;

  // Directory name of an installation path. Tolerates the trailing slash
  // users like to put into search paths.
  //
  static string
  directory_name (const fs::path& p)
  {
    fs::path n (p.lexically_normal ());

    if (!n.has_filename () && n.has_parent_path ())
      n = n.parent_path ();

    return n.filename ().string ();
  }

  static bool
  ends_with (const string& s, const string& x)
  {
    return s.size () >= x.size () &&
           s.compare (s.size () - x.size (), x.size (), x) == 0;
  }

  optional<proton_channel>
  classify_proton (const string& n)
  {
    // Valve isn't exactly consistent with naming. We see things like:
    // - "Proton 9.0"
    // - "Proton 7.0" (but also "Proton 5.0.10" on old installs)
    // - "Proton - Experimental"
    // - "Proton Hotfix", "Proton EasyAntiCheat Runtime"
    //
    // Only the first three are Proton builds we know how to order.
    //
    if (n.compare (0, 6, "Proton") != 0)
      return nullopt;

    if (ends_with (n, "Experimental"))
      return proton_channel::experimental;

    if (n.compare (0, 7, "Proton ") == 0 &&
        parse_proton_version (n.substr (7), false /* revision */))
      return proton_channel::stable;

    return nullopt;
  }

  optional<proton_candidate>
  make_candidate (const fs::path& dir)
  {
    string n (directory_name (dir));
    auto ch (classify_proton (n));

    if (!ch)
      return nullopt;

    proton_candidate c (dir.lexically_normal (), n, *ch);

    if (*ch == proton_channel::stable)
      c.version = parse_proton_version (n.substr (7), false);

    return c;
  }

  vector<proton_candidate>
  order_candidates (vector<proton_candidate> cs, bool x)
  {
    if (!x)
    {
      cs.erase (remove_if (cs.begin (), cs.end (),
                           [] (const proton_candidate& c)
                           {
                             return c.experimental ();
                           }),
                cs.end ());
    }

    sort (cs.begin (), cs.end (),
          [] (const proton_candidate& a, const proton_candidate& b)
    {
      // Experimental tracks the newest upstream branch so, once the user
      // let it in, it beats every numbered release.
      //
      if (a.experimental () != b.experimental ())
        return a.experimental ();

      if (!a.experimental ())
      {
        int r (a.version.value_or (proton_version ()).compare (
                 b.version.value_or (proton_version ())));

        if (r != 0)
          return r > 0;
      }

      if (a.name != b.name)
        return a.name < b.name;

      return a.path < b.path;
    });

    cs.erase (unique (cs.begin (), cs.end (),
                      [] (const proton_candidate& a,
                          const proton_candidate& b)
                      {
                        return a.path == b.path;
                      }),
              cs.end ());

    return cs;
  }

  const proton_candidate&
  select_default (const vector<proton_candidate>& cs)
  {
    if (cs.empty ())
      throw resolve_error (resolve_errc::not_found,
                           "no Proton installation found");

    return cs.front ();
  }

  string
  join_path_list (const vector<proton_candidate>& cs, const string& sep)
  {
    string r;

    for (const auto& c : cs)
    {
      if (!r.empty ())
        r += sep;

      r += c.path.string ();
    }

    return r;
  }

  vector<fs::path>
  split_path_list (const string& s)
  {
    vector<fs::path> r;

    for (size_t b (0), e; b <= s.size (); b = e + 1)
    {
      e = s.find (':', b);

      if (e == string::npos)
        e = s.size ();

      if (e != b)
        r.emplace_back (s.substr (b, e - b));
    }

    return r;
  }

  string
  expand_version (const string& v)
  {
    string l (v);
    transform (l.begin (), l.end (), l.begin (), [] (unsigned char c)
    {
      return static_cast<char> (tolower (c));
    });

    if (l == "experimental")
      return "Proton - Experimental";

    if (parse_proton_version (v))
      return "Proton " + v;

    return v;
  }

  bool
  is_executable (const fs::path& p)
  {
    error_code ec;

    if (!fs::is_regular_file (p, ec))
      return false;

    return ::access (p.c_str (), X_OK) == 0;
  }

  // proton_resolver
  //

  proton_resolver::
  proton_resolver (const launch_config& c, vector<fs::path> roots)
    : config_ (c),
      roots_ (move (roots)),
      scans_ (0)
  {
  }

  vector<proton_candidate> proton_resolver::
  scan (const fs::path& root)
  {
    ++scans_;

    vector<proton_candidate> r;

    // If we can't read the directory (permissions, dangling library), just
    // warn and return whatever we found so far. One bad library shouldn't
    // hide the Proton builds installed in the others.
    //
    auto warn ([&root] (const error_code& ec)
    {
      cerr << "warning: unable to scan " << root.string () << ": "
           << ec.message () << endl;
    });

    error_code ec;
    fs::directory_iterator i (root, ec);

    if (ec)
    {
      warn (ec);
      return r;
    }

    for (fs::directory_iterator e; i != e; i.increment (ec))
    {
      if (ec)
        break;

      error_code dec;
      if (!i->is_directory (dec))
        continue;

      if (auto c = make_candidate (i->path ()))
        r.push_back (move (*c));
    }

    if (ec)
      warn (ec);

    return r;
  }

  vector<proton_candidate> proton_resolver::
  discover ()
  {
    if (discovered_)
      return *discovered_;

    vector<proton_candidate> r;

    // An explicit search path is the candidate list itself. We classify the
    // entries the same way as scanned directories but don't look inside
    // anything.
    //
    if (config_.search_path)
    {
      for (const auto& p : split_path_list (*config_.search_path))
      {
        if (auto c = make_candidate (p))
          r.push_back (move (*c));
      }
    }
    else
    {
      for (const auto& root : roots_)
      {
        auto cs (scan (root));
        r.insert (r.end (),
                  make_move_iterator (cs.begin ()),
                  make_move_iterator (cs.end ()));
      }
    }

    discovered_ = r;
    return r;
  }

  vector<proton_candidate> proton_resolver::
  candidates ()
  {
    return order_candidates (discover (), config_.experimental);
  }

  proton_candidate proton_resolver::
  resolve_version (const string& v) const
  {
    string n (expand_version (v));

    auto make ([] (const fs::path& p)
    {
      // An explicit override isn't filtered: the user may well want to run
      // "Proton Hotfix" or a custom build.
      //
      if (auto c = make_candidate (p))
        return *c;

      return proton_candidate (p.lexically_normal (),
                               directory_name (p),
                               proton_channel::stable);
    });

    // A path names the installation outright.
    //
    if (n.find ('/') != string::npos)
    {
      fs::path p (n);

      error_code ec;
      if (!fs::is_directory (p, ec))
        throw resolve_error (resolve_errc::not_found,
                             "Proton installation " + p.string () +
                             " does not exist");

      return make (p);
    }

    if (config_.search_path)
    {
      for (const auto& p : split_path_list (*config_.search_path))
      {
        if (directory_name (p) == n)
          return make (p);
      }

      throw resolve_error (resolve_errc::not_found,
                           "Proton version '" + v + "' is not in the search "
                           "path");
    }

    for (const auto& root : roots_)
    {
      fs::path p (root / n);

      error_code ec;
      if (fs::is_directory (p, ec))
        return make (p);
    }

    throw resolve_error (resolve_errc::not_found,
                         "Proton version '" + v + "' is not installed");
  }

  fs::path proton_resolver::
  resolve_binary (const fs::path& b) const
  {
    // A bare name is looked up in PATH, much like the shell would.
    //
    if (!b.has_parent_path ())
    {
      auto p (bp::search_path (b.string ()));

      if (p.empty ())
        throw resolve_error (resolve_errc::not_executable,
                             "Proton binary '" + b.string () +
                             "' not found in PATH");

      return fs::path (p.string ());
    }

    return b;
  }

  proton_resolution proton_resolver::
  resolve ()
  {
    proton_resolution r;

    if (config_.binary)
    {
      r.binary = resolve_binary (*config_.binary);
    }
    else
    {
      if (config_.version)
      {
        r.candidate = resolve_version (*config_.version);
      }
      else
      {
        auto all (discover ());
        auto cs (order_candidates (all, config_.experimental));

        if (cs.empty ())
        {
          // Explain the most likely reason rather than just shrugging.
          //
          bool x (any_of (all.begin (), all.end (),
                          [] (const proton_candidate& c)
                          {
                            return c.experimental ();
                          }));

          throw resolve_error (
            resolve_errc::not_found,
            x
            ? "no stable Proton installation found (experimental versions "
              "are excluded, set " + string (config_keys::experimental) +
              "=1 to include them)"
            : "no Proton installation found");
        }

        r.candidate = select_default (cs);
      }

      r.binary = r.candidate->path / config_.binary_name;
    }

    if (!is_executable (r.binary))
      throw resolve_error (resolve_errc::not_executable,
                           "Proton binary " + r.binary.string () +
                           " is not executable");

    return r;
  }
}

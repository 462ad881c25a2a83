#include <protonexec/config/config.hxx>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

#include <boost/process/environment.hpp>

using namespace std;

namespace protonexec
{
  environment_map
  current_environment ()
  {
    environment_map r;

    for (const auto& e : boost::this_process::environment ())
      r.emplace (e.get_name (), e.to_string ());

    return r;
  }

  optional<string>
  lookup_env (const environment_map& env, const string& n)
  {
    auto i (env.find (n));

    if (i == env.end () || i->second.empty ())
      return nullopt;

    return i->second;
  }

  optional<bool>
  parse_bool (const string& v)
  {
    string l (v);
    transform (l.begin (), l.end (), l.begin (), [] (unsigned char c)
    {
      return static_cast<char> (tolower (c));
    });

    if (l == "1" || l == "true" || l == "yes" || l == "on")
      return true;

    if (l == "0" || l == "false" || l == "no" || l == "off")
      return false;

    return nullopt;
  }

  static string
  trim (const string& s)
  {
    size_t b (0), e (s.size ());

    while (b < e && isspace (static_cast<unsigned char> (s[b])))
      ++b;

    while (e > b && isspace (static_cast<unsigned char> (s[e - 1])))
      --e;

    return s.substr (b, e - b);
  }

  // Extract the value from what follows '='.
  //
  // A '#' that follows whitespace outside of quotes starts a comment, as it
  // would in the shell; one glued to the value ("/data#1") is part of it.
  // One level of matching quotes is stripped and nothing inside them is
  // interpreted: "$HOME" stays "$HOME" and "a # b" stays "a # b".
  //
  static string
  parse_value (const string& raw)
  {
    string v (trim (raw));

    if (!v.empty () && (v.front () == '"' || v.front () == '\''))
    {
      size_t q (v.find (v.front (), 1));

      if (q != string::npos)
      {
        string t (v.substr (q + 1));
        string tt (trim (t));

        if (tt.empty () ||
            (tt.front () == '#' && isspace (static_cast<unsigned char> (t[0]))))
          return v.substr (1, q - 1);
      }
    }
    else
    {
      for (size_t i (1); i < raw.size (); ++i)
      {
        if (raw[i] == '#' && isspace (static_cast<unsigned char> (raw[i - 1])))
        {
          v = trim (raw.substr (0, i));
          break;
        }
      }
    }

    // Anything else that is quoted at both ends still loses its quotes.
    //
    if (v.size () >= 2 &&
        (v.front () == '"' || v.front () == '\'') &&
        v.back () == v.front ())
    {
      v = v.substr (1, v.size () - 2);
    }

    return v;
  }

  config_entries
  parse_config (istream& is, const fs::path& name)
  {
    config_entries r;

    size_t ln (0);
    for (string l; getline (is, l); )
    {
      ++ln;

      string s (trim (l));

      if (s.empty () || s[0] == '#')
        continue;

      if (s.compare (0, 7, "export ") == 0)
        s = trim (s.substr (7));

      size_t p (s.find ('='));

      if (p == string::npos)
        throw config_error (name, ln, "expected KEY=value");

      string k (trim (s.substr (0, p)));
      string v (s.substr (p + 1));

      if (k.empty ())
        throw config_error (name, ln, "empty key");

      // Keys are identifiers. This also catches attempts at shell syntax
      // ("$(...)=", "a b=") early with a sensible diagnostics.
      //
      for (char c: k)
      {
        if (!isalnum (static_cast<unsigned char> (c)) && c != '_')
          throw config_error (name, ln, "invalid key '" + k + "'");
      }

      r[move (k)] = parse_value (v);
    }

    return r;
  }

  config_entries
  parse_config_file (const fs::path& f)
  {
    ifstream ifs (f);
    if (!ifs)
      throw config_error ("unable to open config file " + f.string ());

    return parse_config (ifs, f);
  }

  // Return HOME or, if that is missing, the current directory. The latter is
  // not pretty but it keeps a broken environment from taking us down.
  //
  static fs::path
  home_directory (const environment_map& env)
  {
    if (auto h = lookup_env (env, "HOME"))
      return fs::path (*h);

    return fs::current_path ();
  }

  // Expand a leading "~/" the way the shell would have in a sourced file.
  //
  static string
  expand_home (const string& v, const environment_map& env)
  {
    if (v == "~")
      return home_directory (env).string ();

    if (v.compare (0, 2, "~/") == 0)
      return (home_directory (env) / v.substr (2)).string ();

    return v;
  }

  launch_config
  load_config (const environment_map& env, const optional<fs::path>& file)
  {
    launch_config c;
    c.environment = env;

    fs::path h (home_directory (env));

    // Where the config file lives. These can only come from the environment
    // for obvious reasons.
    //
    if (auto v = lookup_env (env, config_keys::config_home))
      c.config_home = *v;
    else if (auto v = lookup_env (env, "XDG_CONFIG_HOME"))
      c.config_home = fs::path (*v) / "protonexec";
    else
      c.config_home = h / ".config" / "protonexec";

    bool required (true);

    if (file)
      c.config_file = *file;
    else if (auto v = lookup_env (env, config_keys::config))
      c.config_file = *v;
    else
    {
      c.config_file = c.config_home / "config";
      required = false;
    }

    config_entries fe;

    if (required || fs::exists (c.config_file))
      fe = parse_config_file (c.config_file);

    // Anything we don't know about is most likely a typo, so say so. We
    // don't fail, though: a config shared with a newer version should still
    // work.
    //
    static const char* known[] = {
      config_keys::data_home,
      config_keys::debug,
      config_keys::steam_root,
      config_keys::search_path,
      config_keys::version,
      config_keys::binary,
      config_keys::binary_name,
      config_keys::experimental,
      config_keys::prefix,
      config_keys::verb};

    for (const auto& [k, v]: fe)
    {
      if (find (begin (known), end (known), k) == end (known))
        cerr << "warning: " << c.config_file.string ()
             << ": unknown setting " << k << endl;
    }

    // Environment first, then the file.
    //
    auto lookup ([&env, &fe] (const char* k) -> optional<string>
    {
      if (auto v = lookup_env (env, k))
        return v;

      if (auto i (fe.find (k)); i != fe.end () && !i->second.empty ())
        return expand_home (i->second, env);

      return nullopt;
    });

    auto flag ([&lookup] (const char* k, bool d) -> bool
    {
      auto v (lookup (k));

      if (!v)
        return d;

      auto b (parse_bool (*v));
      if (!b)
        throw config_error (
          "invalid boolean value '" + *v + "' for " + k);

      return *b;
    });

    if (auto v = lookup (config_keys::data_home))
      c.data_home = *v;
    else if (auto v = lookup_env (env, "XDG_DATA_HOME"))
      c.data_home = fs::path (*v) / "protonexec";
    else
      c.data_home = h / ".local" / "share" / "protonexec";

    c.debug = flag (config_keys::debug, false);
    c.experimental = flag (config_keys::experimental, false);

    if (auto v = lookup (config_keys::steam_root))
      c.steam_root = *v;

    c.search_path = lookup (config_keys::search_path);
    c.version = lookup (config_keys::version);

    if (auto v = lookup (config_keys::binary))
      c.binary = fs::path (*v);

    if (auto v = lookup (config_keys::binary_name))
      c.binary_name = *v;

    c.prefix = lookup (config_keys::prefix);

    if (auto v = lookup (config_keys::verb))
      c.verb = *v;

    return c;
  }
}

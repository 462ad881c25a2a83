#include <protonexec/config/config.hxx>

#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace std;
using namespace protonexec;

namespace fs = std::filesystem;

static config_entries
parse (const string& s)
{
  istringstream is (s);
  return parse_config (is, "test.conf");
}

static void
test_bool ()
{
  for (const char* v : {"1", "true", "TRUE", "yes", "Yes", "on"})
    assert (parse_bool (v) == true);

  for (const char* v : {"0", "false", "False", "no", "off", "OFF"})
    assert (parse_bool (v) == false);

  for (const char* v : {"", "2", "y", "enabled", " 1"})
    assert (!parse_bool (v));
}

// The config file is data, never a script.
//
static void
test_parse ()
{
  auto e (parse (R"(
# Comment.
PROTONEXEC_VERSION=9.0
  PROTONEXEC_DEBUG = yes
export PROTONEXEC_PREFIX="my game"
PROTONEXEC_VERB='waitforexitandrun'
PROTONEXEC_BINARY=$(rm -rf ~)
PROTONEXEC_SEARCH_PATH=/a/Proton 9.0:/b/Proton 8.0
PROTONEXEC_STEAM_ROOT="unbalanced
PROTONEXEC_VERSION=8.0
)"));

  assert (e.size () == 7);
  assert (e["PROTONEXEC_VERSION"] == "8.0"); // Later lines win.
  assert (e["PROTONEXEC_DEBUG"] == "yes");
  assert (e["PROTONEXEC_PREFIX"] == "my game");
  assert (e["PROTONEXEC_VERB"] == "waitforexitandrun");
  assert (e["PROTONEXEC_BINARY"] == "$(rm -rf ~)");
  assert (e["PROTONEXEC_SEARCH_PATH"] == "/a/Proton 9.0:/b/Proton 8.0");
  assert (e["PROTONEXEC_STEAM_ROOT"] == "\"unbalanced");

  // Trailing comments.
  //
  e = parse (R"(
PROTONEXEC_VERSION="9.0"  # pinned
PROTONEXEC_VERB=waitforexitandrun	# tab
PROTONEXEC_PREFIX="my # game" # quoted '#' is data
PROTONEXEC_DATA_HOME=/data#1
PROTONEXEC_BINARY_NAME= # nothing
PROTONEXEC_STEAM_ROOT='/mnt/steam' #spaced
)");

  assert (e["PROTONEXEC_VERSION"] == "9.0");
  assert (e["PROTONEXEC_VERB"] == "waitforexitandrun");
  assert (e["PROTONEXEC_PREFIX"] == "my # game");
  assert (e["PROTONEXEC_DATA_HOME"] == "/data#1");
  assert (e["PROTONEXEC_BINARY_NAME"] == "");
  assert (e["PROTONEXEC_STEAM_ROOT"] == "/mnt/steam");

  // Empty file.
  //
  assert (parse ("").empty ());
  assert (parse ("\n\n# nothing\n").empty ());
}

static void
test_parse_errors ()
{
  auto fail ([] (const string& s, size_t line)
  {
    try
    {
      parse (s);
      assert (false);
    }
    catch (const config_error& e)
    {
      assert (e.line () == line);
      assert (e.file () == fs::path ("test.conf"));
    }
  });

  fail ("PROTONEXEC_DEBUG\n", 1);
  fail ("# ok\nPROTONEXEC_DEBUG=1\nrm -rf /\n", 3);
  fail ("=value\n", 1);
  fail ("$(whoami)=1\n", 1);
  fail ("A B=1\n", 1);
  fail ("source /etc/profile\n", 1);
}

// Scratch home with XDG directories we control.
//
struct scratch
{
  fs::path root;

  explicit
  scratch (const string& n)
    : root (fs::temp_directory_path () / n)
  {
    fs::remove_all (root);
    fs::create_directories (root);
  }

  ~scratch ()
  {
    error_code ec;
    fs::remove_all (root, ec);
  }

  void
  write (const fs::path& f, const string& s) const
  {
    fs::create_directories (f.parent_path ());
    ofstream (f) << s;
  }
};

static void
test_defaults ()
{
  scratch s ("protonexec-config-defaults");

  environment_map env {{"HOME", s.root.string ()}};

  auto c (load_config (env));

  assert (c.config_home == s.root / ".config" / "protonexec");
  assert (c.config_file == c.config_home / "config");
  assert (c.data_home == s.root / ".local" / "share" / "protonexec");
  assert (!c.debug);
  assert (!c.experimental);
  assert (c.steam_root.empty ());
  assert (!c.search_path);
  assert (!c.version);
  assert (!c.binary);
  assert (c.binary_name == "proton");
  assert (!c.prefix);
  assert (c.verb == "run");
  assert (c.environment == env);

  // XDG.
  //
  env["XDG_CONFIG_HOME"] = (s.root / "cfg").string ();
  env["XDG_DATA_HOME"] = (s.root / "data").string ();

  c = load_config (env);

  assert (c.config_file == s.root / "cfg" / "protonexec" / "config");
  assert (c.data_home == s.root / "data" / "protonexec");

  // Our own homes win over XDG. Empty counts as unset.
  //
  env["PROTONEXEC_CONFIG_HOME"] = (s.root / "pcfg").string ();
  env["PROTONEXEC_DATA_HOME"] = (s.root / "pdata").string ();
  env["PROTONEXEC_VERSION"] = "";

  c = load_config (env);

  assert (c.config_file == s.root / "pcfg" / "config");
  assert (c.data_home == s.root / "pdata");
  assert (!c.version);
}

// Environment > file > default.
//
static void
test_precedence ()
{
  scratch s ("protonexec-config-precedence");

  environment_map env {
    {"HOME", s.root.string ()},
    {"XDG_CONFIG_HOME", (s.root / "cfg").string ()}};

  s.write (s.root / "cfg" / "protonexec" / "config",
           "PROTONEXEC_VERSION=8.0\n"
           "PROTONEXEC_EXPERIMENTAL=on\n"
           "PROTONEXEC_STEAM_ROOT=~/games/steam\n"
           "PROTONEXEC_BINARY_NAME=files/bin/proton\n"
           "PROTONEXEC_VERB=waitforexitandrun\n");

  auto c (load_config (env));

  assert (c.version && *c.version == "8.0");
  assert (c.experimental);
  assert (c.steam_root == s.root / "games" / "steam");
  assert (c.binary_name == "files/bin/proton");
  assert (c.verb == "waitforexitandrun");

  env["PROTONEXEC_VERSION"] = "9.0";
  env["PROTONEXEC_EXPERIMENTAL"] = "0";

  c = load_config (env);

  assert (*c.version == "9.0");
  assert (!c.experimental);
  assert (c.binary_name == "files/bin/proton");
}

static void
test_config_file ()
{
  scratch s ("protonexec-config-file");

  environment_map env {{"HOME", s.root.string ()}};

  fs::path f (s.root / "other.conf");
  s.write (f, "PROTONEXEC_PREFIX=shared\nPROTONEXEC_BOGUS=1\n");

  // Through the environment.
  //
  env["PROTONEXEC_CONFIG"] = f.string ();
  auto c (load_config (env));

  assert (c.config_file == f);
  assert (c.prefix && *c.prefix == "shared");

  // Explicit file beats the environment.
  //
  fs::path g (s.root / "explicit.conf");
  s.write (g, "PROTONEXEC_PREFIX=mine\n");

  c = load_config (env, g);
  assert (*c.prefix == "mine");

  // A named file must exist.
  //
  try
  {
    load_config (env, s.root / "missing.conf");
    assert (false);
  }
  catch (const config_error&)
  {
  }

  env["PROTONEXEC_CONFIG"] = (s.root / "missing.conf").string ();

  try
  {
    load_config (env);
    assert (false);
  }
  catch (const config_error&)
  {
  }

  // Bad boolean.
  //
  env.erase ("PROTONEXEC_CONFIG");
  env["PROTONEXEC_DEBUG"] = "maybe";

  try
  {
    load_config (env);
    assert (false);
  }
  catch (const config_error&)
  {
  }
}

static void
test_lookup_env ()
{
  environment_map env {{"A", "1"}, {"B", ""}};

  assert (lookup_env (env, "A") == string ("1"));
  assert (!lookup_env (env, "B"));
  assert (!lookup_env (env, "C"));

  // Whatever we capture must not have empty names.
  //
  for (const auto& e: current_environment ())
    assert (!e.first.empty ());
}

int
main ()
{
  test_bool ();
  test_parse ();
  test_parse_errors ();
  test_defaults ();
  test_precedence ();
  test_config_file ();
  test_lookup_env ();
}

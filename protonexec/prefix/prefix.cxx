#include <protonexec/prefix/prefix.hxx>

#include <stdexcept>
#include <system_error>

using namespace std;

namespace protonexec
{
  fs::path
  prefix_root (const launch_config& c)
  {
    return c.data_home / "prefixes";
  }

  string
  generate_prefix_name (mt19937& g)
  {
    static const char cs[] = "abcdefghijklmnopqrstuvwxyz0123456789";

    uniform_int_distribution<size_t> d (0, sizeof (cs) - 2);

    string r ("pfx-");
    for (size_t i (0); i != 8; ++i)
      r += cs[d (g)];

    return r;
  }

  fs::path
  create_prefix (const fs::path& root, const string& n, mt19937& g)
  {
    if (!n.empty () &&
        (n == "." || n == ".." || n.find ('/') != string::npos))
      throw invalid_argument ("invalid prefix name '" + n + "'");

    fs::create_directories (root);

    if (!n.empty ())
    {
      fs::path p (root / n);

      // Reuse is the whole point of a fixed name, so an existing directory
      // is fine. create_directory() tells us if it's something else.
      //
      error_code ec;
      fs::create_directory (p, ec);

      if (ec || !fs::is_directory (p))
        throw system_error (ec ? ec : make_error_code (errc::not_a_directory),
                            "unable to create prefix " + p.string ());

      return p;
    }

    // create_directory() returns false if the directory already exists, which
    // is our collision check. Doing it this way rather than testing first
    // means two launches racing for the same name can't both win.
    //
    for (size_t i (0); i != prefix_attempts; ++i)
    {
      fs::path p (root / generate_prefix_name (g));

      if (fs::create_directory (p))
        return p;
    }

    throw system_error (make_error_code (errc::file_exists),
                        "unable to find unused prefix name in " +
                        root.string ());
  }

  fs::path
  create_prefix (const fs::path& root, const string& n)
  {
    random_device rd;
    mt19937 g (rd ());

    return create_prefix (root, n, g);
  }
}

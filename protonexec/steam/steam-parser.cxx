#include <protonexec/steam/steam-parser.hxx>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace protonexec
{
  // Try to find a child node by key. Returns nullptr if this node is not an
  // object or the key doesn't exist.
  //
  const vdf_node* vdf_node::
  find (const string& key) const
  {
    if (!is_object ())
      return nullptr;

    const auto& obj (as_object ());
    auto it (obj.find (key));
    return it != obj.end () ? &it->second : nullptr;
  }

  string vdf_node::
  get_string (const string& key, const string& default_value) const
  {
    const vdf_node* n (find (key));

    if (n != nullptr && n->is_string ())
      return n->as_string ();

    return default_value;
  }

  const map<string, vdf_node>* vdf_node::
  get_object (const string& key) const
  {
    const vdf_node* n (find (key));

    if (n != nullptr && n->is_object ())
      return &n->as_object ();

    return nullptr;
  }

  // vdf_parser
  //

  // Skip over any whitespace characters.
  //
  // We also handle C++-style comments (//) here since they effectively act as
  // whitespace between tokens in VDF.
  //
  void vdf_parser::
  skip_whitespace (parser_state& s)
  {
    while (s.current < s.end)
    {
      char c (*s.current);

      if (isspace (static_cast<unsigned char> (c)))
      {
        if (c == '\n')
        {
          ++s.line;
          s.column = 1;
        }
        else
          ++s.column;

        ++s.current;
        continue;
      }

      if (c == '/' && (s.current + 1) < s.end && *(s.current + 1) == '/')
      {
        while (s.current < s.end && *s.current != '\n')
          ++s.current;

        continue;
      }

      break;
    }
  }

  char vdf_parser::
  peek_char (parser_state& s)
  {
    skip_whitespace (s);
    return (s.current < s.end) ? *s.current : '\0';
  }

  char vdf_parser::
  next_char (parser_state& s)
  {
    skip_whitespace (s);

    if (s.current >= s.end)
      return '\0';

    char c (*s.current);
    ++s.current;
    ++s.column;
    return c;
  }

  // Parse a string token.
  //
  // VDF strings can be quoted or unquoted. If quoted, we need to handle escape
  // sequences. If unquoted, they are terminated by whitespace or structural
  // characters ('{', '}', '"').
  //
  string vdf_parser::
  parse_string (parser_state& s)
  {
    skip_whitespace (s);

    if (s.current >= s.end)
      throw runtime_error ("unexpected end of input at line " +
                           std::to_string (s.line));

    bool quoted (*s.current == '"');

    if (quoted)
    {
      ++s.current;
      ++s.column;
    }

    string r;
    bool closed (!quoted);

    while (s.current < s.end)
    {
      char c (*s.current);

      if (quoted)
      {
        if (c == '"')
        {
          ++s.current;
          ++s.column;
          closed = true;
          break;
        }
        else if (c == '\\' && (s.current + 1) < s.end)
        {
          ++s.current;
          ++s.column;
          char next (*s.current);

          switch (next)
          {
            case 'n':  r += '\n'; break;
            case 't':  r += '\t'; break;
            case 'r':  r += '\r'; break;
            case '\\': r += '\\'; break;
            case '"':  r += '"'; break;
            default:   r += next; break;
          }

          ++s.current;
          ++s.column;
        }
        else
        {
          if (c == '\n')
          {
            ++s.line;
            s.column = 0;
          }

          r += c;
          ++s.current;
          ++s.column;
        }
      }
      else
      {
        if (isspace (static_cast<unsigned char> (c)) ||
            c == '{' || c == '}' || c == '"')
          break;

        r += c;
        ++s.current;
        ++s.column;
      }
    }

    if (!closed)
      throw runtime_error ("unterminated string at line " +
                           std::to_string (s.line));

    if (!quoted && r.empty ())
      throw runtime_error (string ("unexpected '") + *s.current +
                           "' at line " + std::to_string (s.line));

    return r;
  }

  // Parse a key-value pair.
  //
  // The structure is always "Key" followed by either a "StringValue" or a
  // nested object { ... }.
  //
  pair<string, vdf_node> vdf_parser::
  parse_pair (parser_state& s)
  {
    string key (parse_string (s));

    if (peek_char (s) == '{')
    {
      next_char (s);
      auto obj (parse_object (s));

      if (next_char (s) != '}')
        throw runtime_error ("expected '}' at line " + std::to_string (s.line));

      return {move (key), vdf_node (move (obj))};
    }

    string val (parse_string (s));
    return {move (key), vdf_node (move (val))};
  }

  map<string, vdf_node> vdf_parser::
  parse_object (parser_state& s)
  {
    map<string, vdf_node> r;

    while (true)
    {
      char c (peek_char (s));

      if (c == '\0' || c == '}')
        break;

      auto [key, val] = parse_pair (s);
      r.emplace (move (key), move (val));
    }

    return r;
  }

  vdf_node vdf_parser::
  parse (const string& str)
  {
    parser_state s (str);

    // VDF files typically have a single root key, but sometimes they are just
    // a bare list of pairs or a braced object.
    //
    char first (peek_char (s));

    if (first == '\0')
      return vdf_node (map<string, vdf_node> {});

    if (first == '{')
    {
      next_char (s);
      auto obj (parse_object (s));

      if (next_char (s) != '}')
        throw runtime_error ("expected '}' at line " + std::to_string (s.line));

      return vdf_node (move (obj));
    }

    vdf_node r (parse_object (s));

    if (peek_char (s) != '\0')
      throw runtime_error ("unexpected '}' at line " +
                           std::to_string (s.line));

    return r;
  }

  vdf_node vdf_parser::
  parse_file (const fs::path& f)
  {
    ifstream ifs (f, ios::binary);
    if (!ifs)
      throw runtime_error ("failed to open file: " + f.string ());

    return parse_stream (ifs);
  }

  vdf_node vdf_parser::
  parse_stream (istream& is)
  {
    ostringstream oss;
    oss << is.rdbuf ();
    return parse (oss.str ());
  }

  // Note that we parse synchronously: library files are tiny.
  //
  asio::awaitable<vdf_node> vdf_parser::
  parse_file_async (asio::io_context&, const fs::path& f)
  {
    co_return parse_file (f);
  }

  // Map libraryfolders.vdf into steam_library entries.
  //
  // The structure is "libraryfolders" -> { "0": {...}, "1": {...} }. Older
  // Steam clients wrote the path directly as the value ("1" "/mnt/games"), so
  // we accept that too. Entries are returned in index order, which is not the
  // map order once there are more than ten of them.
  //
  vector<steam_library>
  library_folders (const vdf_node& root)
  {
    vector<steam_library> r;

    const auto* lo (root.get_object ("libraryfolders"));
    if (lo == nullptr)
      return r;

    vector<pair<unsigned long, const vdf_node*>> entries;

    for (const auto& [key, node] : *lo)
    {
      // Skip non-numeric keys (metadata fields like "contentstatsid").
      //
      if (key.empty () ||
          !all_of (key.begin (), key.end (), [] (unsigned char c)
                   {
                     return isdigit (c) != 0;
                   }))
        continue;

      try
      {
        entries.emplace_back (stoul (key), &node);
      }
      catch (const out_of_range&)
      {
        continue;
      }
    }

    sort (entries.begin (), entries.end (),
          [] (const auto& x, const auto& y) {return x.first < y.first;});

    for (const auto& e : entries)
    {
      const vdf_node* node (e.second);
      steam_library lib;

      if (node->is_string ())
      {
        lib.path = fs::path (node->as_string ()).lexically_normal ();
      }
      else if (const auto* n = node->find ("path"); n && n->is_string ())
      {
        lib.path = fs::path (n->as_string ()).lexically_normal ();
      }

      if (!lib.path.empty ())
        r.push_back (move (lib));
    }

    return r;
  }

  asio::awaitable<vector<steam_library>>
  parse_library_folders (asio::io_context& ioc, const fs::path& f)
  {
    vdf_node root (co_await vdf_parser::parse_file_async (ioc, f));
    co_return library_folders (root);
  }
}

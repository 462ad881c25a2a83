#include <protonexec/proton/proton-version.hxx>

#include <cassert>
#include <iostream>
#include <string>

using namespace std;
using namespace protonexec;

// Directory names give us anything from "9.0" to "5.0.10". The hotfix
// revision only turns up in overrides, so the classifier parses without it.
//

static void
check (const string& s,
       uint32_t mj,
       uint32_t mi,
       uint32_t pa = 0,
       uint32_t rv = 0)
{
  auto v (parse_proton_version (s));

  if (!v)
    assert (false);

  if (v->major != mj ||
      v->minor != mi ||
      v->patch != pa ||
      v->revision != rv)
  {
    assert (false);
  }
}

static void
check_fail (const string& s, bool revision = true)
{
  auto v (parse_proton_version (s, revision));

  if (v)
    assert (false);
}

static void
check_cmp (const proton_version& l, const proton_version& r, int e)
{
  int res (l.compare (r));

  if (res < 0) res = -1;
  if (res > 0) res = 1;

  if (res != e)
    assert (false);
}

static void
test_parse ()
{
  check ("9.0", 9, 0);
  check ("7.0", 7, 0);
  check ("10.0", 10, 0);
  check ("5.0.10", 5, 0, 10);
  check ("3.16.9", 3, 16, 9);
  check ("8.0-5", 8, 0, 0, 5);
  check ("7.0.6-3", 7, 0, 6, 3);
}

static void
test_fail ()
{
  check_fail ("");
  check_fail ("9");
  check_fail ("9.");
  check_fail (".9");
  check_fail ("9.0.");
  check_fail ("9.0-");
  check_fail ("v9.0");
  check_fail ("9.0b");
  check_fail ("9.0 (Beta)");
  check_fail (" 9.0");
  check_fail ("Experimental");

  // Doesn't fit in 32 bits.
  //
  check_fail ("99999999999.0");

  // Revision not allowed.
  //
  check_fail ("8.0-5", false);
}

static void
test_cmp ()
{
  check_cmp (proton_version (9, 0), proton_version (9, 0), 0);

  // Missing components are zero.
  //
  check_cmp (*parse_proton_version ("9.0"),
             *parse_proton_version ("9.0.0"), 0);

  // Numeric, not lexicographic. This is the one the old "sort by the leading
  // number" approach got wrong for 10.0 vs 9.0 in string form.
  //
  check_cmp (proton_version (10, 0), proton_version (9, 0), 1);
  check_cmp (proton_version (5, 0, 10), proton_version (5, 0, 9), 1);
  check_cmp (proton_version (5, 13), proton_version (5, 0, 10), 1);
  check_cmp (proton_version (7, 0), proton_version (8, 0), -1);

  // Revision is the last word.
  //
  check_cmp (proton_version (8, 0, 0, 5), proton_version (8, 0, 0, 4), 1);
  check_cmp (proton_version (8, 0, 0, 5), proton_version (8, 0, 1), -1);

  assert (proton_version (9, 0) > proton_version (8, 0, 0, 5));
  assert (proton_version (6, 3) < proton_version (7, 0));
  assert (proton_version (6, 3) != proton_version (6, 3, 8));
}

static void
test_str ()
{
  assert (proton_version (9, 0).string () == "9.0");
  assert (proton_version (5, 0, 10).string () == "5.0.10");
  assert (proton_version (8, 0, 0, 5).string () == "8.0-5");

  // We print back what we were given.
  //
  assert (parse_proton_version ("9.0.0")->string () == "9.0.0");
  assert (parse_proton_version ("9.0")->string () == "9.0");
}

int
main ()
{
  test_parse ();
  test_fail ();
  test_cmp ();
  test_str ();
}

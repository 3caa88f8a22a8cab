#include "ini_line.hpp"
#include <cassert>
#include <string>

static void check_option(const char* raw, const char* key, const char* value) {
  IniLine l = classify_line(raw);
  assert(l.kind == LineKind::Option);
  assert(l.name == key);
  assert(l.value == value);
}

static void check_section(const char* raw, const char* name) {
  IniLine l = classify_line(raw);
  assert(l.kind == LineKind::Section);
  assert(l.name == name);
}

static void check_kind(const char* raw, LineKind kind) {
  assert(classify_line(raw).kind == kind);
}

int main() {
  check_kind("", LineKind::Blank);
  check_kind("\n", LineKind::Blank);
  check_kind("  \t \r\n", LineKind::Blank);

  check_kind("# comment\n", LineKind::Comment);
  check_kind("   ; comment = not an option\n", LineKind::Comment);
  check_kind("#[section]\n", LineKind::Comment);

  check_option("fav = tea\n", "fav", "tea");
  check_option("fav=tea", "fav", "tea");
  check_option("  fav   =   lemonade juice  \r\n", "fav", "lemonade juice");
  check_option("empty =\n", "empty", "");
  check_option("url = http://x/?a=b\n", "url", "http://x/?a=b");
  check_option("a.b-c_d = 1 = 2\n", "a.b-c_d", "1 = 2");
  /* option wins over section when both could match */
  check_option("[a=b]\n", "[a", "b]");

  check_section("[drinks]\n", "drinks");
  check_section("  [with space]  \n", "with space");
  check_section("[a] trailing text\n", "a");
  check_section("[a]]\n", "a");

  check_kind("[]\n", LineKind::Other);
  check_kind("[unclosed\n", LineKind::Other);
  check_kind("junk line\n", LineKind::Other);
  check_kind("= value\n", LineKind::Other);
  check_kind("two words = x\n", LineKind::Other);

  assert(trim_line("  x y \n") == "x y");
  assert(trim_line("\t\r\n").empty());

  assert(format_option("fav", "lemonade") == "fav = lemonade\n");
  assert(format_option("k", "") == "k = \n");
  assert(format_section("drinks") == "[drinks]\n");

  assert(writable_option("fav"));
  assert(writable_option("a.b-c_d"));
  assert(writable_option("[a"));
  assert(!writable_option(""));
  assert(!writable_option("#k"));
  assert(!writable_option(";k"));
  assert(!writable_option("two words"));
  assert(!writable_option("a=b"));
  assert(!writable_option("k\n"));

  assert(writable_section("drinks"));
  assert(writable_section("with space"));
  assert(!writable_section(""));
  assert(!writable_section("b]c"));
  assert(!writable_section("a=b"));
  assert(!writable_section("a\nb"));

  assert(writable_value(""));
  assert(writable_value("a = b"));
  assert(!writable_value("two\nlines"));
  assert(!writable_value("cr\r"));
  return 0;
}

#include "cli_options.hpp"
#include <cassert>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

static void test_params() {
  CliOptions o;
  std::string msg;
  assert(o.parse_args({"dest=/tmp/x.ini", "section=drinks", "option=fav", "value=lemonade"}, msg));
  assert(o.request.dest == "/tmp/x.ini");
  assert(o.request.section == "drinks");
  assert(o.request.option == "fav");
  assert(o.request.value == "lemonade");
  assert(o.request.state == DesiredState::Present);
  assert(o.validate(msg));

  /* values may contain '=' and be empty */
  assert(o.parse_args({"value=a=b", "state=absent", "section="}, msg));
  assert(o.request.value == "a=b");
  assert(o.request.state == DesiredState::Absent);
  assert(!o.request.section);
  assert(o.parse_args({"value="}, msg));
  assert(o.request.value == "");

  assert(!o.parse_args({"state=maybe"}, msg));
  assert(msg.find("state") != std::string::npos);
  assert(!o.parse_args({"colour=red"}, msg));
  assert(msg == "unsupported parameter: colour");
  assert(!o.parse_args({"dest"}, msg));
  assert(!o.parse_args({"=x"}, msg));
  assert(!o.parse_args({"dest="}, msg));
}

static void test_dest_home() {
  const char* saved = std::getenv("HOME");
  std::string old = saved ? saved : "";
  ::setenv("HOME", "/home/tester", 1);
  std::string msg;

  CliOptions o;
  assert(o.parse_args({"dest=~/app.ini"}, msg));
  assert(o.request.dest == "/home/tester/app.ini");
  assert(o.parse_args({"path=~"}, msg));
  assert(o.request.dest == "/home/tester");
  assert(o.parse_args({"dest=a/~/b.ini"}, msg));
  assert(o.request.dest == "a/~/b.ini");
  assert(o.parse_args({"dest=~no_such_user_here/x.ini"}, msg));
  assert(o.request.dest == "~no_such_user_here/x.ini");

  if (saved) ::setenv("HOME", old.c_str(), 1);
  else ::unsetenv("HOME");
}

static void test_backup_and_check_params() {
  CliOptions o;
  std::string msg;
  assert(!o.request.backup);
  assert(!o.request.check);
  assert(o.parse_args({"dest=a.ini", "backup=yes", "check=true"}, msg));
  assert(o.request.backup);
  assert(o.request.check);
  assert(o.parse_args({"backup=no", "check=off"}, msg));
  assert(!o.request.backup);
  assert(!o.request.check);
  assert(o.parse_args({"--check"}, msg));
  assert(o.request.check);
  assert(!o.parse_args({"backup=sometimes"}, msg));
  assert(msg == "backup: use backup=yes|no");
  assert(!o.parse_args({"check="}, msg));
}

/* names that would not read back are usage errors */
static void test_validate_names() {
  std::string msg;
  const std::vector<std::vector<std::string>> bad = {
    {"dest=a.ini", "section=b]c", "option=k", "value=v"},
    {"dest=a.ini", "section=a=b", "option=k", "value=v"},
    {"dest=a.ini", "section=s", "option=#k", "value=v"},
    {"dest=a.ini", "section=s", "option=;k", "value=v"},
    {"dest=a.ini", "section=s", "option=two words", "value=v"},
    {"dest=a.ini", "section=s", "option=k=j", "value=v"},
    {"dest=a.ini", "section=s", "option=k", "value=one\ntwo"},
    {"dest=a.ini", "section=b]c", "state=absent"},
  };
  for (const auto& args : bad) {
    CliOptions o;
    assert(o.parse_args(args, msg));
    assert(!o.validate(msg));
  }
  CliOptions good;
  assert(good.parse_args({"dest=a.ini", "section=with space", "option=a.b", "value=x = y"}, msg));
  assert(good.validate(msg));
}

static void test_flags_and_validate() {
  CliOptions o;
  std::string msg;
  assert(o.parse_args({"--no-rc", "-h", "path=a.ini", "--rc", "/etc/x", "--rc=/etc/y"}, msg));
  assert(!o.use_rc);
  assert(o.show_help);
  assert(o.request.dest == "a.ini");
  assert(o.rc_path && *o.rc_path == "/etc/y");
  assert(!o.parse_args({"--rc"}, msg));

  CliOptions missing;
  assert(!missing.validate(msg));
  assert(msg == "missing required arguments: dest");

  CliOptions novalue;
  assert(novalue.parse_args({"dest=a.ini", "option=k"}, msg));
  assert(!novalue.validate(msg));
  assert(novalue.parse_args({"state=absent"}, msg));
  assert(novalue.validate(msg));
}

static void test_rc_lines() {
  CliOptions o;
  std::string msg;
  assert(o.settings.color == ColorMode::Auto);
  assert(o.settings.atomic_write);
  assert(!o.settings.quiet);
  assert(o.settings.write_mode() == WriteMode::Atomic);

  assert(o.execute_line("set color off\n", msg));
  assert(o.settings.color == ColorMode::Never);
  assert(o.execute_line(":set color=on", msg));
  assert(o.settings.color == ColorMode::Always);
  assert(o.execute_line("  set atomic off  ", msg));
  assert(o.settings.write_mode() == WriteMode::InPlace);
  assert(o.execute_line("set quiet", msg));
  assert(o.settings.quiet);
  assert(o.execute_line("set quiet", msg));
  assert(!o.settings.quiet);

  assert(o.execute_line("# comment", msg));
  assert(o.execute_line("\" vim style comment", msg));
  assert(o.execute_line("// another", msg));
  assert(o.execute_line("", msg));

  assert(!o.execute_line("set color purple", msg));
  assert(!o.execute_line("set atomic maybe", msg));
  assert(!o.execute_line("set nothing on", msg));
  assert(msg == "unknown command: set nothing");
  assert(!o.execute_line("frobnicate", msg));
}

static void test_rc_file() {
  fs::path dir = fs::temp_directory_path() / ("iniedit_rc_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  fs::path rc = dir / "rc";
  {
    std::ofstream out(rc);
    out << "# settings\nset quiet on\nset bogus 1\nset atomic=off\n";
  }
  std::string msg;

  CliOptions o;
  o.rc_path = rc;
  assert(o.load_rc(msg));
  assert(o.settings.quiet);
  assert(!o.settings.atomic_write);
  assert(msg == rc.string() + ":3: unknown command: set bogus");

  ::setenv("INIEDIT_RC", rc.c_str(), 1);
  CliOptions env;
  assert(env.default_rc_path() == rc);
  assert(env.load_rc(msg));
  assert(env.settings.quiet);

  CliOptions off;
  off.use_rc = false;
  assert(off.load_rc(msg));
  assert(!off.settings.quiet);
  assert(msg.empty());

  ::setenv("INIEDIT_RC", (dir / "absent").c_str(), 1);
  CliOptions quiet_missing;
  assert(quiet_missing.load_rc(msg));
  assert(msg.empty());

  CliOptions loud_missing;
  loud_missing.rc_path = dir / "absent";
  assert(!loud_missing.load_rc(msg));
  ::unsetenv("INIEDIT_RC");

  fs::remove_all(dir);
}

int main() {
  test_params();
  test_dest_home();
  test_backup_and_check_params();
  test_validate_names();
  test_flags_and_validate();
  test_rc_lines();
  test_rc_file();
  assert(CliOptions::usage().find("state=present|absent") != std::string::npos);
  assert(CliOptions::usage().find("backup=yes|no") != std::string::npos);
  return 0;
}

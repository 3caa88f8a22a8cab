#include "cli_options.hpp"
#include <sstream>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>
#include "config.hpp"
#include "file_reader.hpp"
#include "ini_line.hpp"

static bool parse_switch(const std::string& v, bool& out) {
  if (v == "on" || v == "1" || v == "true" || v == "yes") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false" || v == "no") { out = false; return true; }
  return false;
}

/* "set x" with no argument flips the switch, like the editor's :set commands */
static CommandRegistry::Handler switch_handler(const std::string& name, bool& target) {
  return [name, &target](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { target = !target; return true; }
    if (!parse_switch(args[0], target)) { msg = "set " + name + ": use set " + name + " on|off"; return false; }
    return true;
  };
}

/* "~" and "~/x" use $HOME, "~user/x" the password database; anything that
   can not be resolved stays as given */
static std::string expand_user(const std::string& p) {
  if (p.empty() || p[0] != '~') return p;
  size_t slash = p.find('/');
  std::string user = p.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
  std::string home;
  if (user.empty()) {
    if (const char* env = std::getenv("HOME"); env && *env) home = env;
    else if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) home = pw->pw_dir;
  } else if (const passwd* pw = ::getpwnam(user.c_str()); pw && pw->pw_dir) {
    home = pw->pw_dir;
  }
  if (home.empty()) return p;
  return slash == std::string::npos ? home : home + p.substr(slash);
}

CliOptions::CliOptions() {
  register_params();
  register_settings();
}

void CliOptions::register_params() {
  auto dest = [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty() || args[0].empty()) { msg = "dest: path must not be empty"; return false; }
    request.dest = expand_user(args[0]);
    dest_seen_ = true;
    return true;
  };
  params_.register_command("dest", dest);
  params_.register_command("path", dest);
  params_.register_command("section", [this](const std::vector<std::string>& args, std::string&) {
    if (args.empty() || args[0].empty()) request.section.reset();
    else request.section = args[0];
    return true;
  });
  params_.register_command("option", [this](const std::vector<std::string>& args, std::string&) {
    if (args.empty() || args[0].empty()) request.option.reset();
    else request.option = args[0];
    return true;
  });
  params_.register_command("value", [this](const std::vector<std::string>& args, std::string&) {
    request.value = args.empty() ? std::string() : args[0];
    return true;
  });
  params_.register_command("backup", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty() || !parse_switch(args[0], request.backup)) { msg = "backup: use backup=yes|no"; return false; }
    return true;
  });
  params_.register_command("check", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty() || !parse_switch(args[0], request.check)) { msg = "check: use check=yes|no"; return false; }
    return true;
  });
  params_.register_command("state", [this](const std::vector<std::string>& args, std::string& msg) {
    std::string v = args.empty() ? std::string() : args[0];
    if (v == "present") request.state = DesiredState::Present;
    else if (v == "absent") request.state = DesiredState::Absent;
    else { msg = "state: value must be one of: present, absent (got '" + v + "')"; return false; }
    return true;
  });
}

void CliOptions::register_settings() {
  settings_.register_command("set color", [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "set color: use set color auto|on|off"; return false; }
    const std::string& v = args[0];
    bool on = false;
    if (v == "auto") settings.color = ColorMode::Auto;
    else if (v == "always") settings.color = ColorMode::Always;
    else if (v == "never") settings.color = ColorMode::Never;
    else if (parse_switch(v, on)) settings.color = on ? ColorMode::Always : ColorMode::Never;
    else { msg = "set color: value must be auto|on|off"; return false; }
    return true;
  });
  settings_.register_command("set atomic", switch_handler("atomic", settings.atomic_write));
  settings_.register_command("set quiet", switch_handler("quiet", settings.quiet));
}

bool CliOptions::parse_args(int argc, char** argv, std::string& msg) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
  return parse_args(args, msg);
}

bool CliOptions::parse_args(const std::vector<std::string>& args, std::string& msg) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a == "-h" || a == "--help") { show_help = true; continue; }
    if (a == "--no-rc") { use_rc = false; continue; }
    if (a == "--check") { request.check = true; continue; }
    if (a == "--rc") {
      if (i + 1 >= args.size()) { msg = "--rc: missing path"; return false; }
      rc_path = std::filesystem::path(args[++i]);
      continue;
    }
    if (a.rfind("--rc=", 0) == 0) { rc_path = std::filesystem::path(a.substr(5)); continue; }
    size_t eq = a.find('=');
    if (eq == std::string::npos || eq == 0) { msg = "expected key=value, got: " + a; return false; }
    std::string key = a.substr(0, eq);
    if (!params_.contains(key)) { msg = "unsupported parameter: " + key; return false; }
    if (!params_.execute(key, {a.substr(eq + 1)}, msg)) return false;
  }
  return true;
}

bool CliOptions::execute_line(const std::string& line, std::string& msg) {
  std::string s(trim_line(line));
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string name = args[0];
    std::string value;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      value = name.substr(eq + 1);
      name = name.substr(0, eq);
    }
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    return settings_.execute("set " + name, subargs, msg);
  }
  return settings_.execute(cmd, args, msg);
}

std::optional<std::filesystem::path> CliOptions::default_rc_path() const {
  if (const char* env = std::getenv("INIEDIT_RC"); env && *env) return std::filesystem::path(env);
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / IE_RC_FILENAME;
}

bool CliOptions::load_rc(std::string& msg) {
  msg.clear();
  if (!use_rc) return true;
  bool explicit_path = rc_path.has_value();
  std::optional<std::filesystem::path> p = explicit_path ? rc_path : default_rc_path();
  if (!p) return true;
  std::error_code ec;
  if (!std::filesystem::exists(*p, ec)) {
    if (explicit_path || ec) { msg = "can not open rc file: " + p->string(); return false; }
    return true;
  }
  std::vector<std::string> lines;
  std::string rm;
  if (!mmap_read_raw_lines(*p, lines, rm)) { msg = rm; return false; }
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string lm;
    if (execute_line(lines[i], lm)) continue;
    if (!msg.empty()) msg += "\n";
    msg += p->string() + ":" + std::to_string(i + 1) + ": " + lm;
  }
  return true;
}

bool CliOptions::validate(std::string& msg) const {
  if (!dest_seen_) { msg = "missing required arguments: dest"; return false; }
  bool has_option = request.option && !request.option->empty();
  if (request.section && !request.section->empty() && !writable_section(*request.section)) {
    msg = "section: can not be written as a [section] header: " + *request.section;
    return false;
  }
  if (has_option && !writable_option(*request.option)) {
    msg = "option: can not be written as an option key: " + *request.option;
    return false;
  }
  if (request.value && !writable_value(*request.value)) {
    msg = "value: must be a single line";
    return false;
  }
  if (request.state == DesiredState::Present && has_option && !request.value) {
    msg = "value is required when state=present and option is set";
    return false;
  }
  return true;
}

std::string CliOptions::usage() {
  return
    "usage: iniedit [--rc PATH | --no-rc] [--check] [-h] dest=PATH [section=NAME]\n"
    "               [option=KEY] [value=VALUE] [state=present|absent]\n"
    "               [backup=yes|no] [check=yes|no]\n"
    "\n"
    "  state=present  set option=value in section (section is created if missing)\n"
    "  state=absent   remove option from section, or the whole section if no option\n"
    "  backup=yes     copy dest to dest.<timestamp>~ before changing it\n"
    "  check=yes      report what would change, write nothing (same as --check)\n"
    "\n"
    "rc file ($INIEDIT_RC or ~/" IE_RC_FILENAME "):\n"
    "  set color auto|on|off\n"
    "  set atomic on|off\n"
    "  set quiet on|off\n";
}

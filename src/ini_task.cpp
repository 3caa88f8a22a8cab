#include "ini_task.hpp"
#include <ctime>
#include <system_error>
#include <utility>

static std::string backup_stamp() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  ::localtime_r(&now, &tm);
  char buf[32];
  size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d@%H:%M:%S", &tm);
  return std::string(buf, n);
}

bool apply_request(IniEditor& ed, const EditRequest& req) {
  const bool has_option = req.option && !req.option->empty();
  const bool has_section = req.section && !req.section->empty();
  SectionName section = has_section ? req.section : std::nullopt;

  if (req.state == DesiredState::Present) {
    if (!has_option || !req.value) return false;
    if (ed.get_option(section, *req.option) == req.value) return false;
    return ed.set_option(section, *req.option, *req.value);
  }
  if (has_section && !has_option) return ed.delete_section(*section);
  if (has_option) return ed.delete_option(section, *req.option);
  return false;
}

bool backup_file(const std::filesystem::path& path, std::filesystem::path& backup, std::string& msg) {
  backup.clear();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) { msg = "backup failed: " + path.string() + ": " + ec.message(); return false; }
    return true;
  }
  const std::string base = path.string() + "." + backup_stamp();
  std::filesystem::path target = base + "~";
  // several backups within one second get a counter
  for (int n = 1; std::filesystem::exists(target, ec); ++n) target = base + "." + std::to_string(n) + "~";
  if (!std::filesystem::copy_file(path, target, std::filesystem::copy_options::none, ec)) {
    msg = "backup failed: " + target.string() + ": " + ec.message();
    return false;
  }
  backup = target;
  return true;
}

bool run_request(const EditRequest& req, WriteMode mode, bool& changed, std::string& msg) {
  changed = false;
  bool ok = true;
  IniEditor ed(LineStore::from_file(req.dest, msg, ok));
  if (!ok) return false;
  changed = apply_request(ed, req);
  if (!changed) {
    msg = "OK";
    return true;
  }
  if (req.check) {
    msg = "not saved (check mode)";
    return true;
  }
  std::filesystem::path backup;
  if (req.backup && !backup_file(req.dest, backup, msg)) return false;
  if (!ed.store().write_file(req.dest, msg, mode)) {
    msg = std::string("Can't create ") + req.dest.string() + ": " + msg;
    return false;
  }
  if (!backup.empty()) msg += " (backup: " + backup.string() + ")";
  return true;
}

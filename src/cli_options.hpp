#pragma once
/*
 * CliOptions
 *
 * Purpose: fill an EditRequest from "key=value" parameters and Settings from
 * the rc file. Both go through a CommandRegistry, so "section=x" on the
 * command line and "set quiet on" in the rc file share one dispatch path.
 * Usage: parse_args(argc, argv, msg); load_rc(msg); validate(msg).
 */
#include <optional>
#include <filesystem>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "ini_task.hpp"
#include "line_store.hpp"

enum class ColorMode { Auto, Always, Never };

struct Settings {
  ColorMode color = ColorMode::Auto;
  bool atomic_write = true;
  bool quiet = false;

  WriteMode write_mode() const { return atomic_write ? WriteMode::Atomic : WriteMode::InPlace; }
};

class CliOptions {
public:
  CliOptions();
  CliOptions(const CliOptions&) = delete;
  CliOptions& operator=(const CliOptions&) = delete;

  EditRequest request;
  Settings settings;
  std::optional<std::filesystem::path> rc_path;
  bool use_rc = true;
  bool show_help = false;

  bool parse_args(int argc, char** argv, std::string& msg);
  bool parse_args(const std::vector<std::string>& args, std::string& msg);
  /* false only when the rc file exists but can not be read; bad lines are
     reported in msg and skipped */
  bool load_rc(std::string& msg);
  bool execute_line(const std::string& line, std::string& msg);
  bool validate(std::string& msg) const;

  std::optional<std::filesystem::path> default_rc_path() const;
  static std::string usage();

private:
  void register_params();
  void register_settings();
  bool dest_seen_ = false;
  CommandRegistry params_;
  CommandRegistry settings_;
};

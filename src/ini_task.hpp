#pragma once
/*
 * IniTask
 *
 * Purpose: turn one desired-state request into at most one editor operation,
 * and save the file only when that operation changed the document.
 *   present + option + value  -> set_option, unless get_option already equals value
 *   absent  + section only    -> delete_section
 *   absent  + option          -> delete_option
 *   anything else             -> no change
 * check: report the change without saving. backup: copy an existing dest to
 * "<dest>.<YYYY-mm-dd@HH:MM:SS>~" before it is overwritten.
 */
#include <optional>
#include <string>
#include <filesystem>
#include "types.hpp"
#include "line_store.hpp"
#include "ini_editor.hpp"

struct EditRequest {
  std::filesystem::path dest;
  SectionName section;
  std::optional<std::string> option;
  std::optional<std::string> value;
  DesiredState state = DesiredState::Present;
  bool backup = false;
  bool check = false;
};

bool apply_request(IniEditor& ed, const EditRequest& req);

/* copies path beside itself; no copy and an empty backup when path is absent */
bool backup_file(const std::filesystem::path& path, std::filesystem::path& backup, std::string& msg);

bool run_request(const EditRequest& req, WriteMode mode, bool& changed, std::string& msg);

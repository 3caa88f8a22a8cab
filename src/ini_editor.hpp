#pragma once
/*
 * IniEditor
 *
 * Purpose: point queries and single targeted edits over a LineStore.
 * Lines the edit does not need to touch are kept byte for byte; a rewritten
 * option line always takes the canonical "<option> = <value>\n" form.
 * Note: set_option always writes; compare with get_option first if the
 * caller needs an accurate "changed" flag. It refuses (returns false) names
 * and values that would not read back as the same option, see ini_line.hpp.
 * An empty section name addresses the unnamed section, like no name at all.
 */
#include <optional>
#include <string>
#include <string_view>
#include "line_store.hpp"
#include "section_index.hpp"
#include "types.hpp"

class IniEditor {
public:
  IniEditor() = default;
  explicit IniEditor(LineStore store);

  const LineStore& store() const { return store_; }

  std::optional<std::string> get_option(const SectionName& section, std::string_view option) const;
  bool set_option(const SectionName& section, std::string_view option, std::string_view value);
  bool delete_option(const SectionName& section, std::string_view option);
  bool delete_section(std::string_view section);

private:
  static SectionName key_of(const SectionName& section);
  const SectionIndex& index() const;
  std::optional<size_t> find_option(const SectionName& section, std::string_view option) const;
  void insert_at(size_t row, std::string_view s);
  void append_section(std::string_view section, std::string_view option_line);
  void touched() { index_.invalidate(); }

  LineStore store_;
  mutable SectionIndex index_;
};

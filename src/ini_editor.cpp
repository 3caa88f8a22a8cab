#include "ini_editor.hpp"
#include <utility>

IniEditor::IniEditor(LineStore store) : store_(std::move(store)) {}

SectionName IniEditor::key_of(const SectionName& section) {
  if (section && section->empty()) return std::nullopt;
  return section;
}

const SectionIndex& IniEditor::index() const {
  if (!index_.valid()) index_.build(store_);
  return index_;
}

std::optional<size_t> IniEditor::find_option(const SectionName& section, std::string_view option) const {
  const SectionIndex& idx = index();
  for (const SectionSpan* span : idx.find_all(key_of(section))) {
    for (size_t r = span->begin; r < span->end; ++r) {
      const IniLine& l = idx.line(r);
      if (l.kind == LineKind::Option && l.name == option) return r;
    }
  }
  return std::nullopt;
}

std::optional<std::string> IniEditor::get_option(const SectionName& section, std::string_view option) const {
  auto row = find_option(section, option);
  if (!row) return std::nullopt;
  return index().line(*row).value;
}

void IniEditor::insert_at(size_t row, std::string_view s) {
  if (row >= store_.line_count()) {
    store_.ensure_terminated();
    row = store_.line_count();
  }
  store_.insert_line(row, s);
}

void IniEditor::append_section(std::string_view section, std::string_view option_line) {
  if (!store_.empty()) {
    store_.ensure_terminated();
    const std::string& last = store_.line(store_.line_count() - 1);
    if (classify_line(last).kind != LineKind::Blank) store_.insert_line(store_.line_count(), "\n");
  }
  store_.insert_line(store_.line_count(), format_section(section));
  store_.insert_line(store_.line_count(), option_line);
}

bool IniEditor::set_option(const SectionName& section, std::string_view option, std::string_view value) {
  const SectionName key = key_of(section);
  if (!writable_option(option) || !writable_value(value)) return false;
  if (key && !writable_section(*key)) return false;
  std::string text = format_option(option, value);
  const SectionIndex& idx = index();
  const SectionSpan* span = idx.find(key);
  if (!span) {
    // only a named section can be missing
    append_section(*key, text);
    touched();
    return true;
  }
  for (size_t r = span->begin; r < span->end; ++r) {
    const IniLine& l = idx.line(r);
    if (l.kind == LineKind::Option && l.name == option) {
      store_.replace_line(r, text);
      touched();
      return true;
    }
  }
  // end of the section: after its last header/comment/option line
  size_t row = span->last_entry ? *span->last_entry + 1 : span->begin;
  insert_at(row, text);
  touched();
  return true;
}

bool IniEditor::delete_option(const SectionName& section, std::string_view option) {
  auto row = find_option(section, option);
  if (!row) return false;
  store_.erase_line(*row);
  touched();
  return true;
}

bool IniEditor::delete_section(std::string_view section) {
  if (section.empty()) return false;
  const SectionSpan* span = index().find(std::string(section));
  if (!span) return false;
  size_t begin = span->begin;
  size_t end = span->end;
  store_.erase_lines(begin, end);
  touched();
  return true;
}

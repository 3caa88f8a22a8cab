#pragma once
/*
 * SectionIndex
 *
 * Purpose: per-line classification plus section spans, built in one pass.
 * Usage: IniEditor builds it on first query and drops it after any mutation.
 */
#include <vector>
#include <string>
#include <unordered_map>
#include <optional>
#include <cstddef>
#include "ini_line.hpp"
#include "line_store.hpp"
#include "types.hpp"

struct SectionSpan {
  SectionName name;                 /* nullopt for the leading span */
  size_t begin = 0;                 /* header row; 0 for the leading span */
  size_t end = 0;                   /* exclusive */
  std::optional<size_t> last_entry; /* header, or last comment/option row */
};

class SectionIndex {
public:
  void build(const LineStore& store);
  void invalidate();
  bool valid() const { return valid_; }

  const IniLine& line(size_t row) const { return lines_[row]; }
  size_t line_count() const { return lines_.size(); }
  const std::vector<SectionSpan>& spans() const { return spans_; }

  /* first span named `section`; the leading span for nullopt */
  const SectionSpan* find(const SectionName& section) const;
  /* every span named `section`, in document order */
  std::vector<const SectionSpan*> find_all(const SectionName& section) const;

private:
  bool valid_ = false;
  std::vector<IniLine> lines_;
  std::vector<SectionSpan> spans_;
  std::unordered_map<std::string, std::vector<size_t>> by_name_;
};

#pragma once
#include <vector>
#include <string>
#include <string_view>
#include <cstddef>

/*
 * LineGapBuffer
 *
 * Purpose: gap buffer whose elements are whole lines, so that repeated
 * edits around one spot (a section) do not shift the rest of the file.
 * Layout: slots [0, gap_start) and [gap_end, slots.size()) hold lines.
 */
class LineGapBuffer {
public:
  std::vector<std::string> slots;
  size_t gap_start = 0;
  size_t gap_end = 0;

  void clear();
  size_t length() const;
  void init_from_lines(std::vector<std::string>&& lines);
  void move_gap_to(size_t pos);
  void ensure_gap(size_t need);
  void insert_at(size_t pos, std::string_view line);
  void erase_range(size_t pos, size_t len);
  const std::string& at(size_t pos) const;
  std::string& at(size_t pos);
};

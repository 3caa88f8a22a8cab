#include "gap_line_store_core.hpp"
#include <algorithm>

void GapLineStoreCore::init_from_lines(std::vector<std::string>&& lines) {
  gb.clear();
  gb.init_from_lines(std::move(lines));
}

size_t GapLineStoreCore::line_count() const { return gb.length(); }

const std::string& GapLineStoreCore::get_line(size_t r) const {
  static const std::string empty;
  if (r >= gb.length()) return empty;
  return gb.at(r);
}

void GapLineStoreCore::insert_line(size_t row, std::string_view s) {
  gb.insert_at(std::min(row, gb.length()), s);
}

void GapLineStoreCore::insert_lines(size_t row, std::span<const std::string> ss) {
  if (ss.empty()) return;
  size_t pos = std::min(row, gb.length());
  gb.ensure_gap(ss.size());
  for (size_t i = 0; i < ss.size(); ++i) gb.insert_at(pos + i, ss[i]);
}

void GapLineStoreCore::erase_line(size_t row) {
  if (row >= gb.length()) return;
  gb.erase_range(row, 1);
}

void GapLineStoreCore::erase_lines(size_t start_row, size_t end_row) {
  if (end_row <= start_row) return;
  start_row = std::min(start_row, gb.length());
  end_row = std::min(end_row, gb.length());
  gb.erase_range(start_row, end_row - start_row);
}

void GapLineStoreCore::replace_line(size_t row, std::string_view s) {
  if (row >= gb.length()) return;
  gb.at(row).assign(s.data(), s.size());
}

#pragma once
#include <string>
#include <vector>
#include <string_view>
#include <span>
#include <algorithm>
#include "i_line_store_core.hpp"

class VectorLineStoreCore : public LineStoreCoreCRTP<VectorLineStoreCore> {
public:
  static constexpr std::string_view get_name_sv() { return "vector"; }

  void do_init_from_lines(std::vector<std::string>&& lines) { lines_ = std::move(lines); }
  size_t do_line_count() const { return lines_.size(); }
  const std::string& do_get_line(size_t r) const {
    static const std::string empty;
    if (r >= lines_.size()) return empty;
    return lines_[r];
  }

  void do_insert_line(size_t row, std::string_view s) {
    size_t pos = std::min(row, lines_.size());
    lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), std::string(s));
  }
  void do_insert_lines(size_t row, std::span<const std::string> ss) {
    size_t pos = std::min(row, lines_.size());
    lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), ss.begin(), ss.end());
  }
  void do_erase_line(size_t row) {
    if (row >= lines_.size()) return;
    lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(row));
  }
  void do_erase_lines(size_t start_row, size_t end_row) {
    if (end_row < start_row) end_row = start_row;
    start_row = std::min(start_row, lines_.size());
    end_row = std::min(end_row, lines_.size());
    lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(start_row),
                 lines_.begin() + static_cast<std::ptrdiff_t>(end_row));
  }
  void do_replace_line(size_t row, std::string_view s) {
    if (row >= lines_.size()) return;
    lines_[row].assign(s.data(), s.size());
  }
private:
  std::vector<std::string> lines_;
};

static_assert(LineStoreCoreConcept<VectorLineStoreCore>, "Vector backend must satisfy CRTP concept");

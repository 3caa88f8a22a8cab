#pragma once
#include <string>
#include <vector>
#include <string_view>
#include <span>
#include "i_line_store_core.hpp"
#include "line_gap_buffer.hpp"

/*
  this is the gap buffer backend
  it keeps the gap at the last edited row, so a set followed by more
  edits in the same section moves few lines
*/
class GapLineStoreCore : public LineStoreCoreCRTP<GapLineStoreCore> {
public:
  LineGapBuffer gb;
  static constexpr std::string_view get_name_sv() { return "gap"; }

  void init_from_lines(std::vector<std::string>&& lines);
  size_t line_count() const;
  const std::string& get_line(size_t r) const;

  void insert_line(size_t row, std::string_view s);
  void insert_lines(size_t row, std::span<const std::string> ss);
  void erase_line(size_t row);
  void erase_lines(size_t start_row, size_t end_row); // end_row exclusive
  void replace_line(size_t row, std::string_view s);

  /*forward to CRTP impl*/
  void do_init_from_lines(std::vector<std::string>&& lines) { init_from_lines(std::move(lines)); }
  size_t do_line_count() const { return line_count(); }
  const std::string& do_get_line(size_t r) const { return get_line(r); }
  void do_insert_line(size_t row, std::string_view s) { insert_line(row, s); }
  void do_insert_lines(size_t row, std::span<const std::string> ss) { insert_lines(row, ss); }
  void do_erase_line(size_t row) { erase_line(row); }
  void do_erase_lines(size_t start_row, size_t end_row) { erase_lines(start_row, end_row); }
  void do_replace_line(size_t row, std::string_view s) { replace_line(row, s); }
};

static_assert(LineStoreCoreConcept<GapLineStoreCore>, "Gap backend must satisfy CRTP concept");

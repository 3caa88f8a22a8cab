#pragma once
#include <string>
#include <vector>
#include <string_view>
#include <span>
#include <concepts>
#include <cstddef>

/*
 * LineStoreCore (CRTP)
 *
 * Purpose: static interface shared by the line storage backends.
 * Rows are raw lines, each carrying its own terminator (if any).
 */
template <typename Derived>
class LineStoreCoreCRTP {
public:
  std::string_view get_name() const { return as_const_derived().get_name_sv(); }
  void init_from_lines(std::vector<std::string>&& lines) { as_derived().do_init_from_lines(std::move(lines)); }
  size_t line_count() const { return as_const_derived().do_line_count(); }
  const std::string& get_line(size_t r) const { return as_const_derived().do_get_line(r); }
  /*insert*/
  void insert_line(size_t row, std::string_view s) { as_derived().do_insert_line(row, s); }
  void insert_lines(size_t row, std::span<const std::string> ss) { as_derived().do_insert_lines(row, ss); }
  /*erase*/
  void erase_line(size_t row) { as_derived().do_erase_line(row); }
  void erase_lines(size_t start_row, size_t end_row) { as_derived().do_erase_lines(start_row, end_row); }
  /*replace*/
  void replace_line(size_t row, std::string_view s) { as_derived().do_replace_line(row, s); }

private:
  Derived& as_derived() { return static_cast<Derived&>(*this); }
  const Derived& as_const_derived() const { return static_cast<const Derived&>(*this); }
};

template <typename T>
concept LineStoreCoreConcept = std::derived_from<T, LineStoreCoreCRTP<T>> &&
  requires(T& t, const T& ct, std::vector<std::string>&& lines, std::string_view sv,
           std::span<const std::string> ss, size_t row) {
    { T::get_name_sv() } -> std::convertible_to<std::string_view>;
    t.do_init_from_lines(std::move(lines));
    { ct.do_line_count() } -> std::same_as<size_t>;
    { ct.do_get_line(row) } -> std::same_as<const std::string&>;
    t.do_insert_line(row, sv);
    t.do_insert_lines(row, ss);
    t.do_erase_line(row);
    t.do_erase_lines(row, row);
    t.do_replace_line(row, sv);
  };

#pragma once
/*
 * LineStore
 *
 * Purpose: the edited document; an ordered sequence of raw lines plus file I/O.
 * Feature: safe writes (write temp → fdatasync → atomic rename), or a plain
 * truncate-and-rewrite when WriteMode::InPlace is asked for.
 * Note: lines keep their terminators, serialize() is a plain concatenation.
 */
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <filesystem>
#include "i_line_store_core.hpp"
#include "vector_line_store_core.hpp"
#include "gap_line_store_core.hpp"
#include "config.hpp"

enum class WriteMode { Atomic, InPlace };

template <typename Core>
class BasicLineStore {
public:
  static_assert(LineStoreCoreConcept<Core>, "Selected backend must satisfy CRTP concept");
  using CoreType = Core;
  CoreType core;

  std::string_view backend_name() const { return core.get_name(); }
  bool empty() const { return line_count() == 0; }
  size_t line_count() const { return core.line_count(); }
  const std::string& line(size_t r) const { return core.get_line(r); }

  void init_from_lines(std::vector<std::string>&& lines) { core.init_from_lines(std::move(lines)); }

  void insert_line(size_t row, std::string_view s) { core.insert_line(row, s); }
  void insert_lines(size_t row, std::span<const std::string> ss) { core.insert_lines(row, ss); }
  void erase_line(size_t row) { core.erase_line(row); }
  void erase_lines(size_t start_row, size_t end_row) { core.erase_lines(start_row, end_row); }
  void replace_line(size_t row, std::string_view s) { core.replace_line(row, s); }

  /*give the final line a "\n" if it has none*/
  void ensure_terminated();
  std::string serialize() const;

  static BasicLineStore from_text(std::string_view text);
  static BasicLineStore from_file(const std::filesystem::path& path, std::string& msg, bool& ok);
  bool write_file(const std::filesystem::path& path, std::string& msg,
                  WriteMode mode = WriteMode::Atomic) const;

private:
  bool write_all(int fd, const std::string& shown, std::string& msg) const;
};

extern template class BasicLineStore<VectorLineStoreCore>;
extern template class BasicLineStore<GapLineStoreCore>;

#if IE_BACKEND == IE_BACKEND_GAP
using LineStore = BasicLineStore<GapLineStoreCore>;
#else
using LineStore = BasicLineStore<VectorLineStoreCore>;
#endif

#include "line_gap_buffer.hpp"
#include <algorithm>
#include <utility>

static constexpr size_t MIN_GAP_LINES = 16;

void LineGapBuffer::clear() { slots.clear(); gap_start = gap_end = 0; }

size_t LineGapBuffer::length() const { return slots.size() - (gap_end - gap_start); }

void LineGapBuffer::init_from_lines(std::vector<std::string>&& lines) {
  slots = std::move(lines);
  gap_start = gap_end = slots.size();
}

void LineGapBuffer::ensure_gap(size_t need) {
  size_t avail = (gap_end - gap_start);
  if (avail >= need) return;
  size_t grow = std::max(need - avail, std::max(MIN_GAP_LINES, slots.size() / 2));
  size_t right = slots.size() - gap_end;
  std::vector<std::string> ns(slots.size() + grow);
  for (size_t i = 0; i < gap_start; ++i) ns[i] = std::move(slots[i]);
  size_t nge = gap_start + avail + grow;
  for (size_t i = 0; i < right; ++i) ns[nge + i] = std::move(slots[gap_end + i]);
  slots.swap(ns);
  gap_end = nge;
}

void LineGapBuffer::move_gap_to(size_t pos) {
  if (pos == gap_start) return;
  // no gap: the slots already sit where they belong
  if (gap_start == gap_end) { gap_start = gap_end = pos; return; }
  if (pos < gap_start) {
    size_t delta = gap_start - pos;
    for (size_t i = 0; i < delta; ++i) slots[gap_end - 1 - i] = std::move(slots[gap_start - 1 - i]);
    gap_start -= delta; gap_end -= delta;
  } else {
    size_t delta = pos - gap_start;
    for (size_t i = 0; i < delta; ++i) slots[gap_start + i] = std::move(slots[gap_end + i]);
    gap_start += delta; gap_end += delta;
  }
}

void LineGapBuffer::insert_at(size_t pos, std::string_view line) {
  pos = std::min(pos, length());
  ensure_gap(1);
  move_gap_to(pos);
  slots[gap_start].assign(line.data(), line.size());
  gap_start += 1;
}

void LineGapBuffer::erase_range(size_t pos, size_t len) {
  if (pos >= length()) return;
  len = std::min(len, length() - pos);
  move_gap_to(pos);
  for (size_t i = 0; i < len; ++i) slots[gap_end + i].clear();
  gap_end += len;
}

const std::string& LineGapBuffer::at(size_t pos) const {
  if (pos < gap_start) return slots[pos];
  return slots[pos + (gap_end - gap_start)];
}

std::string& LineGapBuffer::at(size_t pos) {
  if (pos < gap_start) return slots[pos];
  return slots[pos + (gap_end - gap_start)];
}

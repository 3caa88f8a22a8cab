#include "section_index.hpp"

void SectionIndex::build(const LineStore& store) {
  lines_.clear();
  spans_.clear();
  by_name_.clear();
  size_t n = store.line_count();
  lines_.reserve(n);
  spans_.push_back(SectionSpan{});
  for (size_t r = 0; r < n; ++r) {
    lines_.push_back(classify_line(store.line(r)));
    const IniLine& l = lines_.back();
    switch (l.kind) {
      case LineKind::Section: {
        spans_.back().end = r;
        SectionSpan s;
        s.name = l.name;
        s.begin = r;
        s.end = r;
        s.last_entry = r;
        by_name_[l.name].push_back(spans_.size());
        spans_.push_back(std::move(s));
      } break;
      case LineKind::Comment:
      case LineKind::Option:
        spans_.back().last_entry = r;
        break;
      case LineKind::Blank:
      case LineKind::Other:
        break;
    }
  }
  spans_.back().end = n;
  valid_ = true;
}

void SectionIndex::invalidate() {
  valid_ = false;
  lines_.clear();
  spans_.clear();
  by_name_.clear();
}

const SectionSpan* SectionIndex::find(const SectionName& section) const {
  if (spans_.empty()) return nullptr;
  if (!section) return &spans_.front();
  auto it = by_name_.find(*section);
  if (it == by_name_.end()) return nullptr;
  return &spans_[it->second.front()];
}

std::vector<const SectionSpan*> SectionIndex::find_all(const SectionName& section) const {
  std::vector<const SectionSpan*> out;
  if (spans_.empty()) return out;
  if (!section) { out.push_back(&spans_.front()); return out; }
  auto it = by_name_.find(*section);
  if (it == by_name_.end()) return out;
  out.reserve(it->second.size());
  for (size_t idx : it->second) out.push_back(&spans_[idx]);
  return out;
}

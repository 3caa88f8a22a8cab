#include "terminal.hpp"
#include <unistd.h>
#include <curses.h>
#include <term.h>

static std::string cap_string(const char* name) {
  char* s = tigetstr(name);
  if (s == nullptr || s == reinterpret_cast<char*>(-1)) return std::string();
  return std::string(s);
}

Terminal::Terminal(int fd, ColorMode mode) {
  if (mode == ColorMode::Never) return;
  if (mode == ColorMode::Auto && !::isatty(fd)) return;
  int err = 0;
  if (setupterm(nullptr, fd, &err) != OK) return;
  loaded_ = true;
  if (tigetnum("colors") < 8) return;
  std::string setaf = cap_string("setaf");
  reset_ = cap_string("sgr0");
  if (setaf.empty() || reset_.empty()) return;
  auto fg = [&setaf](int color) {
    const char* s = tiparm(setaf.c_str(), color);
    return s ? std::string(s) : std::string();
  };
  ok_ = fg(COLOR_GREEN);
  changed_ = fg(COLOR_YELLOW);
  failed_ = fg(COLOR_RED);
  colors_ = !ok_.empty() && !changed_.empty() && !failed_.empty();
}

Terminal::~Terminal() {
  if (loaded_) del_curterm(cur_term);
}

std::string Terminal::paint(const std::string& text, Tone kind) const {
  if (!colors_) return text;
  const std::string* on = &ok_;
  if (kind == Tone::Changed) on = &changed_;
  else if (kind == Tone::Failed) on = &failed_;
  return *on + text + reset_;
}

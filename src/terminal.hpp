#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around the terminfo setup for one output descriptor.
 * Usage: construct in main; paint() wraps text in the terminal's own
 * setaf/sgr0 sequences, or returns it unchanged when colors are off.
 * Note: curses/term.h stay inside terminal.cpp, their macros clash with
 * ordinary identifiers.
 */
#include <string>
#include "cli_options.hpp"

enum class Tone { Ok, Changed, Failed };

class Terminal {
public:
  Terminal(int fd, ColorMode mode);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  std::string paint(const std::string& text, Tone tone) const;

private:
  bool loaded_ = false;
  bool colors_ = false;
  std::string ok_;
  std::string changed_;
  std::string failed_;
  std::string reset_;
};

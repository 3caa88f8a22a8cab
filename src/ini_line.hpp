#pragma once
/*
 * IniLine
 *
 * Purpose: classify one raw line and render canonical lines.
 * Order: blank, comment (# or ;), option (key = value), section ([name]), other.
 * Matching runs on the whitespace-trimmed line; anything after "]" on a
 * header line is ignored, an option value runs to the end of the trimmed line.
 */
#include <string>
#include <string_view>

enum class LineKind { Blank, Comment, Option, Section, Other };

struct IniLine {
  LineKind kind = LineKind::Other;
  std::string name;   /* option key or section name */
  std::string value;  /* option value, empty otherwise */
};

std::string_view trim_line(std::string_view raw);
IniLine classify_line(std::string_view raw);

std::string format_option(std::string_view option, std::string_view value);
std::string format_section(std::string_view section);

/* true when the rendered line classifies back to the same option or section,
   so a later lookup finds it; a value must stay on one line */
bool writable_option(std::string_view option);
bool writable_section(std::string_view section);
bool writable_value(std::string_view value);

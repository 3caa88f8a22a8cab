#pragma once
/*
 * FileReader
 *
 * Purpose: read a whole file via mmap and split it into raw lines.
 * Lines keep their terminators ("\n" or "\r\n") so that joining them
 * reproduces the file byte for byte.
 * Usage: mmap_read_raw_lines(path, out_lines, msg); returns false with msg on failure.
 */
#include <vector>
#include <string>
#include <string_view>
#include <filesystem>

void split_raw_lines(std::string_view text, std::vector<std::string>& out_lines);

bool mmap_read_raw_lines(const std::filesystem::path& path,
                         std::vector<std::string>& out_lines,
                         std::string& msg);

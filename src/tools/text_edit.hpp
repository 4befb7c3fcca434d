#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace memvault::tools::text {

// Splits after every '\n', keeping terminators. A trailing fragment without
// a terminator is its own line; "" has zero lines.
std::vector<std::string> split_lines(const std::string& content);

std::string strip_line_ending(const std::string& line);

// "\r\n" if the first terminator in content is CRLF, "\n" otherwise.
std::string detect_line_ending(const std::string& content);

// Counts (possibly overlapping) occurrences of needle, stopping at limit.
std::size_t count_occurrences(const std::string& haystack, const std::string& needle,
                              std::size_t limit = 2);

// "<n>\t<line>" rows for the 1-based inclusive range [first, last].
std::string render_numbered(const std::vector<std::string>& lines, std::size_t first,
                            std::size_t last);

// Splices text in before line `index` (0-based). Caller checks index <= line count.
std::string insert_at_line(const std::string& content, std::size_t index,
                           const std::string& text);

}  // namespace memvault::tools::text

#pragma once

#include <string>
#include <vector>

namespace worktime {

// Terminal column count of a UTF-8 string (wcwidth per code point; invalid
// bytes count as one column).
int display_width_utf8(const std::string& text);

std::string truncate_utf8_by_width(const std::string& text, int max_width);
std::string pad_right_display(const std::string& text, int width);

std::string trimmed(const std::string& s);

// Single spaces between words, no leading/trailing blanks.
std::string collapse_spaces(const std::string& s);

// Greedy word wrap to `width` columns. Words wider than a line are split.
// An empty input yields one empty line.
std::vector<std::string> wrap_words(const std::string& text, int width);

// Removes the last UTF-8 code point; no-op on an empty string.
void pop_utf8_char(std::string& s);

} // namespace worktime

#pragma once
/*
 * Text utilities
 *
 * Purpose: UTF-8 helpers the screen code needs without depending on the
 * process locale (display width of CJK text, wrapping, case-folding).
 */
#include <string>
#include <vector>

// Terminal columns taken by a UTF-8 string (CJK/fullwidth = 2, combining = 0).
int display_width(const std::string& s);
// Longest prefix of `s` that fits in `cols` columns.
std::string clip_to_width(const std::string& s, int cols);
// Removes the last UTF-8 code point; no-op on empty strings.
void pop_utf8(std::string& s);
// Number of code points.
size_t utf8_length(const std::string& s);
std::vector<std::string> utf8_chars(const std::string& s);

// Word-wraps one paragraph at spaces; words wider than `cols` are split.
std::vector<std::string> wrap_text(const std::string& text, int cols);
// Splits on '\n' (dropping '\r') and wraps each line.
std::vector<std::string> wrap_lines(const std::string& text, int cols);

std::string trim(const std::string& s);
std::string ascii_lower(std::string s);

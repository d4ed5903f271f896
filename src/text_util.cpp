#include "text_util.hpp"
#include <cctype>
#include <cstdint>

static size_t utf8_seq_len(unsigned char c) {
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1; // stray continuation byte: treat as one column
}

static std::uint32_t decode_at(const std::string& s, size_t i, size_t& len) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  len = utf8_seq_len(c);
  if (i + len > s.size()) { len = 1; return c; }
  if (len == 1) return c;
  std::uint32_t cp = c & (0x7F >> len);
  for (size_t k = 1; k < len; ++k) cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
  return cp;
}

static int codepoint_width(std::uint32_t cp) {
  if (cp == 0) return 0;
  if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) return 0;
  if ((cp >= 0x0300 && cp <= 0x036F) || (cp >= 0x200B && cp <= 0x200F) || (cp >= 0xFE00 && cp <= 0xFE0F)) return 0;
  if ((cp >= 0x1100 && cp <= 0x115F) ||
      (cp >= 0x2E80 && cp <= 0xA4CF && cp != 0x303F) ||
      (cp >= 0xAC00 && cp <= 0xD7A3) ||
      (cp >= 0xF900 && cp <= 0xFAFF) ||
      (cp >= 0xFE30 && cp <= 0xFE4F) ||
      (cp >= 0xFF00 && cp <= 0xFF60) ||
      (cp >= 0xFFE0 && cp <= 0xFFE6) ||
      (cp >= 0x1F300 && cp <= 0x1F64F) ||
      (cp >= 0x1F900 && cp <= 0x1F9FF) ||
      (cp >= 0x20000 && cp <= 0x3FFFD)) return 2;
  return 1;
}

int display_width(const std::string& s) {
  int w = 0;
  for (size_t i = 0; i < s.size();) {
    size_t len = 1;
    w += codepoint_width(decode_at(s, i, len));
    i += len;
  }
  return w;
}

std::string clip_to_width(const std::string& s, int cols) {
  if (cols <= 0) return std::string();
  int w = 0;
  size_t i = 0;
  while (i < s.size()) {
    size_t len = 1;
    int cw = codepoint_width(decode_at(s, i, len));
    if (w + cw > cols) break;
    w += cw;
    i += len;
  }
  return s.substr(0, i);
}

void pop_utf8(std::string& s) {
  if (s.empty()) return;
  size_t i = s.size() - 1;
  while (i > 0 && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) --i;
  s.erase(i);
}

size_t utf8_length(const std::string& s) {
  return utf8_chars(s).size();
}

std::vector<std::string> utf8_chars(const std::string& s) {
  std::vector<std::string> out;
  for (size_t i = 0; i < s.size();) {
    size_t len = 1;
    decode_at(s, i, len);
    out.push_back(s.substr(i, len));
    i += len;
  }
  return out;
}

std::vector<std::string> wrap_text(const std::string& text, int cols) {
  std::vector<std::string> lines;
  if (cols <= 0) { lines.push_back(text); return lines; }
  if (display_width(text) <= cols) { lines.push_back(text); return lines; }
  std::string cur;
  int cur_w = 0;
  auto flush = [&]() { lines.push_back(cur); cur.clear(); cur_w = 0; };
  size_t i = 0;
  while (i < text.size()) {
    size_t j = text.find(' ', i);
    if (j == std::string::npos) j = text.size();
    std::string word = text.substr(i, j - i);
    int ww = display_width(word);
    if (cur_w > 0 && cur_w + 1 + ww > cols) flush();
    if (ww > cols) {
      // hard split of an over-long word (CJK sentences have no spaces)
      for (const auto& ch : utf8_chars(word)) {
        int cw = display_width(ch);
        if (cur_w + cw > cols) flush();
        cur += ch;
        cur_w += cw;
      }
    } else {
      if (cur_w > 0) { cur += ' '; cur_w++; }
      cur += word;
      cur_w += ww;
    }
    i = j + 1;
  }
  if (!cur.empty() || lines.empty()) flush();
  return lines;
}

std::vector<std::string> wrap_lines(const std::string& text, int cols) {
  std::vector<std::string> out;
  size_t st = 0;
  while (st <= text.size()) {
    size_t pos = text.find('\n', st);
    std::string line = text.substr(st, pos == std::string::npos ? std::string::npos : pos - st);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    auto w = wrap_text(line, cols);
    out.insert(out.end(), w.begin(), w.end());
    if (pos == std::string::npos) break;
    st = pos + 1;
  }
  while (!out.empty() && out.back().empty()) out.pop_back();
  return out;
}

std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

std::string ascii_lower(std::string s) {
  for (char& c : s) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u < 0x80) c = static_cast<char>(std::tolower(u));
  }
  return s;
}

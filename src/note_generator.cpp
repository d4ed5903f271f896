#include "note_generator.hpp"

const char* generation_error_name(GenerationError e) {
  switch (e) {
    case GenerationError::None: return "None";
    case GenerationError::Timeout: return "Timeout";
    case GenerationError::AuthFailure: return "AuthFailure";
    case GenerationError::NetworkFailure: return "NetworkFailure";
    case GenerationError::ProviderError: return "ProviderError";
  }
  return "ProviderError";
}

const char* search_mode_name(SearchMode m) {
  switch (m) {
    case SearchMode::Auto: return "auto";
    case SearchMode::Provider: return "provider";
    case SearchMode::Offline: return "offline";
  }
  return "auto";
}

bool parse_search_mode(const std::string& s, SearchMode& out) {
  if (s == "auto") { out = SearchMode::Auto; return true; }
  if (s == "provider" || s == "tavily") { out = SearchMode::Provider; return true; }
  if (s == "offline" || s == "off") { out = SearchMode::Offline; return true; }
  return false;
}

std::string describe_failure(const Generation& g) {
  std::string s = generation_error_name(g.error);
  if (!g.detail.empty()) s += ": " + g.detail;
  return s;
}

std::string strip_markdown_headings(const std::string& md) {
  std::string out;
  out.reserve(md.size());
  bool line_start = true;
  size_t i = 0;
  while (i < md.size()) {
    if (line_start) {
      size_t j = i;
      while (j < md.size() && j - i < 6 && md[j] == '#') ++j;
      if (j > i) {
        while (j < md.size() && (md[j] == ' ' || md[j] == '\t')) ++j;
        i = j;
      }
      line_start = false;
      continue;
    }
    char c = md[i++];
    out.push_back(c);
    if (c == '\n') line_start = true;
  }
  return out;
}

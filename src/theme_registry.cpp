#include "theme_registry.hpp"
#include <stdexcept>

// slot order: title, word, meaning, warn, phonetic, body
std::vector<Theme> ThemeRegistry::builtin() {
  using C = Color;
  return {
    {"classic", {C::Cyan,    C::Yellow,  C::Green,  C::Red,     C::Magenta, C::White},   C::Default},
    {"ocean",   {C::Blue,    C::Cyan,    C::White,  C::Magenta, C::Green,   C::Default}, C::Default},
    {"forest",  {C::Green,   C::Yellow,  C::Green,  C::Red,     C::Cyan,    C::Default}, C::Default},
    {"sunset",  {C::Magenta, C::Red,     C::Yellow, C::Red,     C::Cyan,    C::White},   C::Default},
    {"mono",    {C::Default, C::Default, C::Default, C::Default, C::Default, C::Default}, C::Default},
  };
}

ThemeRegistry::ThemeRegistry() : ThemeRegistry(builtin()) {}

ThemeRegistry::ThemeRegistry(std::vector<Theme> themes) : themes_(std::move(themes)) {
  if (themes_.empty()) throw std::invalid_argument("ThemeRegistry: theme list must not be empty");
}

const Theme& ThemeRegistry::cycle() {
  current_ = (current_ + 1) % themes_.size();
  return themes_[current_];
}

bool ThemeRegistry::select(const std::string& name) {
  for (size_t i = 0; i < themes_.size(); ++i) {
    if (themes_[i].name == name) { current_ = i; return true; }
  }
  return false;
}

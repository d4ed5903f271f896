#pragma once
/*
 * ThemeRegistry
 *
 * Purpose: fixed ordered list of named themes mapping semantic slots to
 * colors, plus the index of the active one.
 * Note: switching is a plain index change; nothing else observes it.
 */
#include <array>
#include <string>
#include <vector>

enum class Slot { Title = 0, Word, Meaning, Warn, Phonetic, Body };
constexpr int kSlotCount = 6;

enum class Color { Default, Black, Red, Green, Yellow, Blue, Magenta, Cyan, White };

struct Theme {
  std::string name;
  std::array<Color, kSlotCount> fg{};
  Color bg = Color::Default;
  Color fg_of(Slot s) const { return fg[static_cast<int>(s)]; }
};

class ThemeRegistry {
public:
  ThemeRegistry();
  explicit ThemeRegistry(std::vector<Theme> themes);

  const Theme& current() const { return themes_[current_]; }
  size_t current_index() const { return current_; }
  size_t size() const { return themes_.size(); }
  const std::vector<Theme>& themes() const { return themes_; }
  const Theme& cycle();
  bool select(const std::string& name);

  static std::vector<Theme> builtin();

private:
  std::vector<Theme> themes_;
  size_t current_ = 0;
};

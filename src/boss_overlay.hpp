#pragma once
/*
 * BossOverlay
 *
 * Purpose: generate disguise-screen text (tail -f log / ls -la listing).
 * Constraint: pure functions of (style, tick, clock, rng state); no access to
 * the word table or the session.
 */
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

enum class BossStyle { TailLog, LsDirectory };

struct BossLine {
  enum class Tone { Plain, Info, Debug, Warn, Dir, Exec };
  std::string text;
  Tone tone = Tone::Plain;
};

bool boss_parse_style(const std::string& s, BossStyle& out);
const char* boss_style_name(BossStyle s);

// Title line shown above the generated lines.
std::string boss_title(BossStyle style);
// Screen shown right after the boss key; `count` is the tail backlog size.
std::vector<BossLine> boss_initial_lines(BossStyle style, std::time_t now, int count, std::uint64_t& rng);
// One new line per timer tick.
BossLine boss_next_line(BossStyle style, unsigned tick, std::time_t now, std::uint64_t& rng);

std::string format_log_stamp(std::time_t t);
std::string format_ls_stamp(std::time_t t);

#pragma once
/*
 * xorshift64 helpers. State lives with the caller so shuffles and the boss
 * screen stay reproducible under a fixed seed.
 */
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

inline std::uint64_t advance_rng(std::uint64_t& state) {
  if (state == 0) {
    state = 0x2545F4914F6CDD1DULL;
  }
  std::uint64_t x = state;
  x ^= x << 13;
  x ^= x >> 7;
  x ^= x << 17;
  state = x;
  return x;
}

inline int rand_int(std::uint64_t& state, int min, int max) {
  if (max < min) {
    throw std::invalid_argument("rand_int: invalid interval [" + std::to_string(min) + "," +
                                std::to_string(max) + "]");
  }
  auto span = static_cast<std::uint64_t>(max - min + 1);
  return min + static_cast<int>(advance_rng(state) % span);
}

template <typename T>
void shuffle_in_place(std::vector<T>& v, std::uint64_t& state) {
  for (int i = static_cast<int>(v.size()) - 1; i > 0; --i) {
    int j = rand_int(state, 0, i);
    if (j != i) std::swap(v[i], v[j]);
  }
}

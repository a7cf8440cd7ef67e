#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace bpp {

class XorShift64 {
private:
  uint64_t state;

public:
  // zero is a fixed point of xorshift
  explicit XorShift64(uint64_t s) : state(s == 0 ? 0x9E3779B97F4A7C15ULL : s) {}

  uint64_t next() {
    uint64_t x = state;
    x ^= x << 13;
    x ^= x >> 7;
    x ^= x << 17;
    state = x == 0 ? 0xD1B54A32D192ED03ULL : x;
    return state;
  }

  // 53 bit precision in [0,1)
  double nextDouble() {
    return static_cast<double>(next() >> 11) * (1.0 / 9007199254740992.0);
  }

  std::size_t nextBelow(std::size_t upperExclusive) {
    if (upperExclusive == 0)
      return 0;
    return static_cast<std::size_t>(next() % upperExclusive);
  }

  uint32_t nextInRange(uint32_t low, uint32_t highInclusive) {
    uint64_t span = static_cast<uint64_t>(highInclusive - low) + 1;
    return low + static_cast<uint32_t>(next() % span);
  }

  template <typename T> void shuffle(std::vector<T> &values) {
    for (std::size_t i = values.size(); i > 1; --i) {
      std::size_t j = nextBelow(i);
      std::swap(values[i - 1], values[j]);
    }
  }
};

} // namespace bpp

#pragma once
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace bpp {

struct TabuParams {
  uint32_t neighborhoodSamples = 200;
  std::size_t tabuTenure = 25;
  // iterations without a new best before the order gets reshuffled
  uint32_t stagnationLimit = 600;
};

/**
 * @brief the search stops at whichever limit is hit first, timeLimit is
 * measured on a steady clock
 */
struct SearchBudget {
  uint32_t maxIterations = 5000;
  std::optional<std::chrono::duration<double>> timeLimit;
};

struct TabuConfig {
  TabuParams params;
  SearchBudget budget;
};

enum class TabuPreset { Default, Example, Trace };

inline TabuConfig getTabuConfig(TabuPreset preset) {
  switch (preset) {
  case TabuPreset::Default:
    return {{200, 25, 600}, {5000, std::nullopt}};
  case TabuPreset::Example:
    return {{150, 20, 400}, {2000, std::nullopt}};
  case TabuPreset::Trace:
    return {{25, 10, 10000}, {30, std::nullopt}};
  }
  throw std::invalid_argument("Invalid TabuPreset: " +
                              std::to_string(static_cast<int>(preset)));
}

// non positive seconds disable the limit, nan and inf are rejected
inline std::optional<std::chrono::duration<double>>
timeLimitFromSeconds(double seconds) {
  if (!std::isfinite(seconds))
    throw std::invalid_argument("time limit must be a finite number of "
                                "seconds, got " +
                                std::to_string(seconds));
  if (seconds <= 0.0)
    return std::nullopt;
  return std::chrono::duration<double>(seconds);
}

} // namespace bpp

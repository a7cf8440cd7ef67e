#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bpp {

/**
 * @brief describe what the search should print (might be extended)
 */
struct Logging {
  bool logIterations = false;
  bool logCandidates = false;
  bool logPackings = false;
  bool logBound = false;
};

struct Instance {
  std::string name;
  int capacity = 0;
  std::vector<int> sizes;
  // only set if the dataset ships a reference value
  std::optional<int> knownOptimalBins;
};

/**
 * @brief bins hold indices into Instance::sizes, loads[i] is the sum of
 * bins[i]
 */
struct Packing {
  int capacity = 0;
  std::vector<std::vector<int>> bins;
  std::vector<int> loads;

  std::size_t numBins() const { return bins.size(); }
};

struct RunResult {
  int objective = 0;
  std::chrono::duration<double> elapsed{0};
  std::uint32_t iterations = 0;
  std::uint64_t seed = 0;
  bool failed = false;
  std::string error;
};

} // namespace bpp

#pragma once

#include "bpp/Structs/structCollection.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace bpp {

/**
 * @brief depth first branch and bound for the minimal number of bins, only
 * meant for small instances
 */
class ExactBinPacking {
public:
  ExactBinPacking() = default;

  /**
   * @brief throws InfeasibleItemError if an item is larger than the capacity
   */
  int solve(const Instance &instance);

  uint64_t visitedNodes = 0;

private:
  int capacity = 0;
  std::vector<int> sizes;
  std::vector<int> loads;
  // suffix sums of sizes, used for the remaining-volume bound
  std::vector<int64_t> remainingSize;
  int best = 0;
  int lowerBound = 0;
  bool foundOptimal = false;

  void solvePartial(std::size_t item);
};

int exactMinBins(const Instance &instance);

std::optional<int> exactBinsIfSmall(const Instance &instance,
                                    std::size_t maxItems);

} // namespace bpp

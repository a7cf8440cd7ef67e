#include "bpp/Packing/exactBins.hpp"
#include "bpp/Packing/packing.hpp"
#include "bpp/Structs/errors.hpp"
#include <algorithm>
#include <functional>
#include <string>

namespace bpp {

int ExactBinPacking::solve(const Instance &instance) {
  capacity = instance.capacity;
  sizes = instance.sizes;
  visitedNodes = 0;
  foundOptimal = false;
  for (int size : sizes) {
    if (size > capacity)
      throw InfeasibleItemError("item of size " + std::to_string(size) +
                                " exceeds capacity " +
                                std::to_string(capacity));
  }
  if (sizes.empty())
    return 0;

  std::sort(sizes.begin(), sizes.end(), std::greater<int>());
  remainingSize.assign(sizes.size() + 1, 0);
  for (std::size_t i = sizes.size(); i > 0; --i)
    remainingSize[i - 1] = remainingSize[i] + sizes[i - 1];

  // best fit decreasing is the initial upper bound
  best = static_cast<int>(greedyBaseline(instance).numBins());
  lowerBound = lowerBoundBins(instance);
  if (best == lowerBound)
    return best;

  loads.clear();
  solvePartial(0);
  return best;
}

void ExactBinPacking::solvePartial(std::size_t item) {
  if (foundOptimal)
    return;
  visitedNodes++;
  const int used = static_cast<int>(loads.size());
  if (item == sizes.size()) {
    if (used < best) {
      best = used;
      foundOptimal = best == lowerBound;
    }
    return;
  }
  if (used >= best)
    return;

  // the free space of the open bins plus new bins has to hold the rest
  int64_t freeSpace = 0;
  for (int load : loads)
    freeSpace += capacity - load;
  const int64_t overflow = remainingSize[item] - freeSpace;
  if (overflow > 0 &&
      used + static_cast<int>((overflow + capacity - 1) / capacity) >= best)
    return;

  const int size = sizes[item];
  std::vector<int> tried;
  for (std::size_t b = 0; b < loads.size(); b++) {
    // bins with equal load are symmetric, loads[b] + size may exceed INT_MAX
    if (size > capacity - loads[b] ||
        std::find(tried.begin(), tried.end(), loads[b]) != tried.end())
      continue;
    tried.push_back(loads[b]);
    loads[b] += size;
    solvePartial(item + 1);
    loads[b] -= size;
    if (foundOptimal)
      return;
  }

  loads.push_back(size);
  solvePartial(item + 1);
  loads.pop_back();
}

int exactMinBins(const Instance &instance) {
  ExactBinPacking solver;
  return solver.solve(instance);
}

std::optional<int> exactBinsIfSmall(const Instance &instance,
                                    std::size_t maxItems) {
  if (instance.sizes.size() > maxItems)
    return std::nullopt;
  return exactMinBins(instance);
}

} // namespace bpp

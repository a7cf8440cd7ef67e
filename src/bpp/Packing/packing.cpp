#include "bpp/Packing/packing.hpp"
#include "bpp/Structs/errors.hpp"
#include <algorithm>
#include <iomanip>
#include <numeric>
#include <string>
#include <utility>

namespace bpp {

int64_t totalSize(const Instance &instance) {
  return std::accumulate(instance.sizes.begin(), instance.sizes.end(),
                         int64_t{0});
}

int lowerBoundBins(const Instance &instance) {
  if (instance.capacity <= 0 || instance.sizes.empty())
    return 0;
  const int64_t capacity = instance.capacity;
  return static_cast<int>((totalSize(instance) + capacity - 1) / capacity);
}

Packing bestFitPack(const Instance &instance, const std::vector<int> &order) {
  Packing packing;
  packing.capacity = instance.capacity;

  for (int item : order) {
    const int size = instance.sizes[item];
    int bestBin = -1;
    int bestRemaining = 0;
    for (std::size_t b = 0; b < packing.loads.size(); b++) {
      const int remaining = instance.capacity - packing.loads[b];
      if (size <= remaining &&
          (bestBin < 0 || remaining - size < bestRemaining)) {
        bestRemaining = remaining - size;
        bestBin = static_cast<int>(b);
      }
    }
    if (bestBin < 0) {
      packing.bins.push_back({item});
      packing.loads.push_back(size);
    } else {
      packing.bins[bestBin].push_back(item);
      packing.loads[bestBin] += size;
    }
  }
  return packing;
}

Packing reduceBins(const Instance &instance, const Packing &packing) {
  Packing reduced = packing;
  bool changed = true;
  while (changed) {
    changed = false;
    std::vector<std::size_t> byLoad(reduced.numBins());
    std::iota(byLoad.begin(), byLoad.end(), 0);
    std::stable_sort(byLoad.begin(), byLoad.end(),
                     [&](std::size_t a, std::size_t b) {
                       return reduced.loads[a] < reduced.loads[b];
                     });

    for (std::size_t source : byLoad) {
      std::vector<int> items = reduced.bins[source];
      std::stable_sort(items.begin(), items.end(), [&](int a, int b) {
        return instance.sizes[a] > instance.sizes[b];
      });

      // tentative loads, only committed if every item found a bin
      std::vector<int> loads = reduced.loads;
      std::vector<std::pair<int, std::size_t>> placements;
      bool feasible = true;
      for (int item : items) {
        const int size = instance.sizes[item];
        std::size_t target = reduced.numBins();
        int bestAfter = 0;
        for (std::size_t b = 0; b < loads.size(); b++) {
          if (b == source)
            continue;
          const int remaining = instance.capacity - loads[b];
          if (size <= remaining &&
              (target == reduced.numBins() || remaining - size < bestAfter)) {
            bestAfter = remaining - size;
            target = b;
          }
        }
        if (target == reduced.numBins()) {
          feasible = false;
          break;
        }
        loads[target] += size;
        placements.emplace_back(item, target);
      }
      if (!feasible)
        continue;

      for (const auto &[item, target] : placements)
        reduced.bins[target].push_back(item);
      reduced.loads = std::move(loads);
      reduced.bins.erase(reduced.bins.begin() + source);
      reduced.loads.erase(reduced.loads.begin() + source);
      changed = true;
      break;
    }
  }
  return reduced;
}

Packing greedyBaseline(const Instance &instance) {
  std::vector<int> order(instance.sizes.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
    return instance.sizes[a] > instance.sizes[b];
  });
  return bestFitPack(instance, order);
}

double fillScore(const Packing &packing) {
  if (packing.capacity <= 0)
    return 0.0;
  // loads relative to the capacity, squares of scaled loads overflow int64_t
  const double capacity = packing.capacity;
  double score = 0.0;
  for (int load : packing.loads) {
    const double fill = load / capacity;
    score += fill * fill;
  }
  return score;
}

void validatePacking(const Instance &instance, const Packing &packing) {
  if (packing.capacity != instance.capacity)
    throw EngineInvariantError("capacity mismatch: packing has " +
                               std::to_string(packing.capacity) +
                               ", instance has " +
                               std::to_string(instance.capacity));
  if (packing.bins.size() != packing.loads.size())
    throw EngineInvariantError("bins/loads length mismatch");

  std::vector<bool> seen(instance.sizes.size(), false);
  for (std::size_t b = 0; b < packing.bins.size(); b++) {
    int64_t computed = 0;
    for (int item : packing.bins[b]) {
      if (item < 0 || static_cast<std::size_t>(item) >= seen.size())
        throw EngineInvariantError("invalid item id " + std::to_string(item));
      if (seen[item])
        throw EngineInvariantError("item " + std::to_string(item) +
                                   " appears more than once");
      seen[item] = true;
      computed += instance.sizes[item];
    }
    if (packing.bins[b].empty())
      throw EngineInvariantError("bin " + std::to_string(b) + " is empty");
    if (computed != packing.loads[b])
      throw EngineInvariantError("bin " + std::to_string(b) +
                                 " load mismatch: expected " +
                                 std::to_string(computed) + ", got " +
                                 std::to_string(packing.loads[b]));
    if (computed > instance.capacity)
      throw EngineInvariantError("bin " + std::to_string(b) + " overfull: " +
                                 std::to_string(computed) + " > " +
                                 std::to_string(instance.capacity));
  }
  auto missing = std::find(seen.begin(), seen.end(), false);
  if (missing != seen.end())
    throw EngineInvariantError("item " +
                               std::to_string(missing - seen.begin()) +
                               " missing from packing");
}

void writePacking(std::ostream &out, const Instance &instance,
                  const Packing &packing, const char *indent) {
  for (std::size_t b = 0; b < packing.bins.size(); b++) {
    out << indent << "bin#" << std::setw(2) << std::setfill('0') << b + 1
        << std::setfill(' ') << " load=" << std::setw(3) << packing.loads[b]
        << " [";
    for (std::size_t k = 0; k < packing.bins[b].size(); k++) {
      const int item = packing.bins[b][k];
      out << (k == 0 ? "" : ", ") << item + 1 << ":" << instance.sizes[item];
    }
    out << "]\n";
  }
}

} // namespace bpp

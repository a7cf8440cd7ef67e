#pragma once

#include "bpp/Structs/structCollection.hpp"
#include <cstdint>
#include <ostream>
#include <vector>

namespace bpp {

int64_t totalSize(const Instance &instance);

/**
 * @brief ceil(sum(sizes) / capacity), at least 1 for a non empty instance
 */
int lowerBoundBins(const Instance &instance);

/**
 * @brief place the items in the given order, each into the bin that is left
 * with the least free space (new bin if none fits)
 */
Packing bestFitPack(const Instance &instance, const std::vector<int> &order);

/**
 * @brief repeatedly try to empty the lightest bin into the other bins, stops
 * once no bin can be dissolved
 */
Packing reduceBins(const Instance &instance, const Packing &packing);

/**
 * @brief best fit decreasing, ties broken by item index
 */
Packing greedyBaseline(const Instance &instance);

// sum of squared load / capacity ratios, bigger means fuller bins next to
// emptier ones
double fillScore(const Packing &packing);

/**
 * @brief throws EngineInvariantError if an item is missing, duplicated or a
 * bin is overfull
 */
void validatePacking(const Instance &instance, const Packing &packing);

void writePacking(std::ostream &out, const Instance &instance,
                  const Packing &packing, const char *indent = "  ");

} // namespace bpp

#pragma once

#include "bpp/Structs/structCollection.hpp"
#include <cstdint>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

namespace bpp {

/**
 * @brief the reference instance, capacity 60, optimum 4 bins
 */
Instance exampleInstance();

Instance syntheticInstance(const std::string &name, std::size_t numItems,
                           int capacity, uint32_t minSize, uint32_t maxSize,
                           uint64_t seed);

// reference instance plus synthetic-60, synthetic-120 and synthetic-200
std::vector<Instance> defaultBatchInstances();

/**
 * @brief parse every regular, non hidden file of dir in sorted order. Files
 * that fail to parse are reported on errors and skipped, throws
 * std::runtime_error if dir cannot be read or nothing could be loaded
 */
std::vector<Instance> loadInstancesFromDir(const std::string &dir,
                                           std::ostream &errors = std::cerr);

/**
 * @brief parse the given files in order. Files that cannot be opened or parsed
 * are reported on errors and skipped, throws std::runtime_error if nothing
 * could be loaded
 */
std::vector<Instance> loadInstancesFromFiles(const std::vector<std::string> &paths,
                                             std::ostream &errors = std::cerr);

} // namespace bpp

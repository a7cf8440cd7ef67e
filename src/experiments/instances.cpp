#include "experiments/instances.hpp"
#include "bpp/Structs/XorShift64.hpp"
#include "bpp/Structs/errors.hpp"
#include "experiments/readData/readData.h"
#include <algorithm>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace bpp {

Instance exampleInstance() {
  return {"TP2-example", 60, {22, 17, 45, 12, 38, 27, 19}, 4};
}

Instance syntheticInstance(const std::string &name, std::size_t numItems,
                           int capacity, uint32_t minSize, uint32_t maxSize,
                           uint64_t seed) {
  XorShift64 rng(seed);
  Instance instance{name, capacity, {}, std::nullopt};
  instance.sizes.reserve(numItems);
  for (std::size_t i = 0; i < numItems; i++)
    instance.sizes.push_back(
        static_cast<int>(rng.nextInRange(minSize, maxSize)));
  return instance;
}

std::vector<Instance> defaultBatchInstances() {
  return {exampleInstance(),
          syntheticInstance("synthetic-60", 60, 150, 10, 100, 1),
          syntheticInstance("synthetic-120", 120, 150, 10, 100, 2),
          syntheticInstance("synthetic-200", 200, 150, 10, 100, 3)};
}

std::vector<Instance> loadInstancesFromDir(const std::string &dir,
                                           std::ostream &errors) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec)
    throw std::runtime_error("Failed to read dir " + dir + ": " +
                             ec.message());

  std::vector<fs::path> paths;
  for (const auto &entry : it) {
    const std::string name = entry.path().filename().string();
    if (!name.empty() && name[0] == '.')
      continue;
    if (entry.is_regular_file())
      paths.push_back(entry.path());
  }
  std::sort(paths.begin(), paths.end());
  if (paths.empty())
    throw std::runtime_error("No files found in " + dir);

  std::vector<std::string> files;
  for (const auto &path : paths)
    files.push_back(path.string());
  return loadInstancesFromFiles(files, errors);
}

std::vector<Instance> loadInstancesFromFiles(const std::vector<std::string> &paths,
                                             std::ostream &errors) {
  Parser readData;
  std::vector<Instance> instances;
  std::size_t failed = 0;
  for (const auto &path : paths) {
    try {
      auto loaded = readData.readInstances(path);
      instances.insert(instances.end(),
                       std::make_move_iterator(loaded.begin()),
                       std::make_move_iterator(loaded.end()));
    } catch (const ParseError &e) {
      failed++;
      errors << "skipping " << path << ": " << e.what() << std::endl;
    } catch (const std::runtime_error &e) {
      // unreadable file
      failed++;
      errors << "skipping unreadable " << path << ": " << e.what()
             << std::endl;
    }
  }
  if (instances.empty())
    throw std::runtime_error("No parseable instance among " +
                             std::to_string(paths.size()) + " files (" +
                             std::to_string(failed) + " failed)");
  return instances;
}

} // namespace bpp

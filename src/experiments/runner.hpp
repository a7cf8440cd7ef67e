#pragma once

#include "bpp/Structs/structCollection.hpp"
#include "bpp/TabuConfig.hpp"
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace bpp {

struct ExperimentConfig {
  uint32_t runs = 5;
  uint64_t seed0 = 0;
  std::size_t skip = 0;
  std::optional<std::size_t> take;
  TabuConfig tabu = getTabuConfig(TabuPreset::Default);
  // > 1 runs the repetitions of one instance concurrently
  int threads = 1;
  bool progress = false;
  // compute the exact optimum for instances up to this size if the dataset
  // does not provide one, 0 disables it
  std::size_t exactMaxItems = 0;
};

struct InstanceResults {
  std::string instanceName;
  std::size_t numItems = 0;
  std::optional<int> exactBins;
  std::vector<RunResult> runs;
};

/**
 * @brief runs the tabu search `runs` times per instance, run r uses seed
 * seed0 + r. A failing run is recorded and does not stop the experiment
 */
class ExperimentRunner {
public:
  explicit ExperimentRunner(ExperimentConfig config,
                            std::ostream &progressOut = std::cerr)
      : config(config), progressOut(progressOut) {}

  RunResult runOnce(const Instance &instance, uint64_t seed) const;

  InstanceResults runInstance(const Instance &instance);

  /**
   * @brief applies skip and take, then runs the instances one after another
   */
  std::vector<InstanceResults> runAll(const std::vector<Instance> &instances);

  std::optional<int> exactReference(const Instance &instance) const;

private:
  ExperimentConfig config;
  std::ostream &progressOut;
  std::mutex progressLock;

  void logRun(const RunResult &result, uint32_t run,
              const std::optional<int> &exact);
};

} // namespace bpp

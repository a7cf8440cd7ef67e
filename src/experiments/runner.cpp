#include "experiments/runner.hpp"
#include "bpp/Packing/exactBins.hpp"
#include "bpp/Solver/tabuSearch.hpp"
#include "experiments/report.hpp"
#include <algorithm>
#include <exception>
#include <iomanip>
#include <tbb/tbb.h>

namespace bpp {

RunResult ExperimentRunner::runOnce(const Instance &instance,
                                    uint64_t seed) const {
  RunResult result;
  result.seed = seed;
  const auto start = std::chrono::steady_clock::now();
  try {
    TabuSearch solver(config.tabu.params);
    TabuResult found = solver.solve(instance, seed, config.tabu.budget);
    result.objective = found.bestBins;
    result.iterations = found.iterations;
    result.elapsed = found.elapsed;
  } catch (const std::exception &e) {
    result.failed = true;
    result.error = e.what();
    result.elapsed = std::chrono::steady_clock::now() - start;
  }
  return result;
}

std::optional<int>
ExperimentRunner::exactReference(const Instance &instance) const {
  if (instance.knownOptimalBins)
    return instance.knownOptimalBins;
  if (config.exactMaxItems == 0)
    return std::nullopt;
  return exactBinsIfSmall(instance, config.exactMaxItems);
}

void ExperimentRunner::logRun(const RunResult &result, uint32_t run,
                              const std::optional<int> &exact) {
  std::lock_guard<std::mutex> lock(progressLock);
  progressOut << "  run " << run + 1 << "/" << config.runs
              << " seed=" << result.seed << "\n";
  if (result.failed) {
    progressOut << "    FAILED: " << result.error << std::endl;
    return;
  }
  progressOut << "    found_bins=" << result.objective << " gap_percent=";
  if (exact)
    progressOut << std::fixed << std::setprecision(2)
                << gapPercent(result.objective, *exact);
  else
    progressOut << "N/A";
  progressOut << " time=" << std::fixed << std::setprecision(4)
              << result.elapsed.count() << "s iters=" << result.iterations
              << std::endl;
}

InstanceResults ExperimentRunner::runInstance(const Instance &instance) {
  InstanceResults results;
  results.instanceName = instance.name;
  results.numItems = instance.sizes.size();
  results.exactBins = exactReference(instance);
  results.runs.resize(config.runs);

  if (config.progress) {
    std::lock_guard<std::mutex> lock(progressLock);
    progressOut << "instance=" << instance.name
                << " capacity=" << instance.capacity
                << " n=" << instance.sizes.size() << " exact_bins=";
    if (results.exactBins)
      progressOut << *results.exactBins;
    else
      progressOut << "N/A";
    progressOut << std::endl;
  }

  auto repetition = [&](uint32_t r) {
    results.runs[r] = runOnce(instance, config.seed0 + r);
    if (config.progress)
      logRun(results.runs[r], r, results.exactBins);
  };

  if (config.threads > 1) {
    // every task owns its slot of results.runs, no locking needed
    tbb::global_control globalLimit(
        tbb::global_control::max_allowed_parallelism, config.threads);
    tbb::task_group tg;
    for (uint32_t r = 0; r < config.runs; r++)
      tg.run([&repetition, r] { repetition(r); });
    tg.wait();
  } else {
    for (uint32_t r = 0; r < config.runs; r++)
      repetition(r);
  }
  return results;
}

std::vector<InstanceResults>
ExperimentRunner::runAll(const std::vector<Instance> &instances) {
  std::vector<InstanceResults> all;
  const std::size_t begin = std::min(config.skip, instances.size());
  std::size_t end = instances.size();
  if (config.take)
    end = std::min(end, begin + *config.take);
  for (std::size_t i = begin; i < end; i++)
    all.push_back(runInstance(instances[i]));
  return all;
}

} // namespace bpp

#include "bpp/Packing/exactBins.hpp"
#include "bpp/Packing/packing.hpp"
#include "bpp/Solver/tabuSearch.hpp"
#include "bpp/Structs/errors.hpp"
#include "experiments/instances.hpp"
#include "experiments/readData/readData.h"
#include "experiments/report.hpp"
#include "experiments/runner.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bpp;

struct Config {
  std::string command;
  // file or directory of run-file, run-dir and compare-exact-file
  std::string path;
  ExperimentConfig experiment;
  uint32_t traceIterations = 30;
  uint32_t traceSamples = 25;
  std::size_t traceTenure = 10;
  uint64_t traceSeed = 0;
  bool showPackings = false;
  bool showCandidates = true;
};

class UsageError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

void printUsage() {
  std::cerr
      << "Usage:\n"
         "  tabu_bpp run-example\n"
         "  tabu_bpp trace-example [--iters N] [--samples K] [--tenure T] "
         "[--seed S] [--show-packings] [--no-candidates]\n"
         "  tabu_bpp run-batch [--runs N] [--seed0 S] [--time-limit-s T] "
         "[--threads P] [--progress]\n"
         "  tabu_bpp run-file <FILE> [--runs N] [--seed0 S] [--skip S] "
         "[--take K] [--time-limit-s T] [--threads P] [--progress] "
         "[--exact-max-items M]\n"
         "  tabu_bpp run-dir <DIR> [same options as run-file]\n"
         "  tabu_bpp compare-exact-file <FILE> [same options as run-file]\n";
}

namespace {
uint64_t parseUnsigned(const std::string &flag, const std::string &value) {
  if (value.empty() || value[0] == '-' || value[0] == '+')
    throw UsageError("Invalid value for " + flag + ": '" + value + "'");
  try {
    std::size_t used = 0;
    const uint64_t parsed = std::stoull(value, &used);
    if (used != value.size())
      throw UsageError("Invalid value for " + flag + ": '" + value + "'");
    return parsed;
  } catch (const std::invalid_argument &) {
    throw UsageError("Invalid value for " + flag + ": '" + value + "'");
  } catch (const std::out_of_range &) {
    throw UsageError("Value out of range for " + flag + ": '" + value + "'");
  }
}

uint32_t parseCount(const std::string &flag, const std::string &value) {
  const uint64_t parsed = parseUnsigned(flag, value);
  if (parsed > UINT32_MAX)
    throw UsageError("Value out of range for " + flag + ": '" + value + "'");
  return static_cast<uint32_t>(parsed);
}

double parseSeconds(const std::string &flag, const std::string &value) {
  try {
    std::size_t used = 0;
    const double parsed = std::stod(value, &used);
    if (used != value.size() || !std::isfinite(parsed))
      throw UsageError("Invalid value for " + flag + ": '" + value + "'");
    return parsed;
  } catch (const std::invalid_argument &) {
    throw UsageError("Invalid value for " + flag + ": '" + value + "'");
  } catch (const std::out_of_range &) {
    throw UsageError("Value out of range for " + flag + ": '" + value + "'");
  }
}

bool allowed(const std::string &command, const std::string &flag) {
  static const std::vector<std::string> traceFlags = {
      "--iters", "--samples", "--tenure", "--seed", "--show-packings",
      "--no-candidates"};
  static const std::vector<std::string> batchFlags = {
      "--runs", "--seed0", "--time-limit-s", "--threads", "--progress"};
  static const std::vector<std::string> fileFlags = {
      "--runs",    "--seed0",    "--skip",     "--take",
      "--threads", "--progress", "--time-limit-s", "--exact-max-items"};
  const std::vector<std::string> *flags = &fileFlags;
  if (command == "run-example")
    return false;
  if (command == "trace-example")
    flags = &traceFlags;
  else if (command == "run-batch")
    flags = &batchFlags;
  return std::find(flags->begin(), flags->end(), flag) != flags->end();
}
} // namespace

Config parseArguments(int argc, char *argv[]) {
  Config config;
  if (argc < 2)
    throw UsageError("missing subcommand");
  config.command = argv[1];
  const std::vector<std::string> commands = {
      "run-example", "trace-example", "run-batch",
      "run-file",    "run-dir",       "compare-exact-file"};
  if (std::find(commands.begin(), commands.end(), config.command) ==
      commands.end())
    throw UsageError("unknown subcommand '" + config.command + "'");

  int i = 2;
  const bool needsPath = config.command == "run-file" ||
                         config.command == "run-dir" ||
                         config.command == "compare-exact-file";
  if (needsPath) {
    if (argc <= i || std::string(argv[i]).rfind("--", 0) == 0)
      throw UsageError(config.command + " expects a path");
    config.path = argv[i++];
  }
  // compare-exact-file solves small instances exactly unless told otherwise
  if (config.command == "compare-exact-file")
    config.experiment.exactMaxItems = 30;

  auto &experiment = config.experiment;
  double timeLimitSeconds = 2.0;
  while (i < argc) {
    const std::string flag = argv[i++];
    if (flag == "--help" || flag == "-h")
      throw UsageError("help requested");
    if (!allowed(config.command, flag))
      throw UsageError("Unknown arg for " + config.command + ": " + flag);

    if (flag == "--progress") {
      experiment.progress = true;
      continue;
    }
    if (flag == "--show-packings") {
      config.showPackings = true;
      continue;
    }
    if (flag == "--no-candidates") {
      config.showCandidates = false;
      continue;
    }
    if (i >= argc)
      throw UsageError("Missing value for " + flag);
    const std::string value = argv[i++];

    if (flag == "--runs") {
      experiment.runs = parseCount(flag, value);
      if (experiment.runs == 0)
        throw UsageError("--runs must be at least 1");
    } else if (flag == "--seed0")
      experiment.seed0 = parseUnsigned(flag, value);
    else if (flag == "--skip")
      experiment.skip = parseUnsigned(flag, value);
    else if (flag == "--take")
      experiment.take = parseUnsigned(flag, value);
    else if (flag == "--time-limit-s")
      timeLimitSeconds = parseSeconds(flag, value);
    else if (flag == "--threads") {
      const uint32_t threads = parseCount(flag, value);
      if (threads == 0 || threads > 1024)
        throw UsageError("--threads must be between 1 and 1024");
      experiment.threads = static_cast<int>(threads);
    } else if (flag == "--exact-max-items")
      experiment.exactMaxItems = parseUnsigned(flag, value);
    else if (flag == "--iters")
      config.traceIterations = parseCount(flag, value);
    else if (flag == "--samples")
      config.traceSamples = parseCount(flag, value);
    else if (flag == "--tenure")
      config.traceTenure = parseUnsigned(flag, value);
    else if (flag == "--seed")
      config.traceSeed = parseUnsigned(flag, value);
  }
  experiment.tabu.budget.timeLimit = timeLimitFromSeconds(timeLimitSeconds);
  return config;
}

void printConfigInline(const Config &config) {
  const auto &experiment = config.experiment;
  std::cerr << "Start Experiment with: [Config] command=" << config.command
            << ", runs=" << experiment.runs << ", seed0=" << experiment.seed0
            << ", skip=" << experiment.skip << ", take=";
  if (experiment.take)
    std::cerr << *experiment.take;
  else
    std::cerr << "all";
  std::cerr << ", timeLimit=";
  if (experiment.tabu.budget.timeLimit)
    std::cerr << experiment.tabu.budget.timeLimit->count() << "s";
  else
    std::cerr << "none";
  std::cerr << ", threads=" << experiment.threads
            << ", exactMaxItems=" << experiment.exactMaxItems << std::endl;
}

std::string formatOrder(const Instance &instance,
                        const std::vector<int> &order) {
  std::string text;
  for (std::size_t i = 0; i < order.size(); i++) {
    if (i > 0)
      text += " ";
    text += std::to_string(order[i] + 1) + ":" +
            std::to_string(instance.sizes[order[i]]);
  }
  return text;
}

int runExample() {
  const Instance instance = exampleInstance();
  const TabuConfig config = getTabuConfig(TabuPreset::Example);

  std::cout << "Instance: " << instance.name
            << " (capacity=" << instance.capacity
            << ", n=" << instance.sizes.size() << ")" << std::endl;
  std::cout << "Exact optimum (small-instance check): "
            << exactMinBins(instance) << " bins" << std::endl;

  TabuResult result;
  try {
    TabuSearch solver(config.params);
    result = solver.solve(instance, 0, config.budget);
    validatePacking(instance, result.bestPacking);
  } catch (const EngineInvariantError &e) {
    std::cerr << "ERROR: produced invalid packing: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  std::cout << "Best found: " << result.bestBins
            << " bins  iters=" << result.iterations << "  time(s)="
            << std::fixed << std::setprecision(4) << result.elapsed.count()
            << "  stop=" << toString(result.termination) << std::endl;
  std::cout << "Bins (item_id:size):" << std::endl;
  writePacking(std::cout, instance, result.bestPacking);
  if (instance.knownOptimalBins && result.bestBins != *instance.knownOptimalBins)
    std::cout << "NOTE: expected optimum is " << *instance.knownOptimalBins
              << " bins, try more iterations or samples" << std::endl;
  return EXIT_SUCCESS;
}

int traceExample(const Config &config) {
  const Instance instance = exampleInstance();
  TabuConfig tabu = getTabuConfig(TabuPreset::Trace);
  tabu.params.neighborhoodSamples = config.traceSamples;
  tabu.params.tabuTenure = config.traceTenure;
  tabu.budget.maxIterations = config.traceIterations;

  std::cout << "TRACE: Tabu Search (" << instance.name << ")" << std::endl;
  std::cout << "capacity=" << instance.capacity
            << " n=" << instance.sizes.size() << " seed=" << config.traceSeed
            << std::endl;
  std::cout << "params: iters=" << tabu.budget.maxIterations
            << " samples=" << tabu.params.neighborhoodSamples
            << " tenure=" << tabu.params.tabuTenure
            << " stagnation=" << tabu.params.stagnationLimit << std::endl;

  Logging logging;
  logging.logIterations = true;
  logging.logBound = true;
  logging.logCandidates = config.showCandidates;
  logging.logPackings = config.showPackings;
  TabuSearch solver(tabu.params, logging, std::cout);
  const TabuResult result = solver.solve(instance, config.traceSeed, tabu.budget);

  std::cout << "\nDONE: elapsed=" << std::fixed << std::setprecision(4)
            << result.elapsed.count() << "s iters=" << result.iterations
            << " stop=" << toString(result.termination) << std::endl;
  std::cout << "best: bins=" << result.bestBins
            << " fill=" << fillScore(result.bestPacking) << std::endl;
  std::cout << "best permutation (item:size): "
            << formatOrder(instance, result.bestOrder) << std::endl;
  if (config.showPackings) {
    std::cout << "best packing:" << std::endl;
    writePacking(std::cout, instance, result.bestPacking);
  }
  return EXIT_SUCCESS;
}

int printSummary(const std::vector<InstanceResults> &results) {
  std::vector<SummaryRow> rows;
  std::size_t failed = 0;
  for (const auto &instanceResults : results) {
    rows.push_back(summarize(instanceResults));
    failed += rows.back().failedRuns;
  }
  writeTable(std::cout, rows);
  if (failed > 0)
    std::cerr << failed << " run(s) failed, see the progress output"
              << std::endl;
  return EXIT_SUCCESS;
}

int runInstances(const Config &config, const std::vector<Instance> &instances) {
  ExperimentRunner runner(config.experiment);
  return printSummary(runner.runAll(instances));
}

std::vector<Instance> loadFile(const std::string &path) {
  Parser readData;
  try {
    return readData.readInstances(path);
  } catch (const ParseError &e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

int compareExactFile(const Config &config) {
  ExperimentRunner runner(config.experiment);
  for (const auto &results : runner.runAll(loadFile(config.path)))
    writeExactComparison(std::cout, results);
  return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
  Config config;
  try {
    config = parseArguments(argc, argv);
  } catch (const UsageError &e) {
    std::cerr << e.what() << "\n";
    printUsage();
    return 2;
  }

  try {
    if (config.command == "run-example")
      return runExample();
    if (config.command == "trace-example")
      return traceExample(config);
    printConfigInline(config);
    if (config.command == "run-batch")
      return runInstances(config, defaultBatchInstances());
    if (config.command == "run-file")
      return runInstances(config, loadFile(config.path));
    if (config.command == "run-dir")
      return runInstances(config, loadInstancesFromDir(config.path));
    return compareExactFile(config);
  } catch (const std::exception &e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

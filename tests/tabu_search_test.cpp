#include "bpp/Packing/packing.hpp"
#include "bpp/Solver/tabuSearch.hpp"
#include "experiments/instances.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <sstream>

using namespace bpp;

namespace {
SearchBudget iterations(uint32_t maxIterations) {
  return {maxIterations, std::nullopt};
}
} // namespace

TEST(TabuList, ForgetsTheOldestMove) {
  TabuList tabu(2);
  const MoveKey a{MoveType::Swap, 0, 1};
  const MoveKey b{MoveType::Swap, 1, 2};
  const MoveKey c{MoveType::Insert, 0, 1};
  tabu.push(a);
  tabu.push(b);
  EXPECT_TRUE(tabu.contains(a));
  tabu.push(c);
  EXPECT_FALSE(tabu.contains(a));
  EXPECT_TRUE(tabu.contains(b));
  EXPECT_TRUE(tabu.contains(c));
  EXPECT_EQ(tabu.size(), 2u);
  tabu.clear();
  EXPECT_EQ(tabu.size(), 0u);
  EXPECT_FALSE(tabu.contains(b));
}

TEST(TabuList, RepeatedMovesStayUntilTheLastCopyExpires) {
  TabuList tabu(2);
  const MoveKey a{MoveType::Swap, 3, 4};
  const MoveKey b{MoveType::Insert, 3, 0};
  tabu.push(a);
  tabu.push(a);
  tabu.push(b);
  EXPECT_TRUE(tabu.contains(a));
  tabu.push(b);
  EXPECT_FALSE(tabu.contains(a));
}

TEST(TabuList, ZeroTenureKeepsNothing) {
  TabuList tabu(0);
  tabu.push({MoveType::Swap, 0, 1});
  EXPECT_EQ(tabu.size(), 0u);
}

TEST(Score, FewerBinsThenFullerBins) {
  EXPECT_TRUE((Score{3, 10}).betterThan(Score{4, 100}));
  EXPECT_TRUE((Score{3, 100}).betterThan(Score{3, 10}));
  EXPECT_FALSE((Score{3, 10}).betterThan(Score{3, 10}));
  EXPECT_FALSE((Score{4, 100}).betterThan(Score{3, 10}));
}

TEST(TabuSearch, ReferenceInstanceReachesTheOptimum) {
  const Instance instance = exampleInstance();
  const TabuConfig config = getTabuConfig(TabuPreset::Example);
  TabuSearch solver(config.params);
  TabuResult result = solver.solve(instance, 0, config.budget);

  EXPECT_NO_THROW(validatePacking(instance, result.bestPacking));
  EXPECT_EQ(result.bestBins, 4);
  EXPECT_EQ(result.lowerBound, 3);
  EXPECT_EQ(static_cast<int>(result.bestPacking.numBins()), result.bestBins);
  EXPECT_EQ(result.bestOrder.size(), instance.sizes.size());
  // the lower bound of 3 is out of reach, the whole budget is used
  EXPECT_EQ(result.termination, Termination::iterationLimit);
  EXPECT_EQ(result.iterations, config.budget.maxIterations);
}

TEST(TabuSearch, ReturnsValidPackingsForSyntheticInstances) {
  for (const Instance &instance : defaultBatchInstances()) {
    TabuSearch solver(getTabuConfig(TabuPreset::Default).params);
    TabuResult result = solver.solve(instance, 7, iterations(100));
    EXPECT_NO_THROW(validatePacking(instance, result.bestPacking))
        << instance.name;
    EXPECT_GE(result.bestBins, result.lowerBound) << instance.name;
    EXPECT_LE(result.bestBins, result.initialBins) << instance.name;
  }
}

TEST(TabuSearch, BestBinsNeverIncrease) {
  const Instance instance = syntheticInstance("mono", 80, 150, 10, 100, 11);
  TabuSearch solver({50, 10, 40});
  TabuResult result = solver.solve(instance, 3, iterations(300));

  ASSERT_FALSE(result.improvements.empty());
  EXPECT_EQ(result.improvements.front().iteration, 0u);
  EXPECT_EQ(result.improvements.front().bins, result.initialBins);
  for (std::size_t i = 1; i < result.improvements.size(); i++) {
    EXPECT_LE(result.improvements[i].bins, result.improvements[i - 1].bins);
    EXPECT_GE(result.improvements[i].elapsed,
              result.improvements[i - 1].elapsed);
    EXPECT_GT(result.improvements[i].iteration,
              result.improvements[i - 1].iteration);
  }
  EXPECT_EQ(result.improvements.back().bins, result.bestBins);
}

TEST(TabuSearch, SameSeedSameResult) {
  const Instance instance = syntheticInstance("det", 60, 150, 10, 100, 5);
  TabuSearch first({40, 10, 50});
  TabuSearch second({40, 10, 50});
  TabuResult a = first.solve(instance, 42, iterations(150));
  TabuResult b = second.solve(instance, 42, iterations(150));
  EXPECT_EQ(a.bestBins, b.bestBins);
  EXPECT_EQ(a.bestOrder, b.bestOrder);
  EXPECT_EQ(a.iterations, b.iterations);
  EXPECT_EQ(a.improvements.size(), b.improvements.size());
}

TEST(TabuSearch, ExpiredTimeLimitStillReturnsAPacking) {
  const Instance instance = exampleInstance();
  TabuSearch solver(getTabuConfig(TabuPreset::Default).params);
  SearchBudget budget{5000, std::chrono::duration<double>(0)};
  TabuResult result = solver.solve(instance, 1, budget);

  EXPECT_EQ(result.termination, Termination::timeLimit);
  EXPECT_EQ(result.iterations, 0u);
  EXPECT_EQ(result.bestBins, result.initialBins);
  EXPECT_NO_THROW(validatePacking(instance, result.bestPacking));
}

TEST(TabuSearch, TrivialWhenConstructionHitsTheLowerBound) {
  const Instance instance{"trivial", 10, {5, 5, 4, 6}, std::nullopt};
  TabuSearch solver(getTabuConfig(TabuPreset::Default).params);
  TabuResult result = solver.solve(instance, 0, iterations(1000));
  EXPECT_EQ(result.termination, Termination::trivial);
  EXPECT_EQ(result.bestBins, 2);
  EXPECT_EQ(result.iterations, 0u);
}

TEST(TabuSearch, SingleItem) {
  const Instance instance{"single", 10, {7}, std::nullopt};
  TabuSearch solver(getTabuConfig(TabuPreset::Default).params);
  TabuResult result = solver.solve(instance, 0, iterations(10));
  EXPECT_EQ(result.bestBins, 1);
  EXPECT_NO_THROW(validatePacking(instance, result.bestPacking));
}

TEST(TabuSearch, WritesATraceWhenAsked) {
  const Instance instance = exampleInstance();
  const TabuConfig config = getTabuConfig(TabuPreset::Trace);
  Logging logging;
  logging.logIterations = true;
  logging.logCandidates = true;
  logging.logPackings = true;
  logging.logBound = true;
  std::ostringstream out;
  TabuSearch solver(config.params, logging, out);
  SearchBudget budget = config.budget;
  budget.maxIterations = 3;
  solver.solve(instance, 0, budget);

  const std::string trace = out.str();
  EXPECT_NE(trace.find("initial bins=4 lower_bound=3"), std::string::npos);
  EXPECT_NE(trace.find("-- it=1 --"), std::string::npos);
  EXPECT_NE(trace.find("-- it=3 --"), std::string::npos);
  EXPECT_NE(trace.find("sample#"), std::string::npos);
  EXPECT_TRUE(trace.find("swap pos ") != std::string::npos ||
              trace.find("insert from pos ") != std::string::npos);
  EXPECT_NE(trace.find("bin#01"), std::string::npos);
}

TEST(TabuSearch, SilentByDefault) {
  std::ostringstream out;
  TabuSearch solver(getTabuConfig(TabuPreset::Trace).params, Logging{}, out);
  solver.solve(exampleInstance(), 0, iterations(5));
  EXPECT_TRUE(out.str().empty());
}

TEST(TabuSearch, CandidatesAreOnlyDescribedWhenLogged) {
  Logging logging;
  logging.logIterations = true;
  std::ostringstream out;
  TabuSearch solver(getTabuConfig(TabuPreset::Trace).params, logging, out);
  solver.solve(exampleInstance(), 0, iterations(3));
  const std::string trace = out.str();
  EXPECT_NE(trace.find("-- it=1 --"), std::string::npos);
  EXPECT_EQ(trace.find("sample#"), std::string::npos);
  EXPECT_EQ(trace.find("swap pos "), std::string::npos);
  EXPECT_EQ(trace.find("insert from pos "), std::string::npos);
}

TEST(TimeLimitFromSeconds, NonPositiveDisablesTheLimit) {
  EXPECT_FALSE(timeLimitFromSeconds(0.0).has_value());
  EXPECT_FALSE(timeLimitFromSeconds(-1.5).has_value());
  ASSERT_TRUE(timeLimitFromSeconds(2.0).has_value());
  EXPECT_DOUBLE_EQ(timeLimitFromSeconds(2.0)->count(), 2.0);
}

TEST(TimeLimitFromSeconds, RejectsNonFiniteValues) {
  EXPECT_THROW(timeLimitFromSeconds(std::nan("")), std::invalid_argument);
  EXPECT_THROW(timeLimitFromSeconds(std::numeric_limits<double>::infinity()),
               std::invalid_argument);
  EXPECT_THROW(timeLimitFromSeconds(-std::numeric_limits<double>::infinity()),
               std::invalid_argument);
}

TEST(Termination, Names) {
  EXPECT_STREQ(toString(Termination::trivial), "trivial");
  EXPECT_STREQ(toString(Termination::lowerBoundReached), "lower-bound");
  EXPECT_STREQ(toString(Termination::iterationLimit), "iteration-limit");
  EXPECT_STREQ(toString(Termination::timeLimit), "time-limit");
}

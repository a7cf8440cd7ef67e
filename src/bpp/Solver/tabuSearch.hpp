#pragma once

#include "bpp/Structs/Difficulty.hpp"
#include "bpp/Structs/XorShift64.hpp"
#include "bpp/Structs/structCollection.hpp"
#include "bpp/TabuConfig.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iostream>
#include <ostream>
#include <string>
#include <unordered_set>
#include <vector>

namespace bpp {

/**
 * @brief lexicographic objective: fewer bins first, then fuller bins
 */
struct Score {
  int bins = 0;
  double fill = 0.0;

  bool betterThan(const Score &other) const {
    if (bins != other.bins)
      return bins < other.bins;
    return fill > other.fill;
  }
};

struct Improvement {
  std::chrono::duration<double> elapsed;
  uint32_t iteration;
  int bins;
};

struct TabuResult {
  std::vector<int> bestOrder;
  Packing bestPacking;
  int bestBins = 0;
  int initialBins = 0;
  int lowerBound = 0;
  std::chrono::duration<double> elapsed{0};
  uint32_t iterations = 0;
  Termination termination = Termination::trivial;
  // every new best of the run, bins are non increasing
  std::vector<Improvement> improvements;
};

enum class MoveType { Swap, Insert };

/**
 * @brief Swap keeps the two item ids ordered, Insert stores item and target
 * position
 */
struct MoveKey {
  MoveType type = MoveType::Swap;
  int first = 0;
  int second = 0;

  bool operator==(const MoveKey &other) const = default;
};

struct MoveKeyHasher {
  std::size_t operator()(const MoveKey &key) const {
    uint64_t h = static_cast<uint64_t>(key.first) * 0x9E3779B97F4A7C15ULL;
    h ^= static_cast<uint64_t>(key.second) + 0x7F4A7C15ULL + (h << 6) + (h >> 2);
    return static_cast<std::size_t>(h ^ static_cast<uint64_t>(key.type));
  }
};

/**
 * @brief fifo of the last tabuTenure moves with O(1) membership
 */
class TabuList {
public:
  explicit TabuList(std::size_t tenure) : tenure(tenure) {}

  void push(const MoveKey &key);
  bool contains(const MoveKey &key) const { return members.count(key) > 0; }
  void clear();
  std::size_t size() const { return queue.size(); }

private:
  std::size_t tenure;
  std::deque<MoveKey> queue;
  std::unordered_multiset<MoveKey, MoveKeyHasher> members;
};

/**
 * @brief tabu search over item orders, every order is decoded by best fit
 * followed by reduceBins
 */
class TabuSearch {
public:
  /**
   * @brief Constructor of a solver.
   *
   * @param params neighbourhood size, tenure and stagnation limit
   * @param logging what to write to out while searching
   * @param out destination of the trace
   */
  explicit TabuSearch(TabuParams params, Logging logging = {},
                      std::ostream &out = std::cout)
      : params(params), logging(logging), out(out) {}

  /**
   * @brief search the instance until the budget is used or the lower bound is
   * reached, the returned packing is always feasible
   */
  TabuResult solve(const Instance &instance, uint64_t seed,
                   const SearchBudget &budget);

private:
  TabuParams params;
  Logging logging;
  std::ostream &out;

  struct Candidate {
    std::vector<int> order;
    Packing packing;
    Score score;
    MoveKey move;
    std::string description;
  };

  Packing decode(const Instance &instance, const std::vector<int> &order) const;
  std::vector<int> initialOrder(const Instance &instance,
                                XorShift64 &rng) const;
  bool sampleCandidate(const Instance &instance,
                       const std::vector<int> &current, XorShift64 &rng,
                       Candidate &candidate) const;
};

Score scorePacking(const Packing &packing);

} // namespace bpp

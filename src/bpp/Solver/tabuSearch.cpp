#include "bpp/Solver/tabuSearch.hpp"
#include "bpp/Packing/packing.hpp"
#include <algorithm>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace bpp {

void TabuList::push(const MoveKey &key) {
  if (tenure == 0)
    return;
  while (queue.size() >= tenure) {
    members.erase(members.find(queue.front()));
    queue.pop_front();
  }
  queue.push_back(key);
  members.insert(key);
}

void TabuList::clear() {
  queue.clear();
  members.clear();
}

Score scorePacking(const Packing &packing) {
  return {static_cast<int>(packing.numBins()), fillScore(packing)};
}

Packing TabuSearch::decode(const Instance &instance,
                           const std::vector<int> &order) const {
  return reduceBins(instance, bestFitPack(instance, order));
}

std::vector<int> TabuSearch::initialOrder(const Instance &instance,
                                          XorShift64 &rng) const {
  const std::size_t n = instance.sizes.size();
  std::vector<uint64_t> tiebreak(n);
  for (auto &key : tiebreak)
    key = rng.next();
  std::vector<int> order(n);
  std::iota(order.begin(), order.end(), 0);
  std::sort(order.begin(), order.end(), [&](int a, int b) {
    if (instance.sizes[a] != instance.sizes[b])
      return instance.sizes[a] > instance.sizes[b];
    return tiebreak[a] < tiebreak[b];
  });
  return order;
}

bool TabuSearch::sampleCandidate(const Instance &instance,
                                 const std::vector<int> &current,
                                 XorShift64 &rng, Candidate &candidate) const {
  const std::size_t n = current.size();
  const bool isSwap = rng.nextDouble() < 0.6;
  const std::size_t i = rng.nextBelow(n);
  const std::size_t j = rng.nextBelow(n);
  if (i == j)
    return false;

  candidate.order = current;
  candidate.description.clear();
  if (isSwap) {
    const int a = current[i];
    const int b = current[j];
    std::swap(candidate.order[i], candidate.order[j]);
    candidate.move = {MoveType::Swap, std::min(a, b), std::max(a, b)};
    if (logging.logCandidates) {
      std::ostringstream description;
      description << "swap pos " << i << "<->" << j << "  items " << a + 1
                  << ":" << instance.sizes[a] << " <-> " << b + 1 << ":"
                  << instance.sizes[b];
      candidate.description = description.str();
    }
  } else {
    const int item = current[i];
    candidate.order.erase(candidate.order.begin() + i);
    candidate.order.insert(candidate.order.begin() + j, item);
    candidate.move = {MoveType::Insert, item, static_cast<int>(j)};
    if (logging.logCandidates) {
      std::ostringstream description;
      description << "insert from pos " << i << " to " << j << "  item "
                  << item + 1 << ":" << instance.sizes[item];
      candidate.description = description.str();
    }
  }
  candidate.packing = decode(instance, candidate.order);
  candidate.score = scorePacking(candidate.packing);
  return true;
}

TabuResult TabuSearch::solve(const Instance &instance, uint64_t seed,
                             const SearchBudget &budget) {
  const auto start = std::chrono::steady_clock::now();
  auto elapsed = [&start]() {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                         start);
  };
  XorShift64 rng(seed);
  TabuResult result;
  result.lowerBound = lowerBoundBins(instance);

  std::vector<int> current = initialOrder(instance, rng);
  Packing currentPacking = decode(instance, current);
  validatePacking(instance, currentPacking);
  Score currentScore = scorePacking(currentPacking);

  result.bestOrder = current;
  result.bestPacking = currentPacking;
  Score bestScore = currentScore;
  result.initialBins = bestScore.bins;
  result.improvements.push_back({elapsed(), 0, bestScore.bins});

  if (logging.logBound)
    out << "initial bins=" << bestScore.bins
        << " lower_bound=" << result.lowerBound << std::endl;

  if (bestScore.bins <= result.lowerBound || instance.sizes.size() < 2) {
    result.termination = Termination::trivial;
    result.bestBins = bestScore.bins;
    result.elapsed = elapsed();
    return result;
  }

  TabuList tabu(params.tabuTenure);
  uint32_t bestIteration = 0;
  uint32_t lastRestart = 0;
  uint32_t it = 0;
  result.termination = Termination::iterationLimit;

  while (it < budget.maxIterations) {
    if (budget.timeLimit && elapsed() >= *budget.timeLimit) {
      result.termination = Termination::timeLimit;
      if (logging.logIterations)
        out << "\nstop: time_limit reached at it=" << it + 1 << std::endl;
      break;
    }
    ++it;

    if (it - std::max(bestIteration, lastRestart) >= params.stagnationLimit) {
      if (logging.logIterations)
        out << "\nit=" << it
            << ": stagnation reached, diversify: shuffle(best_order) + clear "
               "tabu"
            << std::endl;
      current = result.bestOrder;
      rng.shuffle(current);
      currentPacking = decode(instance, current);
      currentScore = scorePacking(currentPacking);
      tabu.clear();
      lastRestart = it;
    }

    if (logging.logIterations)
      out << "\n-- it=" << it << " -- current bins=" << currentScore.bins
          << " fill=" << currentScore.fill << " best bins=" << bestScore.bins
          << " fill=" << bestScore.fill << " tabu_size=" << tabu.size()
          << std::endl;

    Candidate chosen;
    bool haveCandidate = false;
    Candidate candidate;
    for (uint32_t s = 0; s < params.neighborhoodSamples; s++) {
      if (!sampleCandidate(instance, current, rng, candidate))
        continue;
      const bool isTabu = tabu.contains(candidate.move);
      const bool aspiration = candidate.score.betterThan(bestScore);
      const bool allowed = !isTabu || aspiration;
      if (logging.logCandidates)
        out << "  sample#" << std::setw(3) << std::setfill('0') << s + 1
            << std::setfill(' ') << ": " << std::left << std::setw(45)
            << candidate.description << std::right
            << " -> bins=" << candidate.score.bins
            << " fill=" << candidate.score.fill << " tabu=" << isTabu
            << " aspiration=" << aspiration << " allowed=" << allowed << "\n";
      if (!allowed)
        continue;
      if (!haveCandidate || candidate.score.betterThan(chosen.score)) {
        std::swap(chosen, candidate);
        haveCandidate = true;
      }
    }

    if (!haveCandidate) {
      if (logging.logIterations)
        out << "  no admissible candidate found" << std::endl;
      continue;
    }

    validatePacking(instance, chosen.packing);
    current = std::move(chosen.order);
    currentPacking = std::move(chosen.packing);
    currentScore = chosen.score;
    tabu.push(chosen.move);

    if (logging.logIterations)
      out << "  new current: bins=" << currentScore.bins
          << " fill=" << currentScore.fill << std::endl;
    if (logging.logPackings) {
      out << "  packing after move:\n";
      writePacking(out, instance, currentPacking, "    ");
    }

    if (currentScore.betterThan(bestScore)) {
      bestScore = currentScore;
      result.bestOrder = current;
      result.bestPacking = currentPacking;
      bestIteration = it;
      result.improvements.push_back({elapsed(), it, bestScore.bins});
      if (logging.logBound || logging.logIterations)
        out << "  NEW BEST at it=" << it << ": bins=" << bestScore.bins
            << " fill=" << bestScore.fill << std::endl;
      if (bestScore.bins <= result.lowerBound) {
        result.termination = Termination::lowerBoundReached;
        if (logging.logIterations)
          out << "stop: reached lower bound on bins" << std::endl;
        break;
      }
    }
  }

  result.iterations = it;
  result.bestBins = bestScore.bins;
  result.elapsed = elapsed();
  return result;
}

} // namespace bpp

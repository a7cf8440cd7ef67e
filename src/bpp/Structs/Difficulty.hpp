#pragma once

namespace bpp {
/**
 * @brief describes why the search stopped
 */
enum class Termination {
  /**
   * @brief the constructed packing already matches the lower bound
   */
  trivial,
  /**
   * @brief the search improved the packing down to the lower bound
   */
  lowerBoundReached,
  /**
   * @brief all iterations of the budget were used
   */
  iterationLimit,
  /**
   * @brief the time limit expired (not an error, best so far is returned)
   */
  timeLimit
};

inline const char *toString(Termination termination) {
  switch (termination) {
  case Termination::trivial:
    return "trivial";
  case Termination::lowerBoundReached:
    return "lower-bound";
  case Termination::iterationLimit:
    return "iteration-limit";
  case Termination::timeLimit:
    return "time-limit";
  }
  return "unknown";
}
} // namespace bpp

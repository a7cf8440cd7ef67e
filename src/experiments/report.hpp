#pragma once

#include "experiments/runner.hpp"
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace bpp {

/**
 * @brief one line of the result table. The statistics only cover successful
 * runs, they are empty if every run failed
 */
struct SummaryRow {
  std::string instanceName;
  std::optional<int> exactBins;
  std::size_t successfulRuns = 0;
  std::size_t failedRuns = 0;
  std::optional<double> meanObjective;
  std::optional<int> bestObjective;
  std::optional<double> stdObjective;
  std::optional<double> meanTime;
  std::optional<double> bestTime;
  // computed from bestObjective
  std::optional<double> gapPercent;
};

double gapPercent(int found, int exact);

SummaryRow summarize(const InstanceResults &results);

/**
 * @brief columns: instance exact mean best std mean_time best_time gap,
 * preceded by a title line and a line of dashes. Missing values are printed
 * as '-'
 */
void writeTable(std::ostream &out, const std::vector<SummaryRow> &rows);

std::string formatTable(const std::vector<SummaryRow> &rows);

/**
 * @brief found bins and gap of every single run
 */
void writeExactComparison(std::ostream &out, const InstanceResults &results);

} // namespace bpp

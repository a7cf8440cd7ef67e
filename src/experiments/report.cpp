#include "experiments/report.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace bpp {

namespace {
constexpr int nameWidth = 18;

// fixed point with the given precision, '-' if there is no value
template <typename T>
std::string formatValue(const std::optional<T> &value, int precision) {
  if (!value)
    return "-";
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision) << *value;
  return ss.str();
}

void writeName(std::ostream &out, const std::string &name) {
  out << std::left << std::setw(nameWidth) << name << ' ' << std::right;
}
} // namespace

double gapPercent(int found, int exact) {
  if (exact == 0)
    return 0.0;
  return (static_cast<double>(found) - exact) / exact * 100.0;
}

SummaryRow summarize(const InstanceResults &results) {
  SummaryRow row;
  row.instanceName = results.instanceName;
  row.exactBins = results.exactBins;

  std::vector<double> objectives;
  std::vector<double> times;
  for (const auto &run : results.runs) {
    if (run.failed) {
      row.failedRuns++;
      continue;
    }
    objectives.push_back(run.objective);
    times.push_back(run.elapsed.count());
  }
  row.successfulRuns = objectives.size();
  if (objectives.empty())
    return row;

  const double n = static_cast<double>(objectives.size());
  double sum = 0;
  int best = static_cast<int>(objectives[0]);
  for (double objective : objectives) {
    sum += objective;
    best = std::min(best, static_cast<int>(objective));
  }
  const double mean = sum / n;
  // population standard deviation
  double squares = 0;
  for (double objective : objectives)
    squares += (objective - mean) * (objective - mean);

  double timeSum = 0;
  for (double t : times)
    timeSum += t;

  row.meanObjective = mean;
  row.bestObjective = best;
  row.stdObjective = std::sqrt(squares / n);
  row.meanTime = timeSum / n;
  row.bestTime = *std::min_element(times.begin(), times.end());
  if (row.exactBins)
    row.gapPercent = gapPercent(best, *row.exactBins);
  return row;
}

void writeTable(std::ostream &out, const std::vector<SummaryRow> &rows) {
  std::ostringstream header;
  writeName(header, "Instance");
  header << std::setw(7) << "Exact" << std::setw(10) << "Mean"
         << std::setw(10) << "Best" << std::setw(10) << "StdDev"
         << std::setw(14) << "MeanTime(s)" << std::setw(14) << "BestTime(s)"
         << std::setw(10) << "Gap%";
  const std::string title = header.str();
  out << title << "\n" << std::string(title.size(), '-') << "\n";

  for (const auto &row : rows) {
    writeName(out, row.instanceName);
    out << std::setw(7) << formatValue(row.exactBins, 0) << std::setw(10)
        << formatValue(row.meanObjective, 2) << std::setw(10)
        << formatValue(row.bestObjective, 0) << std::setw(10)
        << formatValue(row.stdObjective, 2) << std::setw(14)
        << formatValue(row.meanTime, 4) << std::setw(14)
        << formatValue(row.bestTime, 4) << std::setw(10)
        << formatValue(row.gapPercent, 2) << "\n";
  }
}

std::string formatTable(const std::vector<SummaryRow> &rows) {
  std::ostringstream ss;
  writeTable(ss, rows);
  return ss.str();
}

void writeExactComparison(std::ostream &out, const InstanceResults &results) {
  out << "instance=" << results.instanceName << " n=" << results.numItems;
  if (!results.exactBins) {
    out << " exact=N/A (no dataset optimum and too large for the exact "
           "solver)\n";
    return;
  }
  out << " exact_bins=" << *results.exactBins << "\n";
  for (std::size_t r = 0; r < results.runs.size(); r++) {
    const RunResult &run = results.runs[r];
    out << "  run=" << r + 1 << " seed=" << run.seed;
    if (run.failed) {
      out << " FAILED: " << run.error << "\n";
      continue;
    }
    out << " found_bins=" << run.objective << " gap_percent=" << std::fixed
        << std::setprecision(2) << gapPercent(run.objective, *results.exactBins)
        << "\n";
  }
}

} // namespace bpp

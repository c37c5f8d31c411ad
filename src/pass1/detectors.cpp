#include "pass1/detectors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace autopsy::pass1 {

namespace {

constexpr double kMadScale = 0.6745;

} // namespace

std::vector<BoolRun> FindTrueRuns(const std::vector<bool>& mask) {
  std::vector<BoolRun> runs;
  std::size_t i = 0;
  while (i < mask.size()) {
    if (!mask[i]) {
      ++i;
      continue;
    }
    BoolRun run;
    run.start = i;
    while (i < mask.size() && mask[i]) {
      ++i;
    }
    run.length = i - run.start;
    runs.push_back(run);
  }
  return runs;
}

std::vector<bool> FlatlineMask(const std::vector<double>& min_values,
                               const std::vector<double>& max_values, const double eps,
                               const std::int64_t min_run) {
  const std::size_t count = std::min(min_values.size(), max_values.size());
  std::vector<bool> candidates(count, false);
  for (std::size_t i = 0; i < count; ++i) {
    const double spread = max_values[i] - min_values[i];
    // NaN compares false.
    candidates[i] = spread <= eps;
  }

  std::vector<bool> mask(count, false);
  for (const BoolRun& run : FindTrueRuns(candidates)) {
    if (static_cast<std::int64_t>(run.length) < min_run) {
      continue;
    }
    std::fill(mask.begin() + static_cast<std::ptrdiff_t>(run.start),
              mask.begin() + static_cast<std::ptrdiff_t>(run.start + run.length), true);
  }
  return mask;
}

double NanMedian(std::vector<double> values) {
  values.erase(std::remove_if(values.begin(), values.end(),
                              [](const double value) { return std::isnan(value); }),
               values.end());
  if (values.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  std::sort(values.begin(), values.end());
  const std::size_t mid = values.size() / 2U;
  if ((values.size() % 2U) == 0U) {
    return (values[mid - 1U] + values[mid]) * 0.5;
  }
  return values[mid];
}

std::vector<double> MadZScores(const std::vector<double>& values) {
  std::vector<double> scores(values.size(), 0.0);
  if (values.empty()) {
    return scores;
  }

  const double median = NanMedian(values);
  std::vector<double> deviations;
  deviations.reserve(values.size());
  for (const double value : values) {
    deviations.push_back(std::fabs(value - median));
  }
  const double mad = NanMedian(std::move(deviations));
  if (mad == 0.0 || !std::isfinite(mad)) {
    return scores;
  }

  for (std::size_t i = 0; i < values.size(); ++i) {
    const double score = kMadScale * (values[i] - median) / mad;
    scores[i] = std::isfinite(score) ? score : 0.0;
  }
  return scores;
}

std::vector<double> FirstDifference(const std::vector<double>& series) {
  std::vector<double> diffs(series.size(), 0.0);
  for (std::size_t i = 1; i < series.size(); ++i) {
    const double diff = series[i] - series[i - 1U];
    diffs[i] = std::isfinite(diff) ? diff : 0.0;
  }
  return diffs;
}

} // namespace autopsy::pass1

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace autopsy::pass1 {

// Maximal run of consecutive `true` entries.
struct BoolRun {
  std::size_t start = 0;
  std::size_t length = 0;

  std::size_t End() const {
    return start + length - 1U;
  }
};

// Run-length encodes `mask`, returning only the `true` runs in order.
std::vector<BoolRun> FindTrueRuns(const std::vector<bool>& mask);

// Flags buckets inside runs of at least `min_run` consecutive flatline
// candidates, where a candidate has `max - min <= eps`. A NaN spread is never a
// candidate.
std::vector<bool> FlatlineMask(const std::vector<double>& min_values,
                               const std::vector<double>& max_values, double eps,
                               std::int64_t min_run);

// Median ignoring NaN entries; NaN when every entry is NaN.
double NanMedian(std::vector<double> values);

// Robust z-scores `0.6745 * (x - median) / MAD`.
// When MAD is zero or non-finite every score is 0, and a score that overflows
// is 0.
std::vector<double> MadZScores(const std::vector<double>& values);

// `out[i] = series[i] - series[i-1]`; the first entry and any difference that
// involves a NaN or overflows are 0.
std::vector<double> FirstDifference(const std::vector<double>& series);

} // namespace autopsy::pass1

#pragma once

#include <vector>

namespace tradekit {
namespace stats {

// Simple returns v[i]/v[i-1] - 1. A previous value within epsilon of zero
// yields 0. Returns n-1 values (empty for n < 2).
std::vector<double> pct_changes(const std::vector<double>& series);

double mean(const std::vector<double>& x);

// Bessel-corrected; 0 for fewer than two samples.
double variance_sample(const std::vector<double>& x);
double stddev_sample(const std::vector<double>& x);

// Largest peak-to-trough decline as a fraction of the peak.
double max_drawdown(const std::vector<double>& series);

} // namespace stats
} // namespace tradekit

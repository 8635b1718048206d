#pragma once

#include <vector>
#include <cstddef>

namespace tradekit {
namespace indicators {

/**
 * Rolling simple moving average over `window` samples.
 * Output has the same length as the input; the first window-1 entries are NaN.
 * A window of 0 or longer than the input yields an all-NaN series.
 */
std::vector<double> sma(const std::vector<double>& data, size_t window);

} // namespace indicators
} // namespace tradekit

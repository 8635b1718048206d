#include "indicators.hpp"
#include <limits>

namespace tradekit {
namespace indicators {

std::vector<double> sma(const std::vector<double>& data, size_t window) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> out(data.size(), nan);
    if (window == 0 || window > data.size()) return out;

    const double n = static_cast<double>(window);
    double sum = 0.0;
    for (size_t i = 0; i < window; ++i) sum += data[i];
    out[window - 1] = sum / n;

    for (size_t i = window; i < data.size(); ++i) {
        sum += data[i];
        sum -= data[i - window];
        out[i] = sum / n;
    }
    return out;
}

} // namespace indicators
} // namespace tradekit

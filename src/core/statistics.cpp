#include "statistics.hpp"
#include <cmath>
#include <limits>

namespace tradekit {
namespace stats {

std::vector<double> pct_changes(const std::vector<double>& series) {
    std::vector<double> out;
    if (series.size() < 2) return out;
    out.reserve(series.size() - 1);
    for (size_t i = 1; i < series.size(); ++i) {
        double prev = series[i - 1];
        if (std::abs(prev) < std::numeric_limits<double>::epsilon()) {
            out.push_back(0.0);
        } else {
            out.push_back(series[i] / prev - 1.0);
        }
    }
    return out;
}

double mean(const std::vector<double>& x) {
    if (x.empty()) return 0.0;
    double sum = 0.0;
    for (double v : x) sum += v;
    return sum / static_cast<double>(x.size());
}

double variance_sample(const std::vector<double>& x) {
    if (x.size() < 2) return 0.0;
    double m = mean(x);
    double var = 0.0;
    for (double v : x) {
        double d = v - m;
        var += d * d;
    }
    return var / static_cast<double>(x.size() - 1);
}

double stddev_sample(const std::vector<double>& x) {
    return std::sqrt(variance_sample(x));
}

double max_drawdown(const std::vector<double>& series) {
    if (series.empty()) return 0.0;
    double peak = series.front();
    double max_dd = 0.0;
    for (double v : series) {
        if (v > peak) peak = v;
        double dd = peak > 0.0 ? (peak - v) / peak : 0.0;
        if (dd > max_dd) max_dd = dd;
    }
    return max_dd;
}

} // namespace stats
} // namespace tradekit

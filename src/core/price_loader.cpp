#include "price_loader.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace tradekit {

namespace {

bool parse_double(const std::string& s, double& out) {
    // strtod also takes hex floats; closes are decimal only
    if (s.empty() || s.find_first_of("xX") != std::string::npos) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end != begin + s.size()) return false;
    out = v;
    return true;
}

} // namespace

bool parse_price_row(const std::string& line, PricePoint& out) {
    auto fields = utils::split(line, kCsvDelimiter);
    if (fields.size() <= kCloseColumn) return false;
    double price = 0.0;
    if (!parse_double(utils::trim(fields[kCloseColumn]), price)) return false;
    out.date = utils::trim(fields[kDateColumn]);
    out.price = price;
    return true;
}

std::vector<PricePoint> load_date_and_prices(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    std::vector<PricePoint> rows;
    std::string line;
    bool header = true;
    while (std::getline(f, line)) {
        if (header) {
            header = false;
            continue;
        }
        PricePoint p;
        if (parse_price_row(line, p)) rows.push_back(std::move(p));
    }
    if (f.bad()) {
        throw std::runtime_error("read error on " + path);
    }
    return rows;
}

std::vector<TickerFile> discover_ticker_files(const std::string& folder,
                                              const std::string& suffix) {
    namespace fs = std::filesystem;
    std::vector<TickerFile> out;
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        spdlog::warn("Data folder {} not found", folder);
        return out;
    }
    for (const auto& entry : fs::directory_iterator(folder, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        std::string name = entry.path().filename().string();
        if (!utils::ends_with(name, suffix)) continue;
        std::string ticker = name.substr(0, name.size() - suffix.size());
        if (ticker.empty()) continue;
        out.push_back({ticker, entry.path().string()});
    }
    if (ec) {
        spdlog::warn("Listing {} stopped early: {}", folder, ec.message());
    }
    std::sort(out.begin(), out.end(),
              [](const TickerFile& a, const TickerFile& b) { return a.path < b.path; });
    return out;
}

} // namespace tradekit

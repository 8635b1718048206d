#pragma once

#include <string>
#include <vector>

namespace tradekit {

struct PricePoint {
    std::string date;
    double price{0.0};
};

struct TickerFile {
    std::string ticker;
    std::string path;
};

constexpr char kCsvDelimiter = ',';
constexpr size_t kDateColumn = 0;
constexpr size_t kCloseColumn = 4;

/**
 * Load (date, close) pairs from one ticker file.
 * The first line is treated as a header. Rows with fewer than five fields or
 * an unparseable close are dropped. Throws std::runtime_error if the file
 * cannot be opened.
 */
std::vector<PricePoint> load_date_and_prices(const std::string& path);

/**
 * Parse one data row. Returns false when the row has to be dropped.
 */
bool parse_price_row(const std::string& line, PricePoint& out);

/**
 * List "<TICKER><suffix>" files in `folder`, sorted by path.
 * A missing folder yields an empty list.
 */
std::vector<TickerFile> discover_ticker_files(const std::string& folder,
                                              const std::string& suffix);

} // namespace tradekit

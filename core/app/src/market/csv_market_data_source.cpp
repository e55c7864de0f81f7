#include "stratlab/market/csv_market_data_source.hpp"

#include "stratlab/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace stratlab {

using domain::PriceBar;
using domain::PriceSeries;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

std::string trim(const std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n\"");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r\n\"");
  return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& line, char delim) {
  std::vector<std::string> parts;
  std::istringstream iss(line);
  std::string part;
  while (std::getline(iss, part, delim)) {
    parts.push_back(trim(part));
  }
  // getline drops a trailing empty field ("a,b,").
  if (!line.empty() && line.back() == delim) {
    parts.emplace_back();
  }
  return parts;
}

std::string lower(std::string s) {
  for (auto& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

int findColumn(const std::vector<std::string>& headers,
               const std::vector<std::string>& names) {
  for (const auto& name : names) {
    for (std::size_t i = 0; i < headers.size(); ++i) {
      if (lower(headers[i]) == name) {
        return static_cast<int>(i);
      }
    }
  }
  return -1;
}

// Whole-field numeric parse; nullopt on empty or trailing garbage.
std::optional<double> parseNumber(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || errno == ERANGE) {
    return std::nullopt;
  }
  return value;
}

struct Row {
  PriceBar bar;
  std::vector<double> extras;
};

}  // namespace

CsvMarketDataSource::CsvMarketDataSource(std::string path)
    : path_(std::move(path)) {}

// -----------------------------------------------------------------------------
// load()
// -----------------------------------------------------------------------------
PriceSeries CsvMarketDataSource::load() {
  skipped_rows_ = 0;

  std::ifstream in(path_);
  if (!in.is_open()) {
    throw std::runtime_error("Cannot open market data file: " + path_);
  }

  std::string line;
  if (!std::getline(in, line)) {
    throw std::runtime_error("Market data file is empty: " + path_);
  }
  const std::vector<std::string> headers = split(line, ',');

  const int i_time = findColumn(headers, {"timestamp", "date", "datetime"});
  const int i_open = findColumn(headers, {"open"});
  const int i_high = findColumn(headers, {"high"});
  const int i_low = findColumn(headers, {"low"});
  const int i_close = findColumn(headers, {"close"});
  const int i_volume = findColumn(headers, {"volume"});

  if (i_time < 0 || i_open < 0 || i_high < 0 || i_low < 0 || i_close < 0) {
    throw std::runtime_error(
        "Market data file " + path_ +
        " needs timestamp|date|datetime, open, high, low and close columns");
  }

  std::vector<std::size_t> extra_columns;
  for (std::size_t i = 0; i < headers.size(); ++i) {
    const int c = static_cast<int>(i);
    if (c != i_time && c != i_open && c != i_high && c != i_low &&
        c != i_close && c != i_volume && !headers[i].empty()) {
      extra_columns.push_back(i);
    }
  }

  std::vector<Row> rows;
  std::size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (trim(line).empty()) {
      continue;
    }
    const std::vector<std::string> fields = split(line, ',');
    if (fields.size() < headers.size()) {
      std::cerr << "[CsvMarketDataSource] " << path_ << ":" << line_no
                << ": expected " << headers.size() << " fields, got "
                << fields.size() << ", row skipped\n";
      ++skipped_rows_;
      continue;
    }

    const auto ts = parse_timestamp(fields[static_cast<std::size_t>(i_time)]);
    const auto open = parseNumber(fields[static_cast<std::size_t>(i_open)]);
    const auto high = parseNumber(fields[static_cast<std::size_t>(i_high)]);
    const auto low = parseNumber(fields[static_cast<std::size_t>(i_low)]);
    const auto close = parseNumber(fields[static_cast<std::size_t>(i_close)]);
    if (!ts || !open || !high || !low || !close) {
      std::cerr << "[CsvMarketDataSource] " << path_ << ":" << line_no
                << ": bad timestamp or price, row skipped\n";
      ++skipped_rows_;
      continue;
    }

    Row row;
    row.bar.timestamp = *ts;
    row.bar.open = *open;
    row.bar.high = *high;
    row.bar.low = *low;
    row.bar.close = *close;
    if (i_volume >= 0) {
      row.bar.volume =
          parseNumber(fields[static_cast<std::size_t>(i_volume)]).value_or(0.0);
    }
    row.extras.reserve(extra_columns.size());
    for (std::size_t col : extra_columns) {
      row.extras.push_back(parseNumber(fields[col]).value_or(kNaN));
    }
    rows.push_back(std::move(row));
  }

  std::stable_sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
    return a.bar.timestamp < b.bar.timestamp;
  });

  std::vector<PriceBar> bars;
  std::vector<std::vector<double>> extras(extra_columns.size());
  bars.reserve(rows.size());
  for (const Row& row : rows) {
    if (!bars.empty() && bars.back().timestamp == row.bar.timestamp) {
      std::cerr << "[CsvMarketDataSource] Duplicate timestamp "
                << to_iso8601(row.bar.timestamp) << ", row skipped\n";
      ++skipped_rows_;
      continue;
    }
    bars.push_back(row.bar);
    for (std::size_t k = 0; k < extra_columns.size(); ++k) {
      extras[k].push_back(row.extras[k]);
    }
  }

  PriceSeries series(std::move(bars));
  for (std::size_t k = 0; k < extra_columns.size(); ++k) {
    series.setColumn(headers[extra_columns[k]], std::move(extras[k]));
  }

  std::cout << "[CsvMarketDataSource] Loaded " << series.size() << " bars from "
            << path_ << " (" << skipped_rows_ << " skipped)\n";
  return series;
}

}  // namespace stratlab

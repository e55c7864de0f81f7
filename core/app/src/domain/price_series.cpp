#include "stratlab/domain/price_series.hpp"

#include <stdexcept>
#include <utility>

namespace stratlab {
namespace domain {

// -----------------------------------------------------------------------------
// Constructor: take ownership and validate ordering
// -----------------------------------------------------------------------------
PriceSeries::PriceSeries(std::vector<PriceBar> bars) : bars_(std::move(bars)) {
  for (std::size_t i = 1; i < bars_.size(); ++i) {
    if (!(bars_[i - 1].timestamp < bars_[i].timestamp)) {
      throw std::invalid_argument(
          "PriceSeries: timestamps must be strictly increasing (bar " +
          std::to_string(i) + ")");
    }
  }
}

std::vector<double> PriceSeries::closes() const {
  std::vector<double> result;
  result.reserve(bars_.size());
  for (const auto& bar : bars_) {
    result.push_back(bar.close);
  }
  return result;
}

void PriceSeries::setColumn(const std::string& name,
                            std::vector<double> values) {
  if (values.size() != bars_.size()) {
    throw std::invalid_argument("PriceSeries: column '" + name + "' has " +
                                std::to_string(values.size()) +
                                " values, expected " +
                                std::to_string(bars_.size()));
  }
  columns_[name] = std::move(values);
}

bool PriceSeries::hasColumn(const std::string& name) const {
  return columns_.find(name) != columns_.end();
}

const std::vector<double>& PriceSeries::column(const std::string& name) const {
  auto it = columns_.find(name);
  if (it == columns_.end()) {
    throw std::out_of_range("PriceSeries: no column named '" + name + "'");
  }
  return it->second;
}

std::vector<std::string> PriceSeries::columnNames() const {
  std::vector<std::string> names;
  names.reserve(columns_.size());
  for (const auto& [name, values] : columns_) {
    names.push_back(name);
  }
  return names;
}

}  // namespace domain
}  // namespace stratlab

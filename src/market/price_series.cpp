#include <ov/market/price_series.hpp>
#include <ov/core/errors.hpp>

#include <utility>

namespace ov {
namespace market {

PriceSeries::PriceSeries(std::string ticker, std::vector<PriceObservation> observations)
    : ticker_(std::move(ticker)), obs_(std::move(observations)) {
  for (std::size_t i = 1; i < obs_.size(); ++i) {
    if (!(obs_[i - 1].date < obs_[i].date)) {
      throw DataError("PriceSeries(" + ticker_ + "): dates must be strictly increasing (" +
                      obs_[i - 1].date.to_string() + " then " + obs_[i].date.to_string() + ")");
    }
  }
}

} // namespace market
} // namespace ov

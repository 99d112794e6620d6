#pragma once
/**
 * @file price_series.hpp
 * @brief Série de cours ajustés d’un ticker.
 *
 * # Invariants
 * - Dates strictement croissantes (donc sans doublon).
 * - Immuable après construction.
 *
 * Une série vide est autorisée ici : c’est l’estimateur de volatilité qui la
 * refuse (DataError), et la source de marché qui la signale (NoDataError).
 */

#include <ov/core/date.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace ov {
namespace market {

struct PriceObservation {
  core::Date date;
  double     adj_close;
};

class PriceSeries {
public:
  /// @throws ov::DataError si les dates ne sont pas strictement croissantes.
  PriceSeries(std::string ticker, std::vector<PriceObservation> observations);

  const std::string& ticker() const noexcept { return ticker_; }
  const std::vector<PriceObservation>& observations() const noexcept { return obs_; }

  std::size_t size() const noexcept { return obs_.size(); }
  bool empty() const noexcept { return obs_.empty(); }

private:
  std::string ticker_;
  std::vector<PriceObservation> obs_;
};

} // namespace market
} // namespace ov

#pragma once
/**
 * @file market_source.hpp
 * @brief Interface du fournisseur de données de marché (cours, taux).
 *
 * Le coeur ne fait aucune I/O lui-même : il consomme cette interface.
 * Les appels sont bloquants ; timeouts/retries relèvent de l’implémentation.
 */

#include <ov/core/date.hpp>
#include <ov/market/price_series.hpp>

#include <string>

namespace ov {
namespace market {

class MarketDataSource {
public:
  virtual ~MarketDataSource() = default;

  /// @brief Cours ajustés de `ticker` sur [start, end) (end exclu).
  /// @throws ov::NoDataError si l’intervalle ne contient aucune observation.
  virtual PriceSeries fetch_price_series(const std::string& ticker,
                                         const core::Date& start,
                                         const core::Date& end) = 0;

  /// @brief Rendement (en %) de l’instrument `symbol` autour de `around`.
  /// @throws ov::NoDataError si aucune cotation n’est disponible.
  virtual double fetch_yield(const std::string& symbol, const core::Date& around) = 0;
};

} // namespace market
} // namespace ov

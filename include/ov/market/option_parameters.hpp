#pragma once
/**
 * @file option_parameters.hpp
 * @brief Caractéristiques de l’attribution d’options à valoriser.
 *
 * # Contenu
 * - Spot S (> 0) et strike K (> 0), en devise.
 * - Dates : attribution, valorisation, expiration, fin d’acquisition (vesting).
 *
 * # Domaine valide
 * - spot > 0, strike > 0.
 * - L’ordre des dates est vérifié au calcul de maturité (DomainError),
 *   pas ici : la date d’attribution n’intervient que dans le rapport.
 *
 * Immuables après construction.
 */

#include <ov/core/date.hpp>
#include <ov/core/errors.hpp>

namespace ov {
namespace market {

struct OptionParameters {
public:
  const double     spot;             ///< Cours de l’action (> 0).
  const double     strike;           ///< Prix d’exercice (> 0).
  const core::Date grant_date;       ///< Date d’attribution.
  const core::Date valuation_date;   ///< Date de valorisation.
  const core::Date expiration_date;  ///< Date d’expiration.
  const core::Date vesting_end_date; ///< Fin de la période d’acquisition.

  /// @throws ov::ConfigError si spot <= 0 ou strike <= 0.
  OptionParameters(double spot, double strike,
                   core::Date grant_date, core::Date valuation_date,
                   core::Date expiration_date, core::Date vesting_end_date)
      : spot(spot), strike(strike),
        grant_date(grant_date), valuation_date(valuation_date),
        expiration_date(expiration_date), vesting_end_date(vesting_end_date) {
    if (!(spot > 0.0)) {
      throw ConfigError("OptionParameters: stock_price must be > 0");
    }
    if (!(strike > 0.0)) {
      throw ConfigError("OptionParameters: strike_price must be > 0");
    }
  }
};

} // namespace market
} // namespace ov

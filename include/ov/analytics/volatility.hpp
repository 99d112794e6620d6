#pragma once
/**
 * @file volatility.hpp
 * @brief Volatilité historique annualisée et agrégation sur un panier de comparables.
 *
 * # Estimation (un ticker)
 * 1. Rééchantillonnage : daily (aucun), weekly (dernier cours de chaque semaine
 *    samedi..vendredi, étiquetée par le vendredi), monthly (dernier cours du mois).
 * 2. Rendements log r_t = ln(P_t / P_{t-1}) entre observations consécutives.
 *    En weekly/monthly, une période sans cotation coupe la série : aucun
 *    rendement n’est calculé à travers elle.
 * 3. Écart-type d’échantillon (n-1).
 * 4. Annualisation : x sqrt(252 | 52 | 12).
 * 5. En pourcentage, arrondi à 2 décimales.
 *
 * # Agrégation
 * Chaque ticker produit un TickerVolatility : soit une estimation, soit une
 * FetchError. Tout échec d’un ticker (std::exception) est enregistré, jamais
 * propagé ; seule ov::CanceledError remonte à l’appelant.
 * Moyenne = moyenne arithmétique des % réussis / 100 (fraction).
 */

#include <ov/config/valuation_config.hpp>
#include <ov/core/date.hpp>
#include <ov/market/price_series.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ov {
namespace analytics {

struct VolatilityEstimate {
  std::string ticker;
  core::Date  period_start;
  core::Date  period_end;
  double      annualized_volatility_percent; ///< ex. 27.34
  std::size_t n_returns;                     ///< nombre de rendements utilisés
};

struct FetchError {
  std::string ticker;
  std::string message;
};

/// Résultat par ticker : exactement un des deux est renseigné.
struct TickerVolatility {
  std::string ticker;
  std::optional<VolatilityEstimate> estimate;
  std::optional<FetchError> error;

  bool ok() const noexcept { return estimate.has_value(); }
};

struct VolatilityAggregate {
  std::vector<TickerVolatility>   table;     ///< même ordre que les tickers en entrée
  std::vector<VolatilityEstimate> successes;
  std::vector<FetchError>         failures;
  std::optional<double>           average;   ///< fraction (0.2734), absente si aucun succès

  /// Moyenne en %, arrondie à 2 décimales (ligne "Average" du rapport).
  std::optional<double> average_percent_rounded() const;
};

/// Dernière observation par période (ordre chronologique conservé).
std::vector<market::PriceObservation>
resample(const market::PriceSeries& series, config::Frequency frequency);

/// ln(P_t / P_{t-1}) ; taille = n - 1 (vide si n < 2).
/// @throws ov::DataError si un cours est <= 0.
std::vector<double> log_returns(const std::vector<market::PriceObservation>& obs);

/// Idem sur une série rééchantillonnée : seules les paires de périodes
/// adjacentes donnent un rendement (daily : toutes les paires).
/// @throws ov::DataError si un cours est <= 0.
std::vector<double> log_returns(const std::vector<market::PriceObservation>& obs,
                                config::Frequency frequency);

/// @brief Volatilité annualisée en %, arrondie à 2 décimales.
/// @param n_returns (optionnel) nombre de rendements utilisés.
/// @throws ov::DataError si la série est vide, s’il reste moins de 2 observations
///         après rééchantillonnage ou si l’écart-type est indéfini (< 2 rendements).
double estimate_volatility(const market::PriceSeries& series,
                           config::Frequency frequency,
                           std::size_t* n_returns = nullptr);

using PriceFetcher = std::function<market::PriceSeries(const std::string& ticker,
                                                       const core::Date& start,
                                                       const core::Date& end)>;

/// Appelé après chaque ticker (index dans la liste, résultat).
using TickerCallback = std::function<void(std::size_t index, const TickerVolatility& result)>;

/// @brief Estime chaque ticker puis moyenne les succès.
/// @param stop si non nul et positionné entre deux tickers : ov::CanceledError.
VolatilityAggregate aggregate_volatility(const std::vector<std::string>& tickers,
                                         const core::Date& period_start,
                                         const core::Date& period_end,
                                         config::Frequency frequency,
                                         const PriceFetcher& fetch,
                                         const std::atomic<bool>* stop = nullptr,
                                         const TickerCallback& on_ticker = {});

} // namespace analytics
} // namespace ov

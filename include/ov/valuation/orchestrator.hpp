#pragma once
/**
 * @file orchestrator.hpp
 * @brief Pipeline de valorisation : maturité -> volatilité -> courbe -> Black–Scholes.
 *
 * # Étapes (dans cet ordre, sans reprise automatique)
 * 1. YTM = compute_maturity(valorisation, expiration, fin de vesting).
 * 2. Fenêtre d’historique [valorisation - YTM ans, valorisation).
 * 3. Volatilité moyenne des comparables (échecs par ticker enregistrés).
 * 4. Taux des instruments de référence (échecs enregistrés, taux absent) -> courbe.
 * 5. r = lookup(courbe, YTM) / 100.
 * 6. Prix = price_call_bs(S, K, YTM, r, sigma moyenne).
 *
 * Les échecs de récupération par ticker / par instrument sont enregistrés
 * (toute std::exception sauf CanceledError) ; les autres erreurs remontent
 * telles quelles (InsufficientDataError si aucun comparable,
 * MaturityNotFoundError, DomainError, ...).
 *
 * # Annulation
 * `stop` est consulté entre deux tickers et entre deux instruments :
 * ov::CanceledError, aucun résultat partiel n’est renvoyé.
 */

#include <ov/analytics/volatility.hpp>
#include <ov/analytics/yield_curve.hpp>
#include <ov/config/valuation_config.hpp>
#include <ov/core/date.hpp>
#include <ov/market/market_source.hpp>
#include <ov/market/option_parameters.hpp>

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace ov {
namespace valuation {

/// Écho des entrées (copiable, pour le rapport).
struct InputEcho {
  double     spot{0.0};
  double     strike{0.0};
  core::Date grant_date;
  core::Date valuation_date;
  core::Date expiration_date;
  core::Date vesting_end_date;
};

struct ValuationResult {
  int    years_to_maturity{0};
  double risk_free_rate{0.0};      ///< décimal (0.0169)
  double average_volatility{0.0};  ///< décimal (0.2734)
  double option_value{0.0};

  InputEcho         inputs;
  config::Frequency frequency{config::Frequency::Daily};
  core::Date        history_start;
  core::Date        history_end;

  analytics::VolatilityAggregate     volatility;
  std::vector<analytics::YieldPoint> yield_points;   ///< y compris les absents
  std::vector<analytics::FetchError> yield_failures; ///< ticker = libellé "<N>-year"
  analytics::YieldCurve              curve;
};

struct RunOptions {
  const std::atomic<bool>* stop = nullptr;

  /// Étape en cours ("volatility", "yields", ...), cur/total dans l’étape.
  std::function<void(const std::string& stage, int cur, int total)> on_progress;

  analytics::TickerCallback on_ticker;
};

ValuationResult run_valuation(const market::OptionParameters& params,
                              const std::vector<std::string>& tickers,
                              config::Frequency frequency,
                              const std::vector<config::YieldInstrument>& instruments,
                              market::MarketDataSource& source,
                              const RunOptions& options = {});

/// Variante depuis une configuration complète (validée : ConfigError).
ValuationResult run_valuation(const config::ValuationConfig& cfg,
                              market::MarketDataSource& source,
                              const RunOptions& options = {});

} // namespace valuation
} // namespace ov

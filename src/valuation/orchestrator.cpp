#include <ov/valuation/orchestrator.hpp>
#include <ov/analytics/maturity.hpp>
#include <ov/core/errors.hpp>
#include <ov/pricing/analytic_bs.hpp>

#include <utility>

namespace ov {
namespace valuation {

namespace {

void check_stop(const RunOptions& opt, const char* where) {
  if (opt.stop && opt.stop->load(std::memory_order_relaxed)) {
    throw CanceledError(std::string("Valuation canceled during ") + where);
  }
}

void report(const RunOptions& opt, const char* stage, int cur, int total) {
  if (opt.on_progress) opt.on_progress(stage, cur, total);
}

} // namespace

ValuationResult run_valuation(const market::OptionParameters& params,
                              const std::vector<std::string>& tickers,
                              config::Frequency frequency,
                              const std::vector<config::YieldInstrument>& instruments,
                              market::MarketDataSource& source,
                              const RunOptions& options) {
  ValuationResult res;
  res.inputs = InputEcho{params.spot, params.strike, params.grant_date, params.valuation_date,
                         params.expiration_date, params.vesting_end_date};
  res.frequency = frequency;

  // 1) maturité
  report(options, "maturity", 0, 1);
  res.years_to_maturity = analytics::compute_maturity(params.valuation_date,
                                                      params.expiration_date,
                                                      params.vesting_end_date);
  if (res.years_to_maturity < 1) {
    // fenêtre d’historique vide et T = 0 pour Black–Scholes
    throw DomainError("Years to maturity rounds to " + std::to_string(res.years_to_maturity) +
                      "; the model needs at least 1 year");
  }
  report(options, "maturity", 1, 1);

  // 2) fenêtre d’historique
  res.history_start = analytics::history_start(params.valuation_date, res.years_to_maturity);
  res.history_end   = params.valuation_date;

  // 3) volatilité des comparables
  const int n_tickers = static_cast<int>(tickers.size());
  report(options, "volatility", 0, n_tickers);
  analytics::PriceFetcher fetch = [&source](const std::string& t, const core::Date& a, const core::Date& b) {
    return source.fetch_price_series(t, a, b);
  };
  analytics::TickerCallback on_ticker = [&options, n_tickers](std::size_t i, const analytics::TickerVolatility& tv) {
    if (options.on_ticker) options.on_ticker(i, tv);
    report(options, "volatility", static_cast<int>(i) + 1, n_tickers);
  };
  res.volatility = analytics::aggregate_volatility(tickers, res.history_start, res.history_end,
                                                   frequency, fetch, options.stop, on_ticker);
  if (!res.volatility.average) {
    std::string why = "No volatility could be computed for any comparable ticker";
    for (const auto& f : res.volatility.failures) why += "; " + f.ticker + ": " + f.message;
    throw InsufficientDataError(why);
  }
  res.average_volatility = *res.volatility.average;

  // 4) taux de référence -> courbe
  const int n_inst = static_cast<int>(instruments.size());
  report(options, "yields", 0, n_inst);
  res.yield_points.reserve(instruments.size());
  for (std::size_t i = 0; i < instruments.size(); ++i) {
    check_stop(options, "yield retrieval");
    const auto& inst = instruments[i];
    analytics::YieldPoint pt{inst.maturity_years, std::nullopt, inst.symbol};
    try {
      pt.yield_percent = source.fetch_yield(inst.symbol, params.valuation_date);
    } catch (const CanceledError&) {
      throw;
    } catch (const std::exception& e) {
      res.yield_failures.push_back({analytics::YieldCurve::label(inst.maturity_years), e.what()});
    }
    res.yield_points.push_back(std::move(pt));
    report(options, "yields", static_cast<int>(i) + 1, n_inst);
  }
  res.curve = analytics::build_curve(res.yield_points);

  // 5) taux sans risque à l’horizon
  res.risk_free_rate = analytics::lookup(res.curve, res.years_to_maturity) / 100.0;

  // 6) Black–Scholes
  report(options, "pricing", 0, 1);
  res.option_value = pricing::price_call_bs(params.spot, params.strike,
                                            static_cast<double>(res.years_to_maturity),
                                            res.risk_free_rate, res.average_volatility);
  report(options, "pricing", 1, 1);
  return res;
}

ValuationResult run_valuation(const config::ValuationConfig& cfg,
                              market::MarketDataSource& source,
                              const RunOptions& options) {
  const auto params = config::to_option_parameters(cfg);
  return run_valuation(params, cfg.public_comps, cfg.frequency, cfg.treasury, source, options);
}

} // namespace valuation
} // namespace ov

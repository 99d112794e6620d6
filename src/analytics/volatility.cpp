#include <ov/analytics/volatility.hpp>
#include <ov/core/errors.hpp>
#include <ov/core/stats.hpp>

#include <cmath>
#include <utility>

namespace ov {
namespace analytics {

namespace {

// Clé de période : serial du vendredi de clôture (weekly), année*12+mois (monthly).
long period_key(const core::Date& d, config::Frequency f) noexcept {
  switch (f) {
    case config::Frequency::Weekly: {
      const int to_friday = (4 - d.weekday() + 7) % 7; // samedi -> +6, dimanche -> +5
      return d.serial() + to_friday;
    }
    case config::Frequency::Monthly:
      return static_cast<long>(d.year()) * 12 + static_cast<long>(d.month()) - 1;
    case config::Frequency::Daily:
      break;
  }
  return d.serial();
}

// Écart entre deux périodes consécutives (weekly : 7 jours entre vendredis).
long period_step(config::Frequency f) noexcept {
  return f == config::Frequency::Weekly ? 7 : 1;
}

} // namespace

std::optional<double> VolatilityAggregate::average_percent_rounded() const {
  if (!average) return std::nullopt;
  return core::round_to(*average * 100.0, 2);
}

std::vector<market::PriceObservation>
resample(const market::PriceSeries& series, config::Frequency frequency) {
  const auto& obs = series.observations();
  if (frequency == config::Frequency::Daily) return obs;

  std::vector<market::PriceObservation> out;
  long current = 0;
  for (const auto& o : obs) {
    const long key = period_key(o.date, frequency);
    if (!out.empty() && key == current) {
      out.back() = o; // dernière observation de la période
    } else {
      out.push_back(o);
      current = key;
    }
  }
  return out;
}

std::vector<double> log_returns(const std::vector<market::PriceObservation>& obs) {
  std::vector<double> r;
  if (obs.size() < 2) return r;
  r.reserve(obs.size() - 1);
  for (std::size_t i = 0; i < obs.size(); ++i) {
    if (!(obs[i].adj_close > 0.0)) {
      throw DataError("Non-positive price on " + obs[i].date.to_string());
    }
    if (i > 0) r.push_back(std::log(obs[i].adj_close / obs[i - 1].adj_close));
  }
  return r;
}

std::vector<double> log_returns(const std::vector<market::PriceObservation>& obs,
                                config::Frequency frequency) {
  if (frequency == config::Frequency::Daily) return log_returns(obs);

  std::vector<double> r;
  if (obs.size() < 2) return r;
  r.reserve(obs.size() - 1);
  for (std::size_t i = 0; i < obs.size(); ++i) {
    if (!(obs[i].adj_close > 0.0)) {
      throw DataError("Non-positive price on " + obs[i].date.to_string());
    }
    if (i == 0) continue;
    const long gap = period_key(obs[i].date, frequency) - period_key(obs[i - 1].date, frequency);
    if (gap != period_step(frequency)) continue; // période vide entre les deux
    r.push_back(std::log(obs[i].adj_close / obs[i - 1].adj_close));
  }
  return r;
}

double estimate_volatility(const market::PriceSeries& series,
                           config::Frequency frequency,
                           std::size_t* n_returns) {
  if (series.empty()) {
    throw DataError("Empty price series for " + series.ticker());
  }
  const auto sampled = resample(series, frequency);
  if (sampled.size() < 2) {
    throw DataError("Not enough " + std::string(config::to_string(frequency)) +
                    " observations for " + series.ticker() + " (" +
                    std::to_string(sampled.size()) + ")");
  }

  core::RunningStats acc;
  for (double r : log_returns(sampled, frequency)) acc.add(r);

  const double sd = acc.stddev();
  if (!std::isfinite(sd)) {
    throw DataError("Sample deviation undefined for " + series.ticker() + " (" +
                    std::to_string(acc.count()) + " return)");
  }
  if (n_returns) *n_returns = acc.count();

  const double annual = sd * std::sqrt(static_cast<double>(config::periods_per_year(frequency)));
  return core::round_to(annual * 100.0, 2);
}

VolatilityAggregate aggregate_volatility(const std::vector<std::string>& tickers,
                                         const core::Date& period_start,
                                         const core::Date& period_end,
                                         config::Frequency frequency,
                                         const PriceFetcher& fetch,
                                         const std::atomic<bool>* stop,
                                         const TickerCallback& on_ticker) {
  VolatilityAggregate agg;
  agg.table.reserve(tickers.size());

  for (std::size_t i = 0; i < tickers.size(); ++i) {
    if (stop && stop->load(std::memory_order_relaxed)) {
      throw CanceledError("Volatility aggregation canceled");
    }
    const std::string& ticker = tickers[i];

    TickerVolatility row;
    row.ticker = ticker;
    try {
      const auto series = fetch(ticker, period_start, period_end);
      std::size_t n = 0;
      const double pct = estimate_volatility(series, frequency, &n);
      row.estimate = VolatilityEstimate{ticker, period_start, period_end, pct, n};
    } catch (const CanceledError&) {
      throw;
    } catch (const std::exception& e) {
      row.error = FetchError{ticker, e.what()};
    }

    if (row.ok()) agg.successes.push_back(*row.estimate);
    else          agg.failures.push_back(*row.error);

    if (on_ticker) on_ticker(i, row);
    agg.table.push_back(std::move(row));
  }

  if (!agg.successes.empty()) {
    double sum = 0.0;
    for (const auto& s : agg.successes) sum += s.annualized_volatility_percent;
    agg.average = sum / static_cast<double>(agg.successes.size()) / 100.0;
  }
  return agg;
}

} // namespace analytics
} // namespace ov

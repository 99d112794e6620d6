#include "ov/valuation/orchestrator.hpp"
#include "ov/valuation/report.hpp"
#include "ov/core/errors.hpp"
#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

using ov::core::Date;
using ov::market::PriceObservation;
using ov::market::PriceSeries;

// Source en mémoire : séries de cours et taux fixes ; symboles/tickers absents -> NoDataError
class FakeSource : public ov::market::MarketDataSource {
public:
  std::map<std::string, std::vector<PriceObservation>> prices;
  std::map<std::string, double> yields;
  std::set<std::string> broken;   // DataError simulée
  std::set<std::string> offline;  // erreur de transport (hors hiérarchie ov)
  int price_calls = 0;
  Date last_start, last_end;

  PriceSeries fetch_price_series(const std::string& t, const Date& start, const Date& end) override {
    ++price_calls;
    last_start = start; last_end = end;
    if (offline.count(t)) throw std::runtime_error("connection reset");
    if (broken.count(t)) throw ov::DataError("malformed response for " + t);
    auto it = prices.find(t);
    if (it == prices.end()) throw ov::NoDataError("No data found for " + t);
    std::vector<PriceObservation> obs;
    for (const auto& o : it->second) if (o.date >= start && o.date < end) obs.push_back(o);
    if (obs.empty()) throw ov::NoDataError("No data found for " + t + " in window");
    return PriceSeries(t, obs);
  }

  double fetch_yield(const std::string& symbol, const Date&) override {
    if (offline.count(symbol)) throw std::runtime_error("connection reset");
    auto it = yields.find(symbol);
    if (it == yields.end()) throw ov::NoDataError("No data found for " + symbol);
    return it->second;
  }
};

// Rendements alternés +a / -a : volatilité annualisée daily = 30 % exactement
static std::vector<PriceObservation> thirty_pct_path(Date start, int n_returns) {
  const double n = static_cast<double>(n_returns);
  const double a = 0.30 / std::sqrt(252.0) * std::sqrt((n - 1.0) / n);
  std::vector<PriceObservation> obs;
  double p = 100.0;
  for (int i = 0; i <= n_returns; ++i) {
    obs.push_back({start.add_days(i), p});
    p *= std::exp((i % 2 == 0) ? a : -a);
  }
  return obs;
}

static FakeSource make_source() {
  FakeSource s;
  s.prices["AAA"] = thirty_pct_path(Date(2019, 6, 1), 100);
  s.prices["BBB"] = thirty_pct_path(Date(2018, 3, 1), 200);
  s.yields = {{"^IRX", 1.50}, {"^FVX", 1.70}, {"^TNX", 1.90}, {"^TYX", 2.30}};
  return s;
}

static ov::config::ValuationConfig make_config() {
  ov::config::ValuationConfig cfg;
  cfg.stock_price      = 50.0;
  cfg.strike_price     = 45.0;
  cfg.grant_date       = "2019-07-01";
  cfg.valuation_date   = "2020-01-01";
  cfg.expiration_date  = "2025-01-01";
  cfg.vesting_end_date = "2023-01-01";
  cfg.public_comps     = {"AAA", "BBB"};
  return cfg;
}

template <class E, class F>
static bool throws_as(F f) {
  try { f(); } catch (const E&) { return true; }
  return false;
}

int main() {
  using namespace ov::valuation;

  // --- Bout en bout : YTM 4, sigma 30 %, r = 1.65 % (interpolé entre 1 et 5 ans) ---
  {
    auto src = make_source();
    std::vector<std::string> stages;
    RunOptions opt;
    opt.on_progress = [&](const std::string& st, int, int) {
      if (stages.empty() || stages.back() != st) stages.push_back(st);
    };
    const auto res = run_valuation(make_config(), src, opt);

    std::cout << "YTM=" << res.years_to_maturity << " r=" << res.risk_free_rate
              << " sigma=" << res.average_volatility << " value=" << res.option_value << "\n";
    assert(res.years_to_maturity == 4);
    assert(res.history_start == Date(2016, 1, 1));
    assert(res.history_end == Date(2020, 1, 1));
    assert(src.last_start == Date(2016, 1, 1) && src.last_end == Date(2020, 1, 1));
    assert(std::abs(res.average_volatility - 0.30) < 1e-12);
    assert(std::abs(res.risk_free_rate - 0.0165) < 1e-12);
    assert(std::abs(res.option_value - 15.225442) < 1e-5);
    assert(res.volatility.failures.empty() && res.yield_failures.empty());
    assert(res.curve.max_maturity() == 30);
    assert((stages == std::vector<std::string>{"maturity", "volatility", "yields", "pricing"}));

    // Rapport
    const auto rep = build_report(res);
    assert(rep.summary.rows.size() == 10);
    assert(rep.summary.rows[0][1] == "7/1/2019");
    assert(rep.summary.rows[6][1] == "4");
    assert(rep.summary.rows[7][1] == "0.0165");
    assert(rep.summary.rows[8][1] == "0.3");
    assert(rep.summary.rows[9][0] == "Option Valuation" && rep.summary.rows[9][1] == "15.23");
    assert(rep.volatility.header[1] == "2016-01-01 to 2020-01-01");
    assert(rep.volatility.rows.size() == 3);
    assert(rep.volatility.rows.back()[0] == "Average" && rep.volatility.rows.back()[1] == "30");
    assert(rep.risk_free_rate.rows.size() == 30);
    assert(rep.risk_free_rate.rows[3][0] == "4-year" && rep.risk_free_rate.rows[3][1] == "1.65");
    assert(rep.risk_free_rate.rows[3][2] == "interpolated");
    assert(rep.risk_free_rate.rows[4][2] == "known");
  }

  // --- Comparable en échec : enregistré, la moyenne porte sur les autres ---
  {
    auto src = make_source();
    src.broken.insert("BBB");
    auto cfg = make_config();
    cfg.public_comps = {"AAA", "BBB", "NOPE"};
    const auto res = run_valuation(cfg, src);
    assert(res.volatility.successes.size() == 1);
    assert(res.volatility.failures.size() == 2);
    assert(std::abs(res.average_volatility - 0.30) < 1e-12);
    const auto rep = build_report(res);
    assert(rep.volatility.rows[1][2].find("malformed") != std::string::npos);
  }

  // --- Instrument 30 ans absent : courbe jusqu’à 30 ans, échec enregistré ---
  {
    auto src = make_source();
    src.yields.erase("^TYX");
    const auto res = run_valuation(make_config(), src);
    assert(res.yield_failures.size() == 1 && res.yield_failures[0].ticker == "30-year");
    assert(res.curve.max_maturity() == 30);
    assert(std::abs(res.risk_free_rate - 0.0165) < 1e-12);
    assert(res.yield_points.size() == 4 && !res.yield_points.back().yield_percent);
  }

  // --- Erreur de transport sur un ticker et un instrument : enregistrées ---
  {
    auto src = make_source();
    src.offline = {"FLAKY", "^TNX"};
    auto cfg = make_config();
    cfg.public_comps = {"FLAKY", "AAA"};
    const auto res = run_valuation(cfg, src);
    assert(res.volatility.failures.size() == 1);
    assert(res.volatility.failures[0].ticker == "FLAKY");
    assert(res.volatility.failures[0].message == "connection reset");
    assert(std::abs(res.average_volatility - 0.30) < 1e-12);
    assert(res.yield_failures.size() == 1 && res.yield_failures[0].ticker == "10-year");
    assert(res.curve.at(10).source == ov::analytics::YieldCurve::Source::Interpolated);
    assert(std::abs(res.risk_free_rate - 0.0165) < 1e-12);
    assert(std::abs(res.option_value - 15.225442) < 1e-5);
  }

  // --- Aucun comparable exploitable ---
  {
    auto src = make_source();
    auto cfg = make_config();
    cfg.public_comps = {"X1", "X2"};
    try {
      run_valuation(cfg, src);
      assert(false);
    } catch (const ov::InsufficientDataError& e) {
      assert(std::string(e.what()).find("X2") != std::string::npos);
    }
  }

  // --- Maturité au-delà de la courbe ---
  {
    auto src = make_source();
    auto cfg = make_config();
    cfg.treasury = {{1, "^IRX"}, {2, "^FVX"}};
    try {
      run_valuation(cfg, src);
      assert(false);
    } catch (const ov::MaturityNotFoundError& e) {
      assert(e.requested() == 4);
      assert((e.available() == std::vector<std::string>{"1-year", "2-year"}));
    }
  }

  // --- Dates incohérentes / YTM < 1 / entrées invalides ---
  {
    auto src = make_source();
    auto cfg = make_config();
    cfg.expiration_date = "2019-06-30";
    assert(throws_as<ov::DomainError>([&]{ run_valuation(cfg, src); }));

    cfg = make_config();
    cfg.expiration_date = "2020-06-30";
    cfg.vesting_end_date = "2020-03-31";
    assert(throws_as<ov::DomainError>([&]{ run_valuation(cfg, src); }));
    assert(src.price_calls == 0);

    cfg = make_config();
    cfg.valuation_date = "2020/01/01";
    assert(throws_as<ov::ConfigError>([&]{ run_valuation(cfg, src); }));

    cfg = make_config();
    cfg.strike_price = 0.0;
    assert(throws_as<ov::ConfigError>([&]{ run_valuation(cfg, src); }));

    cfg = make_config();
    cfg.public_comps.clear();
    assert(throws_as<ov::ConfigError>([&]{ run_valuation(cfg, src); }));
  }

  // --- Annulation ---
  {
    auto src = make_source();
    std::atomic<bool> stop{true};
    RunOptions opt;
    opt.stop = &stop;
    assert(throws_as<ov::CanceledError>([&]{ run_valuation(make_config(), src, opt); }));
    assert(src.price_calls == 0);
  }

  std::cout << "OK\n";
  return 0;
}

#include "ov/analytics/volatility.hpp"
#include "ov/core/errors.hpp"
#include "ov/core/stats.hpp"
#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <stdexcept>

using ov::core::Date;
using ov::config::Frequency;
using ov::market::PriceObservation;
using ov::market::PriceSeries;

template <class E, class F>
static bool throws_as(F f) {
  try { f(); } catch (const E&) { return true; }
  return false;
}

// Jours ouvrés (lun..ven) à partir de `start`, cours fournis par px(i)
template <class Px>
static PriceSeries business_days(const std::string& ticker, Date start, int n, Px px) {
  std::vector<PriceObservation> obs;
  Date d = start;
  for (int i = 0; static_cast<int>(obs.size()) < n; d = d.add_days(1)) {
    if (d.weekday() >= 5) continue;
    obs.push_back({d, px(i++)});
  }
  return PriceSeries(ticker, std::move(obs));
}

int main() {
  using namespace ov::analytics;

  // --- RunningStats (Welford) ---
  {
    ov::core::RunningStats s;
    assert(std::isnan(s.variance()));
    for (double x : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) s.add(x);
    assert(s.count() == 8);
    assert(std::abs(s.mean() - 5.0) < 1e-12);
    assert(std::abs(s.variance() - 32.0 / 7.0) < 1e-12);
    assert(std::abs(ov::core::round_to(3.14159, 2) - 3.14) < 1e-12);
    assert(std::abs(ov::core::round_to(27.345, 1) - 27.3) < 1e-12);
  }

  // --- Série invalide ---
  assert(throws_as<ov::DataError>([]{
    PriceSeries("X", {{Date(2021, 1, 5), 1.0}, {Date(2021, 1, 4), 1.0}});
  }));
  assert(throws_as<ov::DataError>([]{
    PriceSeries("X", {{Date(2021, 1, 4), 1.0}, {Date(2021, 1, 4), 2.0}});
  }));

  // --- Cours constant : volatilité nulle ---
  const auto flat = business_days("FLAT", Date(2021, 1, 4), 60, [](int){ return 42.0; });
  for (auto f : {Frequency::Daily, Frequency::Weekly, Frequency::Monthly}) {
    assert(estimate_volatility(flat, f) == 0.0);
  }

  // --- Valeur connue : 100, 110, 99 en daily ---
  {
    PriceSeries s("ABC", {{Date(2021, 1, 4), 100.0}, {Date(2021, 1, 5), 110.0}, {Date(2021, 1, 6), 99.0}});
    std::size_t n = 0;
    const double v = estimate_volatility(s, Frequency::Daily, &n);
    std::cout << "vol(100,110,99) = " << v << "\n";
    assert(n == 2);
    assert(std::abs(v - 225.25) < 1e-9);
  }

  // --- Weekly : n semaines complètes -> n-1 rendements ---
  {
    const int n_weeks = 12;
    const auto s = business_days("WK", Date(2021, 1, 4), 5 * n_weeks,
                                 [](int i){ return 100.0 + std::sin(0.3 * i) * 5.0; });
    const auto w = resample(s, Frequency::Weekly);
    assert(static_cast<int>(w.size()) == n_weeks);
    for (const auto& o : w) assert(o.date.weekday() == 4);   // dernier cours = vendredi
    std::size_t n = 0;
    estimate_volatility(s, Frequency::Weekly, &n);
    assert(static_cast<int>(n) == n_weeks - 1);
  }

  // --- Weekly : samedi/dimanche rattachés au vendredi suivant ---
  {
    PriceSeries s("WE", {{Date(2021, 1, 8), 10.0},    // vendredi
                         {Date(2021, 1, 9), 11.0},    // samedi -> semaine du 15
                         {Date(2021, 1, 15), 12.0}}); // vendredi
    const auto w = resample(s, Frequency::Weekly);
    assert(w.size() == 2);
    assert(w[1].date == Date(2021, 1, 15) && w[1].adj_close == 12.0);
  }

  // --- Monthly : dernier cours de chaque mois ---
  {
    const auto s = business_days("MO", Date(2021, 1, 4), 125, [](int i){ return 50.0 + i; });
    const auto m = resample(s, Frequency::Monthly);
    assert(m.size() == 6);
    assert(m[0].date == Date(2021, 1, 29));
    assert(m[1].date == Date(2021, 2, 26));
    std::size_t n = 0;
    estimate_volatility(s, Frequency::Monthly, &n);
    assert(n == 5);
  }

  // --- Semaine sans cotation : pas de rendement à travers le trou ---
  {
    // semaines du 8, 15, (22 vide), 29 janvier et 5 février 2021
    PriceSeries s("GAP", {{Date(2021, 1, 8), 100.0}, {Date(2021, 1, 15), 110.0},
                          {Date(2021, 1, 29), 90.0}, {Date(2021, 2, 5), 99.0}});
    assert(resample(s, Frequency::Weekly).size() == 4);
    const auto r = log_returns(resample(s, Frequency::Weekly), Frequency::Weekly);
    assert(r.size() == 2);
    assert(std::abs(r[0] - std::log(1.1)) < 1e-15);
    assert(std::abs(r[1] - std::log(1.1)) < 1e-15);
    std::size_t n = 0;
    assert(estimate_volatility(s, Frequency::Weekly, &n) == 0.0 && n == 2);
    // en daily, toutes les paires comptent
    assert(log_returns(s.observations(), Frequency::Daily).size() == 3);

    // mois sans cotation (février)
    PriceSeries m("MGAP", {{Date(2021, 1, 29), 10.0}, {Date(2021, 3, 31), 11.0},
                           {Date(2021, 4, 30), 12.0}});
    assert(log_returns(resample(m, Frequency::Monthly), Frequency::Monthly).size() == 1);
    assert(throws_as<ov::DataError>([&]{ estimate_volatility(m, Frequency::Monthly); }));
  }

  // --- Pas assez d’observations ---
  {
    PriceSeries empty("E", {});
    assert(throws_as<ov::DataError>([&]{ estimate_volatility(empty, Frequency::Daily); }));
    PriceSeries one("O", {{Date(2021, 1, 4), 10.0}});
    assert(throws_as<ov::DataError>([&]{ estimate_volatility(one, Frequency::Daily); }));
    PriceSeries two("T", {{Date(2021, 1, 4), 10.0}, {Date(2021, 1, 5), 11.0}});
    assert(throws_as<ov::DataError>([&]{ estimate_volatility(two, Frequency::Daily); }));
    // tout dans le même mois
    assert(throws_as<ov::DataError>([&]{ estimate_volatility(two, Frequency::Monthly); }));
    PriceSeries neg("N", {{Date(2021, 1, 4), 10.0}, {Date(2021, 1, 5), 0.0}, {Date(2021, 1, 6), 9.0}});
    assert(throws_as<ov::DataError>([&]{ estimate_volatility(neg, Frequency::Daily); }));
  }

  // --- Agrégation : [A, B], B en échec -> moyenne = vol(A) ---
  const auto seriesA = business_days("A", Date(2020, 1, 6), 120,
                                     [](int i){ return 100.0 * std::exp(0.01 * ((i % 2) ? 1 : -1) + 0.001 * i); });
  const auto seriesC = business_days("C", Date(2020, 1, 6), 120,
                                     [](int i){ return 20.0 + 0.5 * std::cos(0.7 * i); });
  const double volA = estimate_volatility(seriesA, Frequency::Daily);
  const double volC = estimate_volatility(seriesC, Frequency::Daily);

  std::map<std::string, PriceSeries> store{{"A", seriesA}, {"C", seriesC}};
  int calls = 0;
  PriceFetcher fetch = [&](const std::string& t, const Date&, const Date&) {
    ++calls;
    if (t == "BAD") return PriceSeries(t, {{Date(2020, 1, 6), 5.0}});   // 1 obs -> DataError
    auto it = store.find(t);
    if (it == store.end()) throw ov::NoDataError("No data found for " + t);
    return it->second;
  };
  const Date p0(2020, 1, 1), p1(2021, 1, 1);

  {
    const auto agg = aggregate_volatility({"A", "B"}, p0, p1, Frequency::Daily, fetch);
    assert(agg.table.size() == 2);
    assert(agg.table[0].ok() && !agg.table[1].ok());
    assert(agg.successes.size() == 1 && agg.failures.size() == 1);
    assert(agg.failures[0].ticker == "B");
    assert(agg.failures[0].message.find("No data") != std::string::npos);
    assert(agg.average && std::abs(*agg.average - volA / 100.0) < 1e-12);
    assert(agg.table[0].estimate->period_start == p0);
    assert(agg.table[0].estimate->period_end == p1);
  }
  {
    std::vector<std::string> seen;
    const auto agg = aggregate_volatility({"A", "BAD", "C"}, p0, p1, Frequency::Daily, fetch, nullptr,
                                          [&](std::size_t, const TickerVolatility& tv){ seen.push_back(tv.ticker); });
    assert((seen == std::vector<std::string>{"A", "BAD", "C"}));
    assert(agg.failures.size() == 1 && agg.failures[0].ticker == "BAD");
    assert(std::abs(*agg.average - (volA + volC) / 200.0) < 1e-12);
    assert(std::abs(*agg.average_percent_rounded() - (volA + volC) / 2.0) <= 0.005 + 1e-9);
  }
  {
    const auto agg = aggregate_volatility({"X", "Y"}, p0, p1, Frequency::Daily, fetch);
    assert(!agg.average && agg.successes.empty() && agg.failures.size() == 2);
    assert(!agg.average_percent_rounded());
  }

  // --- Erreur réseau d’un ticker : enregistrée, les autres continuent ---
  {
    PriceFetcher flaky = [&](const std::string& t, const Date& a, const Date& b) -> PriceSeries {
      if (t == "FLAKY") throw std::runtime_error("connection reset");
      return fetch(t, a, b);
    };
    const auto agg = aggregate_volatility({"FLAKY", "A"}, p0, p1, Frequency::Daily, flaky);
    assert(agg.failures.size() == 1);
    assert(agg.failures[0].ticker == "FLAKY" && agg.failures[0].message == "connection reset");
    assert(agg.successes.size() == 1 && agg.successes[0].ticker == "A");
    assert(std::abs(*agg.average - volA / 100.0) < 1e-12);

    PriceFetcher cancel = [](const std::string&, const Date&, const Date&) -> PriceSeries {
      throw ov::CanceledError("stop");
    };
    assert(throws_as<ov::CanceledError>([&]{ aggregate_volatility({"A"}, p0, p1, Frequency::Daily, cancel); }));
  }

  // --- Annulation ---
  {
    std::atomic<bool> stop{true};
    calls = 0;
    assert(throws_as<ov::CanceledError>([&]{
      aggregate_volatility({"A", "C"}, p0, p1, Frequency::Daily, fetch, &stop);
    }));
    assert(calls == 0);

    std::atomic<bool> later{false};
    calls = 0;
    assert(throws_as<ov::CanceledError>([&]{
      aggregate_volatility({"A", "C"}, p0, p1, Frequency::Daily, fetch, &later,
                           [&](std::size_t, const TickerVolatility&){ later = true; });
    }));
    assert(calls == 1);
  }

  std::cout << "OK\n";
  return 0;
}

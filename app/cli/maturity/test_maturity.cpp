#include "ov/analytics/maturity.hpp"
#include "ov/core/date.hpp"
#include "ov/core/errors.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using ov::core::Date;

template <class E, class F>
static bool throws_as(F f) {
  try { f(); } catch (const E&) { return true; }
  return false;
}

int main() {
  using namespace ov::analytics;

  // --- Date ---
  const Date d = Date::parse("2020-01-01");
  assert(d.year() == 2020 && d.month() == 1 && d.day() == 1);
  assert(d.serial() == 18262);
  assert(d.weekday() == 2);                 // mercredi
  assert(d.to_string() == "2020-01-01");
  assert(d.to_us_string() == "1/1/2020");
  assert(Date::parse("2025-01-01") - d == 1827);
  assert(Date::from_serial(0) == Date());
  assert(Date(2020, 2, 29).minus_years(1) == Date(2019, 2, 28));
  assert(Date(2020, 2, 29).minus_years(4) == Date(2016, 2, 29));
  assert(Date(2021, 3, 1).add_days(-1) == Date(2021, 2, 28));
  assert(Date::is_leap(2000) && !Date::is_leap(1900) && Date::is_leap(2024));

  assert(throws_as<ov::ConfigError>([]{ Date::parse("2020-13-01"); }));
  assert(throws_as<ov::ConfigError>([]{ Date::parse("2021-02-29"); }));
  assert(throws_as<ov::ConfigError>([]{ Date::parse("01/02/2020"); }));
  assert(throws_as<ov::ConfigError>([]{ Date::parse("2020-1-1"); }));
  assert(throws_as<ov::ConfigError>([]{ Date::parse(""); }));

  // --- Maturité : exemple de référence ---
  const Date val = Date::parse("2020-01-01");
  const Date exp = Date::parse("2025-01-01");
  const Date ves = Date::parse("2023-01-01");
  const double x = fractional_maturity(val, exp, ves);
  std::cout << "fractional = " << x << "\n";
  assert(std::abs(x - (1827.0 / 365.0 + 1096.0 / 365.0) / 2.0) < 1e-12);
  assert(compute_maturity(val, exp, ves) == 4);

  // --- Invariance par translation des trois dates ---
  for (long shift : {-4000L, -365L, -1L, 1L, 59L, 366L, 2000L}) {
    assert(compute_maturity(val.add_days(shift), exp.add_days(shift), ves.add_days(shift)) == 4);
  }

  // --- Arrondi ---
  assert(compute_maturity(val, val.add_days(365), val.add_days(365)) == 1);
  assert(compute_maturity(val, val.add_days(200), val.add_days(100)) == 0);   // 0.41
  assert(compute_maturity(val, val.add_days(600), val.add_days(500)) == 2);   // 1.51
  assert(compute_maturity(val, val, val) == 0);

  // Égalité exacte x.5 : arrondi vers le haut (2.5 -> 3, 0.5 -> 1)
  assert(fractional_maturity(val, val.add_days(1825), val) == 2.5);
  assert(compute_maturity(val, val.add_days(1825), val) == 3);
  assert(fractional_maturity(val, val.add_days(365), val) == 0.5);
  assert(compute_maturity(val, val.add_days(365), val) == 1);
  assert(compute_maturity(val, val.add_days(1095), val.add_days(730)) == 3);   // 2.5

  // --- Ordre des dates ---
  assert(throws_as<ov::DomainError>([&]{ compute_maturity(val, val.add_days(-1), ves); }));
  assert(throws_as<ov::DomainError>([&]{ compute_maturity(val, exp, val.add_days(-30)); }));

  // --- Fenêtre d’historique ---
  assert(history_start(val, 4) == Date(2016, 1, 1));
  assert(history_start(Date(2024, 2, 29), 3) == Date(2021, 2, 28));

  std::cout << "OK\n";
  return 0;
}

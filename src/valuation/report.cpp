#include "ov/valuation/report.hpp"
#include "ov/core/stats.hpp"

#include <cmath>
#include <cstdio>

namespace ov::valuation {

namespace {
const char* source_name(analytics::YieldCurve::Source s) {
  switch (s) {
    case analytics::YieldCurve::Source::Known:        return "known";
    case analytics::YieldCurve::Source::Interpolated: return "interpolated";
    case analytics::YieldCurve::Source::Missing:      return "missing";
  }
  return "missing";
}
} // namespace

std::string format_number(double x, int decimals) {
  if (!std::isfinite(x)) return "";
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, core::round_to(x, decimals));
  std::string s(buf);
  if (s.find('.') != std::string::npos) {
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
  }
  if (s == "-0") s = "0";
  return s;
}

ValuationReport build_report(const ValuationResult& res) {
  ValuationReport rep;

  // --- Black Scholes ---
  auto& sm = rep.summary;
  sm.name = "Black Scholes";
  sm.header = {"", "Value"};
  sm.rows = {
    {"Grant date",              res.inputs.grant_date.to_us_string()},
    {"Valuation date",          res.inputs.valuation_date.to_us_string()},
    {"Expiration date",         res.inputs.expiration_date.to_us_string()},
    {"Vesting end date",        res.inputs.vesting_end_date.to_us_string()},
    {"Stock price",             format_number(res.inputs.spot, 6)},
    {"Strike/Exercise price",   format_number(res.inputs.strike, 6)},
    {"Years to maturity (YTM)", std::to_string(res.years_to_maturity)},
    {"Risk free rate",          format_number(res.risk_free_rate, 4)},
    {"Volatility",              format_number(res.average_volatility, 4)},
    {"Option Valuation",        format_number(res.option_value, 2)},
  };

  // --- Volatility ---
  auto& vt = rep.volatility;
  vt.name = "Volatility";
  vt.header = {"Ticker",
               res.history_start.to_string() + " to " + res.history_end.to_string(),
               "Error"};
  for (const auto& row : res.volatility.table) {
    if (row.ok()) {
      vt.rows.push_back({row.ticker, format_number(row.estimate->annualized_volatility_percent, 2), ""});
    } else {
      vt.rows.push_back({row.ticker, "", row.error->message});
    }
  }
  const auto avg = res.volatility.average_percent_rounded();
  vt.rows.push_back({"Average", avg ? format_number(*avg, 2) : "", ""});

  // --- Risk Free Rate ---
  auto& rt = rep.risk_free_rate;
  rt.name = "Risk Free Rate";
  rt.header = {"Maturity", res.inputs.valuation_date.to_string(), "Source"};
  for (int m = 1; m <= res.curve.max_maturity(); ++m) {
    const auto& slot = res.curve.at(m);
    rt.rows.push_back({analytics::YieldCurve::label(m),
                       slot.yield_percent ? format_number(*slot.yield_percent, 6) : "",
                       source_name(slot.source)});
  }
  return rep;
}

} // namespace ov::valuation

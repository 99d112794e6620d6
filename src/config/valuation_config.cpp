#include <ov/config/valuation_config.hpp>
#include <ov/core/errors.hpp>

#include <algorithm>
#include <cctype>
#include <set>

namespace ov {
namespace config {

namespace {
std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

core::Date parse_field(const std::string& key, const std::string& value) {
  if (value.empty()) {
    throw ConfigError("Missing required field '" + key + "'");
  }
  try {
    return core::Date::parse(value);
  } catch (const ConfigError& e) {
    throw ConfigError("Invalid field '" + key + "': " + e.what());
  }
}
} // namespace

Frequency parse_frequency(const std::string& text) {
  const std::string f = lower(text);
  if (f == "daily")   return Frequency::Daily;
  if (f == "weekly")  return Frequency::Weekly;
  if (f == "monthly") return Frequency::Monthly;
  throw DataError("Invalid frequency '" + text + "'. Use 'daily', 'weekly', or 'monthly'.");
}

const char* to_string(Frequency f) noexcept {
  switch (f) {
    case Frequency::Daily:   return "daily";
    case Frequency::Weekly:  return "weekly";
    case Frequency::Monthly: return "monthly";
  }
  return "daily";
}

int periods_per_year(Frequency f) noexcept {
  switch (f) {
    case Frequency::Daily:   return 252;
    case Frequency::Weekly:  return 52;
    case Frequency::Monthly: return 12;
  }
  return 252;
}

std::vector<YieldInstrument> default_treasury_instruments() {
  return {
    {1,  "^IRX"},
    {5,  "^FVX"},
    {10, "^TNX"},
    {30, "^TYX"},
  };
}

void validate(const ValuationConfig& cfg) {
  if (cfg.public_comps.empty()) {
    throw ConfigError("Field 'public_comps' must list at least one ticker");
  }
  for (const auto& t : cfg.public_comps) {
    if (t.empty()) throw ConfigError("Field 'public_comps' contains an empty ticker");
  }
  if (cfg.treasury.empty()) {
    throw ConfigError("At least one treasury instrument is required");
  }
  std::set<int> seen;
  for (const auto& inst : cfg.treasury) {
    if (inst.maturity_years < 1) {
      throw ConfigError("Treasury maturity must be >= 1 year (got " +
                        std::to_string(inst.maturity_years) + ")");
    }
    if (!seen.insert(inst.maturity_years).second) {
      throw ConfigError("Duplicate treasury maturity " + std::to_string(inst.maturity_years) + "-year");
    }
    if (inst.symbol.empty()) {
      throw ConfigError("Treasury instrument " + std::to_string(inst.maturity_years) +
                        "-year has no symbol");
    }
  }
}

ov::market::OptionParameters to_option_parameters(const ValuationConfig& cfg) {
  validate(cfg);
  return ov::market::OptionParameters(
      cfg.stock_price, cfg.strike_price,
      parse_field("grant_date", cfg.grant_date),
      parse_field("valuation_date", cfg.valuation_date),
      parse_field("expiration_date", cfg.expiration_date),
      parse_field("vesting_end_date", cfg.vesting_end_date));
}

} // namespace config
} // namespace ov

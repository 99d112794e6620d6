#include <ov/analytics/maturity.hpp>
#include <ov/core/errors.hpp>

#include <cmath>

namespace ov {
namespace analytics {

double fractional_maturity(const core::Date& valuation,
                           const core::Date& expiration,
                           const core::Date& vesting_end) {
  if (expiration < valuation) {
    throw DomainError("Expiration date " + expiration.to_string() +
                      " precedes valuation date " + valuation.to_string());
  }
  if (vesting_end < valuation) {
    throw DomainError("Vesting end date " + vesting_end.to_string() +
                      " precedes valuation date " + valuation.to_string());
  }
  const double a = static_cast<double>(expiration - valuation) / 365.0;
  const double b = static_cast<double>(vesting_end - valuation) / 365.0;
  return 0.5 * (a + b);
}

int compute_maturity(const core::Date& valuation,
                     const core::Date& expiration,
                     const core::Date& vesting_end) {
  const double x = fractional_maturity(valuation, expiration, vesting_end);
  return static_cast<int>(std::floor(x + 0.5)); // demi vers le haut
}

core::Date history_start(const core::Date& valuation, int years_to_maturity) {
  return valuation.minus_years(years_to_maturity);
}

} // namespace analytics
} // namespace ov

#include <ov/pricing/analytic_bs.hpp>
#include <ov/core/errors.hpp>

#include <cmath>    // log, exp, sqrt, erfc
#include <string>

namespace ov {
namespace pricing {

namespace {
constexpr double INV_SQRT2 = 0.70710678118654752440084436210484903928; // 1/sqrt(2)

void check_domain(double S, double K, double T, double sigma) {
  if (!(T > 0.0)) {
    throw DomainError("Black-Scholes: maturity must be > 0 (got " + std::to_string(T) + ")");
  }
  if (!(sigma > 0.0)) {
    throw DomainError("Black-Scholes: volatility must be > 0 (got " + std::to_string(sigma) + ")");
  }
  if (!(S > 0.0) || !(K > 0.0)) {
    throw DomainError("Black-Scholes: spot and strike must be > 0");
  }
}
} // unnamed namespace

double norm_cdf(double x) noexcept {
  // Phi(x) = 0.5 * erfc(-x / sqrt(2))
  return 0.5 * std::erfc(-x * INV_SQRT2);
}

BsTerms bs_terms(double S, double K, double T, double r, double sigma) {
  check_domain(S, K, T, sigma);
  const double sigSqrtT = sigma * std::sqrt(T);
  const double d1 = (std::log(S / K) + (r + 0.5 * sigma * sigma) * T) / sigSqrtT;
  return {d1, d1 - sigSqrtT};
}

double price_call_bs(double S, double K, double T, double r, double sigma) {
  const BsTerms d = bs_terms(S, K, T, r, sigma);
  const double df = std::exp(-r * T);
  return S * norm_cdf(d.d1) - K * df * norm_cdf(d.d2);
}

} // namespace pricing
} // namespace ov

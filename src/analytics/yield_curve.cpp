#include <ov/analytics/yield_curve.hpp>
#include <ov/core/errors.hpp>
#include <ov/core/stats.hpp>

#include <algorithm>
#include <stdexcept>

namespace ov {
namespace analytics {

const YieldCurve::Slot& YieldCurve::at(int maturity) const {
  if (maturity < 1 || maturity > max_maturity()) {
    throw std::out_of_range("YieldCurve::at: maturity " + std::to_string(maturity) +
                            " outside [1, " + std::to_string(max_maturity()) + "]");
  }
  return slots_[static_cast<std::size_t>(maturity - 1)];
}

std::string YieldCurve::label(int maturity) {
  return std::to_string(maturity) + "-year";
}

std::vector<std::string> YieldCurve::available_labels() const {
  std::vector<std::string> out;
  for (int m = 1; m <= max_maturity(); ++m) {
    if (slots_[static_cast<std::size_t>(m - 1)].yield_percent) out.push_back(label(m));
  }
  return out;
}

double interp_linear(const std::vector<double>& xs, const std::vector<double>& ys, double x) {
  if (x <= xs.front()) return ys.front();
  if (x >= xs.back())  return ys.back();

  auto it = std::upper_bound(xs.begin(), xs.end(), x);
  const std::size_t i = static_cast<std::size_t>(it - xs.begin()) - 1;
  const double t = (x - xs[i]) / (xs[i + 1] - xs[i]);
  return ys[i] + t * (ys[i + 1] - ys[i]);
}

YieldCurve build_curve(const std::vector<YieldPoint>& points) {
  YieldCurve curve;
  if (points.empty()) return curve;

  int max_m = 0;
  std::vector<int> seen;
  for (const auto& p : points) {
    if (p.maturity_years < 1) {
      throw DataError("Yield point maturity must be >= 1 (got " + std::to_string(p.maturity_years) + ")");
    }
    if (std::find(seen.begin(), seen.end(), p.maturity_years) != seen.end()) {
      throw DataError("Duplicate yield point for " + YieldCurve::label(p.maturity_years));
    }
    seen.push_back(p.maturity_years);
    max_m = std::max(max_m, p.maturity_years);
  }

  // points connus, triés par maturité
  std::vector<YieldPoint> known;
  for (const auto& p : points) {
    if (p.yield_percent) known.push_back(p);
  }
  std::sort(known.begin(), known.end(),
            [](const YieldPoint& a, const YieldPoint& b){ return a.maturity_years < b.maturity_years; });

  std::vector<double> xs, ys;
  xs.reserve(known.size());
  ys.reserve(known.size());
  for (const auto& p : known) {
    xs.push_back(static_cast<double>(p.maturity_years));
    ys.push_back(*p.yield_percent);
  }

  curve.slots_.assign(static_cast<std::size_t>(max_m), YieldCurve::Slot{});
  curve.known_ = known.size();
  if (known.empty()) return curve; // toutes les cases restent absentes

  std::size_t k = 0;
  for (int m = 1; m <= max_m; ++m) {
    auto& slot = curve.slots_[static_cast<std::size_t>(m - 1)];
    if (k < known.size() && known[k].maturity_years == m) {
      slot.yield_percent = *known[k].yield_percent;
      slot.source = YieldCurve::Source::Known;
      ++k;
    } else {
      slot.yield_percent = core::round_to(interp_linear(xs, ys, static_cast<double>(m)), 2);
      slot.source = YieldCurve::Source::Interpolated;
    }
  }
  return curve;
}

double lookup(const YieldCurve& curve, int maturity_years) {
  if (maturity_years < 1 || maturity_years > curve.max_maturity() || !curve.has_known_points()) {
    throw MaturityNotFoundError(maturity_years, curve.available_labels());
  }
  const auto& slot = curve.at(maturity_years);
  if (!slot.yield_percent) {
    throw MaturityNotFoundError(maturity_years, curve.available_labels());
  }
  return *slot.yield_percent;
}

} // namespace analytics
} // namespace ov

#pragma once
/**
 * @file yield_curve.hpp
 * @brief Courbe de taux sans risque par maturité entière (1..N années).
 *
 * # Construction
 * - Domaine : [1, N], N = plus grande maturité des instruments de référence
 *   (qu’ils aient été obtenus ou non).
 * - Points connus : recopiés tels quels (pas d’arrondi).
 * - Autres maturités : interpolation linéaire entre les deux points connus qui
 *   l’encadrent, arrondie à 2 décimales. Hors de la plage connue (instrument
 *   d’extrémité absent) : valeur du point connu le plus proche (comme np.interp).
 * - Aucun point connu : toutes les cases sont absentes.
 *
 * Stockage : tableau ordonné, case m-1 pour la maturité m, remplie en une passe.
 * Les taux sont en pourcentage (1.88 = 1.88 %).
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ov {
namespace analytics {

/// Taux d’un instrument de référence ; yield_percent absent = échec de récupération.
struct YieldPoint {
  int                   maturity_years;
  std::optional<double> yield_percent;
  std::string           symbol;
};

class YieldCurve {
public:
  enum class Source { Known, Interpolated, Missing };

  struct Slot {
    std::optional<double> yield_percent;
    Source                source{Source::Missing};
  };

  YieldCurve() = default;

  int max_maturity() const noexcept { return static_cast<int>(slots_.size()); }
  bool empty() const noexcept { return slots_.empty(); }
  bool has_known_points() const noexcept { return known_ > 0; }

  /// Case de la maturité m (1 <= m <= max_maturity()).
  /// @throws std::out_of_range sinon.
  const Slot& at(int maturity) const;

  const std::vector<Slot>& slots() const noexcept { return slots_; }

  /// "<N>-year" pour les maturités qui ont une valeur.
  std::vector<std::string> available_labels() const;

  static std::string label(int maturity);

private:
  friend YieldCurve build_curve(const std::vector<YieldPoint>& points);

  std::vector<Slot> slots_;
  std::size_t known_{0};
};

/// Interpolation linéaire par morceaux (xs strictement croissants, non vide),
/// bornée aux extrémités.
double interp_linear(const std::vector<double>& xs, const std::vector<double>& ys, double x);

/// @throws ov::DataError si une maturité est < 1 ou dupliquée.
YieldCurve build_curve(const std::vector<YieldPoint>& points);

/// @return Taux (%) de la maturité demandée.
/// @throws ov::MaturityNotFoundError si la maturité est hors [1, N] ou sans valeur ;
///         l’erreur porte les maturités disponibles.
double lookup(const YieldCurve& curve, int maturity_years);

} // namespace analytics
} // namespace ov

#pragma once
/**
 * @file stats.hpp
 * @brief Accumulateur statistique en streaming (Welford) + arrondis de rapport.
 *
 * - Welford : une passe, stable numériquement.
 * - Variance : échantillon (diviseur n-1, correction de Bessel).
 * - n < 2 : variance()/stddev() renvoient NaN (indéfini), à l’appelant de lever.
 */

#include <cstddef> // std::size_t

namespace ov {
namespace core {

struct RunningStats {
public:
  RunningStats() noexcept;

  /// @brief Ajoute un échantillon.
  void add(double x) noexcept;

  std::size_t count() const noexcept;
  double mean() const noexcept;

  /// @return Variance d'échantillon (n-1), NaN si n < 2.
  [[nodiscard]] double variance() const noexcept;

  /// @return sqrt(variance()), NaN si n < 2.
  [[nodiscard]] double stddev() const noexcept;

private:
  std::size_t n_{0};
  double mean_{0.0};
  double m2_{0.0}; // somme des carrés des écarts à la moyenne
};

/// @brief Arrondi décimal au plus proche (demi vers l’extérieur), ex. round_to(3.14159, 2) = 3.14.
[[nodiscard]] double round_to(double x, int decimals) noexcept;

} // namespace core
} // namespace ov

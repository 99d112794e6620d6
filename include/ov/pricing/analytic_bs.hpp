#pragma once
/**
 * @file analytic_bs.hpp
 * @brief Formule fermée Black–Scholes, call européen sans dividende.
 *
 * # Notations
 * d1 = [ ln(S/K) + (r + 0.5*sigma^2) T ] / (sigma * sqrt(T))
 * d2 = d1 - sigma * sqrt(T)
 * Call = S * N(d1) - K * e^{-rT} * N(d2)
 *
 * # Unités
 * - T en années.
 * - r et sigma en décimal (0.05 = 5 %).
 *
 * # Domaine
 * T > 0, sigma > 0, S > 0, K > 0 ; sinon DomainError (pas de branche limite :
 * le modèle n’est pas défini pour ces valeurs). Aucun arrondi.
 *
 * # Référence
 * price_call_bs(100, 100, 1, 0.05, 0.2) ≈ 10.4506.
 */

namespace ov {
namespace pricing {

/// @brief CDF de la loi normale centrée réduite, via erfc.
double norm_cdf(double x) noexcept;

/// @brief d1 et d2 de Black–Scholes.
struct BsTerms {
  double d1;
  double d2;
};

/// @throws ov::DomainError hors domaine (voir en-tête).
BsTerms bs_terms(double S, double K, double T, double r, double sigma);

/**
 * @brief Prix Black–Scholes d’un call européen.
 * @param S     Spot (> 0)
 * @param K     Strike (> 0)
 * @param T     Maturité en années (> 0)
 * @param r     Taux sans risque (décimal, peut être < 0)
 * @param sigma Volatilité (> 0)
 * @return Prix au temps 0
 * @throws ov::DomainError si T <= 0, sigma <= 0, S <= 0 ou K <= 0.
 */
double price_call_bs(double S, double K, double T, double r, double sigma);

} // namespace pricing
} // namespace ov

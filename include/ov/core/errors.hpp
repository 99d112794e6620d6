#pragma once
/**
 * @file errors.hpp
 * @brief Hiérarchie d’exceptions du pipeline de valorisation.
 *
 * Toutes dérivent de ov::Error (std::runtime_error) : un appelant peut
 * attraper la famille entière ou un cas précis.
 *
 * - DataError             : série vide / mal formée, fréquence inconnue.
 * - NoDataError           : la source de marché n’a rien renvoyé.
 * - InsufficientDataError : aucune volatilité calculable (tous les comparables en échec).
 * - MaturityNotFoundError : maturité hors de la courbe (liste des maturités dispo).
 * - DomainError           : Black–Scholes hors domaine (T <= 0, sigma <= 0, ...).
 * - ConfigError           : champ d’entrée manquant ou invalide.
 * - CanceledError         : arrêt demandé par l’appelant.
 */

#include <stdexcept>
#include <string>
#include <vector>

namespace ov {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct DataError : Error {
  using Error::Error;
};

struct NoDataError : Error {
  using Error::Error;
};

struct InsufficientDataError : Error {
  using Error::Error;
};

struct DomainError : Error {
  using Error::Error;
};

struct ConfigError : Error {
  using Error::Error;
};

struct CanceledError : Error {
  using Error::Error;
};

/// @brief Maturité demandée absente de la courbe.
/// @details Porte les maturités disponibles ("1-year", ...) pour le diagnostic.
class MaturityNotFoundError : public Error {
public:
  MaturityNotFoundError(int requested, std::vector<std::string> available);

  int requested() const noexcept { return requested_; }
  const std::vector<std::string>& available() const noexcept { return available_; }

private:
  int requested_;
  std::vector<std::string> available_;
};

} // namespace ov

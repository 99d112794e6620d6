#pragma once
/**
 * @file valuation_config.hpp
 * @brief Configuration standard d’un run de valorisation.
 *
 * # Contenu
 * - stock_price / strike_price : spot et strike de l’attribution.
 * - grant/valuation/expiration/vesting_end dates : texte ISO `YYYY-MM-DD`.
 * - public_comps : comparables cotés servant à la volatilité historique.
 * - frequency    : cadence des rendements (daily, weekly, monthly). Défaut : daily.
 * - treasury     : instruments de référence pour la courbe sans risque
 *                  (maturité en années -> symbole de marché).
 * - data_dir     : racine des CSV de marché (prices/, yields/).
 * - output_dir   : dossier des rapports.
 *
 * Les dates restent en texte ici : elles sont validées (ConfigError) à la
 * construction de OptionParameters via to_option_parameters().
 */

#include <ov/market/option_parameters.hpp>

#include <string>
#include <vector>

namespace ov {
namespace config {

enum class Frequency { Daily, Weekly, Monthly };

/// @brief "daily" | "weekly" | "monthly" (insensible à la casse).
/// @throws ov::DataError sinon.
Frequency parse_frequency(const std::string& text);

const char* to_string(Frequency f) noexcept;

/// Nombre de périodes par an : 252, 52, 12.
int periods_per_year(Frequency f) noexcept;

/// @brief Instrument de référence de la courbe de taux.
struct YieldInstrument {
  int         maturity_years; ///< >= 1
  std::string symbol;         ///< ex. "^TNX"
};

/// 1-year ^IRX, 5-year ^FVX, 10-year ^TNX, 30-year ^TYX.
std::vector<YieldInstrument> default_treasury_instruments();

/// @brief Configuration d’un run de valorisation.
struct ValuationConfig {
  double stock_price{0.0};
  double strike_price{0.0};

  std::string grant_date;
  std::string valuation_date;
  std::string expiration_date;
  std::string vesting_end_date;

  std::vector<std::string> public_comps;
  Frequency frequency{Frequency::Daily};

  std::vector<YieldInstrument> treasury{default_treasury_instruments()};

  std::string data_dir{"data/market"};
  std::string output_dir{"output"};
};

/// @brief Valide les champs et construit les paramètres de l’option.
/// @throws ov::ConfigError (date illisible, prix <= 0, comparables vides, instrument invalide).
ov::market::OptionParameters to_option_parameters(const ValuationConfig& cfg);

/// @brief Vérifie les champs non couverts par OptionParameters.
/// @throws ov::ConfigError
void validate(const ValuationConfig& cfg);

} // namespace config
} // namespace ov

#pragma once
#include <QJsonObject>
#include <QString>

#include <ov/config/valuation_config.hpp>

namespace qtio {

// Lit le fichier JSON de configuration (cf. clés de ValuationConfig).
// Clés obligatoires : stock_price, strike_price, grant_date, valuation_date,
// expiration_date, vesting_end_date, public_comps.
// Optionnelles : frequency, data_dir, output_dir, treasury_tickers {"<N>-year": "SYM"}.
// Lève ov::ConfigError (fichier illisible, JSON invalide, clé manquante/mal typée)
// ou ov::DataError (fréquence inconnue).
ov::config::ValuationConfig load_valuation_config(const QString& path);

ov::config::ValuationConfig parse_valuation_config(const QJsonObject& obj);

// Inverse de parse_valuation_config (sauvegarde depuis la GUI).
QJsonObject valuation_config_to_json(const ov::config::ValuationConfig& cfg);

} // namespace qtio

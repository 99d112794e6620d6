#pragma once
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <ov/valuation/orchestrator.hpp>
#include <ov/valuation/report.hpp>

namespace qtio {

// Écrit un CSV par tableau dans `outDir` (créé si besoin) :
// black_scholes.csv, volatility.csv, risk_free_rate.csv.
// Retourne les chemins écrits. Lève ov::Error si un fichier ne peut être ouvert.
QStringList export_report_csv(const ov::valuation::ValuationReport& rep, const QString& outDir);

// Résumé JSON : résultats, entrées, tableaux, échecs récupérés.
QJsonObject result_to_json(const ov::valuation::ValuationResult& res,
                           const ov::valuation::ValuationReport& rep);

// Écrit result_to_json(...) indenté dans `path`. Lève ov::Error si échec d’écriture.
void write_report_json(const ov::valuation::ValuationResult& res,
                       const ov::valuation::ValuationReport& rep,
                       const QString& path);

} // namespace qtio

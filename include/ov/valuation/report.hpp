#pragma once
#include <ov/valuation/orchestrator.hpp>

#include <string>
#include <vector>

namespace ov::valuation {

// Tableau texte prêt à afficher / exporter (CSV, QTableWidget).
struct ReportTable {
  std::string name;                              // "Black Scholes", "Volatility", "Risk Free Rate"
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows;
};

struct ValuationReport {
  ReportTable summary;         // entrées + résultats
  ReportTable volatility;      // un ticker par ligne + "Average"
  ReportTable risk_free_rate;  // "<N>-year" -> taux (%)
};

// Formate x avec `decimals` décimales, zéros de fin retirés ("0.3" plutôt que "0.3000").
std::string format_number(double x, int decimals);

// Construit les trois tableaux du rapport :
// - summary : dates au format M/D/YYYY, r et sigma à 4 décimales, prix à 2 décimales ;
// - volatility : colonnes Ticker, "<début> to <fin>", Error ; ligne Average (2 décimales) ;
// - risk_free_rate : colonnes Maturity, <date de valorisation>, Source.
ValuationReport build_report(const ValuationResult& res);

} // namespace ov::valuation

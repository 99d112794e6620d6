#pragma once
#include <ov/core/date.hpp>
#include <ov/market/market_source.hpp>

#include <cstddef>
#include <initializer_list>
#include <limits>
#include <string>
#include <vector>

namespace ov::io {

struct DatedValueRow {
  ov::core::Date date;
  double value = std::numeric_limits<double>::quiet_NaN();
};

// Lit un CSV daté (export type Yahoo: Date,Open,High,Low,Close,Adj Close,Volume).
// `value_columns` : synonymes de la colonne valeur, par ordre de préférence
// (ex. {"adj close","adj_close","close"}). En-tête insensible à la casse.
// Filtre les lignes invalides (date illisible, valeur non finie ou <= 0 si
// require_positive). Trie par date et garde la dernière ligne d’une date dupliquée.
// num_ignored/warnings sont optionnels pour diagnostic.
// Lève ov::NoDataError si le fichier est introuvable.
std::vector<DatedValueRow>
read_dated_csv(const std::string& path,
               std::initializer_list<const char*> value_columns,
               bool require_positive,
               std::size_t* num_ignored = nullptr,
               std::vector<std::string>* warnings = nullptr);

// Source de marché sur fichiers locaux :
//   <root>/prices/<TICKER>.csv  (Date, Adj Close | Close)
//   <root>/yields/<SYMBOL>.csv  (Date, Close) en pourcentage
class CsvMarketDataSource : public ov::market::MarketDataSource {
public:
  explicit CsvMarketDataSource(std::string root);

  ov::market::PriceSeries fetch_price_series(const std::string& ticker,
                                             const ov::core::Date& start,
                                             const ov::core::Date& end) override;

  // Fenêtre [around-7j, around+1j) : la cotation du jour si présente, sinon la
  // dernière disponible. Arrondie à 2 décimales.
  double fetch_yield(const std::string& symbol, const ov::core::Date& around) override;

  const std::string& root() const { return root_; }

  // Avertissements accumulés (lignes ignorées), vidés par take_warnings().
  std::vector<std::string> take_warnings();

private:
  std::string root_;
  std::vector<std::string> warnings_;
};

} // namespace ov::io

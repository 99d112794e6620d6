#include "ov/io/market_csv.hpp"
#include "ov/core/errors.hpp"
#include "ov/core/stats.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <utility>

namespace {

// --- helpers texte ---
static inline std::string trim(std::string s) {
  auto notsp = [](int ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}
static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

// CSV splitter minimal qui gère les champs entre "..."
static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

// parse double tolérant (“”, "null" -> NaN)
static double parse_double(const std::string& s) {
  if (s.empty()) return std::numeric_limits<double>::quiet_NaN();
  char* end=nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end==s.c_str()) return std::numeric_limits<double>::quiet_NaN();
  return v;
}

// récupère index de colonne via map (synonymes acceptés)
static int col(const std::unordered_map<std::string,int>& idx, std::initializer_list<const char*> names) {
  for (auto* n: names) {
    auto it = idx.find(lower(n));
    if (it != idx.end()) return it->second;
  }
  return -1;
}

} // namespace

namespace ov::io {

std::vector<DatedValueRow>
read_dated_csv(const std::string& path,
               std::initializer_list<const char*> value_columns,
               bool require_positive,
               std::size_t* num_ignored,
               std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  std::vector<DatedValueRow> out;

  std::ifstream f(path);
  if (!f) {
    throw ov::NoDataError("Cannot open market data file: " + path);
  }

  std::string line;
  bool header_seen = false;
  int iDate = -1, iVal = -1;

  auto ignore = [&](const std::string& why) {
    if (num_ignored) (*num_ignored)++;
    if (warnings) warnings->push_back(path + ": ligne ignorée: " + why);
  };

  while (std::getline(f, line)) {
    if (!line.empty() && line.back()=='\r') line.pop_back();
    auto l = trim(line);
    if (l.empty() || l.rfind("#",0)==0) continue;

    auto cells = split_csv_line(l);

    if (!header_seen) {
      header_seen = true;
      std::unordered_map<std::string,int> idx;
      for (int i=0;i<(int)cells.size();++i) idx[lower(trim(cells[i]))] = i;
      iDate = col(idx, {"date","datetime","timestamp"});
      iVal  = col(idx, value_columns);
      if (iDate < 0 || iVal < 0) {
        throw ov::DataError("Missing date/value column in " + path);
      }
      continue;
    }

    if (iDate >= (int)cells.size() || iVal >= (int)cells.size()) { ignore("colonnes manquantes"); continue; }

    // les exports datetime ("2020-01-02 00:00:00") gardent les 10 premiers caractères
    const std::string ds = cells[iDate].substr(0, 10);
    DatedValueRow row;
    try {
      row.date = ov::core::Date::parse(ds);
    } catch (const ov::ConfigError&) {
      ignore("date invalide '" + cells[iDate] + "'");
      continue;
    }
    row.value = parse_double(cells[iVal]);
    if (!std::isfinite(row.value)) { ignore("valeur manquante au " + ds); continue; }
    if (require_positive && row.value <= 0.0) { ignore("valeur <= 0 au " + ds); continue; }

    out.push_back(row);
  }

  // tri stable par date, la dernière occurrence d’une date l’emporte
  std::stable_sort(out.begin(), out.end(),
                   [](const DatedValueRow& a, const DatedValueRow& b){ return a.date < b.date; });
  std::vector<DatedValueRow> dedup;
  dedup.reserve(out.size());
  for (const auto& r : out) {
    if (!dedup.empty() && dedup.back().date == r.date) {
      ignore("date dupliquée " + r.date.to_string());
      dedup.back() = r;
    } else {
      dedup.push_back(r);
    }
  }
  return dedup;
}

// ===== CsvMarketDataSource =====

CsvMarketDataSource::CsvMarketDataSource(std::string root) : root_(std::move(root)) {}

std::vector<std::string> CsvMarketDataSource::take_warnings() {
  std::vector<std::string> out;
  out.swap(warnings_);
  return out;
}

ov::market::PriceSeries
CsvMarketDataSource::fetch_price_series(const std::string& ticker,
                                        const ov::core::Date& start,
                                        const ov::core::Date& end)
{
  const std::string path = root_ + "/prices/" + ticker + ".csv";
  auto rows = read_dated_csv(path, {"adj close","adj_close","adjclose","close"},
                             /*require_positive=*/true, nullptr, &warnings_);

  std::vector<ov::market::PriceObservation> obs;
  obs.reserve(rows.size());
  for (const auto& r : rows) {
    if (r.date < start || !(r.date < end)) continue;
    obs.push_back({r.date, r.value});
  }
  if (obs.empty()) {
    throw ov::NoDataError("No data found for " + ticker + " from " + start.to_string() +
                          " to " + end.to_string());
  }
  return ov::market::PriceSeries(ticker, std::move(obs));
}

double CsvMarketDataSource::fetch_yield(const std::string& symbol, const ov::core::Date& around) {
  const std::string path = root_ + "/yields/" + symbol + ".csv";
  auto rows = read_dated_csv(path, {"close","yield","value"},
                             /*require_positive=*/false, nullptr, &warnings_);

  const ov::core::Date lo = around.add_days(-7);
  const ov::core::Date hi = around.add_days(1);

  const DatedValueRow* last = nullptr;
  for (const auto& r : rows) {
    if (r.date < lo || !(r.date < hi)) continue;
    if (r.date == around) return ov::core::round_to(r.value, 2);
    last = &r;
  }
  if (!last) {
    throw ov::NoDataError("No data found for " + symbol + " around " + around.to_string());
  }
  return ov::core::round_to(last->value, 2);
}

} // namespace ov::io

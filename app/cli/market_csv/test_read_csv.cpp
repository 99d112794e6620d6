#include "ov/io/market_csv.hpp"
#include "ov/core/errors.hpp"
#include <algorithm> // any_of
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
using namespace std;
namespace fs = std::filesystem;

using ov::core::Date;

static void write_file(const fs::path& p, const string& text) {
  fs::create_directories(p.parent_path());
  ofstream f(p);
  f << text;
}

template <class E, class F>
static bool throws_as(F f) {
  try { f(); } catch (const E&) { return true; }
  return false;
}

int main() {
  const fs::path root = fs::temp_directory_path() / "ov_test_read_csv";
  fs::remove_all(root);

  // Export type Yahoo : lignes invalides, doublon, désordre, CRLF
  write_file(root / "prices" / "AAA.csv",
    "Date,Open,High,Low,Close,Adj Close,Volume\r\n"
    "2020-01-03,1,1,1,10.5,10.0,100\r\n"
    "2020-01-02,1,1,1,9.5,9.0,100\r\n"
    "# commentaire\n"
    "2020-01-06,1,1,1,11,,100\n"            // adj close manquant
    "2020-01-07,1,1,1,11,-1,100\n"          // <= 0
    "not-a-date,1,1,1,11,11,100\n"
    "2020-01-08 00:00:00,1,1,1,12,12.0,100\n"
    "2020-01-09,1,1,1,13,13.0,100\n"
    "2020-01-09,1,1,1,13,13.5,100\n"        // doublon : le dernier gagne
    "2020-01-10,1,1,1,14,14.0,100\n");

  size_t ignored = 0;
  vector<string> warnings;
  auto rows = ov::io::read_dated_csv((root / "prices" / "AAA.csv").string(),
                                     {"adj close", "close"}, true, &ignored, &warnings);
  cout << "Valid rows: " << rows.size() << "\n";
  cout << "Ignored rows: " << ignored << "\n";
  for (auto& w : warnings) cerr << "[warn] " << w << "\n";

  assert(rows.size() == 5);
  assert(ignored == 4);
  assert(rows.front().date == Date(2020, 1, 2) && rows.front().value == 9.0);
  assert(rows[2].date == Date(2020, 1, 8));
  assert(rows[3].date == Date(2020, 1, 9) && rows[3].value == 13.5);
  auto has_warn = [&](const string& needle){
    return any_of(warnings.begin(), warnings.end(),
                  [&](const string& w){ return w.find(needle) != string::npos; });
  };
  assert(has_warn("valeur manquante"));
  assert(has_warn("valeur <= 0"));
  assert(has_warn("date invalide"));
  assert(has_warn("date dupliquée"));

  // Colonne "Close" seule (pas d’Adj Close)
  write_file(root / "prices" / "BBB.csv",
    "date,close\n2020-01-02,5\n2020-01-03,6\n2020-01-06,7\n");
  // Colonne valeur absente
  write_file(root / "prices" / "BAD.csv", "Date,Open\n2020-01-02,5\n");

  ov::io::CsvMarketDataSource src(root.string());

  // --- Fenêtre [start, end) : end exclu ---
  {
    auto s = src.fetch_price_series("AAA", Date(2020, 1, 3), Date(2020, 1, 9));
    assert(s.ticker() == "AAA");
    assert(s.size() == 2);
    assert(s.observations().front().date == Date(2020, 1, 3));
    assert(s.observations().back().date == Date(2020, 1, 8));
    assert(!src.take_warnings().empty());
    assert(src.take_warnings().empty());
  }
  {
    auto s = src.fetch_price_series("BBB", Date(2019, 1, 1), Date(2021, 1, 1));
    assert(s.size() == 3 && s.observations().back().adj_close == 7.0);
  }
  assert(throws_as<ov::NoDataError>([&]{ src.fetch_price_series("AAA", Date(2021, 1, 1), Date(2022, 1, 1)); }));
  assert(throws_as<ov::NoDataError>([&]{ src.fetch_price_series("ZZZ", Date(2020, 1, 1), Date(2021, 1, 1)); }));
  assert(throws_as<ov::DataError>([&]{ src.fetch_price_series("BAD", Date(2020, 1, 1), Date(2021, 1, 1)); }));

  // --- Taux : cotation du jour, sinon dernière de la fenêtre [d-7, d+1) ---
  write_file(root / "yields" / "^TNX.csv",
    "Date,Open,High,Low,Close,Adj Close,Volume\n"
    "2019-12-20,0,0,0,1.901,1.901,0\n"
    "2019-12-27,0,0,0,1.876,1.876,0\n"
    "2019-12-31,0,0,0,1.919,1.919,0\n"
    "2020-01-02,0,0,0,1.882,1.882,0\n"
    "2020-01-03,0,0,0,1.788,1.788,0\n");
  assert(abs(src.fetch_yield("^TNX", Date(2020, 1, 2)) - 1.88) < 1e-12);  // jour exact
  assert(abs(src.fetch_yield("^TNX", Date(2020, 1, 1)) - 1.92) < 1e-12);  // dernière avant
  assert(abs(src.fetch_yield("^TNX", Date(2019, 12, 28)) - 1.88) < 1e-12);
  assert(throws_as<ov::NoDataError>([&]{ src.fetch_yield("^TNX", Date(2020, 3, 1)); }));
  assert(throws_as<ov::NoDataError>([&]{ src.fetch_yield("^TNX", Date(2019, 12, 1)); }));
  assert(throws_as<ov::NoDataError>([&]{ src.fetch_yield("^IRX", Date(2020, 1, 2)); }));

  fs::remove_all(root);
  cout << "OK\n";
  return 0;
}

#include <ov/analytics/volatility.hpp>
#include <ov/config/valuation_config.hpp>
#include <ov/core/errors.hpp>
#include <ov/io/market_csv.hpp>
#include <ov/market/price_series.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <utility>
#include <vector>

// Volatilité historique d’un fichier de cours, pour les trois fréquences
// (ou une seule avec -F).
int main(int argc, char** argv) {
  std::string path, only;
  bool show_warnings = false;

  for (int i=1;i<argc;++i) {
    std::string a = argv[i];
    if ((a=="-f" || a=="--file") && i+1<argc) { path = argv[++i]; }
    else if ((a=="-F" || a=="--frequency") && i+1<argc) { only = argv[++i]; }
    else if (a=="-w" || a=="--show-warnings") { show_warnings = true; }
    else if (a=="-h" || a=="--help") {
      std::cout << "Usage: vol_info -f <prices.csv> [-F daily|weekly|monthly] [-w]\n";
      return 0;
    } else if (path.empty()) { path = a; }
  }
  if (path.empty()) {
    std::cerr << "Please provide a CSV path (-f <prices.csv>).\n";
    return 2;
  }

  try {
    std::size_t ignored = 0;
    std::vector<std::string> warnings;
    auto rows = ov::io::read_dated_csv(path, {"adj close","adj_close","adjclose","close"},
                                       /*require_positive=*/true, &ignored, &warnings);

    std::vector<ov::market::PriceObservation> obs;
    obs.reserve(rows.size());
    for (const auto& r : rows) obs.push_back({r.date, r.value});
    const ov::market::PriceSeries series(path, std::move(obs));

    std::cout << "File: " << path << "\n";
    std::cout << "Valid rows: " << series.size() << "\n";
    std::cout << "Ignored rows: " << ignored << "\n";
    if (!series.empty()) {
      std::cout << "Range: " << series.observations().front().date.to_string()
                << " .. " << series.observations().back().date.to_string() << "\n";
    }

    std::vector<ov::config::Frequency> freqs;
    if (only.empty()) {
      freqs = {ov::config::Frequency::Daily, ov::config::Frequency::Weekly, ov::config::Frequency::Monthly};
    } else {
      freqs = {ov::config::parse_frequency(only)};
    }

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(2);
    for (auto f : freqs) {
      std::size_t n = 0;
      try {
        const double v = ov::analytics::estimate_volatility(series, f, &n);
        std::cout << std::setw(8) << ov::config::to_string(f) << " : " << std::setw(7) << v
                  << " %  (" << n << " returns)\n";
      } catch (const ov::DataError& e) {
        std::cout << std::setw(8) << ov::config::to_string(f) << " : n/a  (" << e.what() << ")\n";
      }
    }

    if (show_warnings) {
      for (auto& w : warnings) std::cerr << "[warn] " << w << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
  return 0;
}

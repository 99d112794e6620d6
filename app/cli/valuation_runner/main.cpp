#include <ov/config/valuation_config.hpp>
#include <ov/core/errors.hpp>
#include <ov/io/market_csv.hpp>
#include <ov/valuation/orchestrator.hpp>
#include <ov/valuation/report.hpp>

#include "config_json.hpp"
#include "report_export.hpp"

#include <QDir>
#include <QString>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static void usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " [-c config.json] [-d data_dir] [-o output_dir]"
            << " [-f daily|weekly|monthly] [--no-export]\n"
            << "Defaults: -c config/config.json, data/output dirs from the config.\n";
}

static void print_table(const ov::valuation::ReportTable& t) {
  std::vector<std::size_t> w(t.header.size(), 0);
  for (std::size_t i = 0; i < t.header.size(); ++i) w[i] = t.header[i].size();
  for (const auto& r : t.rows)
    for (std::size_t i = 0; i < r.size() && i < w.size(); ++i) w[i] = std::max(w[i], r[i].size());

  std::cout << "== " << t.name << " ==\n";
  for (std::size_t i = 0; i < t.header.size(); ++i)
    std::cout << std::left << std::setw(static_cast<int>(w[i]) + 2) << t.header[i];
  std::cout << "\n";
  for (const auto& r : t.rows) {
    for (std::size_t i = 0; i < r.size() && i < w.size(); ++i)
      std::cout << std::left << std::setw(static_cast<int>(w[i]) + 2) << r[i];
    std::cout << "\n";
  }
  std::cout << std::right << "\n";
}

int main(int argc, char** argv) {
  std::string config_path = "config/config.json";
  std::string data_dir, out_dir, freq;
  bool do_export = true;

  for (int i=1;i<argc;++i) {
    std::string a = argv[i];
    if      ((a=="-c" || a=="--config") && i+1<argc) config_path = argv[++i];
    else if ((a=="-d" || a=="--data")   && i+1<argc) data_dir = argv[++i];
    else if ((a=="-o" || a=="--output") && i+1<argc) out_dir = argv[++i];
    else if ((a=="-f" || a=="--frequency") && i+1<argc) freq = argv[++i];
    else if (a=="--no-export") do_export = false;
    else if (a=="-h" || a=="--help") { usage(argv[0]); return 0; }
    else { std::cerr << "Unknown arg: " << a << "\n"; usage(argv[0]); return 1; }
  }

  try {
    std::cout << "Loading configuration from " << config_path << "\n";
    auto cfg = qtio::load_valuation_config(QString::fromStdString(config_path));
    if (!data_dir.empty()) cfg.data_dir = data_dir;
    if (!out_dir.empty())  cfg.output_dir = out_dir;
    if (!freq.empty())     cfg.frequency = ov::config::parse_frequency(freq);

    std::cout << "Comparables: " << cfg.public_comps.size()
              << "  frequency: " << ov::config::to_string(cfg.frequency)
              << "  data: " << cfg.data_dir << "\n";

    ov::io::CsvMarketDataSource source(cfg.data_dir);

    ov::valuation::RunOptions opt;
    opt.on_ticker = [](std::size_t, const ov::analytics::TickerVolatility& tv) {
      if (tv.ok()) {
        std::cout << "Volatility for " << tv.ticker << ": "
                  << tv.estimate->annualized_volatility_percent
                  << " (" << tv.estimate->n_returns << " returns)\n";
      } else {
        std::cerr << "[warn] " << tv.ticker << ": " << tv.error->message << "\n";
      }
    };

    const auto res = ov::valuation::run_valuation(cfg, source, opt);

    for (const auto& w : source.take_warnings()) std::cerr << "[warn] " << w << "\n";
    for (const auto& f : res.yield_failures)
      std::cerr << "[warn] yield " << f.ticker << ": " << f.message << "\n";

    std::cout << "Years to maturity: " << res.years_to_maturity << "\n"
              << "History window: " << res.history_start.to_string()
              << " to " << res.history_end.to_string() << "\n";
    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6)
              << "Risk-free rate for " << res.years_to_maturity << "-year: " << res.risk_free_rate << "\n"
              << "Average volatility: " << res.average_volatility << "\n"
              << "Option valuation  : " << res.option_value << "\n\n";
    std::cout.unsetf(std::ios::fixed);

    const auto rep = ov::valuation::build_report(res);
    print_table(rep.summary);
    print_table(rep.volatility);
    print_table(rep.risk_free_rate);

    if (do_export) {
      const QString dir = QString::fromStdString(cfg.output_dir);
      const QStringList files = qtio::export_report_csv(rep, dir);
      const QString json = QDir(dir).filePath("option_valuation_results.json");
      qtio::write_report_json(res, rep, json);
      for (const auto& p : files) std::cout << "Saved " << p.toStdString() << "\n";
      std::cout << "Saved " << json.toStdString() << "\n";
    }
  } catch (const ov::MaturityNotFoundError& e) {
    std::cerr << "Error: " << e.what() << "\n"; return 3;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"; return 2;
  }
  return 0;
}

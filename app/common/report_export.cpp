#include "report_export.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

#include <fstream>

#include <ov/core/errors.hpp>

namespace qtio {

namespace {

// champ CSV : entre guillemets si virgule / guillemet / saut de ligne
std::string csv_field(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string o = "\"";
  for (char c : s) { if (c == '"') o.push_back('"'); o.push_back(c); }
  o.push_back('"');
  return o;
}

void write_csv(const ov::valuation::ReportTable& t, const QString& path) {
  std::ofstream f(path.toStdString());
  if (!f) throw ov::Error("Cannot open " + path.toStdString() + " for writing");
  for (std::size_t i = 0; i < t.header.size(); ++i) {
    if (i) f << ",";
    f << csv_field(t.header[i]);
  }
  f << "\n";
  for (const auto& row : t.rows) {
    for (std::size_t i = 0; i < row.size(); ++i) {
      if (i) f << ",";
      f << csv_field(row[i]);
    }
    f << "\n";
  }
  f.close();
  if (!f) throw ov::Error("Failed writing " + path.toStdString());
}

QJsonObject table_to_json(const ov::valuation::ReportTable& t) {
  QJsonArray header;
  for (const auto& h : t.header) header.append(QString::fromStdString(h));
  QJsonArray rows;
  for (const auto& r : t.rows) {
    QJsonArray row;
    for (const auto& c : r) row.append(QString::fromStdString(c));
    rows.append(row);
  }
  QJsonObject o;
  o["name"]   = QString::fromStdString(t.name);
  o["header"] = header;
  o["rows"]   = rows;
  return o;
}

} // namespace

QStringList export_report_csv(const ov::valuation::ValuationReport& rep, const QString& outDir) {
  QDir dir(outDir);
  if (!dir.mkpath(".")) throw ov::Error("Cannot create output directory " + outDir.toStdString());

  const QString pSummary = dir.filePath("black_scholes.csv");
  const QString pVol     = dir.filePath("volatility.csv");
  const QString pRate    = dir.filePath("risk_free_rate.csv");
  write_csv(rep.summary, pSummary);
  write_csv(rep.volatility, pVol);
  write_csv(rep.risk_free_rate, pRate);
  return {pSummary, pVol, pRate};
}

QJsonObject result_to_json(const ov::valuation::ValuationResult& res,
                           const ov::valuation::ValuationReport& rep) {
  QJsonObject o;
  o["timestamp"]          = QDateTime::currentDateTime().toString(Qt::ISODate);
  o["years_to_maturity"]  = res.years_to_maturity;
  o["risk_free_rate"]     = res.risk_free_rate;
  o["average_volatility"] = res.average_volatility;
  o["option_value"]       = res.option_value;
  o["frequency"]          = QString::fromLatin1(ov::config::to_string(res.frequency));
  o["history_start"]      = QString::fromStdString(res.history_start.to_string());
  o["history_end"]        = QString::fromStdString(res.history_end.to_string());

  QJsonArray volFailures;
  for (const auto& f : res.volatility.failures) {
    QJsonObject e;
    e["ticker"] = QString::fromStdString(f.ticker);
    e["error"]  = QString::fromStdString(f.message);
    volFailures.append(e);
  }
  o["volatility_failures"] = volFailures;

  QJsonArray yieldFailures;
  for (const auto& f : res.yield_failures) {
    QJsonObject e;
    e["maturity"] = QString::fromStdString(f.ticker);
    e["error"]    = QString::fromStdString(f.message);
    yieldFailures.append(e);
  }
  o["yield_failures"] = yieldFailures;

  QJsonObject tables;
  tables["black_scholes"]  = table_to_json(rep.summary);
  tables["volatility"]     = table_to_json(rep.volatility);
  tables["risk_free_rate"] = table_to_json(rep.risk_free_rate);
  o["tables"] = tables;
  return o;
}

void write_report_json(const ov::valuation::ValuationResult& res,
                       const ov::valuation::ValuationReport& rep,
                       const QString& path) {
  QFile f(path);
  if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    throw ov::Error("Cannot open " + path.toStdString() + ": " + f.errorString().toStdString());
  }
  QJsonDocument doc(result_to_json(res, rep));
  f.write(doc.toJson(QJsonDocument::Indented));
  f.close();
}

} // namespace qtio

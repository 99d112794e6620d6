#include "config_json.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QStringList>

#include <algorithm>

#include <ov/core/errors.hpp>

namespace qtio {

namespace {

QJsonValue require(const QJsonObject& obj, const char* key) {
  const QJsonValue v = obj.value(QLatin1String(key));
  if (v.isUndefined() || v.isNull()) {
    throw ov::ConfigError(std::string("Missing required field '") + key + "'");
  }
  return v;
}

double require_number(const QJsonObject& obj, const char* key) {
  const QJsonValue v = require(obj, key);
  if (!v.isDouble()) {
    throw ov::ConfigError(std::string("Field '") + key + "' must be a number");
  }
  return v.toDouble();
}

std::string require_string(const QJsonObject& obj, const char* key) {
  const QJsonValue v = require(obj, key);
  if (!v.isString()) {
    throw ov::ConfigError(std::string("Field '") + key + "' must be a string");
  }
  return v.toString().toStdString();
}

std::string optional_string(const QJsonObject& obj, const char* key, const std::string& def) {
  const QJsonValue v = obj.value(QLatin1String(key));
  if (v.isUndefined() || v.isNull()) return def;
  if (!v.isString()) {
    throw ov::ConfigError(std::string("Field '") + key + "' must be a string");
  }
  return v.toString().toStdString();
}

// "10-year" -> 10
int maturity_from_label(const QString& label) {
  const QString head = label.section('-', 0, 0).trimmed();
  bool ok = false;
  const int m = head.toInt(&ok);
  if (!ok || m < 1) {
    throw ov::ConfigError("Invalid treasury maturity label '" + label.toStdString() +
                          "' (expected '<N>-year')");
  }
  return m;
}

} // namespace

ov::config::ValuationConfig parse_valuation_config(const QJsonObject& obj) {
  ov::config::ValuationConfig cfg;
  cfg.stock_price      = require_number(obj, "stock_price");
  cfg.strike_price     = require_number(obj, "strike_price");
  cfg.grant_date       = require_string(obj, "grant_date");
  cfg.valuation_date   = require_string(obj, "valuation_date");
  cfg.expiration_date  = require_string(obj, "expiration_date");
  cfg.vesting_end_date = require_string(obj, "vesting_end_date");

  const QJsonValue comps = require(obj, "public_comps");
  if (!comps.isArray()) {
    throw ov::ConfigError("Field 'public_comps' must be an array of tickers");
  }
  const QJsonArray arr = comps.toArray();
  for (const QJsonValue& t : arr) {
    if (!t.isString()) throw ov::ConfigError("Field 'public_comps' must contain strings only");
    cfg.public_comps.push_back(t.toString().trimmed().toStdString());
  }

  cfg.frequency  = ov::config::parse_frequency(optional_string(obj, "frequency", "daily"));
  cfg.data_dir   = optional_string(obj, "data_dir", cfg.data_dir);
  cfg.output_dir = optional_string(obj, "output_dir", cfg.output_dir);

  const QJsonValue tt = obj.value(QLatin1String("treasury_tickers"));
  if (!tt.isUndefined() && !tt.isNull()) {
    if (!tt.isObject()) {
      throw ov::ConfigError("Field 'treasury_tickers' must be an object {\"<N>-year\": \"SYMBOL\"}");
    }
    const QJsonObject t = tt.toObject();
    cfg.treasury.clear();
    for (auto it = t.begin(); it != t.end(); ++it) {
      if (!it.value().isString()) {
        throw ov::ConfigError("Treasury symbol for '" + it.key().toStdString() + "' must be a string");
      }
      cfg.treasury.push_back({maturity_from_label(it.key()), it.value().toString().toStdString()});
    }
    std::sort(cfg.treasury.begin(), cfg.treasury.end(),
              [](const auto& a, const auto& b){ return a.maturity_years < b.maturity_years; });
  }

  ov::config::validate(cfg);
  return cfg;
}

ov::config::ValuationConfig load_valuation_config(const QString& path) {
  QFile f(path);
  if (!f.open(QIODevice::ReadOnly)) {
    throw ov::ConfigError("Cannot open configuration file " + path.toStdString() + ": " +
                          f.errorString().toStdString());
  }
  const QByteArray bytes = f.readAll(); f.close();

  QJsonParseError perr;
  const QJsonDocument doc = QJsonDocument::fromJson(bytes, &perr);
  if (perr.error != QJsonParseError::NoError) {
    throw ov::ConfigError("Invalid JSON in " + path.toStdString() + ": " + perr.errorString().toStdString());
  }
  if (!doc.isObject()) {
    throw ov::ConfigError("Configuration root must be a JSON object: " + path.toStdString());
  }
  return parse_valuation_config(doc.object());
}

QJsonObject valuation_config_to_json(const ov::config::ValuationConfig& cfg) {
  QJsonObject o;
  o["stock_price"]      = cfg.stock_price;
  o["strike_price"]     = cfg.strike_price;
  o["grant_date"]       = QString::fromStdString(cfg.grant_date);
  o["valuation_date"]   = QString::fromStdString(cfg.valuation_date);
  o["expiration_date"]  = QString::fromStdString(cfg.expiration_date);
  o["vesting_end_date"] = QString::fromStdString(cfg.vesting_end_date);

  QJsonArray comps;
  for (const auto& t : cfg.public_comps) comps.append(QString::fromStdString(t));
  o["public_comps"] = comps;

  o["frequency"]  = QString::fromLatin1(ov::config::to_string(cfg.frequency));
  o["data_dir"]   = QString::fromStdString(cfg.data_dir);
  o["output_dir"] = QString::fromStdString(cfg.output_dir);

  QJsonObject tt;
  for (const auto& inst : cfg.treasury)
    tt[QString("%1-year").arg(inst.maturity_years)] = QString::fromStdString(inst.symbol);
  o["treasury_tickers"] = tt;
  return o;
}

} // namespace qtio

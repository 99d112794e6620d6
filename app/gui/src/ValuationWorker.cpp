#include "ValuationWorker.hpp"

#include <ov/core/errors.hpp>
#include <ov/io/market_csv.hpp>

#include <chrono>

#include <QDebug>
#include <QString>

namespace gui {

ValuationWorker::ValuationWorker(QObject* parent) : QObject(parent) {}

void ValuationWorker::requestStop() { stop_.store(true, std::memory_order_relaxed); }

void ValuationWorker::runValuation(ov::config::ValuationConfig cfg)
{
  stop_.store(false, std::memory_order_relaxed);

  try {
    qDebug() << "[Valuation]"
             << "S=" << cfg.stock_price << "K=" << cfg.strike_price
             << "valuation=" << QString::fromStdString(cfg.valuation_date)
             << "comps=" << static_cast<int>(cfg.public_comps.size())
             << "freq=" << ov::config::to_string(cfg.frequency)
             << "data=" << QString::fromStdString(cfg.data_dir);

    const auto t0 = std::chrono::steady_clock::now();

    ov::io::CsvMarketDataSource source(cfg.data_dir);

    ov::valuation::RunOptions opt;
    opt.stop = &stop_;
    opt.on_progress = [this](const std::string& stage, int cur, int total) {
      emit progress(QString::fromStdString(stage), cur, total);
    };
    opt.on_ticker = [this](std::size_t, const ov::analytics::TickerVolatility& tv) {
      const QString t = QString::fromStdString(tv.ticker);
      if (tv.ok()) {
        emit tickerDone(t, true, tv.estimate->annualized_volatility_percent, QString());
      } else {
        qWarning() << "[Valuation]" << t << QString::fromStdString(tv.error->message);
        emit tickerDone(t, false, 0.0, QString::fromStdString(tv.error->message));
      }
    };

    auto res = std::make_shared<const ov::valuation::ValuationResult>(
        ov::valuation::run_valuation(cfg, source, opt));

    for (const auto& w : source.take_warnings())
      qWarning() << "[Valuation]" << QString::fromStdString(w);
    for (const auto& f : res->yield_failures)
      emit message(QString("Taux %1 indisponible: %2")
                   .arg(QString::fromStdString(f.ticker), QString::fromStdString(f.message)));

    const auto t1 = std::chrono::steady_clock::now();
    qDebug() << "[Valuation]" << "YTM=" << res->years_to_maturity
             << "r=" << res->risk_free_rate << "sigma=" << res->average_volatility
             << "value=" << res->option_value
             << "elapsed_ms=" << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();

    emit finished(res);
  } catch (const ov::CanceledError&) {
    emit canceled();
  } catch (const std::exception& e) {
    emit failed(QString::fromUtf8(e.what()));
  }
}

} // namespace gui

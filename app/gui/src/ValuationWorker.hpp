#pragma once
#include <QObject>
#include <QString>
#include <atomic>
#include <memory>

// OV types (passés par valeur ⇒ on inclut ici)
#include <ov/config/valuation_config.hpp>
#include <ov/valuation/orchestrator.hpp>


namespace gui {

class ValuationWorker : public QObject {
  Q_OBJECT
public:
  explicit ValuationWorker(QObject* parent = nullptr);
  ~ValuationWorker() override = default;

  // Demande d’arrêt : thread-safe, appelée directement depuis le thread UI.
  void requestStop();

public slots:
  // Pipeline complet (mono-thread) ; progress() par ticker / instrument.
  void runValuation(ov::config::ValuationConfig cfg);

signals:
  void message(const QString& text);
  void progress(const QString& stage, int cur, int total);
  void tickerDone(const QString& ticker, bool ok, double volPct, const QString& error);
  void finished(std::shared_ptr<const ov::valuation::ValuationResult> result);
  void failed(const QString& why);
  void canceled();

private:
  std::atomic<bool> stop_{false};
};

} // namespace gui

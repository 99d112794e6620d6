#pragma once
#include <QMainWindow>
#include <QThread>
#include <memory>
#include <optional>

#include <QtCharts/QChartView>
#include <QtCharts/QChart>
#include <QtCharts/QLineSeries>
#include <QtCharts/QScatterSeries>
#include <QtCharts/QValueAxis>
#include <QtCharts/QBarSeries>
#include <QtCharts/QBarSet>
#include <QtCharts/QBarCategoryAxis>

#include <ov/config/valuation_config.hpp>
#include <ov/valuation/orchestrator.hpp>
#include <ov/valuation/report.hpp>

namespace gui { class ValuationWorker; }

class QLabel;
class QLineEdit;
class QDoubleSpinBox;
class QDateEdit;
class QComboBox;
class QPlainTextEdit;
class QProgressBar;
class QPushButton;
class QTableWidget;
class QTabWidget;

class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override;

  // Charge un fichier de configuration dans le formulaire (utilisé au démarrage).
  bool loadConfigFile(const QString& path);

private slots:
  void onRun();
  void onStop();
  void onLoadConfig();
  void onSaveConfig();
  void onExportCsv();
  void onExportJson();

  // Callbacks worker
  void onValuationProgress(const QString& stage, int cur, int total);
  void onTickerDone(const QString& ticker, bool ok, double volPct, const QString& error);
  void onValuationMessage(const QString& text);
  void onValuationFinished(std::shared_ptr<const ov::valuation::ValuationResult> res);
  void onValuationFailed(const QString& why);
  void onValuationCanceled();

private:
  // --- construction UI
  QWidget* buildInputsPanel_();
  QWidget* buildResultsPanel_();
  void setupCurveChart_();
  void setupVolChart_();

  // --- formulaire <-> configuration
  ov::config::ValuationConfig configFromForm_() const;
  void applyConfigToForm_(const ov::config::ValuationConfig& cfg);

  // --- affichage
  void fillTable_(QTableWidget* t, const ov::valuation::ReportTable& table);
  void updateCurveChart_(const ov::valuation::ValuationResult& res);
  void updateVolChart_(const ov::valuation::ValuationResult& res);
  void setBusy_(bool busy);
  void log_(const QString& line);

  // --- worker
  void startValuationWorker();
  void stopValuationWorker();

  // Entrées
  QDoubleSpinBox* sbSpot_      = nullptr;
  QDoubleSpinBox* sbStrike_    = nullptr;
  QDateEdit*      deGrant_     = nullptr;
  QDateEdit*      deValuation_ = nullptr;
  QDateEdit*      deExpiry_    = nullptr;
  QDateEdit*      deVesting_   = nullptr;
  QLineEdit*      edComps_     = nullptr;
  QComboBox*      cbFrequency_ = nullptr;
  QLineEdit*      edTreasury_  = nullptr;
  QLineEdit*      edDataDir_   = nullptr;
  QLineEdit*      edOutputDir_ = nullptr;

  QPushButton* btnRun_        = nullptr;
  QPushButton* btnStop_       = nullptr;
  QPushButton* btnExportCsv_  = nullptr;
  QPushButton* btnExportJson_ = nullptr;
  QProgressBar* progress_     = nullptr;
  QLabel*       lblStage_     = nullptr;

  // Résultats
  QLabel* lblYtm_   = nullptr;
  QLabel* lblRate_  = nullptr;
  QLabel* lblVol_   = nullptr;
  QLabel* lblValue_ = nullptr;

  QTabWidget*     tabs_        = nullptr;
  QTableWidget*   tblSummary_  = nullptr;
  QTableWidget*   tblVol_      = nullptr;
  QTableWidget*   tblRate_     = nullptr;
  QPlainTextEdit* logView_     = nullptr;

  QtCharts::QChartView*     curveView_  = nullptr;
  QtCharts::QChart*         curveChart_ = nullptr;
  QtCharts::QLineSeries*    curveLine_  = nullptr;
  QtCharts::QScatterSeries* curveKnown_ = nullptr;
  QtCharts::QValueAxis*     curveAxX_   = nullptr;
  QtCharts::QValueAxis*     curveAxY_   = nullptr;

  QtCharts::QChartView*       volView_  = nullptr;
  QtCharts::QChart*           volChart_ = nullptr;
  QtCharts::QBarSeries*       volBars_  = nullptr;
  QtCharts::QBarCategoryAxis* volAxX_   = nullptr;
  QtCharts::QValueAxis*       volAxY_   = nullptr;

  // Thread + worker
  QThread*               valThread_ = nullptr;
  gui::ValuationWorker*  valWorker_ = nullptr;
  bool                   running_   = false;

  // Dernier run réussi (export)
  std::shared_ptr<const ov::valuation::ValuationResult> lastResult_;
  std::optional<ov::valuation::ValuationReport>         lastReport_;
  ov::config::ValuationConfig                           lastConfig_;
};

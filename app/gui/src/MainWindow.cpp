#include "MainWindow.hpp"
#include "ValuationWorker.hpp"

#include "config_json.hpp"
#include "report_export.hpp"

#include <ov/analytics/yield_curve.hpp>
#include <ov/core/errors.hpp>

#include <QComboBox>
#include <QDate>
#include <QDateEdit>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QDoubleSpinBox>
#include <QFile>
#include <QFileDialog>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QJsonDocument>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPainter>
#include <QPlainTextEdit>
#include <QProgressBar>
#include <QPushButton>
#include <QSplitter>
#include <QStatusBar>
#include <QTabWidget>
#include <QTableWidget>
#include <QVBoxLayout>

#include <algorithm>

using namespace QtCharts;

namespace {

QDateEdit* makeDateEdit(QWidget* parent) {
  auto* d = new QDateEdit(parent);
  d->setCalendarPopup(true);
  d->setDisplayFormat("yyyy-MM-dd");
  return d;
}

QDoubleSpinBox* makePriceBox(QWidget* parent) {
  auto* s = new QDoubleSpinBox(parent);
  s->setDecimals(4);
  s->setRange(0.0001, 1e9);
  s->setSingleStep(1.0);
  return s;
}

std::string isoFrom(const QDateEdit* d) {
  return d->date().toString("yyyy-MM-dd").toStdString();
}

void setIso(QDateEdit* d, const std::string& iso) {
  const QDate q = QDate::fromString(QString::fromStdString(iso), "yyyy-MM-dd");
  if (q.isValid()) d->setDate(q);
}

// "1:^IRX, 5:^FVX" <-> instruments
QString treasuryToText(const std::vector<ov::config::YieldInstrument>& v) {
  QStringList parts;
  for (const auto& i : v) parts << QString("%1:%2").arg(i.maturity_years).arg(QString::fromStdString(i.symbol));
  return parts.join(", ");
}

std::vector<ov::config::YieldInstrument> treasuryFromText(const QString& text) {
  std::vector<ov::config::YieldInstrument> out;
  const QStringList parts = text.split(',', Qt::SkipEmptyParts);
  for (const QString& raw : parts) {
    const QString p = raw.trimmed();
    const int colon = p.indexOf(':');
    bool ok = false;
    const int m = colon > 0 ? p.left(colon).trimmed().toInt(&ok) : 0;
    if (!ok) {
      throw ov::ConfigError("Invalid treasury entry '" + p.toStdString() + "' (expected '<years>:<symbol>')");
    }
    out.push_back({m, p.mid(colon + 1).trimmed().toStdString()});
  }
  std::sort(out.begin(), out.end(),
            [](const auto& a, const auto& b){ return a.maturity_years < b.maturity_years; });
  return out;
}

} // namespace

MainWindow::MainWindow(QWidget* parent)
  : QMainWindow(parent) {
  // Enregistrements pour les queued connections
  qRegisterMetaType<ov::config::ValuationConfig>("ov::config::ValuationConfig");
  qRegisterMetaType<std::shared_ptr<const ov::valuation::ValuationResult>>(
      "std::shared_ptr<const ov::valuation::ValuationResult>");

  setWindowTitle(tr("Option Valuation"));

  auto* split = new QSplitter(Qt::Horizontal, this);
  split->addWidget(buildInputsPanel_());
  split->addWidget(buildResultsPanel_());
  split->setStretchFactor(1, 1);
  setCentralWidget(split);

  setupCurveChart_();
  setupVolChart_();

  connect(btnRun_,        &QPushButton::clicked, this, &MainWindow::onRun);
  connect(btnStop_,       &QPushButton::clicked, this, &MainWindow::onStop);
  connect(btnExportCsv_,  &QPushButton::clicked, this, &MainWindow::onExportCsv);
  connect(btnExportJson_, &QPushButton::clicked, this, &MainWindow::onExportJson);

  // Valeurs par défaut
  applyConfigToForm_(ov::config::ValuationConfig{});
  const QDate today = QDate::currentDate();
  deGrant_->setDate(today);
  deValuation_->setDate(today);
  deExpiry_->setDate(today.addYears(10));
  deVesting_->setDate(today.addYears(4));

  setBusy_(false);
  statusBar()->showMessage(tr("Ready"));
  resize(1200, 760);
}

MainWindow::~MainWindow() {
  if (valWorker_) QObject::disconnect(valWorker_, nullptr, this, nullptr);
  stopValuationWorker();

  // Les vues possèdent leurs QChart
  delete curveView_; curveView_ = nullptr;
  delete volView_;   volView_   = nullptr;
}

// ============================================================================
// Construction UI
// ============================================================================

QWidget* MainWindow::buildInputsPanel_() {
  auto* panel = new QWidget(this);
  auto* v = new QVBoxLayout(panel);

  auto* grpOption = new QGroupBox(tr("Grant"), panel);
  auto* f1 = new QFormLayout(grpOption);
  sbSpot_      = makePriceBox(grpOption);
  sbStrike_    = makePriceBox(grpOption);
  deGrant_     = makeDateEdit(grpOption);
  deValuation_ = makeDateEdit(grpOption);
  deExpiry_    = makeDateEdit(grpOption);
  deVesting_   = makeDateEdit(grpOption);
  f1->addRow(tr("Stock price"),     sbSpot_);
  f1->addRow(tr("Strike price"),    sbStrike_);
  f1->addRow(tr("Grant date"),      deGrant_);
  f1->addRow(tr("Valuation date"),  deValuation_);
  f1->addRow(tr("Expiration date"), deExpiry_);
  f1->addRow(tr("Vesting end"),     deVesting_);
  v->addWidget(grpOption);

  auto* grpMarket = new QGroupBox(tr("Market data"), panel);
  auto* f2 = new QFormLayout(grpMarket);
  edComps_ = new QLineEdit(grpMarket);
  edComps_->setPlaceholderText("AAPL, MSFT, GOOG");
  cbFrequency_ = new QComboBox(grpMarket);
  cbFrequency_->addItems({"daily", "weekly", "monthly"});
  edTreasury_  = new QLineEdit(grpMarket);
  edDataDir_   = new QLineEdit(grpMarket);
  edOutputDir_ = new QLineEdit(grpMarket);
  f2->addRow(tr("Public comps"),  edComps_);
  f2->addRow(tr("Frequency"),     cbFrequency_);
  f2->addRow(tr("Treasury"),      edTreasury_);
  f2->addRow(tr("Data dir"),      edDataDir_);
  f2->addRow(tr("Output dir"),    edOutputDir_);
  v->addWidget(grpMarket);

  auto* rowCfg = new QHBoxLayout();
  auto* btnLoad = new QPushButton(tr("Load config…"), panel);
  auto* btnSave = new QPushButton(tr("Save config…"), panel);
  connect(btnLoad, &QPushButton::clicked, this, &MainWindow::onLoadConfig);
  connect(btnSave, &QPushButton::clicked, this, &MainWindow::onSaveConfig);
  rowCfg->addWidget(btnLoad);
  rowCfg->addWidget(btnSave);
  v->addLayout(rowCfg);

  auto* rowRun = new QHBoxLayout();
  btnRun_  = new QPushButton(tr("Run valuation"), panel);
  btnStop_ = new QPushButton(tr("Stop"), panel);
  rowRun->addWidget(btnRun_);
  rowRun->addWidget(btnStop_);
  v->addLayout(rowRun);

  progress_ = new QProgressBar(panel);
  progress_->setRange(0, 1);
  progress_->setValue(0);
  lblStage_ = new QLabel(panel);
  v->addWidget(progress_);
  v->addWidget(lblStage_);

  auto* grpRes = new QGroupBox(tr("Results"), panel);
  auto* f3 = new QFormLayout(grpRes);
  lblYtm_   = new QLabel("-", grpRes);
  lblRate_  = new QLabel("-", grpRes);
  lblVol_   = new QLabel("-", grpRes);
  lblValue_ = new QLabel("-", grpRes);
  QFont bold = lblValue_->font(); bold.setBold(true);
  lblValue_->setFont(bold);
  f3->addRow(tr("Years to maturity"), lblYtm_);
  f3->addRow(tr("Risk free rate"),    lblRate_);
  f3->addRow(tr("Volatility"),        lblVol_);
  f3->addRow(tr("Option value"),      lblValue_);
  v->addWidget(grpRes);

  auto* rowExp = new QHBoxLayout();
  btnExportCsv_  = new QPushButton(tr("Export CSV"), panel);
  btnExportJson_ = new QPushButton(tr("Export JSON"), panel);
  rowExp->addWidget(btnExportCsv_);
  rowExp->addWidget(btnExportJson_);
  v->addLayout(rowExp);

  v->addStretch(1);
  return panel;
}

QWidget* MainWindow::buildResultsPanel_() {
  tabs_ = new QTabWidget(this);

  auto makeTable = [this]() {
    auto* t = new QTableWidget(tabs_);
    t->setEditTriggers(QAbstractItemView::NoEditTriggers);
    t->verticalHeader()->setVisible(false);
    t->horizontalHeader()->setStretchLastSection(true);
    return t;
  };
  tblSummary_ = makeTable();
  tblVol_     = makeTable();
  tblRate_    = makeTable();
  tabs_->addTab(tblSummary_, tr("Black Scholes"));
  tabs_->addTab(tblVol_,     tr("Volatility"));
  tabs_->addTab(tblRate_,    tr("Risk Free Rate"));

  curveView_ = new QChartView(tabs_);
  curveView_->setRenderHint(QPainter::Antialiasing);
  tabs_->addTab(curveView_, tr("Yield curve"));

  volView_ = new QChartView(tabs_);
  volView_->setRenderHint(QPainter::Antialiasing);
  tabs_->addTab(volView_, tr("Comps"));

  logView_ = new QPlainTextEdit(tabs_);
  logView_->setReadOnly(true);
  logView_->setMaximumBlockCount(2000);
  tabs_->addTab(logView_, tr("Log"));

  return tabs_;
}

void MainWindow::setupCurveChart_() {
  curveChart_ = new QChart();
  curveChart_->setTitle(tr("Risk free curve (%)"));
  curveChart_->legend()->setVisible(true);
  curveChart_->legend()->setAlignment(Qt::AlignBottom);

  curveLine_ = new QLineSeries(curveChart_);
  curveLine_->setName(tr("Curve"));
  curveKnown_ = new QScatterSeries(curveChart_);
  curveKnown_->setName(tr("Observed"));
  curveKnown_->setMarkerSize(9.0);
  curveChart_->addSeries(curveLine_);
  curveChart_->addSeries(curveKnown_);

  curveAxX_ = new QValueAxis(curveChart_);
  curveAxX_->setTitleText(tr("Maturity (years)"));
  curveAxX_->setLabelFormat("%d");
  curveAxY_ = new QValueAxis(curveChart_);
  curveAxY_->setTitleText(tr("Yield (%)"));
  curveAxY_->setLabelFormat("%.2f");

  curveChart_->addAxis(curveAxX_, Qt::AlignBottom);
  curveChart_->addAxis(curveAxY_, Qt::AlignLeft);
  for (auto* s : {static_cast<QAbstractSeries*>(curveLine_), static_cast<QAbstractSeries*>(curveKnown_)}) {
    s->attachAxis(curveAxX_);
    s->attachAxis(curveAxY_);
  }
  curveView_->setChart(curveChart_);
}

void MainWindow::setupVolChart_() {
  volChart_ = new QChart();
  volChart_->setTitle(tr("Annualized volatility (%)"));
  volChart_->legend()->setVisible(false);

  volBars_ = new QBarSeries(volChart_);
  volChart_->addSeries(volBars_);

  volAxX_ = new QBarCategoryAxis(volChart_);
  volAxY_ = new QValueAxis(volChart_);
  volAxY_->setLabelFormat("%.1f");
  volChart_->addAxis(volAxX_, Qt::AlignBottom);
  volChart_->addAxis(volAxY_, Qt::AlignLeft);
  volBars_->attachAxis(volAxX_);
  volBars_->attachAxis(volAxY_);
  volView_->setChart(volChart_);
}

// ============================================================================
// Formulaire <-> configuration
// ============================================================================

ov::config::ValuationConfig MainWindow::configFromForm_() const {
  ov::config::ValuationConfig cfg;
  cfg.stock_price      = sbSpot_->value();
  cfg.strike_price     = sbStrike_->value();
  cfg.grant_date       = isoFrom(deGrant_);
  cfg.valuation_date   = isoFrom(deValuation_);
  cfg.expiration_date  = isoFrom(deExpiry_);
  cfg.vesting_end_date = isoFrom(deVesting_);

  const QStringList comps = edComps_->text().split(',', Qt::SkipEmptyParts);
  for (const QString& t : comps) {
    const QString s = t.trimmed();
    if (!s.isEmpty()) cfg.public_comps.push_back(s.toStdString());
  }
  cfg.frequency  = ov::config::parse_frequency(cbFrequency_->currentText().toStdString());
  cfg.treasury   = treasuryFromText(edTreasury_->text());
  cfg.data_dir   = edDataDir_->text().trimmed().toStdString();
  cfg.output_dir = edOutputDir_->text().trimmed().toStdString();

  ov::config::validate(cfg);
  (void)ov::config::to_option_parameters(cfg); // dates / prix
  return cfg;
}

void MainWindow::applyConfigToForm_(const ov::config::ValuationConfig& cfg) {
  if (cfg.stock_price > 0)  sbSpot_->setValue(cfg.stock_price);
  if (cfg.strike_price > 0) sbStrike_->setValue(cfg.strike_price);
  setIso(deGrant_,     cfg.grant_date);
  setIso(deValuation_, cfg.valuation_date);
  setIso(deExpiry_,    cfg.expiration_date);
  setIso(deVesting_,   cfg.vesting_end_date);

  QStringList comps;
  for (const auto& t : cfg.public_comps) comps << QString::fromStdString(t);
  edComps_->setText(comps.join(", "));

  cbFrequency_->setCurrentText(QString::fromLatin1(ov::config::to_string(cfg.frequency)));
  edTreasury_->setText(treasuryToText(cfg.treasury));
  edDataDir_->setText(QString::fromStdString(cfg.data_dir));
  edOutputDir_->setText(QString::fromStdString(cfg.output_dir));
}

bool MainWindow::loadConfigFile(const QString& path) {
  try {
    applyConfigToForm_(qtio::load_valuation_config(path));
    statusBar()->showMessage(tr("Loaded %1").arg(QDir::toNativeSeparators(path)), 3000);
    log_(QString("Configuration: %1").arg(path));
    return true;
  } catch (const std::exception& e) {
    QMessageBox::warning(this, tr("Load config"), QString::fromUtf8(e.what()));
    return false;
  }
}

void MainWindow::onLoadConfig() {
  const QString fn = QFileDialog::getOpenFileName(
      this, tr("Load config"), QDir::currentPath() + "/config", tr("JSON (*.json)"));
  if (fn.isEmpty()) return;
  loadConfigFile(fn);
}

void MainWindow::onSaveConfig() {
  ov::config::ValuationConfig cfg;
  try {
    cfg = configFromForm_();
  } catch (const std::exception& e) {
    QMessageBox::warning(this, tr("Save config"), QString::fromUtf8(e.what()));
    return;
  }

  const QString fn = QFileDialog::getSaveFileName(
      this, tr("Save config"), QDir::currentPath() + "/config/config.json", tr("JSON (*.json)"));
  if (fn.isEmpty()) return;

  QFile f(fn);
  if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    QMessageBox::warning(this, tr("Save config"), tr("Cannot open file for writing."));
    return;
  }
  f.write(QJsonDocument(qtio::valuation_config_to_json(cfg)).toJson(QJsonDocument::Indented));
  f.close();
  statusBar()->showMessage(tr("Config saved to %1").arg(QDir::toNativeSeparators(fn)), 2000);
}

// ============================================================================
// Run / Stop
// ============================================================================

void MainWindow::startValuationWorker() {
  if (valThread_ && valWorker_) return;

  valThread_ = new QThread(this);
  valWorker_ = new gui::ValuationWorker();      // PAS de parent → il vivra dans valThread_
  valWorker_->moveToThread(valThread_);

  connect(valThread_, &QThread::finished, valWorker_, &QObject::deleteLater);

  // Worker -> GUI
  connect(valWorker_, &gui::ValuationWorker::progress,   this, &MainWindow::onValuationProgress, Qt::QueuedConnection);
  connect(valWorker_, &gui::ValuationWorker::tickerDone, this, &MainWindow::onTickerDone,        Qt::QueuedConnection);
  connect(valWorker_, &gui::ValuationWorker::message,    this, &MainWindow::onValuationMessage,  Qt::QueuedConnection);
  connect(valWorker_, &gui::ValuationWorker::finished,   this, &MainWindow::onValuationFinished, Qt::QueuedConnection);
  connect(valWorker_, &gui::ValuationWorker::failed,     this, &MainWindow::onValuationFailed,   Qt::QueuedConnection);
  connect(valWorker_, &gui::ValuationWorker::canceled,   this, &MainWindow::onValuationCanceled, Qt::QueuedConnection);

  valThread_->start();
}

void MainWindow::stopValuationWorker() {
  if (!valThread_) return;

  if (valWorker_) {
    QObject::disconnect(valWorker_, nullptr, this, nullptr);
    valWorker_->requestStop();
  }
  valThread_->quit();
  valThread_->wait();   // le worker est détruit via deleteLater (finished)
  delete valThread_;
  valThread_ = nullptr;
  valWorker_ = nullptr;
}

void MainWindow::onRun() {
  if (running_) return;

  ov::config::ValuationConfig cfg;
  try {
    cfg = configFromForm_();
  } catch (const std::exception& e) {
    QMessageBox::warning(this, tr("Invalid inputs"), QString::fromUtf8(e.what()));
    return;
  }

  startValuationWorker();

  lastResult_.reset();
  lastReport_.reset();
  lastConfig_ = cfg;
  tblSummary_->clear(); tblSummary_->setRowCount(0);
  tblVol_->clear();     tblVol_->setRowCount(0);
  tblRate_->clear();    tblRate_->setRowCount(0);
  for (auto* l : {lblYtm_, lblRate_, lblVol_, lblValue_}) l->setText("-");

  qDebug() << "[UI] run valuation, comps=" << static_cast<int>(cfg.public_comps.size());
  log_(QString("Run: S=%1 K=%2 valuation=%3 freq=%4")
       .arg(cfg.stock_price).arg(cfg.strike_price)
       .arg(QString::fromStdString(cfg.valuation_date))
       .arg(ov::config::to_string(cfg.frequency)));

  setBusy_(true);
  QMetaObject::invokeMethod(valWorker_, [w = valWorker_, cfg]() {
    w->runValuation(cfg);
  }, Qt::QueuedConnection);
}

void MainWindow::onStop() {
  if (!running_ || !valWorker_) return;
  valWorker_->requestStop();
  lblStage_->setText(tr("Stopping…"));
}

// ============================================================================
// Callbacks worker
// ============================================================================

void MainWindow::onValuationProgress(const QString& stage, int cur, int total) {
  progress_->setRange(0, std::max(1, total));
  progress_->setValue(std::min(cur, std::max(1, total)));
  lblStage_->setText(QString("%1 %2/%3").arg(stage).arg(cur).arg(total));
}

void MainWindow::onTickerDone(const QString& ticker, bool ok, double volPct, const QString& error) {
  if (ok) log_(QString("%1: %2 %").arg(ticker).arg(volPct, 0, 'f', 2));
  else    log_(QString("%1: ERROR %2").arg(ticker, error));
}

void MainWindow::onValuationMessage(const QString& text) {
  log_(text);
}

void MainWindow::onValuationFinished(std::shared_ptr<const ov::valuation::ValuationResult> res) {
  setBusy_(false);
  if (!res) return;

  lastResult_ = res;
  lastReport_ = ov::valuation::build_report(*res);

  lblYtm_->setText(QString::number(res->years_to_maturity));
  lblRate_->setText(QString::number(res->risk_free_rate, 'f', 4));
  lblVol_->setText(QString::number(res->average_volatility, 'f', 4));
  lblValue_->setText(QString::number(res->option_value, 'f', 2));

  fillTable_(tblSummary_, lastReport_->summary);
  fillTable_(tblVol_,     lastReport_->volatility);
  fillTable_(tblRate_,    lastReport_->risk_free_rate);
  updateCurveChart_(*res);
  updateVolChart_(*res);

  if (!res->volatility.failures.empty() || !res->yield_failures.empty()) {
    statusBar()->showMessage(tr("Done with %1 recovered failure(s), see Log")
                             .arg(res->volatility.failures.size() + res->yield_failures.size()), 5000);
  } else {
    statusBar()->showMessage(tr("Done"), 3000);
  }
  log_(QString("Option value: %1").arg(res->option_value, 0, 'f', 2));
}

void MainWindow::onValuationFailed(const QString& why) {
  setBusy_(false);
  log_(QString("FAILED: %1").arg(why));
  QMessageBox::critical(this, tr("Valuation failed"), why);
}

void MainWindow::onValuationCanceled() {
  setBusy_(false);
  lblStage_->setText(tr("Canceled"));
  log_("Canceled");
  statusBar()->showMessage(tr("Canceled"), 2000);
}

// ============================================================================
// Affichage
// ============================================================================

void MainWindow::fillTable_(QTableWidget* t, const ov::valuation::ReportTable& table) {
  t->clear();
  t->setColumnCount(static_cast<int>(table.header.size()));
  t->setRowCount(static_cast<int>(table.rows.size()));
  QStringList hdr;
  for (const auto& h : table.header) hdr << QString::fromStdString(h);
  t->setHorizontalHeaderLabels(hdr);
  for (int r = 0; r < static_cast<int>(table.rows.size()); ++r) {
    const auto& row = table.rows[static_cast<std::size_t>(r)];
    for (int c = 0; c < static_cast<int>(row.size()); ++c) {
      t->setItem(r, c, new QTableWidgetItem(QString::fromStdString(row[static_cast<std::size_t>(c)])));
    }
  }
  t->resizeColumnsToContents();
}

void MainWindow::updateCurveChart_(const ov::valuation::ValuationResult& res) {
  curveLine_->clear();
  curveKnown_->clear();

  double lo = 1e300, hi = -1e300;
  for (int m = 1; m <= res.curve.max_maturity(); ++m) {
    const auto& slot = res.curve.at(m);
    if (!slot.yield_percent) continue;
    const double y = *slot.yield_percent;
    curveLine_->append(m, y);
    if (slot.source == ov::analytics::YieldCurve::Source::Known) curveKnown_->append(m, y);
    lo = std::min(lo, y); hi = std::max(hi, y);
  }
  if (lo > hi) { lo = 0.0; hi = 1.0; }
  const double pad = std::max(0.05, 0.1 * (hi - lo));
  curveAxX_->setRange(0.0, std::max(1, res.curve.max_maturity()) + 1.0);
  curveAxY_->setRange(lo - pad, hi + pad);
}

void MainWindow::updateVolChart_(const ov::valuation::ValuationResult& res) {
  volBars_->clear();   // détruit les anciens sets
  volAxX_->clear();

  auto* set = new QBarSet(tr("Volatility"));
  QStringList cats;
  double hi = 0.0;
  for (const auto& s : res.volatility.successes) {
    *set << s.annualized_volatility_percent;
    cats << QString::fromStdString(s.ticker);
    hi = std::max(hi, s.annualized_volatility_percent);
  }
  if (const auto avg = res.volatility.average_percent_rounded()) {
    *set << *avg;
    cats << tr("Average");
    hi = std::max(hi, *avg);
  }
  volBars_->append(set);
  volAxX_->append(cats);
  volAxY_->setRange(0.0, hi > 0.0 ? hi * 1.15 : 1.0);
}

void MainWindow::setBusy_(bool busy) {
  running_ = busy;
  btnRun_->setEnabled(!busy);
  btnStop_->setEnabled(busy);
  const bool canExport = !busy && lastReport_.has_value();
  btnExportCsv_->setEnabled(canExport);
  btnExportJson_->setEnabled(canExport);
  if (busy) { progress_->setRange(0, 0); lblStage_->setText(tr("Starting…")); }
  else if (progress_->maximum() == 0) { progress_->setRange(0, 1); progress_->setValue(0); }
}

void MainWindow::log_(const QString& line) {
  logView_->appendPlainText(QDateTime::currentDateTime().toString("HH:mm:ss  ") + line);
}

// ============================================================================
// Export
// ============================================================================

void MainWindow::onExportCsv() {
  if (!lastReport_) return;
  const QString dir = QFileDialog::getExistingDirectory(
      this, tr("Export CSV"), QString::fromStdString(lastConfig_.output_dir));
  if (dir.isEmpty()) return;
  try {
    const QStringList written = qtio::export_report_csv(*lastReport_, dir);
    for (const auto& p : written) log_(QString("Saved %1").arg(p));
    statusBar()->showMessage(tr("Exported %1 file(s) to %2").arg(written.size()).arg(dir), 3000);
  } catch (const std::exception& e) {
    QMessageBox::warning(this, tr("Export CSV"), QString::fromUtf8(e.what()));
  }
}

void MainWindow::onExportJson() {
  if (!lastReport_ || !lastResult_) return;
  const QString suggested = QString::fromStdString(lastConfig_.output_dir) + "/option_valuation_results.json";
  const QString fn = QFileDialog::getSaveFileName(this, tr("Export JSON"), suggested, tr("JSON (*.json)"));
  if (fn.isEmpty()) return;
  try {
    qtio::write_report_json(*lastResult_, *lastReport_, fn);
    log_(QString("Saved %1").arg(fn));
    statusBar()->showMessage(tr("Saved %1").arg(QDir::toNativeSeparators(fn)), 3000);
  } catch (const std::exception& e) {
    QMessageBox::warning(this, tr("Export JSON"), QString::fromUtf8(e.what()));
  }
}

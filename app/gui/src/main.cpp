#include "MainWindow.hpp"

#include <QApplication>
#include <QFileInfo>

int main(int argc, char** argv) {
  QApplication app(argc, argv);
  QApplication::setApplicationName("optval");

  MainWindow w;
  // Configuration optionnelle : premier argument, sinon config/config.json s’il existe
  const QString cfg = argc > 1 ? QString::fromLocal8Bit(argv[1]) : QString("config/config.json");
  if (QFileInfo::exists(cfg)) w.loadConfigFile(cfg);
  w.show();
  return app.exec();
}

#include "app/ui/MainWindow.h"

#include <QVBoxLayout>
#include <QWidget>

#include "app/ui/pages/TicketPage.h"
#include "app/ui/presenters/TicketPresenter.h"
#include "core/log/Log.h"

MainWindow::~MainWindow() = default;

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
  const auto settingsPath = Settings::defaultSettingsPath();
  initLogging(settingsPath.parent_path() / kLogFileName);
  settings_ = Settings::loadFrom(settingsPath);
  spdlog::info("Settings loaded from {}", settingsPath.string());

  setupUi();
  ticketPresenter_->setSettings(&settings_);
}

void MainWindow::setupUi() {
  setWindowTitle(tr("票据随机生成器"));
  resize(480, 480);

  auto* central = new QWidget(this);
  auto* rootLayout = new QVBoxLayout(central);
  rootLayout->setContentsMargins(12, 12, 12, 12);
  rootLayout->setSpacing(12);

  ticketPage_ = new TicketPage(central);
  rootLayout->addWidget(ticketPage_);
  ticketPresenter_ = std::make_unique<TicketPresenter>(ticketPage_);

  setCentralWidget(central);
}

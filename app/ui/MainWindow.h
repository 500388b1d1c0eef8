#pragma once

#include <QMainWindow>
#include <memory>

#include "core/config/Settings.h"

class TicketPage;
class TicketPresenter;

/**
 * @brief Application main window hosting the ticket generation page.
 */
class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow();

private:
  void setupUi();

  // 页面只负责界面，表单状态与后台任务由 TicketPresenter 持有
  TicketPage* ticketPage_{};
  std::unique_ptr<TicketPresenter> ticketPresenter_;

  Settings settings_{};
};

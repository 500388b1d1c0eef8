#pragma once

#include <QObject>
#include <QString>

#include "core/ticket/GenerationJob.h"
#include "core/ticket/TicketForm.h"

class QTimer;

class TicketPage;
struct Settings;

/**
 * @brief 票据页业务协调器：维护表单状态，提交后台生成任务并展示结束状态。
 */
class TicketPresenter : public QObject {
  Q_OBJECT
public:
  explicit TicketPresenter(TicketPage* page, QObject* parent = nullptr);

  /// 以设置初始化表单，并在之后的修改中回写设置。
  void setSettings(Settings* settings);

  const TicketForm& form() const { return form_; }

private slots:
  void handleCharsetToggled();
  void handleExcludedTextChanged(const QString& text);
  void handleCountEditingFinished();
  void handleLengthEditingFinished();
  void handleDestinationRequested();
  void handleSubmitRequested();
  void pollJob();

private:
  void refreshUi();
  void updateCharsetPreview();
  void setStatus(const QString& text, bool isError);
  void persistSettings();

  TicketPage* page_{};
  Settings* settings_{};
  TicketForm form_;
  GenerationJob job_;
  QTimer* pollTimer_{};
  bool suppressCharsetSignals_ = false;
};

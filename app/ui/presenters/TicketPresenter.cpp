#include "app/ui/presenters/TicketPresenter.h"

#include <QCheckBox>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSignalBlocker>
#include <QTimer>

#include <utility>

#include <spdlog/spdlog.h>

#include "app/ui/pages/TicketPage.h"
#include "core/config/Settings.h"

namespace {

constexpr int kPollIntervalMs = 50;

} // namespace

TicketPresenter::TicketPresenter(TicketPage* page, QObject* parent)
    : QObject(parent), page_(page) {
  pollTimer_ = new QTimer(this);
  pollTimer_->setInterval(kPollIntervalMs);
  connect(pollTimer_, &QTimer::timeout, this, &TicketPresenter::pollJob);

  if (page_) {
    connect(page_, &TicketPage::charsetToggled, this, &TicketPresenter::handleCharsetToggled);
    connect(page_, &TicketPage::excludedTextChanged, this, &TicketPresenter::handleExcludedTextChanged);
    connect(page_, &TicketPage::countEditingFinished, this, &TicketPresenter::handleCountEditingFinished);
    connect(page_, &TicketPage::lengthEditingFinished, this, &TicketPresenter::handleLengthEditingFinished);
    connect(page_, &TicketPage::destinationRequested, this, &TicketPresenter::handleDestinationRequested);
    connect(page_, &TicketPage::submitRequested, this, &TicketPresenter::handleSubmitRequested);
  }
  refreshUi();
}

void TicketPresenter::setSettings(Settings* settings) {
  settings_ = settings;
  if (settings_) {
    form_ = settings_->toForm();
  }
  refreshUi();
}

void TicketPresenter::refreshUi() {
  if (!page_) {
    return;
  }
  // 程序性回填控件时屏蔽信号，避免反向覆盖表单状态
  suppressCharsetSignals_ = true;
  {
    const QSignalBlocker blockExcluded(page_->excludedEdit());
    page_->capitalsCheck()->setChecked(form_.charset.capitals);
    page_->lowercaseCheck()->setChecked(form_.charset.lowercase);
    page_->digitsCheck()->setChecked(form_.charset.digits);
    page_->specialsCheck()->setChecked(form_.charset.specials);
    page_->excludedEdit()->setText(QString::fromStdString(form_.charset.excluded));
  }
  suppressCharsetSignals_ = false;

  page_->countEdit()->setText(QString::number(static_cast<qulonglong>(form_.ticketCount)));
  page_->lengthEdit()->setText(QString::number(static_cast<qulonglong>(form_.ticketLength)));
  page_->destinationLabel()->setText(form_.filePath ? QDir::toNativeSeparators(QString::fromStdString(*form_.filePath))
                                                    : QString());
  page_->submitButton()->setEnabled(!job_.isBusy());
  updateCharsetPreview();
}

void TicketPresenter::updateCharsetPreview() {
  if (!page_) {
    return;
  }
  page_->charsetLabel()->setText(tr("当前字符集: %1").arg(QString::fromStdString(form_.alphabet())));
}

void TicketPresenter::setStatus(const QString& text, bool isError) {
  if (!page_) {
    return;
  }
  page_->statusLabel()->setText(text);
  page_->statusLabel()->setStyleSheet(isError ? QStringLiteral("color: #c62828;") : QString());
}

void TicketPresenter::persistSettings() {
  if (!settings_) {
    return;
  }
  settings_->updateFromForm(form_);
  if (!settings_->save()) {
    spdlog::warn("Form defaults were not persisted");
  }
}

void TicketPresenter::handleCharsetToggled() {
  if (!page_ || suppressCharsetSignals_) {
    return;
  }
  form_.charset.capitals = page_->capitalsCheck()->isChecked();
  form_.charset.lowercase = page_->lowercaseCheck()->isChecked();
  form_.charset.digits = page_->digitsCheck()->isChecked();
  form_.charset.specials = page_->specialsCheck()->isChecked();
  updateCharsetPreview();
}

void TicketPresenter::handleExcludedTextChanged(const QString& text) {
  form_.charset.excluded = text.toStdString();
  updateCharsetPreview();
}

void TicketPresenter::handleCountEditingFinished() {
  if (!page_) {
    return;
  }
  // 解析失败时回退为上一次的有效值
  if (!form_.setTicketCountText(page_->countEdit()->text().toStdString())) {
    page_->countEdit()->setText(QString::number(static_cast<qulonglong>(form_.ticketCount)));
  }
}

void TicketPresenter::handleLengthEditingFinished() {
  if (!page_) {
    return;
  }
  if (!form_.setTicketLengthText(page_->lengthEdit()->text().toStdString())) {
    page_->lengthEdit()->setText(QString::number(static_cast<qulonglong>(form_.ticketLength)));
  }
}

void TicketPresenter::handleDestinationRequested() {
  if (!page_) {
    return;
  }
  QString startDir = settings_ ? QString::fromStdString(settings_->lastDirectory) : QString();
  if (startDir.isEmpty() || !QDir(startDir).exists()) {
    startDir = QDir::homePath();
  }
  const QString path =
      QFileDialog::getSaveFileName(page_, tr("选择保存位置"), startDir, tr("CSV 文件 (*.csv)"));
  if (path.isEmpty()) {
    return;
  }

  form_.filePath = QDir::cleanPath(path).toStdString();
  page_->destinationLabel()->setText(QDir::toNativeSeparators(path));
  if (settings_) {
    settings_->lastDirectory = QFileInfo(path).absolutePath().toStdString();
  }
  persistSettings();
}

void TicketPresenter::handleSubmitRequested() {
  if (job_.isBusy()) {
    return;
  }
  // 数量与长度仅在编辑结束时提交，点击按钮前先同步一次
  handleCountEditingFinished();
  handleLengthEditingFinished();

  auto request = form_.toRequest();
  if (!request) {
    return;
  }
  persistSettings();

  if (!job_.start(std::move(*request))) {
    return;
  }
  if (page_) {
    page_->submitButton()->setEnabled(false);
  }
  pollTimer_->start();
}

void TicketPresenter::pollJob() {
  auto outcome = job_.poll();
  if (!outcome) {
    return;
  }
  pollTimer_->stop();
  if (page_) {
    page_->submitButton()->setEnabled(true);
  }
  if (outcome->success) {
    setStatus(tr("已成功写入 CSV"), false);
  } else {
    setStatus(QString::fromStdString(outcome->message), true);
  }
}

#pragma once

#include <QWidget>

class QCheckBox;
class QLabel;
class QLineEdit;
class QPushButton;

/**
 * @brief 票据生成页的 UI 容器，仅负责搭建界面并透出必要控件信号。
 */
class TicketPage : public QWidget {
  Q_OBJECT
public:
  explicit TicketPage(QWidget* parent = nullptr);

  QCheckBox* capitalsCheck() const { return capitalsCheck_; }
  QCheckBox* lowercaseCheck() const { return lowercaseCheck_; }
  QCheckBox* digitsCheck() const { return digitsCheck_; }
  QCheckBox* specialsCheck() const { return specialsCheck_; }
  QLineEdit* excludedEdit() const { return excludedEdit_; }
  QLineEdit* countEdit() const { return countEdit_; }
  QLineEdit* lengthEdit() const { return lengthEdit_; }
  QLabel* destinationLabel() const { return destinationLabel_; }
  QLabel* charsetLabel() const { return charsetLabel_; }
  QPushButton* submitButton() const { return submitBtn_; }
  QLabel* statusLabel() const { return statusLabel_; }

signals:
  void charsetToggled();
  void excludedTextChanged(const QString& text);
  void countEditingFinished();
  void lengthEditingFinished();
  void destinationRequested();
  void submitRequested();

private:
  void buildUi();
  void wireSignals();

  QCheckBox* capitalsCheck_{};
  QCheckBox* lowercaseCheck_{};
  QCheckBox* digitsCheck_{};
  QCheckBox* specialsCheck_{};
  QLineEdit* excludedEdit_{};
  QLineEdit* countEdit_{};
  QLineEdit* lengthEdit_{};
  QPushButton* destinationBtn_{};
  QLabel* destinationLabel_{};
  QLabel* charsetLabel_{};
  QPushButton* submitBtn_{};
  QLabel* statusLabel_{};
};

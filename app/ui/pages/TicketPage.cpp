#include "app/ui/pages/TicketPage.h"

#include <QCheckBox>
#include <QFont>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>

TicketPage::TicketPage(QWidget* parent) : QWidget(parent) {
  buildUi();
  wireSignals();
}

void TicketPage::buildUi() {
  auto* layout = new QVBoxLayout(this);
  layout->setSpacing(12);

  auto* heading = new QLabel(tr("票据随机生成器"), this);
  QFont headingFont = heading->font();
  headingFont.setPointSizeF(headingFont.pointSizeF() * 1.4);
  headingFont.setBold(true);
  heading->setFont(headingFont);
  layout->addWidget(heading);

  // 字符类别
  capitalsCheck_ = new QCheckBox(tr("大写字母 (A-Z)"), this);
  lowercaseCheck_ = new QCheckBox(tr("小写字母 (a-z)"), this);
  digitsCheck_ = new QCheckBox(tr("数字 (0-9)"), this);
  specialsCheck_ = new QCheckBox(tr("特殊符号 (,.;:\"'!%#)"), this);
  layout->addWidget(capitalsCheck_);
  layout->addWidget(lowercaseCheck_);
  layout->addWidget(digitsCheck_);
  layout->addWidget(specialsCheck_);

  auto* form = new QFormLayout();
  form->setSpacing(8);
  excludedEdit_ = new QLineEdit(this);
  excludedEdit_->setPlaceholderText(tr("例如 O0Il1"));
  countEdit_ = new QLineEdit(this);
  lengthEdit_ = new QLineEdit(this);
  form->addRow(tr("排除字符:"), excludedEdit_);
  form->addRow(tr("票据数量:"), countEdit_);
  form->addRow(tr("票据长度:"), lengthEdit_);
  layout->addLayout(form);

  // 目标文件
  auto* destinationRow = new QHBoxLayout();
  destinationRow->setSpacing(8);
  destinationBtn_ = new QPushButton(tr("选择保存位置..."), this);
  destinationLabel_ = new QLabel(this);
  destinationLabel_->setTextInteractionFlags(Qt::TextSelectableByMouse);
  destinationRow->addWidget(destinationBtn_);
  destinationRow->addWidget(destinationLabel_, 1);
  layout->addLayout(destinationRow);

  charsetLabel_ = new QLabel(this);
  charsetLabel_->setWordWrap(true);
  layout->addWidget(charsetLabel_);

  submitBtn_ = new QPushButton(tr("生成"), this);
  layout->addWidget(submitBtn_);

  statusLabel_ = new QLabel(this);
  statusLabel_->setWordWrap(true);
  layout->addWidget(statusLabel_);
  layout->addStretch(1);
}

void TicketPage::wireSignals() {
  connect(capitalsCheck_, &QCheckBox::toggled, this, &TicketPage::charsetToggled);
  connect(lowercaseCheck_, &QCheckBox::toggled, this, &TicketPage::charsetToggled);
  connect(digitsCheck_, &QCheckBox::toggled, this, &TicketPage::charsetToggled);
  connect(specialsCheck_, &QCheckBox::toggled, this, &TicketPage::charsetToggled);
  connect(excludedEdit_, &QLineEdit::textChanged, this, &TicketPage::excludedTextChanged);
  connect(countEdit_, &QLineEdit::editingFinished, this, &TicketPage::countEditingFinished);
  connect(lengthEdit_, &QLineEdit::editingFinished, this, &TicketPage::lengthEditingFinished);
  connect(destinationBtn_, &QPushButton::clicked, this, &TicketPage::destinationRequested);
  connect(submitBtn_, &QPushButton::clicked, this, &TicketPage::submitRequested);
}

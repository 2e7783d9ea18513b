#include "addeventdialog.h"
#include "helpers.h"
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QTextEdit>
#include <QComboBox>
#include <QCheckBox>
#include <QDateEdit>
#include <QDateTimeEdit>
#include <QPushButton>
#include <QMessageBox>

AddEventDialog::AddEventDialog(const Event& event, QWidget *parent)
    : QDialog(parent)
    , m_event(event)
    , m_editTitle(new QLineEdit(this))
    , m_editDesc(new QTextEdit(this))
    , m_checkCountdown(new QCheckBox("倒计时", this))
    , m_dateTarget(new QDateEdit(this))
    , m_checkRemind(new QCheckBox("到时提醒", this))
    , m_dtEditRemind(new QDateTimeEdit(this))
    , m_comboRepeat(new QComboBox(this))
    , m_checkEnabled(new QCheckBox("启用", this))
{
    setWindowTitle(event.isValid() ? "编辑事件" : "添加事件");
    setModal(true);
    resize(400, 420);

    QFormLayout* layout = new QFormLayout(this);

    m_editTitle->setText(event.title);
    layout->addRow("标题：", m_editTitle);

    m_editDesc->setText(event.description);
    layout->addRow("描述：", m_editDesc);

    m_checkCountdown->setChecked(event.isCountdown);
    layout->addRow("", m_checkCountdown);

    m_dateTarget->setCalendarPopup(true);
    m_dateTarget->setDate(event.targetDate.isValid() ? event.targetDate : QDate::currentDate().addDays(30));
    layout->addRow("目标日期：", m_dateTarget);

    m_checkRemind->setChecked(!event.isValid() || event.remindTime.isValid());
    layout->addRow("", m_checkRemind);

    // 默认一小时后提醒
    m_dtEditRemind->setCalendarPopup(true);
    m_dtEditRemind->setDateTime(event.remindTime.isValid() ? event.remindTime
                                                           : QDateTime::currentDateTime().addSecs(3600));
    layout->addRow("提醒时间：", m_dtEditRemind);

    const QList<RepeatType> repeatTypes {
        RepeatType::Once, RepeatType::Daily, RepeatType::Workdays, RepeatType::Weekly, RepeatType::Monthly
    };
    for (RepeatType type : repeatTypes) {
        m_comboRepeat->addItem(repeatTypeDisplayName(type), repeatTypeToString(type));
    }
    const int repeatIndex = m_comboRepeat->findData(repeatTypeToString(event.repeatType));
    if (repeatIndex >= 0) {
        m_comboRepeat->setCurrentIndex(repeatIndex);
    }
    layout->addRow("重复：", m_comboRepeat);

    m_checkEnabled->setChecked(event.enabled);
    layout->addRow("", m_checkEnabled);

    QPushButton* btnOk = new QPushButton("确认", this);
    QPushButton* btnCancel = new QPushButton("取消", this);
    QHBoxLayout* btnLayout = new QHBoxLayout();
    btnLayout->addStretch();
    btnLayout->addWidget(btnOk);
    btnLayout->addWidget(btnCancel);
    layout->addRow(btnLayout);

    connect(btnOk, &QPushButton::clicked, this, &AddEventDialog::accept);
    connect(btnCancel, &QPushButton::clicked, this, &QDialog::reject);
    connect(m_checkCountdown, &QCheckBox::toggled, this, &AddEventDialog::onCountdownToggled);
    connect(m_checkRemind, &QCheckBox::toggled, m_dtEditRemind, &QWidget::setEnabled);
    connect(m_checkRemind, &QCheckBox::toggled, m_comboRepeat, &QWidget::setEnabled);

    onCountdownToggled(event.isCountdown);
}

// 倒计时只显示天数，不注册提醒
void AddEventDialog::onCountdownToggled(bool checked)
{
    m_dateTarget->setEnabled(checked);
    m_checkRemind->setEnabled(!checked);
    const bool remind = !checked && m_checkRemind->isChecked();
    m_dtEditRemind->setEnabled(remind);
    m_comboRepeat->setEnabled(remind);
}

void AddEventDialog::accept()
{
    const QString title = m_editTitle->text().trimmed();
    if (title.isEmpty()) {
        QMessageBox::warning(this, "提示", "标题不能为空！");
        return;
    }

    const bool remind = !m_checkCountdown->isChecked() && m_checkRemind->isChecked();
    const RepeatType repeatType = repeatTypeFromString(m_comboRepeat->currentData().toString());
    // 一次性提醒不能设在过去
    if (remind && repeatType == RepeatType::Once && m_dtEditRemind->dateTime() <= QDateTime::currentDateTime()) {
        QMessageBox::warning(this, "提示", "提醒时间不能早于当前时间！");
        return;
    }

    if (!m_event.isValid()) {
        m_event.id = generateUniqueId();
        m_event.createdAt = QDateTime::currentDateTime();
    }
    m_event.title = title;
    m_event.description = m_editDesc->toPlainText().trimmed();
    m_event.isCountdown = m_checkCountdown->isChecked();
    m_event.targetDate = m_event.isCountdown ? m_dateTarget->date() : QDate();
    m_event.remindTime = remind ? m_dtEditRemind->dateTime() : QDateTime();
    m_event.repeatType = repeatType;
    m_event.enabled = m_checkEnabled->isChecked();

    QDialog::accept();
}

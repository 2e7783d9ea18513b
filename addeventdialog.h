#ifndef ADDEVENTDIALOG_H
#define ADDEVENTDIALOG_H

#include <QDialog>
#include "models.h"

class QLineEdit;
class QTextEdit;
class QComboBox;
class QCheckBox;
class QDateEdit;
class QDateTimeEdit;

// 添加或编辑事件 / 倒计时
class AddEventDialog : public QDialog
{
    Q_OBJECT

public:
    // event.id 为空表示新建
    explicit AddEventDialog(const Event& event = Event(), QWidget *parent = nullptr);

    // 对话框接受后的事件（新建时已生成 id）
    Event editedEvent() const { return m_event; }

public slots:
    void accept() override;

private slots:
    void onCountdownToggled(bool checked);

private:
    Event m_event;
    QLineEdit* m_editTitle;
    QTextEdit* m_editDesc;
    QCheckBox* m_checkCountdown;
    QDateEdit* m_dateTarget;
    QCheckBox* m_checkRemind;
    QDateTimeEdit* m_dtEditRemind;
    QComboBox* m_comboRepeat;
    QCheckBox* m_checkEnabled;
};

#endif // ADDEVENTDIALOG_H

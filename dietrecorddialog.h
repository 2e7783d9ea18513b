#ifndef DIETRECORDDIALOG_H
#define DIETRECORDDIALOG_H

#include <QDialog>
#include <QDate>
#include <QStringList>

class QComboBox;
class QLineEdit;
class QTimeEdit;
class DietAnalyzer;

// 记录一餐（餐食类型、时间、食物）
class DietRecordDialog : public QDialog
{
    Q_OBJECT

public:
    DietRecordDialog(DietAnalyzer* analyzer, const QDate& date, QWidget *parent = nullptr);

    static QStringList quickFoods();

public slots:
    void accept() override;

private slots:
    void onQuickFoodClicked(const QString& food);

private:
    DietAnalyzer* m_analyzer;
    QDate m_date;
    QComboBox* m_comboMealType;
    QTimeEdit* m_timeEdit;
    QLineEdit* m_editFoods;
};

#endif // DIETRECORDDIALOG_H

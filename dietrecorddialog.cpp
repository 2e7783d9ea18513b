#include "dietrecorddialog.h"
#include "dietanalyzer.h"
#include "models.h"
#include <QFormLayout>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QComboBox>
#include <QLineEdit>
#include <QTimeEdit>
#include <QPushButton>
#include <QMessageBox>

DietRecordDialog::DietRecordDialog(DietAnalyzer* analyzer, const QDate& date, QWidget *parent)
    : QDialog(parent)
    , m_analyzer(analyzer)
    , m_date(date)
    , m_comboMealType(new QComboBox(this))
    , m_timeEdit(new QTimeEdit(QTime::currentTime(), this))
    , m_editFoods(new QLineEdit(this))
{
    setWindowTitle(QString("记录饮食 - %1").arg(date.toString(DATE_FORMAT)));
    setModal(true);
    resize(380, 260);

    QFormLayout* layout = new QFormLayout(this);

    for (const QString& type : mealTypes()) {
        m_comboMealType->addItem(mealTypeDisplayName(type), type);
    }
    // 按当前时间预选餐次
    const int hour = QTime::currentTime().hour();
    QString defaultType = "snack";
    if (hour >= 5 && hour < 10) {
        defaultType = "breakfast";
    } else if (hour >= 11 && hour < 14) {
        defaultType = "lunch";
    } else if (hour >= 17 && hour < 20) {
        defaultType = "dinner";
    }
    m_comboMealType->setCurrentIndex(m_comboMealType->findData(defaultType));
    layout->addRow("餐次：", m_comboMealType);

    m_timeEdit->setDisplayFormat(CLOCK_FORMAT);
    layout->addRow("时间：", m_timeEdit);

    m_editFoods->setPlaceholderText("多个食物用逗号或顿号分隔");
    layout->addRow("食物：", m_editFoods);

    // 常用食物快捷按钮
    QGridLayout* quickLayout = new QGridLayout();
    const QStringList foods = quickFoods();
    for (int i = 0; i < foods.size(); ++i) {
        QPushButton* btn = new QPushButton(foods.at(i), this);
        const QString food = foods.at(i);
        connect(btn, &QPushButton::clicked, this, [this, food]() {
            onQuickFoodClicked(food);
        });
        quickLayout->addWidget(btn, i / 4, i % 4);
    }
    layout->addRow("常用：", quickLayout);

    QPushButton* btnOk = new QPushButton("保存", this);
    QPushButton* btnCancel = new QPushButton("取消", this);
    QHBoxLayout* btnLayout = new QHBoxLayout();
    btnLayout->addStretch();
    btnLayout->addWidget(btnOk);
    btnLayout->addWidget(btnCancel);
    layout->addRow(btnLayout);

    connect(btnOk, &QPushButton::clicked, this, &DietRecordDialog::accept);
    connect(btnCancel, &QPushButton::clicked, this, &QDialog::reject);
}

QStringList DietRecordDialog::quickFoods()
{
    return {"米饭", "面条", "鸡蛋", "牛奶", "水果", "蔬菜", "肉类", "鱼类"};
}

void DietRecordDialog::onQuickFoodClicked(const QString& food)
{
    QStringList foods = DietAnalyzer::parseFoods(m_editFoods->text());
    if (!foods.contains(food)) {
        foods << food;
    }
    m_editFoods->setText(foods.join("、"));
}

void DietRecordDialog::accept()
{
    const QStringList foods = DietAnalyzer::parseFoods(m_editFoods->text());
    if (foods.isEmpty()) {
        QMessageBox::warning(this, "提示", "请至少输入一种食物！");
        return;
    }

    if (!m_analyzer->addMeal(m_date, m_comboMealType->currentData().toString(), foods,
                             m_timeEdit->time().toString(CLOCK_FORMAT))) {
        QMessageBox::critical(this, "错误", "饮食记录保存失败！");
        return;
    }
    QDialog::accept();
}

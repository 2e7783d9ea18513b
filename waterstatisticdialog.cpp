#include "waterstatisticdialog.h"
#include "databasemanager.h"
#include <QBarSet>
#include <QBarCategoryAxis>
#include <QValueAxis>
#include <QFileDialog>
#include <QMessageBox>
#include <QPixmap>
#include <QPainter>
#include <QDir>
#include <QLabel>
#include <QRadioButton>
#include <QPushButton>
#include <QHBoxLayout>
#include <QVBoxLayout>

WaterStatisticDialog::WaterStatisticDialog(int dailyTarget, QWidget *parent)
    : QDialog(parent)
    , m_dailyTarget(dailyTarget > 0 ? dailyTarget : 1800)
    , m_barChart(new QChart())
    , m_chartView(new QChartView(this))
    , m_radioWeek(new QRadioButton("最近 7 天", this))
    , m_radioMonth(new QRadioButton("最近 30 天", this))
    , m_labelInfo(new QLabel(this))
{
    setWindowTitle("饮水统计");
    setModal(true);
    resize(720, 480);

    QPushButton* btnExportPng = new QPushButton("导出图片", this);
    QHBoxLayout* topLayout = new QHBoxLayout();
    topLayout->addWidget(m_radioWeek);
    topLayout->addWidget(m_radioMonth);
    topLayout->addStretch();
    topLayout->addWidget(btnExportPng);

    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->addLayout(topLayout);
    mainLayout->addWidget(m_chartView, 1);
    mainLayout->addWidget(m_labelInfo);

    m_radioWeek->setChecked(true);
    connect(m_radioWeek, &QRadioButton::clicked, this, &WaterStatisticDialog::generateReport);
    connect(m_radioMonth, &QRadioButton::clicked, this, &WaterStatisticDialog::generateReport);
    connect(btnExportPng, &QPushButton::clicked, this, &WaterStatisticDialog::exportReportAsPng);

    m_chartView->setChart(m_barChart);
    m_chartView->setRenderHint(QPainter::Antialiasing);
    m_barChart->legend()->setAlignment(Qt::AlignBottom);

    generateReport();
}

WaterStatisticDialog::~WaterStatisticDialog()
{
    // 图表归 QChartView 所有，随视图释放
}

void WaterStatisticDialog::generateReport()
{
    const int days = m_radioWeek->isChecked() ? 7 : 30;
    const QDate to = QDate::currentDate();
    const QDate from = to.addDays(-(days - 1));
    const QMap<QDate, int> totals = DatabaseManager::instance().getDailyWaterTotals(from, to);

    // 清空原有数据和坐标轴
    m_barChart->removeAllSeries();
    for (QAbstractAxis* axis : m_barChart->axes()) {
        m_barChart->removeAxis(axis);
        delete axis;
    }

    QBarSet* intakeSet = new QBarSet("饮水量 (ml)");
    intakeSet->setColor(QColor(107, 185, 255));
    QLineSeries* targetSeries = new QLineSeries();
    targetSeries->setName(QString("目标 %1 ml").arg(m_dailyTarget));
    targetSeries->setColor(QColor(255, 105, 180));

    QStringList categories;
    int maxValue = m_dailyTarget;
    int sum = 0;
    int reachedDays = 0;
    int index = 0;
    for (auto it = totals.constBegin(); it != totals.constEnd(); ++it, ++index) {
        categories << it.key().toString(days == 7 ? "MM-dd ddd" : "MM-dd");
        *intakeSet << it.value();
        targetSeries->append(index, m_dailyTarget);
        maxValue = qMax(maxValue, it.value());
        sum += it.value();
        if (it.value() >= m_dailyTarget) {
            reachedDays++;
        }
    }

    QBarSeries* barSeries = new QBarSeries();
    barSeries->append(intakeSet);
    m_barChart->addSeries(barSeries);
    m_barChart->addSeries(targetSeries);

    QBarCategoryAxis* xAxis = new QBarCategoryAxis();
    xAxis->append(categories);
    m_barChart->addAxis(xAxis, Qt::AlignBottom);
    barSeries->attachAxis(xAxis);
    targetSeries->attachAxis(xAxis);

    QValueAxis* yAxis = new QValueAxis();
    yAxis->setRange(0, maxValue * 1.2);
    yAxis->setLabelFormat("%d");
    yAxis->setTitleText("饮水量（ml）");
    m_barChart->addAxis(yAxis, Qt::AlignLeft);
    barSeries->attachAxis(yAxis);
    targetSeries->attachAxis(yAxis);

    m_barChart->setTitle(QString("每日饮水量（%1 至 %2）")
                             .arg(from.toString("yyyy-MM-dd"), to.toString("yyyy-MM-dd")));

    const double average = totals.isEmpty() ? 0.0 : static_cast<double>(sum) / totals.size();
    m_labelInfo->setText(QString("平均每天：%1 ml | 达标天数：%2 / %3 | 今日：%4 ml")
                             .arg(average, 0, 'f', 0)
                             .arg(reachedDays)
                             .arg(totals.size())
                             .arg(totals.value(to)));
}

void WaterStatisticDialog::exportReportAsPng()
{
    QString filePath = QFileDialog::getSaveFileName(
        this,
        "导出饮水统计为PNG",
        QDir::homePath() + QString("/饮水统计_%1.png").arg(QDateTime::currentDateTime().toString("yyyyMMddHHmmss")),
        "PNG图片 (*.png);;所有文件 (*.*)"
        );

    if (filePath.isEmpty()) {
        return;
    }

    QPixmap pixmap(this->size());
    this->render(&pixmap);

    if (pixmap.save(filePath)) {
        QMessageBox::information(this, "导出成功", QString("统计图已导出至：\n%1").arg(filePath));
    } else {
        QMessageBox::critical(this, "导出失败", "统计图导出失败，请检查文件路径是否可写入！");
    }
}

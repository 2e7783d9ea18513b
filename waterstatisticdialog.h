#ifndef WATERSTATISTICDIALOG_H
#define WATERSTATISTICDIALOG_H

#include <QDialog>
#include <QDate>
#include <QMap>
// 直接包含QtCharts的类头文件，不使用命名空间
#include <QChart>
#include <QChartView>
#include <QBarSeries>
#include <QLineSeries>

class QLabel;
class QRadioButton;

// 饮水统计：最近 7 天 / 30 天每日饮水量柱状图和目标线
class WaterStatisticDialog : public QDialog
{
    Q_OBJECT

public:
    WaterStatisticDialog(int dailyTarget, QWidget *parent = nullptr);
    ~WaterStatisticDialog();

private slots:
    void generateReport();
    void exportReportAsPng();

private:
    int m_dailyTarget;
    QChart* m_barChart;
    QChartView* m_chartView;
    QRadioButton* m_radioWeek;
    QRadioButton* m_radioMonth;
    QLabel* m_labelInfo;
};

#endif // WATERSTATISTICDIALOG_H

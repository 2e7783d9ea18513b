#ifndef PREGNANCYCALCULATOR_H
#define PREGNANCYCALCULATOR_H

#include <QDate>
#include <QString>
#include "models.h"

// 孕周信息
struct PregnancyWeekInfo {
    int week = 0;
    int day = 0;
    QString display;        // "12周+3天"
    int trimester = 0;      // 0 表示无
    QString trimesterName;
    QDate dueDate;
    int daysUntilDue = 0;

    bool isValid() const { return dueDate.isValid(); }
};

// 孕期计算器（以末次月经日期为基准）
class PregnancyCalculator
{
public:
    explicit PregnancyCalculator(const PregnancyConfig& config);

    QDate lastPeriodDate() const { return m_config.lastPeriodDate; }
    bool hasLastPeriodDate() const { return m_config.lastPeriodDate.isValid(); }

    // 当前孕周，未设置末次月经时返回 -1
    int currentWeek(const QDate& today = QDate::currentDate()) const;
    // 当前孕周和天数，未设置末次月经时返回 false
    bool currentWeekDay(int* weeks, int* days, const QDate& today = QDate::currentDate()) const;
    // 预产期 = 末次月经 + 280 天
    QDate dueDate() const;
    int daysUntilDue(const QDate& today = QDate::currentDate()) const;

    // 孕期阶段：1 孕早期 (1-13)，2 孕中期 (14-27)，3 孕晚期 (28 周以后)，0 表示无
    static int trimester(int week);
    static QString trimesterName(int trimester);

    PregnancyWeekInfo weekInfo(const QDate& today = QDate::currentDate()) const;

    // 宝宝发育阶段描述
    static QString babyDevelopmentStage(int week);

private:
    PregnancyConfig m_config;
};

#endif // PREGNANCYCALCULATOR_H

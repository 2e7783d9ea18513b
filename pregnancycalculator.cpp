#include "pregnancycalculator.h"

namespace {
const int FULL_TERM_DAYS = 280;
}

PregnancyCalculator::PregnancyCalculator(const PregnancyConfig& config)
    : m_config(config)
{
}

int PregnancyCalculator::currentWeek(const QDate& today) const
{
    int weeks = 0;
    int days = 0;
    if (!currentWeekDay(&weeks, &days, today)) {
        return -1;
    }
    return weeks;
}

bool PregnancyCalculator::currentWeekDay(int* weeks, int* days, const QDate& today) const
{
    if (!hasLastPeriodDate()) {
        return false;
    }
    qint64 total = m_config.lastPeriodDate.daysTo(today);
    // 末次月经日期在未来时按 0 周处理
    if (total < 0) {
        total = 0;
    }
    if (weeks) *weeks = static_cast<int>(total / 7);
    if (days) *days = static_cast<int>(total % 7);
    return true;
}

QDate PregnancyCalculator::dueDate() const
{
    if (!hasLastPeriodDate()) {
        return QDate();
    }
    return m_config.lastPeriodDate.addDays(FULL_TERM_DAYS);
}

int PregnancyCalculator::daysUntilDue(const QDate& today) const
{
    QDate due = dueDate();
    return due.isValid() ? static_cast<int>(today.daysTo(due)) : 0;
}

int PregnancyCalculator::trimester(int week)
{
    if (week >= 1 && week <= 13) {
        return 1;
    } else if (week >= 14 && week <= 27) {
        return 2;
    } else if (week >= 28) {
        return 3;
    }
    return 0;
}

QString PregnancyCalculator::trimesterName(int trimester)
{
    switch (trimester) {
    case 1: return "孕早期";
    case 2: return "孕中期";
    case 3: return "孕晚期";
    default: return QString();
    }
}

PregnancyWeekInfo PregnancyCalculator::weekInfo(const QDate& today) const
{
    PregnancyWeekInfo info;
    if (!currentWeekDay(&info.week, &info.day, today)) {
        return info;
    }

    info.display = info.day > 0 ? QString("%1周+%2天").arg(info.week).arg(info.day)
                                : QString("%1周").arg(info.week);
    info.trimester = trimester(info.week);
    info.trimesterName = trimesterName(info.trimester);
    info.dueDate = dueDate();
    info.daysUntilDue = daysUntilDue(today);
    return info;
}

QString PregnancyCalculator::babyDevelopmentStage(int week)
{
    struct Stage {
        int start;
        int end;
        const char* description;
    };
    static const Stage stages[] = {
        {1, 4, "受精卵正在分裂，准备着床"},
        {5, 8, "胚胎期，心脏开始跳动"},
        {9, 12, "胎儿期开始，各器官正在形成"},
        {13, 16, "胎儿快速生长，可能开始感受到胎动"},
        {17, 20, "宝宝活动增多，胎动更明显"},
        {21, 24, "宝宝听力发育，可以听到外界声音"},
        {25, 28, "宝宝眼睛可以睁开了"},
        {29, 32, "宝宝体重快速增加"},
        {33, 36, "宝宝各器官基本成熟"},
        {37, 40, "足月期，随时可能出生"},
    };

    for (const Stage& stage : stages) {
        if (week >= stage.start && week <= stage.end) {
            return QString::fromUtf8(stage.description);
        }
    }
    if (week > 40) {
        return "已过预产期，请注意产检";
    }
    return QString();
}

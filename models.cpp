#include "models.h"
#include <QMap>

namespace {

const QMap<RepeatType, QString>& repeatTypeNames()
{
    static const QMap<RepeatType, QString> names {
        {RepeatType::Once, "once"},
        {RepeatType::Daily, "daily"},
        {RepeatType::Weekly, "weekly"},
        {RepeatType::Monthly, "monthly"},
        {RepeatType::Workdays, "workdays"}
    };
    return names;
}

const QMap<ReminderType, QString>& reminderTypeNames()
{
    static const QMap<ReminderType, QString> names {
        {ReminderType::Water, "water"},
        {ReminderType::Event, "event"},
        {ReminderType::Countdown, "countdown"},
        {ReminderType::PregnancyTip, "pregnancy_tip"},
        {ReminderType::StandUp, "stand_up"},
        {ReminderType::EyeRest, "eye_rest"},
        {ReminderType::Nutrition, "nutrition"},
        {ReminderType::Medication, "medication"},
        {ReminderType::Posture, "posture"},
        {ReminderType::Relaxation, "relaxation"},
        {ReminderType::FetalMovement, "fetal_movement"},
        {ReminderType::Nap, "nap"}
    };
    return names;
}

} // namespace

QString repeatTypeToString(RepeatType type)
{
    return repeatTypeNames().value(type, "once");
}

RepeatType repeatTypeFromString(const QString& value, RepeatType fallback)
{
    const QString key = value.trimmed().toLower();
    for (auto it = repeatTypeNames().cbegin(); it != repeatTypeNames().cend(); ++it) {
        if (it.value() == key) {
            return it.key();
        }
    }
    return fallback;
}

QString repeatTypeDisplayName(RepeatType type)
{
    switch (type) {
    case RepeatType::Once: return "一次性";
    case RepeatType::Daily: return "每天";
    case RepeatType::Weekly: return "每周";
    case RepeatType::Monthly: return "每月";
    case RepeatType::Workdays: return "工作日";
    }
    return QString();
}

QString reminderTypeToString(ReminderType type)
{
    return reminderTypeNames().value(type);
}

bool reminderTypeFromString(const QString& value, ReminderType* type)
{
    for (auto it = reminderTypeNames().cbegin(); it != reminderTypeNames().cend(); ++it) {
        if (it.value() == value) {
            if (type) {
                *type = it.key();
            }
            return true;
        }
    }
    return false;
}

bool Medication::isActiveOn(const QDate& date) const
{
    if (!startDate.isValid()) {
        return true;
    }
    if (date < startDate) {
        return false;
    }
    if (durationDays > 0 && date >= startDate.addDays(durationDays)) {
        return false;
    }
    // 每周服药：只在开始日期对应的星期几
    if (cycle == RepeatType::Weekly && date.dayOfWeek() != startDate.dayOfWeek()) {
        return false;
    }
    if (cycle == RepeatType::Workdays && date.dayOfWeek() > 5) {
        return false;
    }
    return true;
}

QJsonObject PregnancyConfig::toJson() const
{
    return QJsonObject {
        {"enabled", enabled},
        {"last_period_date", lastPeriodDate.isValid() ? QJsonValue(lastPeriodDate.toString(DATE_FORMAT))
                                                      : QJsonValue(QJsonValue::Null)},
        {"daily_tip_time", dailyTipTime}
    };
}

PregnancyConfig PregnancyConfig::fromJson(const QJsonObject& obj)
{
    PregnancyConfig config;
    config.enabled = obj.value("enabled").toBool(false);
    config.lastPeriodDate = QDate::fromString(obj.value("last_period_date").toString(), DATE_FORMAT);
    config.dailyTipTime = obj.value("daily_tip_time").toString("09:00");
    return config;
}

QString mealTypeDisplayName(const QString& mealType)
{
    if (mealType == "breakfast") return "早餐";
    if (mealType == "lunch") return "午餐";
    if (mealType == "dinner") return "晚餐";
    if (mealType == "snack") return "加餐";
    return mealType;
}

QStringList mealTypes()
{
    return {"breakfast", "lunch", "dinner", "snack"};
}

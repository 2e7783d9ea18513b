#ifndef MODELS_H
#define MODELS_H

#include <QString>
#include <QStringList>
#include <QDate>
#include <QDateTime>
#include <QList>
#include <QJsonObject>
#include "constants.h"

// 重复类型
enum class RepeatType {
    Once,       // 一次性
    Daily,      // 每天
    Weekly,     // 每周
    Monthly,    // 每月
    Workdays    // 工作日
};

// 提醒类型
enum class ReminderType {
    Water,
    Event,
    Countdown,
    PregnancyTip,
    StandUp,
    EyeRest,
    Nutrition,
    Medication,
    Posture,
    Relaxation,
    FetalMovement,
    Nap
};

QString repeatTypeToString(RepeatType type);
// 未知字符串返回 fallback
RepeatType repeatTypeFromString(const QString& value, RepeatType fallback = RepeatType::Once);
QString repeatTypeDisplayName(RepeatType type);

QString reminderTypeToString(ReminderType type);
bool reminderTypeFromString(const QString& value, ReminderType* type);

// 事件（普通提醒或倒计时）
struct Event {
    QString id;
    QString title;
    QString description;
    QDateTime remindTime;           // 无效表示不提醒
    RepeatType repeatType = RepeatType::Once;
    bool isCountdown = false;
    QDate targetDate;               // 倒计时目标日期
    bool enabled = true;
    QDateTime createdAt = QDateTime::currentDateTime();

    bool isValid() const { return !id.isEmpty(); }
};

// 药物
struct Medication {
    QString id;
    QString name;
    QString dosage;
    QStringList times;              // ["09:00", "21:00"]
    RepeatType cycle = RepeatType::Daily;
    QDate startDate;                // 无效表示立即开始
    int durationDays = 0;           // 0 表示长期
    QString notes;
    bool enabled = true;

    // 指定日期是否在服药周期内
    bool isActiveOn(const QDate& date) const;
};

// 孕期配置
struct PregnancyConfig {
    bool enabled = false;
    QDate lastPeriodDate;
    QString dailyTipTime = "09:00";

    QJsonObject toJson() const;
    static PregnancyConfig fromJson(const QJsonObject& obj);
};

// 餐食记录
struct MealRecord {
    QString type;                   // breakfast, lunch, dinner, snack
    QString time;                   // HH:mm
    QStringList foods;
};

// 每日饮食记录
struct DietRecord {
    QDate date;
    QList<MealRecord> meals;
    QJsonObject analysis;           // 为空表示尚未分析
    QDateTime analyzedAt;

    bool hasAnalysis() const { return !analysis.isEmpty(); }
};

// 胎动记录
struct FetalMovementRecord {
    QString id;
    QDate date;
    QDateTime startTime;
    QDateTime endTime;
    int count = 0;
    QString notes;
};

// 饮水记录
struct WaterIntakeRecord {
    QString id;
    QDateTime time;
    int amount = 0;                 // 毫升
    QString note;
};

// 餐食类型的中文名
QString mealTypeDisplayName(const QString& mealType);
QStringList mealTypes();

#endif // MODELS_H

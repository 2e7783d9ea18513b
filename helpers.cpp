#include "helpers.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QUuid>

QTime parseClockTime(const QString& timeStr)
{
    QTime time = QTime::fromString(timeStr.trimmed(), "H:mm");
    return time;
}

QString formatClockTime(const QString& timeStr)
{
    QTime time = parseClockTime(timeStr);
    return time.isValid() ? time.toString("HH:mm") : timeStr;
}

bool isWithinTimeRange(const QString& startTime, const QString& endTime, const QTime& now)
{
    QTime start = parseClockTime(startTime);
    QTime end = parseClockTime(endTime);
    if (!start.isValid() || !end.isValid()) {
        qWarning() << "无效的时间范围：" << startTime << "~" << endTime;
        return false;
    }

    // 只比较到分钟，"18:00" 包含 18:00:59
    QTime current(now.hour(), now.minute());
    if (start <= end) {
        return start <= current && current <= end;
    }
    // 跨午夜的情况
    return current >= start || current <= end;
}

int daysUntil(const QDate& target, const QDate& today)
{
    return static_cast<int>(today.daysTo(target));
}

QString currentSeason(const QDate& date)
{
    int month = date.month();
    if (month >= 3 && month <= 5) {
        return "春季";
    } else if (month >= 6 && month <= 8) {
        return "夏季";
    } else if (month >= 9 && month <= 11) {
        return "秋季";
    }
    return "冬季";
}

QString timePeriod(const QTime& time)
{
    int hour = time.hour();
    if (hour >= 5 && hour < 9) {
        return "早晨";
    } else if (hour >= 9 && hour < 12) {
        return "上午";
    } else if (hour >= 12 && hour < 14) {
        return "中午";
    } else if (hour >= 14 && hour < 18) {
        return "下午";
    } else if (hour >= 18 && hour < 22) {
        return "晚上";
    }
    return "深夜";
}

QString truncateText(const QString& text, int maxLength)
{
    if (text.length() <= maxLength) {
        return text;
    }
    return text.left(qMax(0, maxLength - 3)) + "...";
}

QString generateUniqueId()
{
    return QUuid::createUuid().toString(QUuid::Id128).left(8);
}

QDate parseDate(const QString& dateStr)
{
    const QStringList formats {"yyyy-MM-dd", "yyyy/MM/dd", "yyyy.MM.dd"};
    for (const QString& format : formats) {
        QDate date = QDate::fromString(dateStr.trimmed(), format);
        if (date.isValid()) {
            return date;
        }
    }
    return QDate();
}

QString formatDate(const QDate& date, bool includeWeekday)
{
    static const QStringList weekdays {"周一", "周二", "周三", "周四", "周五", "周六", "周日"};
    QString result = date.toString("yyyy-MM-dd");
    if (includeWeekday && date.isValid()) {
        result += " " + weekdays.at(date.dayOfWeek() - 1);
    }
    return result;
}

QJsonObject loadJson(const QString& filePath, const QJsonObject& defaultValue)
{
    QFile file(filePath);
    if (!file.exists()) {
        return defaultValue;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "加载 JSON 文件失败" << filePath << "：" << file.errorString();
        return defaultValue;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "加载 JSON 文件失败" << filePath << "：" << parseError.errorString();
        return defaultValue;
    }
    return doc.object();
}

bool saveJson(const QString& filePath, const QJsonObject& data)
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());

    // QSaveFile 先写临时文件再替换，写入中断不会损坏原文件
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "保存 JSON 文件失败" << filePath << "：" << file.errorString();
        return false;
    }
    file.write(QJsonDocument(data).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "保存 JSON 文件失败" << filePath << "：" << file.errorString();
        return false;
    }
    return true;
}

bool parseJsonObject(const QString& text, QJsonObject* result)
{
    QString body = text.trimmed();
    if (body.startsWith("```")) {
        int firstLineEnd = body.indexOf('\n');
        int fenceEnd = body.lastIndexOf("```");
        if (firstLineEnd < 0 || fenceEnd <= firstLineEnd) {
            return false;
        }
        body = body.mid(firstLineEnd + 1, fenceEnd - firstLineEnd - 1).trimmed();
    }

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(body.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return false;
    }
    *result = doc.object();
    return true;
}

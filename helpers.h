#ifndef HELPERS_H
#define HELPERS_H

#include <QString>
#include <QDate>
#include <QTime>
#include <QJsonObject>
#include <QStringList>

// 解析 "HH:mm"（也接受 "H:mm"），格式错误返回无效 QTime
QTime parseClockTime(const QString& timeStr);
// 格式化为标准 "HH:mm"，无法解析时原样返回
QString formatClockTime(const QString& timeStr);

// 检查时间是否在 [start, end] 范围内，支持跨午夜（如 22:00 ~ 06:00）
bool isWithinTimeRange(const QString& startTime, const QString& endTime, const QTime& now = QTime::currentTime());

// 距离目标日期的天数（已过为负数）
int daysUntil(const QDate& target, const QDate& today = QDate::currentDate());

QString currentSeason(const QDate& date = QDate::currentDate());
QString timePeriod(const QTime& time = QTime::currentTime());

// 截断文本，超出部分用省略号代替
QString truncateText(const QString& text, int maxLength = 50);

// 8 位十六进制唯一 ID
QString generateUniqueId();

// 支持 yyyy-MM-dd / yyyy/MM/dd / yyyy.MM.dd
QDate parseDate(const QString& dateStr);
QString formatDate(const QDate& date, bool includeWeekday = false);

// JSON 文件读写（失败时记录日志，读取失败返回默认值）
QJsonObject loadJson(const QString& filePath, const QJsonObject& defaultValue = QJsonObject());
bool saveJson(const QString& filePath, const QJsonObject& data);

// 从模型回复中解析 JSON 对象（允许包裹在 ``` 代码块中），失败返回 false
bool parseJsonObject(const QString& text, QJsonObject* result);

#endif // HELPERS_H

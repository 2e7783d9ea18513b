#ifndef AICONTENTCACHE_H
#define AICONTENTCACHE_H

#include <QString>
#include <QMap>
#include <QJsonObject>
#include <QJsonValue>
#include <QDateTime>

// AI 生成内容的缓存（按孕周或按日期分组，数据存于 ai_cache 表）
class AIContentCache
{
public:
    enum class GroupBy {
        None,   // 不缓存
        Week,
        Date
    };

    struct CacheRule {
        int ttlDays = 0;
        GroupBy groupBy = GroupBy::None;
    };

    struct Stats {
        int totalItems = 0;
        QMap<QString, int> byType;
    };

    AIContentCache() = default;

    // 生成缓存键；context 中包含 week（孕周）或 date（yyyy-MM-dd），不需要缓存时返回空
    QString cacheKey(const QString& contentType, const QJsonObject& context,
                     const QDate& today = QDate::currentDate()) const;

    // 不存在或已过期时返回 undefined，过期条目顺便删除
    QJsonValue get(const QString& contentType, const QJsonObject& context,
                   const QDateTime& now = QDateTime::currentDateTime());
    // 不可缓存的类型返回 false
    bool set(const QString& contentType, const QJsonObject& context, const QJsonValue& content,
             const QDateTime& now = QDateTime::currentDateTime());

    // contentType 为空时清除全部
    bool clear(const QString& contentType = QString());
    // 返回清除的数量
    int clearExpired(const QDateTime& now = QDateTime::currentDateTime());
    Stats stats() const;

    static CacheRule rule(const QString& contentType);

private:
    static bool isExpired(const QDateTime& createdAt, const QString& contentType, const QDateTime& now);
};

#endif // AICONTENTCACHE_H

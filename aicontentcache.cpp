#include "aicontentcache.h"
#include "databasemanager.h"
#include "constants.h"
#include <QDebug>

AIContentCache::CacheRule AIContentCache::rule(const QString& contentType)
{
    static const QMap<QString, CacheRule> rules {
        {"nutrition", {7, GroupBy::Week}},
        {"relaxation", {0, GroupBy::None}},
        {"stand_up", {1, GroupBy::Date}},
        {"posture", {7, GroupBy::Week}},
        {"daily_tips", {1, GroupBy::Date}},
        {"diet_analysis", {1, GroupBy::Date}}
    };
    return rules.value(contentType, CacheRule());
}

QString AIContentCache::cacheKey(const QString& contentType, const QJsonObject& context, const QDate& today) const
{
    switch (rule(contentType).groupBy) {
    case GroupBy::Week:
        return QString("%1_week_%2").arg(contentType).arg(context.value("week").toInt(0));
    case GroupBy::Date:
        return QString("%1_%2").arg(contentType, context.value("date").toString(today.toString(DATE_FORMAT)));
    case GroupBy::None:
        break;
    }
    return QString();
}

bool AIContentCache::isExpired(const QDateTime& createdAt, const QString& contentType, const QDateTime& now)
{
    CacheRule cacheRule = rule(contentType);
    if (cacheRule.ttlDays <= 0 || !createdAt.isValid()) {
        return true;
    }
    return now > createdAt.addDays(cacheRule.ttlDays);
}

QJsonValue AIContentCache::get(const QString& contentType, const QJsonObject& context, const QDateTime& now)
{
    QString key = cacheKey(contentType, context, now.date());
    if (key.isEmpty()) {
        return QJsonValue(QJsonValue::Undefined);
    }

    CacheEntry entry;
    if (!DatabaseManager::instance().getCacheEntry(key, &entry)) {
        return QJsonValue(QJsonValue::Undefined);
    }

    if (isExpired(entry.createdAt, contentType, now)) {
        // 清除过期缓存
        DatabaseManager::instance().removeCacheEntry(key);
        return QJsonValue(QJsonValue::Undefined);
    }
    return entry.content;
}

bool AIContentCache::set(const QString& contentType, const QJsonObject& context, const QJsonValue& content,
                         const QDateTime& now)
{
    QString key = cacheKey(contentType, context, now.date());
    if (key.isEmpty()) {
        return false;
    }

    CacheEntry entry;
    entry.key = key;
    entry.contentType = contentType;
    entry.content = content;
    entry.context = context;
    entry.createdAt = now;
    return DatabaseManager::instance().setCacheEntry(entry);
}

bool AIContentCache::clear(const QString& contentType)
{
    return DatabaseManager::instance().clearCache(contentType);
}

int AIContentCache::clearExpired(const QDateTime& now)
{
    int removed = 0;
    const QList<CacheEntry> entries = DatabaseManager::instance().getCacheEntries();
    for (const CacheEntry& entry : entries) {
        if (isExpired(entry.createdAt, entry.contentType, now)
            && DatabaseManager::instance().removeCacheEntry(entry.key)) {
            removed++;
        }
    }
    if (removed > 0) {
        qDebug() << "已清除" << removed << "条过期 AI 缓存";
    }
    return removed;
}

AIContentCache::Stats AIContentCache::stats() const
{
    Stats result;
    const QList<CacheEntry> entries = DatabaseManager::instance().getCacheEntries();
    result.totalItems = entries.count();
    for (const CacheEntry& entry : entries) {
        result.byType[entry.contentType]++;
    }
    return result;
}

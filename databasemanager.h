#ifndef DATABASEMANAGER_H
#define DATABASEMANAGER_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include <QList>
#include <QMap>
#include <QString>
#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>
#include <QMutex>
#include "models.h"

// AI 内容缓存条目
struct CacheEntry {
    QString key;
    QString contentType;
    QJsonValue content;
    QJsonObject context;
    QDateTime createdAt;
};

// 提醒历史（触发、稍后提醒、关闭、升级、错过）
struct ReminderHistoryEntry {
    int id = -1;
    QString reminderId;
    QString jobId;
    QString type;
    QString title;
    QString action;     // shown / snoozed / dismissed / escalated / missed
    int priority = static_cast<int>(ReminderPriority::Normal);
    QDateTime occurredAt;
};

class DatabaseManager
{
public:
    // 单例模式：全局唯一实例
    static DatabaseManager& instance() {
        static DatabaseManager instance;
        return instance;
    }

    // 初始化数据库（创建表），dbPath 为空时使用用户数据目录下的 drinkwater.db
    bool init(const QString& dbPath = QString());
    // 关闭所有线程的数据库连接
    void close();
    bool isOpen();
    QString databasePath() const;
    // 获取线程安全数据库连接（每个线程独立连接）
    QSqlDatabase getThreadSafeDatabase();

    // 事件
    bool addEvent(const Event& event);
    bool updateEvent(const Event& event);
    bool deleteEvent(const QString& eventId);
    QList<Event> getEvents();
    Event getEvent(const QString& eventId);  // 不存在时返回 id 为空的事件
    QList<Event> getCountdownEvents();       // 启用的倒计时事件，按目标日期排序

    // 药物
    bool addMedication(const Medication& medication);
    bool updateMedication(const Medication& medication);
    bool deleteMedication(const QString& medicationId);
    QList<Medication> getMedications();

    // 饮水记录
    bool addWaterRecord(const WaterIntakeRecord& record);
    bool deleteWaterRecord(const QString& recordId);
    QList<WaterIntakeRecord> getWaterRecords(const QDate& date);
    int getWaterTotal(const QDate& date);
    // [from, to] 每天的饮水总量，没有记录的日期为 0
    QMap<QDate, int> getDailyWaterTotals(const QDate& from, const QDate& to);

    // 饮食记录
    bool hasDietRecord(const QDate& date);
    // 不存在时返回只有日期的空记录
    DietRecord getDietRecord(const QDate& date);
    bool addMeal(const QDate& date, const MealRecord& meal);
    // 当日没有饮食记录时返回 false
    bool updateDietAnalysis(const QDate& date, const QJsonObject& analysis,
                            const QDateTime& analyzedAt = QDateTime::currentDateTime());

    // 胎动记录
    bool addFetalMovement(const FetalMovementRecord& record);
    bool updateFetalMovement(const FetalMovementRecord& record);
    // date 无效时返回全部记录
    QList<FetalMovementRecord> getFetalMovements(const QDate& date = QDate());

    // AI 内容缓存
    bool getCacheEntry(const QString& key, CacheEntry* entry);
    bool setCacheEntry(const CacheEntry& entry);
    bool removeCacheEntry(const QString& key);
    // contentType 为空时清除全部
    bool clearCache(const QString& contentType = QString());
    QList<CacheEntry> getCacheEntries();

    // 提醒历史
    bool addReminderHistory(const ReminderHistoryEntry& entry);
    QList<ReminderHistoryEntry> getReminderHistory(int limit = 100);
    int getReminderHistoryCount(const QString& action, const QDate& date);

private:
    // 私有构造函数/析构函数（单例模式，禁止外部实例化）
    DatabaseManager() = default;
    ~DatabaseManager();
    // 禁止拷贝构造和赋值运算符（确保单例唯一性）
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool createTables(QSqlDatabase& db);
    bool ensureDietRecord(QSqlDatabase& db, const QDate& date);

    static Event eventFromQuery(const QSqlQuery& query);
    static Medication medicationFromQuery(const QSqlQuery& query);
    static FetalMovementRecord fetalMovementFromQuery(const QSqlQuery& query);

    QMutex m_mutex; // 线程安全锁（保护数据库路径和连接创建）
    QString m_dbPath;
    QString m_connectionPrefix = "DrinkWaterDB_";
};

#endif // DATABASEMANAGER_H

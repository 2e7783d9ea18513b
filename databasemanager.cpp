#include "databasemanager.h"
#include "constants.h"
#include <QDebug>
#include <QDir>
#include <QSqlError>
#include <QThread>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMutexLocker>

namespace {

QVariant dateTimeValue(const QDateTime& dateTime)
{
    return dateTime.isValid() ? QVariant(dateTime.toString(DATETIME_FORMAT)) : QVariant();
}

QVariant dateValue(const QDate& date)
{
    return date.isValid() ? QVariant(date.toString(DATE_FORMAT)) : QVariant();
}

QDateTime toDateTime(const QVariant& value)
{
    return QDateTime::fromString(value.toString(), DATETIME_FORMAT);
}

QDate toDate(const QVariant& value)
{
    return QDate::fromString(value.toString(), DATE_FORMAT);
}

QString foodsToJson(const QStringList& foods)
{
    return QString::fromUtf8(QJsonDocument(QJsonArray::fromStringList(foods)).toJson(QJsonDocument::Compact));
}

QStringList foodsFromJson(const QString& text)
{
    QStringList foods;
    const QJsonArray array = QJsonDocument::fromJson(text.toUtf8()).array();
    for (const QJsonValue& value : array) {
        foods.append(value.toString());
    }
    return foods;
}

// JSON 文档只能存对象或数组，缓存内容统一包一层 {"content": ...}
QString wrapJsonValue(const QJsonValue& value)
{
    return QString::fromUtf8(QJsonDocument(QJsonObject {{"content", value}}).toJson(QJsonDocument::Compact));
}

QJsonValue unwrapJsonValue(const QString& text)
{
    return QJsonDocument::fromJson(text.toUtf8()).object().value("content");
}

QString objectToJson(const QJsonObject& object)
{
    return QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact));
}

QJsonObject objectFromJson(const QString& text)
{
    return QJsonDocument::fromJson(text.toUtf8()).object();
}

} // namespace

DatabaseManager::~DatabaseManager()
{
    close();
}

// 每个线程独立的数据库连接
QSqlDatabase DatabaseManager::getThreadSafeDatabase()
{
    QMutexLocker locker(&m_mutex);
    QString connectionName = QString("%1%2").arg(m_connectionPrefix).arg((quintptr)QThread::currentThreadId());
    if (QSqlDatabase::contains(connectionName)) {
        return QSqlDatabase::database(connectionName);
    }

    if (m_dbPath.isEmpty()) {
        qCritical() << "数据库尚未初始化";
        return QSqlDatabase();
    }

    QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", connectionName);
    db.setDatabaseName(m_dbPath);
    if (!db.open()) {
        qCritical() << "线程" << QThread::currentThreadId() << "数据库打开失败：" << db.lastError().text();
    }
    return db;
}

bool DatabaseManager::init(const QString& dbPath)
{
    close();
    {
        QMutexLocker locker(&m_mutex);
        m_dbPath = dbPath.isEmpty() ? QDir(userDataDir()).filePath(DATABASE_FILE_NAME) : dbPath;
    }

    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) {
        qDebug() << "数据库打开失败：" << db.lastError().text();
        return false;
    }

    if (!createTables(db)) {
        db.close();
        return false;
    }
    qDebug() << "数据库初始化完成：" << m_dbPath;
    return true;
}

void DatabaseManager::close()
{
    QMutexLocker locker(&m_mutex);
    const QStringList names = QSqlDatabase::connectionNames();
    for (const QString& name : names) {
        if (!name.startsWith(m_connectionPrefix)) {
            continue;
        }
        {
            QSqlDatabase db = QSqlDatabase::database(name, false);
            if (db.isOpen()) {
                db.close();
            }
        }
        QSqlDatabase::removeDatabase(name);
    }
}

bool DatabaseManager::isOpen()
{
    return getThreadSafeDatabase().isOpen();
}

QString DatabaseManager::databasePath() const
{
    return m_dbPath;
}

bool DatabaseManager::createTables(QSqlDatabase& db)
{
    const QStringList statements {
        R"(
        CREATE TABLE IF NOT EXISTS events (
            id TEXT PRIMARY KEY,
            title TEXT NOT NULL,
            description TEXT,
            remind_time DATETIME,
            repeat_type TEXT NOT NULL DEFAULT 'once'
                CHECK(repeat_type IN ('once', 'daily', 'weekly', 'monthly', 'workdays')),
            is_countdown INTEGER NOT NULL DEFAULT 0 CHECK(is_countdown IN (0, 1)),
            target_date DATE,
            enabled INTEGER NOT NULL DEFAULT 1 CHECK(enabled IN (0, 1)),
            created_at DATETIME NOT NULL
        )
        )",
        R"(
        CREATE TABLE IF NOT EXISTS medications (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            dosage TEXT,
            times TEXT NOT NULL,
            cycle TEXT NOT NULL DEFAULT 'daily',
            start_date DATE,
            duration_days INTEGER NOT NULL DEFAULT 0,
            notes TEXT,
            enabled INTEGER NOT NULL DEFAULT 1 CHECK(enabled IN (0, 1))
        )
        )",
        R"(
        CREATE TABLE IF NOT EXISTS water_records (
            id TEXT PRIMARY KEY,
            time DATETIME NOT NULL,
            amount INTEGER NOT NULL CHECK(amount > 0),
            note TEXT
        )
        )",
        R"(
        CREATE TABLE IF NOT EXISTS diet_records (
            date DATE PRIMARY KEY,
            analysis TEXT,
            analyzed_at DATETIME
        )
        )",
        R"(
        CREATE TABLE IF NOT EXISTS meals (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            record_date DATE NOT NULL REFERENCES diet_records(date),
            type TEXT NOT NULL CHECK(type IN ('breakfast', 'lunch', 'dinner', 'snack')),
            time TEXT NOT NULL,
            foods TEXT NOT NULL
        )
        )",
        R"(
        CREATE TABLE IF NOT EXISTS fetal_movements (
            id TEXT PRIMARY KEY,
            date DATE NOT NULL,
            start_time DATETIME NOT NULL,
            end_time DATETIME,
            count INTEGER NOT NULL DEFAULT 0,
            notes TEXT
        )
        )",
        R"(
        CREATE TABLE IF NOT EXISTS ai_cache (
            cache_key TEXT PRIMARY KEY,
            content_type TEXT NOT NULL,
            content TEXT NOT NULL,
            context TEXT,
            created_at DATETIME NOT NULL
        )
        )",
        R"(
        CREATE TABLE IF NOT EXISTS reminder_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            reminder_id TEXT,
            job_id TEXT,
            type TEXT,
            title TEXT,
            action TEXT NOT NULL,
            priority INTEGER NOT NULL DEFAULT 2,
            occurred_at DATETIME NOT NULL
        )
        )",
        "CREATE INDEX IF NOT EXISTS idx_water_time ON water_records(time)",
        "CREATE INDEX IF NOT EXISTS idx_meals_date ON meals(record_date)",
        "CREATE INDEX IF NOT EXISTS idx_history_time ON reminder_history(occurred_at)"
    };

    QSqlQuery query(db);
    for (const QString& sql : statements) {
        if (!query.exec(sql)) {
            qDebug() << "创建表失败：" << query.lastError().text();
            return false;
        }
    }
    return true;
}

// ==================== 事件 ====================

Event DatabaseManager::eventFromQuery(const QSqlQuery& query)
{
    Event event;
    event.id = query.value(0).toString();
    event.title = query.value(1).toString();
    event.description = query.value(2).toString();
    event.remindTime = toDateTime(query.value(3));
    event.repeatType = repeatTypeFromString(query.value(4).toString());
    event.isCountdown = query.value(5).toInt() == 1;
    event.targetDate = toDate(query.value(6));
    event.enabled = query.value(7).toInt() == 1;
    event.createdAt = toDateTime(query.value(8));
    return event;
}

bool DatabaseManager::addEvent(const Event& event)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || event.id.isEmpty()) return false;

    QSqlQuery query(db);
    query.prepare(R"(
        INSERT INTO events (id, title, description, remind_time, repeat_type, is_countdown, target_date, enabled, created_at)
        VALUES (:id, :title, :description, :remind_time, :repeat_type, :is_countdown, :target_date, :enabled, :created_at)
    )");
    query.bindValue(":id", event.id);
    query.bindValue(":title", event.title);
    query.bindValue(":description", event.description);
    query.bindValue(":remind_time", dateTimeValue(event.remindTime));
    query.bindValue(":repeat_type", repeatTypeToString(event.repeatType));
    query.bindValue(":is_countdown", event.isCountdown ? 1 : 0);
    query.bindValue(":target_date", dateValue(event.targetDate));
    query.bindValue(":enabled", event.enabled ? 1 : 0);
    query.bindValue(":created_at", dateTimeValue(event.createdAt.isValid() ? event.createdAt : QDateTime::currentDateTime()));

    if (!query.exec()) {
        qDebug() << "添加事件失败：" << query.lastError().text();
        return false;
    }
    return true;
}

bool DatabaseManager::updateEvent(const Event& event)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || event.id.isEmpty()) return false;

    QSqlQuery query(db);
    query.prepare(R"(
        UPDATE events
        SET title = :title,
            description = :description,
            remind_time = :remind_time,
            repeat_type = :repeat_type,
            is_countdown = :is_countdown,
            target_date = :target_date,
            enabled = :enabled
        WHERE id = :id
    )");
    query.bindValue(":title", event.title);
    query.bindValue(":description", event.description);
    query.bindValue(":remind_time", dateTimeValue(event.remindTime));
    query.bindValue(":repeat_type", repeatTypeToString(event.repeatType));
    query.bindValue(":is_countdown", event.isCountdown ? 1 : 0);
    query.bindValue(":target_date", dateValue(event.targetDate));
    query.bindValue(":enabled", event.enabled ? 1 : 0);
    query.bindValue(":id", event.id);

    if (!query.exec()) {
        qDebug() << "更新事件失败：" << query.lastError().text();
        return false;
    }
    return query.numRowsAffected() > 0;
}

bool DatabaseManager::deleteEvent(const QString& eventId)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || eventId.isEmpty()) return false;

    QSqlQuery query(db);
    query.prepare("DELETE FROM events WHERE id = :id");
    query.bindValue(":id", eventId);

    if (!query.exec()) {
        qDebug() << "删除事件失败：" << query.lastError().text();
        return false;
    }
    return true;
}

QList<Event> DatabaseManager::getEvents()
{
    QList<Event> eventList;
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) return eventList;

    QSqlQuery query(db);
    if (!query.exec("SELECT id, title, description, remind_time, repeat_type, is_countdown, target_date, enabled, created_at "
                    "FROM events ORDER BY created_at ASC")) {
        qDebug() << "获取事件失败：" << query.lastError().text();
        return eventList;
    }
    while (query.next()) {
        eventList.append(eventFromQuery(query));
    }
    return eventList;
}

Event DatabaseManager::getEvent(const QString& eventId)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) return Event();

    QSqlQuery query(db);
    query.prepare("SELECT id, title, description, remind_time, repeat_type, is_countdown, target_date, enabled, created_at "
                  "FROM events WHERE id = :id");
    query.bindValue(":id", eventId);
    if (!query.exec() || !query.next()) {
        return Event();
    }
    return eventFromQuery(query);
}

QList<Event> DatabaseManager::getCountdownEvents()
{
    QList<Event> eventList;
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) return eventList;

    QSqlQuery query(db);
    if (!query.exec("SELECT id, title, description, remind_time, repeat_type, is_countdown, target_date, enabled, created_at "
                    "FROM events WHERE is_countdown = 1 AND enabled = 1 ORDER BY target_date ASC")) {
        qDebug() << "获取倒计时事件失败：" << query.lastError().text();
        return eventList;
    }
    while (query.next()) {
        eventList.append(eventFromQuery(query));
    }
    return eventList;
}

// ==================== 药物 ====================

Medication DatabaseManager::medicationFromQuery(const QSqlQuery& query)
{
    Medication medication;
    medication.id = query.value(0).toString();
    medication.name = query.value(1).toString();
    medication.dosage = query.value(2).toString();
    medication.times = query.value(3).toString().split(",", Qt::SkipEmptyParts);
    medication.cycle = repeatTypeFromString(query.value(4).toString(), RepeatType::Daily);
    medication.startDate = toDate(query.value(5));
    medication.durationDays = query.value(6).toInt();
    medication.notes = query.value(7).toString();
    medication.enabled = query.value(8).toInt() == 1;
    return medication;
}

bool DatabaseManager::addMedication(const Medication& medication)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || medication.id.isEmpty()) return false;

    QSqlQuery query(db);
    query.prepare(R"(
        INSERT INTO medications (id, name, dosage, times, cycle, start_date, duration_days, notes, enabled)
        VALUES (:id, :name, :dosage, :times, :cycle, :start_date, :duration_days, :notes, :enabled)
    )");
    query.bindValue(":id", medication.id);
    query.bindValue(":name", medication.name);
    query.bindValue(":dosage", medication.dosage);
    query.bindValue(":times", medication.times.join(","));
    query.bindValue(":cycle", repeatTypeToString(medication.cycle));
    query.bindValue(":start_date", dateValue(medication.startDate));
    query.bindValue(":duration_days", medication.durationDays);
    query.bindValue(":notes", medication.notes);
    query.bindValue(":enabled", medication.enabled ? 1 : 0);

    if (!query.exec()) {
        qDebug() << "添加药物失败：" << query.lastError().text();
        return false;
    }
    return true;
}

bool DatabaseManager::updateMedication(const Medication& medication)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || medication.id.isEmpty()) return false;

    QSqlQuery query(db);
    query.prepare(R"(
        UPDATE medications
        SET name = :name,
            dosage = :dosage,
            times = :times,
            cycle = :cycle,
            start_date = :start_date,
            duration_days = :duration_days,
            notes = :notes,
            enabled = :enabled
        WHERE id = :id
    )");
    query.bindValue(":name", medication.name);
    query.bindValue(":dosage", medication.dosage);
    query.bindValue(":times", medication.times.join(","));
    query.bindValue(":cycle", repeatTypeToString(medication.cycle));
    query.bindValue(":start_date", dateValue(medication.startDate));
    query.bindValue(":duration_days", medication.durationDays);
    query.bindValue(":notes", medication.notes);
    query.bindValue(":enabled", medication.enabled ? 1 : 0);
    query.bindValue(":id", medication.id);

    if (!query.exec()) {
        qDebug() << "更新药物失败：" << query.lastError().text();
        return false;
    }
    return query.numRowsAffected() > 0;
}

bool DatabaseManager::deleteMedication(const QString& medicationId)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || medicationId.isEmpty()) return false;

    QSqlQuery query(db);
    query.prepare("DELETE FROM medications WHERE id = :id");
    query.bindValue(":id", medicationId);

    if (!query.exec()) {
        qDebug() << "删除药物失败：" << query.lastError().text();
        return false;
    }
    return true;
}

QList<Medication> DatabaseManager::getMedications()
{
    QList<Medication> medicationList;
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) return medicationList;

    QSqlQuery query(db);
    if (!query.exec("SELECT id, name, dosage, times, cycle, start_date, duration_days, notes, enabled "
                    "FROM medications ORDER BY name ASC")) {
        qDebug() << "获取药物失败：" << query.lastError().text();
        return medicationList;
    }
    while (query.next()) {
        medicationList.append(medicationFromQuery(query));
    }
    return medicationList;
}

// ==================== 饮水记录 ====================

bool DatabaseManager::addWaterRecord(const WaterIntakeRecord& record)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || record.id.isEmpty() || record.amount <= 0) return false;

    QSqlQuery query(db);
    query.prepare("INSERT INTO water_records (id, time, amount, note) VALUES (:id, :time, :amount, :note)");
    query.bindValue(":id", record.id);
    query.bindValue(":time", dateTimeValue(record.time.isValid() ? record.time : QDateTime::currentDateTime()));
    query.bindValue(":amount", record.amount);
    query.bindValue(":note", record.note);

    if (!query.exec()) {
        qDebug() << "添加饮水记录失败：" << query.lastError().text();
        return false;
    }
    return true;
}

bool DatabaseManager::deleteWaterRecord(const QString& recordId)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || recordId.isEmpty()) return false;

    QSqlQuery query(db);
    query.prepare("DELETE FROM water_records WHERE id = :id");
    query.bindValue(":id", recordId);

    if (!query.exec()) {
        qDebug() << "删除饮水记录失败：" << query.lastError().text();
        return false;
    }
    return true;
}

QList<WaterIntakeRecord> DatabaseManager::getWaterRecords(const QDate& date)
{
    QList<WaterIntakeRecord> recordList;
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || !date.isValid()) return recordList;

    // 存储格式以日期开头，按前缀筛选当天记录
    QSqlQuery query(db);
    query.prepare("SELECT id, time, amount, note FROM water_records WHERE time LIKE :day ORDER BY time ASC");
    query.bindValue(":day", date.toString(DATE_FORMAT) + "%");

    if (!query.exec()) {
        qDebug() << "获取饮水记录失败：" << query.lastError().text();
        return recordList;
    }
    while (query.next()) {
        WaterIntakeRecord record;
        record.id = query.value(0).toString();
        record.time = toDateTime(query.value(1));
        record.amount = query.value(2).toInt();
        record.note = query.value(3).toString();
        recordList.append(record);
    }
    return recordList;
}

int DatabaseManager::getWaterTotal(const QDate& date)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || !date.isValid()) return 0;

    QSqlQuery query(db);
    query.prepare("SELECT COALESCE(SUM(amount), 0) FROM water_records WHERE time LIKE :day");
    query.bindValue(":day", date.toString(DATE_FORMAT) + "%");
    if (query.exec() && query.next()) {
        return query.value(0).toInt();
    }
    return 0;
}

QMap<QDate, int> DatabaseManager::getDailyWaterTotals(const QDate& from, const QDate& to)
{
    QMap<QDate, int> totals;
    if (!from.isValid() || !to.isValid() || from > to) return totals;

    for (QDate day = from; day <= to; day = day.addDays(1)) {
        totals.insert(day, 0);
    }

    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) return totals;

    QSqlQuery query(db);
    query.prepare(R"(
        SELECT substr(time, 1, 10) AS day, SUM(amount)
        FROM water_records
        WHERE time >= :from AND time < :to
        GROUP BY day
    )");
    query.bindValue(":from", from.toString(DATE_FORMAT));
    query.bindValue(":to", to.addDays(1).toString(DATE_FORMAT));

    if (!query.exec()) {
        qDebug() << "统计饮水量失败：" << query.lastError().text();
        return totals;
    }
    while (query.next()) {
        QDate day = toDate(query.value(0));
        if (totals.contains(day)) {
            totals[day] = query.value(1).toInt();
        }
    }
    return totals;
}

// ==================== 饮食记录 ====================

bool DatabaseManager::hasDietRecord(const QDate& date)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare("SELECT COUNT(*) FROM diet_records WHERE date = :date");
    query.bindValue(":date", date.toString(DATE_FORMAT));
    return query.exec() && query.next() && query.value(0).toInt() > 0;
}

DietRecord DatabaseManager::getDietRecord(const QDate& date)
{
    DietRecord record;
    record.date = date;
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || !date.isValid()) return record;

    QSqlQuery query(db);
    query.prepare("SELECT analysis, analyzed_at FROM diet_records WHERE date = :date");
    query.bindValue(":date", date.toString(DATE_FORMAT));
    if (query.exec() && query.next()) {
        record.analysis = objectFromJson(query.value(0).toString());
        record.analyzedAt = toDateTime(query.value(1));
    }

    QSqlQuery mealQuery(db);
    mealQuery.prepare("SELECT type, time, foods FROM meals WHERE record_date = :date ORDER BY id ASC");
    mealQuery.bindValue(":date", date.toString(DATE_FORMAT));
    if (!mealQuery.exec()) {
        qDebug() << "获取饮食记录失败：" << mealQuery.lastError().text();
        return record;
    }
    while (mealQuery.next()) {
        MealRecord meal;
        meal.type = mealQuery.value(0).toString();
        meal.time = mealQuery.value(1).toString();
        meal.foods = foodsFromJson(mealQuery.value(2).toString());
        record.meals.append(meal);
    }
    return record;
}

bool DatabaseManager::ensureDietRecord(QSqlDatabase& db, const QDate& date)
{
    QSqlQuery query(db);
    query.prepare("INSERT OR IGNORE INTO diet_records (date) VALUES (:date)");
    query.bindValue(":date", date.toString(DATE_FORMAT));
    if (!query.exec()) {
        qDebug() << "创建饮食记录失败：" << query.lastError().text();
        return false;
    }
    return true;
}

bool DatabaseManager::addMeal(const QDate& date, const MealRecord& meal)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || !date.isValid() || meal.foods.isEmpty()) return false;

    if (!db.transaction()) {
        qDebug() << "开启事务失败：" << db.lastError().text();
        return false;
    }
    if (!ensureDietRecord(db, date)) {
        db.rollback();
        return false;
    }

    QSqlQuery query(db);
    query.prepare("INSERT INTO meals (record_date, type, time, foods) VALUES (:date, :type, :time, :foods)");
    query.bindValue(":date", date.toString(DATE_FORMAT));
    query.bindValue(":type", meal.type);
    query.bindValue(":time", meal.time);
    query.bindValue(":foods", foodsToJson(meal.foods));
    if (!query.exec()) {
        qDebug() << "添加餐食记录失败：" << query.lastError().text();
        db.rollback();
        return false;
    }
    return db.commit();
}

bool DatabaseManager::updateDietAnalysis(const QDate& date, const QJsonObject& analysis, const QDateTime& analyzedAt)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || !hasDietRecord(date)) return false;

    QSqlQuery query(db);
    query.prepare("UPDATE diet_records SET analysis = :analysis, analyzed_at = :analyzed_at WHERE date = :date");
    query.bindValue(":analysis", objectToJson(analysis));
    query.bindValue(":analyzed_at", dateTimeValue(analyzedAt));
    query.bindValue(":date", date.toString(DATE_FORMAT));

    if (!query.exec()) {
        qDebug() << "更新饮食分析失败：" << query.lastError().text();
        return false;
    }
    return true;
}

// ==================== 胎动记录 ====================

FetalMovementRecord DatabaseManager::fetalMovementFromQuery(const QSqlQuery& query)
{
    FetalMovementRecord record;
    record.id = query.value(0).toString();
    record.date = toDate(query.value(1));
    record.startTime = toDateTime(query.value(2));
    record.endTime = toDateTime(query.value(3));
    record.count = query.value(4).toInt();
    record.notes = query.value(5).toString();
    return record;
}

bool DatabaseManager::addFetalMovement(const FetalMovementRecord& record)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || record.id.isEmpty()) return false;

    QSqlQuery query(db);
    query.prepare(R"(
        INSERT INTO fetal_movements (id, date, start_time, end_time, count, notes)
        VALUES (:id, :date, :start_time, :end_time, :count, :notes)
    )");
    query.bindValue(":id", record.id);
    query.bindValue(":date", dateValue(record.date));
    query.bindValue(":start_time", dateTimeValue(record.startTime));
    query.bindValue(":end_time", dateTimeValue(record.endTime));
    query.bindValue(":count", record.count);
    query.bindValue(":notes", record.notes);

    if (!query.exec()) {
        qDebug() << "添加胎动记录失败：" << query.lastError().text();
        return false;
    }
    return true;
}

bool DatabaseManager::updateFetalMovement(const FetalMovementRecord& record)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || record.id.isEmpty()) return false;

    QSqlQuery query(db);
    query.prepare(R"(
        UPDATE fetal_movements
        SET end_time = :end_time, count = :count, notes = :notes
        WHERE id = :id
    )");
    query.bindValue(":end_time", dateTimeValue(record.endTime));
    query.bindValue(":count", record.count);
    query.bindValue(":notes", record.notes);
    query.bindValue(":id", record.id);

    if (!query.exec()) {
        qDebug() << "更新胎动记录失败：" << query.lastError().text();
        return false;
    }
    return query.numRowsAffected() > 0;
}

QList<FetalMovementRecord> DatabaseManager::getFetalMovements(const QDate& date)
{
    QList<FetalMovementRecord> recordList;
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) return recordList;

    QSqlQuery query(db);
    if (date.isValid()) {
        query.prepare("SELECT id, date, start_time, end_time, count, notes FROM fetal_movements "
                      "WHERE date = :date ORDER BY start_time ASC");
        query.bindValue(":date", date.toString(DATE_FORMAT));
    } else {
        query.prepare("SELECT id, date, start_time, end_time, count, notes FROM fetal_movements "
                      "ORDER BY start_time ASC");
    }

    if (!query.exec()) {
        qDebug() << "获取胎动记录失败：" << query.lastError().text();
        return recordList;
    }
    while (query.next()) {
        recordList.append(fetalMovementFromQuery(query));
    }
    return recordList;
}

// ==================== AI 内容缓存 ====================

bool DatabaseManager::getCacheEntry(const QString& key, CacheEntry* entry)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || key.isEmpty()) return false;

    QSqlQuery query(db);
    query.prepare("SELECT cache_key, content_type, content, context, created_at FROM ai_cache WHERE cache_key = :key");
    query.bindValue(":key", key);
    if (!query.exec() || !query.next()) {
        return false;
    }

    if (entry) {
        entry->key = query.value(0).toString();
        entry->contentType = query.value(1).toString();
        entry->content = unwrapJsonValue(query.value(2).toString());
        entry->context = objectFromJson(query.value(3).toString());
        entry->createdAt = toDateTime(query.value(4));
    }
    return true;
}

bool DatabaseManager::setCacheEntry(const CacheEntry& entry)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen() || entry.key.isEmpty()) return false;

    QSqlQuery query(db);
    query.prepare(R"(
        INSERT OR REPLACE INTO ai_cache (cache_key, content_type, content, context, created_at)
        VALUES (:key, :type, :content, :context, :created_at)
    )");
    query.bindValue(":key", entry.key);
    query.bindValue(":type", entry.contentType);
    query.bindValue(":content", wrapJsonValue(entry.content));
    query.bindValue(":context", objectToJson(entry.context));
    query.bindValue(":created_at", dateTimeValue(entry.createdAt.isValid() ? entry.createdAt : QDateTime::currentDateTime()));

    if (!query.exec()) {
        qDebug() << "保存缓存失败：" << query.lastError().text();
        return false;
    }
    return true;
}

bool DatabaseManager::removeCacheEntry(const QString& key)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare("DELETE FROM ai_cache WHERE cache_key = :key");
    query.bindValue(":key", key);
    if (!query.exec()) {
        qDebug() << "删除缓存失败：" << query.lastError().text();
        return false;
    }
    return true;
}

bool DatabaseManager::clearCache(const QString& contentType)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    if (contentType.isEmpty()) {
        query.prepare("DELETE FROM ai_cache");
    } else {
        query.prepare("DELETE FROM ai_cache WHERE content_type = :type");
        query.bindValue(":type", contentType);
    }
    if (!query.exec()) {
        qDebug() << "清除缓存失败：" << query.lastError().text();
        return false;
    }
    return true;
}

QList<CacheEntry> DatabaseManager::getCacheEntries()
{
    QList<CacheEntry> entries;
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) return entries;

    QSqlQuery query(db);
    if (!query.exec("SELECT cache_key, content_type, content, context, created_at FROM ai_cache")) {
        qDebug() << "获取缓存失败：" << query.lastError().text();
        return entries;
    }
    while (query.next()) {
        CacheEntry entry;
        entry.key = query.value(0).toString();
        entry.contentType = query.value(1).toString();
        entry.content = unwrapJsonValue(query.value(2).toString());
        entry.context = objectFromJson(query.value(3).toString());
        entry.createdAt = toDateTime(query.value(4));
        entries.append(entry);
    }
    return entries;
}

// ==================== 提醒历史 ====================

bool DatabaseManager::addReminderHistory(const ReminderHistoryEntry& entry)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) return false;

    QSqlQuery query(db);
    query.prepare(R"(
        INSERT INTO reminder_history (reminder_id, job_id, type, title, action, priority, occurred_at)
        VALUES (:reminder_id, :job_id, :type, :title, :action, :priority, :occurred_at)
    )");
    query.bindValue(":reminder_id", entry.reminderId);
    query.bindValue(":job_id", entry.jobId);
    query.bindValue(":type", entry.type);
    query.bindValue(":title", entry.title);
    query.bindValue(":action", entry.action);
    query.bindValue(":priority", entry.priority);
    query.bindValue(":occurred_at", dateTimeValue(entry.occurredAt.isValid() ? entry.occurredAt : QDateTime::currentDateTime()));

    if (!query.exec()) {
        qDebug() << "记录提醒历史失败：" << query.lastError().text();
        return false;
    }
    return true;
}

QList<ReminderHistoryEntry> DatabaseManager::getReminderHistory(int limit)
{
    QList<ReminderHistoryEntry> entries;
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) return entries;

    QSqlQuery query(db);
    query.prepare(R"(
        SELECT id, reminder_id, job_id, type, title, action, priority, occurred_at
        FROM reminder_history
        ORDER BY id DESC
        LIMIT :limit
    )");
    query.bindValue(":limit", limit);
    if (!query.exec()) {
        qDebug() << "获取提醒历史失败：" << query.lastError().text();
        return entries;
    }
    while (query.next()) {
        ReminderHistoryEntry entry;
        entry.id = query.value(0).toInt();
        entry.reminderId = query.value(1).toString();
        entry.jobId = query.value(2).toString();
        entry.type = query.value(3).toString();
        entry.title = query.value(4).toString();
        entry.action = query.value(5).toString();
        entry.priority = query.value(6).toInt();
        entry.occurredAt = toDateTime(query.value(7));
        entries.append(entry);
    }
    return entries;
}

int DatabaseManager::getReminderHistoryCount(const QString& action, const QDate& date)
{
    QSqlDatabase db = getThreadSafeDatabase();
    if (!db.isOpen()) return 0;

    QSqlQuery query(db);
    query.prepare("SELECT COUNT(*) FROM reminder_history WHERE action = :action AND occurred_at LIKE :day");
    query.bindValue(":action", action);
    query.bindValue(":day", date.toString(DATE_FORMAT) + "%");
    if (query.exec() && query.next()) {
        return query.value(0).toInt();
    }
    return 0;
}

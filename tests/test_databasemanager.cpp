#include "testutils.h"
#include "helpers.h"

namespace {

Event makeEvent(const QString& id, const QString& title)
{
    Event event;
    event.id = id;
    event.title = title;
    event.remindTime = QDateTime(QDate(2030, 5, 1), QTime(9, 30));
    event.repeatType = RepeatType::Weekly;
    return event;
}

WaterIntakeRecord makeWater(const QString& id, const QDateTime& time, int amount)
{
    WaterIntakeRecord record;
    record.id = id;
    record.time = time;
    record.amount = amount;
    return record;
}

} // namespace

using DatabaseManagerTest = TempDataTest;

TEST_F(DatabaseManagerTest, EventCrud)
{
    DatabaseManager& db = DatabaseManager::instance();

    Event event = makeEvent("e1", "产检");
    event.description = "带上产检本";
    ASSERT_TRUE(db.addEvent(event));

    Event loaded = db.getEvent("e1");
    ASSERT_TRUE(loaded.isValid());
    EXPECT_EQ(loaded.title, "产检");
    EXPECT_EQ(loaded.description, "带上产检本");
    EXPECT_EQ(loaded.repeatType, RepeatType::Weekly);
    EXPECT_EQ(loaded.remindTime, event.remindTime);
    EXPECT_FALSE(loaded.isCountdown);

    loaded.title = "第二次产检";
    loaded.enabled = false;
    EXPECT_TRUE(db.updateEvent(loaded));
    EXPECT_EQ(db.getEvent("e1").title, "第二次产检");
    EXPECT_FALSE(db.getEvent("e1").enabled);

    EXPECT_TRUE(db.deleteEvent("e1"));
    EXPECT_FALSE(db.getEvent("e1").isValid());
    EXPECT_TRUE(db.getEvents().isEmpty());
}

TEST_F(DatabaseManagerTest, EventWithoutIdIsRejected)
{
    EXPECT_FALSE(DatabaseManager::instance().addEvent(makeEvent(QString(), "无编号")));
}

TEST_F(DatabaseManagerTest, UpdateMissingEventFails)
{
    EXPECT_FALSE(DatabaseManager::instance().updateEvent(makeEvent("missing", "不存在")));
}

TEST_F(DatabaseManagerTest, EventsOrderedByCreation)
{
    DatabaseManager& db = DatabaseManager::instance();
    Event later = makeEvent("b", "后建");
    later.createdAt = QDateTime(QDate(2024, 3, 2), QTime(8, 0));
    Event earlier = makeEvent("a", "先建");
    earlier.createdAt = QDateTime(QDate(2024, 3, 1), QTime(8, 0));
    ASSERT_TRUE(db.addEvent(later));
    ASSERT_TRUE(db.addEvent(earlier));

    QList<Event> events = db.getEvents();
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].id, "a");
    EXPECT_EQ(events[1].id, "b");
}

TEST_F(DatabaseManagerTest, CountdownEventsSortedAndFiltered)
{
    DatabaseManager& db = DatabaseManager::instance();

    Event birth = makeEvent("c1", "预产期");
    birth.isCountdown = true;
    birth.remindTime = QDateTime();
    birth.targetDate = QDate(2030, 10, 1);
    Event party = makeEvent("c2", "生日");
    party.isCountdown = true;
    party.remindTime = QDateTime();
    party.targetDate = QDate(2030, 6, 1);
    Event disabled = makeEvent("c3", "已停用");
    disabled.isCountdown = true;
    disabled.targetDate = QDate(2030, 1, 1);
    disabled.enabled = false;
    Event normal = makeEvent("n1", "普通提醒");

    ASSERT_TRUE(db.addEvent(birth));
    ASSERT_TRUE(db.addEvent(party));
    ASSERT_TRUE(db.addEvent(disabled));
    ASSERT_TRUE(db.addEvent(normal));

    QList<Event> countdowns = db.getCountdownEvents();
    ASSERT_EQ(countdowns.size(), 2);
    EXPECT_EQ(countdowns[0].id, "c2");
    EXPECT_EQ(countdowns[1].id, "c1");
    EXPECT_EQ(countdowns[1].targetDate, QDate(2030, 10, 1));
    EXPECT_FALSE(countdowns[0].remindTime.isValid());
}

TEST_F(DatabaseManagerTest, MedicationRoundTrip)
{
    DatabaseManager& db = DatabaseManager::instance();

    Medication medication;
    medication.id = "m1";
    medication.name = "叶酸";
    medication.dosage = "1 片";
    medication.times = QStringList{"09:00", "21:00"};
    medication.cycle = RepeatType::Workdays;
    medication.startDate = QDate(2024, 1, 1);
    medication.durationDays = 90;
    ASSERT_TRUE(db.addMedication(medication));

    QList<Medication> medications = db.getMedications();
    ASSERT_EQ(medications.size(), 1);
    EXPECT_EQ(medications[0].name, "叶酸");
    EXPECT_EQ(medications[0].times, medication.times);
    EXPECT_EQ(medications[0].cycle, RepeatType::Workdays);
    EXPECT_EQ(medications[0].startDate, QDate(2024, 1, 1));
    EXPECT_EQ(medications[0].durationDays, 90);

    EXPECT_TRUE(db.deleteMedication("m1"));
    EXPECT_TRUE(db.getMedications().isEmpty());
}

TEST_F(DatabaseManagerTest, WaterRecordsByDay)
{
    DatabaseManager& db = DatabaseManager::instance();
    const QDate day(2024, 6, 10);

    ASSERT_TRUE(db.addWaterRecord(makeWater("w1", QDateTime(day, QTime(9, 0)), 250)));
    ASSERT_TRUE(db.addWaterRecord(makeWater("w2", QDateTime(day, QTime(14, 30)), 300)));
    ASSERT_TRUE(db.addWaterRecord(makeWater("w3", QDateTime(day.addDays(1), QTime(8, 0)), 200)));

    QList<WaterIntakeRecord> records = db.getWaterRecords(day);
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0].id, "w1");
    EXPECT_EQ(records[1].amount, 300);
    EXPECT_EQ(db.getWaterTotal(day), 550);
    EXPECT_EQ(db.getWaterTotal(day.addDays(1)), 200);

    EXPECT_TRUE(db.deleteWaterRecord("w1"));
    EXPECT_EQ(db.getWaterTotal(day), 300);
}

TEST_F(DatabaseManagerTest, InvalidWaterRecordRejected)
{
    DatabaseManager& db = DatabaseManager::instance();
    const QDateTime now = QDateTime::currentDateTime();
    EXPECT_FALSE(db.addWaterRecord(makeWater("w0", now, 0)));
    EXPECT_FALSE(db.addWaterRecord(makeWater("w-", now, -100)));
    EXPECT_FALSE(db.addWaterRecord(makeWater(QString(), now, 200)));
    EXPECT_EQ(db.getWaterTotal(now.date()), 0);
}

TEST_F(DatabaseManagerTest, DailyTotalsFillMissingDays)
{
    DatabaseManager& db = DatabaseManager::instance();
    const QDate from(2024, 6, 1);
    ASSERT_TRUE(db.addWaterRecord(makeWater("a", QDateTime(from, QTime(10, 0)), 200)));
    ASSERT_TRUE(db.addWaterRecord(makeWater("b", QDateTime(from, QTime(23, 59)), 300)));
    ASSERT_TRUE(db.addWaterRecord(makeWater("c", QDateTime(from.addDays(2), QTime(7, 0)), 150)));
    ASSERT_TRUE(db.addWaterRecord(makeWater("d", QDateTime(from.addDays(3), QTime(7, 0)), 999)));

    QMap<QDate, int> totals = db.getDailyWaterTotals(from, from.addDays(2));
    ASSERT_EQ(totals.size(), 3);
    EXPECT_EQ(totals.value(from), 500);
    EXPECT_EQ(totals.value(from.addDays(1)), 0);
    EXPECT_EQ(totals.value(from.addDays(2)), 150);

    EXPECT_TRUE(db.getDailyWaterTotals(from.addDays(2), from).isEmpty());
}

TEST_F(DatabaseManagerTest, MealsAndAnalysis)
{
    DatabaseManager& db = DatabaseManager::instance();
    const QDate day(2024, 6, 10);

    EXPECT_FALSE(db.hasDietRecord(day));
    EXPECT_FALSE(db.updateDietAnalysis(day, QJsonObject{{"score", 80}}));

    MealRecord empty;
    empty.type = "breakfast";
    EXPECT_FALSE(db.addMeal(day, empty));
    EXPECT_FALSE(db.hasDietRecord(day));

    MealRecord breakfast;
    breakfast.type = "breakfast";
    breakfast.time = "08:00";
    breakfast.foods = QStringList{"鸡蛋", "牛奶"};
    MealRecord lunch;
    lunch.type = "lunch";
    lunch.time = "12:10";
    lunch.foods = QStringList{"米饭", "鱼类", "蔬菜"};
    ASSERT_TRUE(db.addMeal(day, breakfast));
    ASSERT_TRUE(db.addMeal(day, lunch));
    EXPECT_TRUE(db.hasDietRecord(day));

    DietRecord record = db.getDietRecord(day);
    ASSERT_EQ(record.meals.size(), 2);
    EXPECT_EQ(record.meals[0].type, "breakfast");
    EXPECT_EQ(record.meals[0].foods, breakfast.foods);
    EXPECT_EQ(record.meals[1].foods.size(), 3);
    EXPECT_FALSE(record.hasAnalysis());

    const QDateTime analyzedAt(day, QTime(20, 0));
    ASSERT_TRUE(db.updateDietAnalysis(day, QJsonObject{{"score", 82}}, analyzedAt));
    record = db.getDietRecord(day);
    ASSERT_TRUE(record.hasAnalysis());
    EXPECT_EQ(record.analysis.value("score").toInt(), 82);
    EXPECT_EQ(record.analyzedAt, analyzedAt);
}

TEST_F(DatabaseManagerTest, FetalMovementSessions)
{
    DatabaseManager& db = DatabaseManager::instance();
    const QDate day(2024, 6, 10);

    FetalMovementRecord record;
    record.id = "f1";
    record.date = day;
    record.startTime = QDateTime(day, QTime(9, 0));
    ASSERT_TRUE(db.addFetalMovement(record));

    record.count = 12;
    record.endTime = QDateTime(day, QTime(10, 0));
    ASSERT_TRUE(db.updateFetalMovement(record));

    FetalMovementRecord other;
    other.id = "f2";
    other.date = day.addDays(1);
    other.startTime = QDateTime(other.date, QTime(20, 0));
    ASSERT_TRUE(db.addFetalMovement(other));

    QList<FetalMovementRecord> today = db.getFetalMovements(day);
    ASSERT_EQ(today.size(), 1);
    EXPECT_EQ(today[0].count, 12);
    EXPECT_EQ(today[0].endTime, record.endTime);
    EXPECT_EQ(db.getFetalMovements().size(), 2);
}

TEST_F(DatabaseManagerTest, CacheEntries)
{
    DatabaseManager& db = DatabaseManager::instance();

    CacheEntry entry;
    entry.key = "daily_tips_2024-06-10";
    entry.contentType = "daily_tips";
    entry.content = QJsonValue("多喝温水");
    entry.context = QJsonObject{{"week", 20}};
    ASSERT_TRUE(db.setCacheEntry(entry));

    CacheEntry loaded;
    ASSERT_TRUE(db.getCacheEntry(entry.key, &loaded));
    EXPECT_EQ(loaded.contentType, "daily_tips");
    EXPECT_EQ(loaded.content.toString(), "多喝温水");
    EXPECT_EQ(loaded.context.value("week").toInt(), 20);
    EXPECT_TRUE(loaded.createdAt.isValid());

    entry.content = QJsonValue("少喝冰水");
    ASSERT_TRUE(db.setCacheEntry(entry));
    ASSERT_TRUE(db.getCacheEntry(entry.key, &loaded));
    EXPECT_EQ(loaded.content.toString(), "少喝冰水");

    CacheEntry nutrition;
    nutrition.key = "nutrition_x";
    nutrition.contentType = "nutrition";
    nutrition.content = QJsonValue(QJsonObject{{"text", "吃点坚果"}});
    ASSERT_TRUE(db.setCacheEntry(nutrition));
    EXPECT_EQ(db.getCacheEntries().size(), 2);

    ASSERT_TRUE(db.clearCache("nutrition"));
    EXPECT_FALSE(db.getCacheEntry("nutrition_x", &loaded));
    EXPECT_EQ(db.getCacheEntries().size(), 1);

    ASSERT_TRUE(db.removeCacheEntry(entry.key));
    EXPECT_FALSE(db.getCacheEntry(entry.key, &loaded));
}

TEST_F(DatabaseManagerTest, ReminderHistoryCounts)
{
    DatabaseManager& db = DatabaseManager::instance();
    const QDate day(2024, 6, 10);

    const QStringList actions{"shown", "shown", "snoozed", "dismissed"};
    for (int i = 0; i < actions.size(); ++i) {
        ReminderHistoryEntry entry;
        entry.reminderId = QString("r%1").arg(i);
        entry.jobId = "water_reminder";
        entry.type = "water";
        entry.title = "喝水时间到";
        entry.action = actions[i];
        entry.occurredAt = QDateTime(day, QTime(9, i));
        ASSERT_TRUE(db.addReminderHistory(entry));
    }
    ReminderHistoryEntry yesterday;
    yesterday.reminderId = "old";
    yesterday.type = "water";
    yesterday.action = "shown";
    yesterday.occurredAt = QDateTime(day.addDays(-1), QTime(9, 0));
    ASSERT_TRUE(db.addReminderHistory(yesterday));

    EXPECT_EQ(db.getReminderHistoryCount("shown", day), 2);
    EXPECT_EQ(db.getReminderHistoryCount("snoozed", day), 1);
    EXPECT_EQ(db.getReminderHistoryCount("escalated", day), 0);
    EXPECT_EQ(db.getReminderHistory().size(), 5);
    EXPECT_EQ(db.getReminderHistory(2).size(), 2);
}

#include <gtest/gtest.h>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>
#include "configmanager.h"
#include "helpers.h"
#include "models.h"

class ConfigManagerTest : public ::testing::Test
{
protected:
    QString configPath() const { return QDir(m_dir.path()).filePath("config.json"); }

    QTemporaryDir m_dir;
};

TEST_F(ConfigManagerTest, MissingFileUsesDefaults)
{
    ConfigManager config(configPath());
    EXPECT_EQ(config.get("water_reminder.interval_minutes").toInt(), 45);
    EXPECT_EQ(config.get("water_reminder.daily_target").toInt(), 1800);
    EXPECT_EQ(config.get("ai_mode").toString(), QString("smart"));
    EXPECT_EQ(config.get("reminder_engine.misfire_grace_seconds").toInt(), 60);
    EXPECT_EQ(config.get("reminder_engine.escalation_minutes.urgent").toInt(), 5);
    EXPECT_FALSE(config.pregnancyConfig().enabled);
}

TEST_F(ConfigManagerTest, CorruptFileFallsBackToDefaults)
{
    QFile file(configPath());
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    ConfigManager config(configPath());
    EXPECT_EQ(config.get("theme").toString(), QString("hello_kitty"));
}

TEST_F(ConfigManagerTest, LoadedValuesMergeOverDefaults)
{
    ASSERT_TRUE(saveJson(configPath(), QJsonObject {
        {"water_reminder", QJsonObject {{"interval_minutes", 30}}},
        {"extra", "kept"}
    }));

    ConfigManager config(configPath());
    EXPECT_EQ(config.get("water_reminder.interval_minutes").toInt(), 30);
    // 同一层级的其他默认键仍然存在
    EXPECT_EQ(config.get("water_reminder.start_time").toString(), QString("09:00"));
    EXPECT_TRUE(config.get("water_reminder.enabled").toBool());
    EXPECT_EQ(config.get("extra").toString(), QString("kept"));
}

TEST_F(ConfigManagerTest, GetReturnsDefaultForMissingOrNull)
{
    ConfigManager config(configPath());
    EXPECT_EQ(config.get("no.such.key", 7).toInt(), 7);
    EXPECT_EQ(config.get("pregnancy.last_period_date", "none").toString(), QString("none"));
    EXPECT_EQ(config.get("water_reminder.interval_minutes.deeper", 3).toInt(), 3);
    EXPECT_EQ(config.get("", 1).toInt(), 1);
}

TEST_F(ConfigManagerTest, SetCreatesIntermediateObjectsAndPersists)
{
    {
        ConfigManager config(configPath());
        ASSERT_TRUE(config.set("a.b.c", 42));
        ASSERT_TRUE(config.set("workplace_reminders.eye_rest.interval_minutes", 25));
        EXPECT_EQ(config.get("a.b.c").toInt(), 42);
    }

    ConfigManager reloaded(configPath());
    EXPECT_EQ(reloaded.get("a.b.c").toInt(), 42);
    EXPECT_EQ(reloaded.get("workplace_reminders.eye_rest.interval_minutes").toInt(), 25);
    EXPECT_TRUE(reloaded.get("workplace_reminders.eye_rest.enabled").toBool());
}

TEST_F(ConfigManagerTest, PregnancyConfigRoundTrip)
{
    ConfigManager config(configPath());
    PregnancyConfig pregnancy;
    pregnancy.enabled = true;
    pregnancy.lastPeriodDate = QDate(2024, 1, 15);
    pregnancy.dailyTipTime = "08:30";
    ASSERT_TRUE(config.setPregnancyConfig(pregnancy));

    EXPECT_EQ(config.get("pregnancy.last_period_date").toString(), QString("2024-01-15"));

    ConfigManager reloaded(configPath());
    const PregnancyConfig loaded = reloaded.pregnancyConfig();
    EXPECT_TRUE(loaded.enabled);
    EXPECT_EQ(loaded.lastPeriodDate, QDate(2024, 1, 15));
    EXPECT_EQ(loaded.dailyTipTime, QString("08:30"));
}

TEST(MedicationTest, ActivePeriod)
{
    Medication medication;
    EXPECT_TRUE(medication.isActiveOn(QDate(2024, 1, 1)));

    medication.startDate = QDate(2024, 1, 1);   // 周一
    medication.durationDays = 7;
    EXPECT_FALSE(medication.isActiveOn(QDate(2023, 12, 31)));
    EXPECT_TRUE(medication.isActiveOn(QDate(2024, 1, 7)));
    EXPECT_FALSE(medication.isActiveOn(QDate(2024, 1, 8)));

    medication.durationDays = 0;
    medication.cycle = RepeatType::Weekly;
    EXPECT_TRUE(medication.isActiveOn(QDate(2024, 1, 8)));
    EXPECT_FALSE(medication.isActiveOn(QDate(2024, 1, 9)));

    medication.cycle = RepeatType::Workdays;
    EXPECT_TRUE(medication.isActiveOn(QDate(2024, 1, 12)));
    EXPECT_FALSE(medication.isActiveOn(QDate(2024, 1, 13)));
}

TEST(ModelsTest, RepeatAndReminderTypeStrings)
{
    EXPECT_EQ(repeatTypeToString(RepeatType::Workdays), QString("workdays"));
    EXPECT_EQ(repeatTypeFromString("monthly"), RepeatType::Monthly);
    EXPECT_EQ(repeatTypeFromString("bogus", RepeatType::Daily), RepeatType::Daily);

    ReminderType type;
    ASSERT_TRUE(reminderTypeFromString("fetal_movement", &type));
    EXPECT_EQ(type, ReminderType::FetalMovement);
    EXPECT_EQ(reminderTypeToString(ReminderType::PregnancyTip), QString("pregnancy_tip"));
    EXPECT_FALSE(reminderTypeFromString("bogus", &type));
}

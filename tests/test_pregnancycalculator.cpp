#include <gtest/gtest.h>
#include "pregnancycalculator.h"

namespace {

PregnancyConfig configWithLmp(const QDate& lmp)
{
    PregnancyConfig config;
    config.enabled = true;
    config.lastPeriodDate = lmp;
    return config;
}

}

TEST(PregnancyCalculatorTest, WeekAndDayFromLastPeriod)
{
    PregnancyCalculator calculator(configWithLmp(QDate(2024, 1, 1)));
    int weeks = 0;
    int days = 0;
    ASSERT_TRUE(calculator.currentWeekDay(&weeks, &days, QDate(2024, 3, 28)));
    EXPECT_EQ(weeks, 12);
    EXPECT_EQ(days, 3);
    EXPECT_EQ(calculator.currentWeek(QDate(2024, 3, 28)), 12);
}

TEST(PregnancyCalculatorTest, WithoutLastPeriodDate)
{
    PregnancyCalculator calculator(PregnancyConfig{});
    EXPECT_EQ(calculator.currentWeek(QDate(2024, 3, 28)), -1);
    EXPECT_FALSE(calculator.dueDate().isValid());
    EXPECT_EQ(calculator.daysUntilDue(QDate(2024, 3, 28)), 0);
    EXPECT_FALSE(calculator.weekInfo(QDate(2024, 3, 28)).isValid());
}

TEST(PregnancyCalculatorTest, FutureLastPeriodCountsAsWeekZero)
{
    PregnancyCalculator calculator(configWithLmp(QDate(2024, 5, 1)));
    EXPECT_EQ(calculator.currentWeek(QDate(2024, 4, 1)), 0);
}

TEST(PregnancyCalculatorTest, DueDateIs280DaysAfterLastPeriod)
{
    PregnancyCalculator calculator(configWithLmp(QDate(2024, 1, 1)));
    EXPECT_EQ(calculator.dueDate(), QDate(2024, 10, 7));
    EXPECT_EQ(calculator.daysUntilDue(QDate(2024, 10, 1)), 6);
}

TEST(PregnancyCalculatorTest, TrimesterBoundaries)
{
    EXPECT_EQ(PregnancyCalculator::trimester(0), 0);
    EXPECT_EQ(PregnancyCalculator::trimester(1), 1);
    EXPECT_EQ(PregnancyCalculator::trimester(13), 1);
    EXPECT_EQ(PregnancyCalculator::trimester(14), 2);
    EXPECT_EQ(PregnancyCalculator::trimester(27), 2);
    EXPECT_EQ(PregnancyCalculator::trimester(28), 3);
    EXPECT_EQ(PregnancyCalculator::trimesterName(2), QString("孕中期"));
    EXPECT_TRUE(PregnancyCalculator::trimesterName(0).isEmpty());
}

TEST(PregnancyCalculatorTest, WeekInfoDisplay)
{
    PregnancyCalculator calculator(configWithLmp(QDate(2024, 1, 1)));
    PregnancyWeekInfo info = calculator.weekInfo(QDate(2024, 3, 28));
    EXPECT_EQ(info.display, QString("12周+3天"));
    EXPECT_EQ(info.trimester, 1);
    EXPECT_EQ(info.trimesterName, QString("孕早期"));

    info = calculator.weekInfo(QDate(2024, 3, 25));
    EXPECT_EQ(info.display, QString("12周"));
}

TEST(PregnancyCalculatorTest, BabyDevelopmentStage)
{
    EXPECT_EQ(PregnancyCalculator::babyDevelopmentStage(6), QString("胚胎期，心脏开始跳动"));
    EXPECT_EQ(PregnancyCalculator::babyDevelopmentStage(42), QString("已过预产期，请注意产检"));
    EXPECT_TRUE(PregnancyCalculator::babyDevelopmentStage(0).isEmpty());
}

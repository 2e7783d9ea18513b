#include "testutils.h"
#include "reminderscheduler.h"
#include <QPair>

namespace {

struct Fired {
    QString id;
    QDateTime scheduled;
};

} // namespace

class ReminderSchedulerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_now = localTime(2024, 6, 10, 9, 0);
        m_scheduler.setTimeZone(testZone());
        m_scheduler.setClock([this]() { return m_now; });

        QObject::connect(&m_scheduler, &ReminderScheduler::jobFired,
                         [this](const QString& id, const QDateTime& scheduled, const QDateTime&) {
                             m_fired.append({id, scheduled});
                         });
        QObject::connect(&m_scheduler, &ReminderScheduler::jobMissed,
                         [this](const QString& id, const QDateTime& scheduled) {
                             m_missed.append({id, scheduled});
                         });
        QObject::connect(&m_scheduler, &ReminderScheduler::clockJumped,
                         [this](qint64 seconds) { m_jumps.append(seconds); });
    }

    // 移动时钟并检查一次
    void tick(const QDateTime& at)
    {
        m_now = at;
        m_scheduler.checkJobs(at);
    }

    QStringList firedIds() const
    {
        QStringList ids;
        for (const Fired& item : m_fired) {
            ids << item.id;
        }
        return ids;
    }

    ReminderScheduler m_scheduler;
    QDateTime m_now;
    QList<Fired> m_fired;
    QList<Fired> m_missed;
    QList<qint64> m_jumps;
};

TEST(ReminderSchedulerParseTest, DayOfWeekSpecs)
{
    quint8 mask = 0;
    ASSERT_TRUE(ReminderScheduler::parseDayOfWeek("mon-fri", &mask));
    EXPECT_EQ(mask, 0x1F);
    ASSERT_TRUE(ReminderScheduler::parseDayOfWeek("0,2,4", &mask));
    EXPECT_EQ(mask, 0x15);
    ASSERT_TRUE(ReminderScheduler::parseDayOfWeek("Sat, sun", &mask));
    EXPECT_EQ(mask, 0x60);
    ASSERT_TRUE(ReminderScheduler::parseDayOfWeek("", &mask));
    EXPECT_EQ(mask, 0x7F);
    ASSERT_TRUE(ReminderScheduler::parseDayOfWeek("*", &mask));
    EXPECT_EQ(mask, 0x7F);

    EXPECT_FALSE(ReminderScheduler::parseDayOfWeek("fri-mon", &mask));
    EXPECT_FALSE(ReminderScheduler::parseDayOfWeek("xyz", &mask));
    EXPECT_FALSE(ReminderScheduler::parseDayOfWeek("7", &mask));
    EXPECT_FALSE(ReminderScheduler::parseDayOfWeek("1-2-3", &mask));
}

TEST_F(ReminderSchedulerTest, IntervalJobFiresEachPeriod)
{
    ASSERT_TRUE(m_scheduler.addIntervalJob("water", 45 * 60));
    EXPECT_EQ(m_scheduler.job("water").nextRun, m_now.addSecs(45 * 60));

    const QDateTime start = m_now;
    tick(start.addSecs(45 * 60 - 1));
    EXPECT_TRUE(m_fired.isEmpty());

    tick(start.addSecs(45 * 60));
    ASSERT_EQ(m_fired.size(), 1);
    EXPECT_EQ(m_fired[0].id, "water");
    EXPECT_EQ(m_fired[0].scheduled, start.addSecs(45 * 60));
    EXPECT_EQ(m_scheduler.job("water").nextRun, start.addSecs(90 * 60));
    EXPECT_TRUE(m_jumps.isEmpty());
}

TEST_F(ReminderSchedulerTest, IntervalJobFromExplicitStart)
{
    ASSERT_TRUE(m_scheduler.addIntervalJob("eye", 20 * 60, localTime(2024, 6, 10, 8, 50)));
    EXPECT_EQ(m_scheduler.job("eye").nextRun, localTime(2024, 6, 10, 9, 10));
    EXPECT_FALSE(m_scheduler.addIntervalJob("bad", 0));
    EXPECT_FALSE(m_scheduler.addIntervalJob(QString(), 60));
}

TEST_F(ReminderSchedulerTest, CronJobSkipsExcludedDays)
{
    // 2024-06-14 是周五
    m_now = localTime(2024, 6, 14, 10, 0);
    ASSERT_TRUE(m_scheduler.addCronJob("stand", 9, 30, "mon-fri"));
    EXPECT_EQ(m_scheduler.job("stand").nextRun, localTime(2024, 6, 17, 9, 30));

    ASSERT_TRUE(m_scheduler.addTimeJob("snack", "15:00"));
    EXPECT_EQ(m_scheduler.job("snack").nextRun, localTime(2024, 6, 14, 15, 0));

    EXPECT_FALSE(m_scheduler.addTimeJob("bad_time", "25:00"));
    EXPECT_FALSE(m_scheduler.addCronJob("bad_days", 9, 0, "someday"));
    EXPECT_FALSE(m_scheduler.jobExists("bad_time"));
}

TEST_F(ReminderSchedulerTest, MonthlyJobClampsToMonthEnd)
{
    m_now = localTime(2024, 2, 1, 8, 0);
    ASSERT_TRUE(m_scheduler.addMonthlyJob("rent", 31, 9, 0));
    EXPECT_EQ(m_scheduler.job("rent").nextRun, localTime(2024, 2, 29, 9, 0));

    tick(localTime(2024, 2, 29, 9, 0, 5));
    EXPECT_EQ(firedIds(), QStringList{"rent"});
    EXPECT_EQ(m_scheduler.job("rent").nextRun, localTime(2024, 3, 31, 9, 0));

    EXPECT_FALSE(m_scheduler.addMonthlyJob("bad", 32, 9, 0));
}

TEST_F(ReminderSchedulerTest, OnceJobFiresLateAndIsRemoved)
{
    EXPECT_FALSE(m_scheduler.addOnceJob("past", m_now.addSecs(-1)));
    EXPECT_FALSE(m_scheduler.addOnceJob("now", m_now));

    const QDateTime runTime = m_now.addSecs(600);
    ASSERT_TRUE(m_scheduler.addOnceJob("checkup", runTime));
    EXPECT_LT(m_scheduler.job("checkup").misfireGraceSecs, 0);

    // 晚了一个小时仍然补发
    tick(runTime.addSecs(3600));
    ASSERT_EQ(m_fired.size(), 1);
    EXPECT_EQ(m_fired[0].scheduled, runTime);
    EXPECT_TRUE(m_missed.isEmpty());
    EXPECT_FALSE(m_scheduler.jobExists("checkup"));
}

TEST_F(ReminderSchedulerTest, WakeFromSleepCoalescesIntervalRuns)
{
    const QDateTime start = m_now;
    ASSERT_TRUE(m_scheduler.addIntervalJob("posture", 60));
    tick(start);

    tick(start.addSecs(1000));
    ASSERT_EQ(m_jumps.size(), 1);
    EXPECT_EQ(m_jumps[0], 1000);

    // 只补发最近的一次
    ASSERT_EQ(m_fired.size(), 1);
    EXPECT_EQ(m_fired[0].scheduled, start.addSecs(960));
    EXPECT_EQ(m_scheduler.job("posture").nextRun, start.addSecs(1020));
}

TEST_F(ReminderSchedulerTest, RunsBeyondGraceAreMissed)
{
    m_now = localTime(2024, 6, 10, 8, 59);
    ASSERT_TRUE(m_scheduler.addCronJob("nap", 9, 0));
    tick(m_now);

    tick(localTime(2024, 6, 10, 11, 0));
    EXPECT_TRUE(m_fired.isEmpty());
    ASSERT_EQ(m_missed.size(), 1);
    EXPECT_EQ(m_missed[0].id, "nap");
    EXPECT_EQ(m_missed[0].scheduled, localTime(2024, 6, 10, 9, 0));
    EXPECT_EQ(m_scheduler.job("nap").nextRun, localTime(2024, 6, 11, 9, 0));
}

TEST_F(ReminderSchedulerTest, GraceIsConfigurable)
{
    m_scheduler.setMisfireGraceSeconds(300);
    m_now = localTime(2024, 6, 10, 8, 59);
    ASSERT_TRUE(m_scheduler.addCronJob("snack", 9, 0));
    EXPECT_EQ(m_scheduler.job("snack").misfireGraceSecs, 300);

    tick(localTime(2024, 6, 10, 9, 4));
    EXPECT_EQ(firedIds(), QStringList{"snack"});
}

TEST_F(ReminderSchedulerTest, PausedJobDoesNotCatchUp)
{
    const QDateTime start = m_now;
    ASSERT_TRUE(m_scheduler.addIntervalJob("eye", 60));
    ASSERT_TRUE(m_scheduler.pauseJob("eye"));
    EXPECT_TRUE(m_scheduler.job("eye").paused);

    tick(start.addSecs(120));
    EXPECT_TRUE(m_fired.isEmpty());

    m_now = start.addSecs(130);
    ASSERT_TRUE(m_scheduler.resumeJob("eye"));
    EXPECT_EQ(m_scheduler.job("eye").nextRun, start.addSecs(190));
    tick(start.addSecs(135));
    EXPECT_TRUE(m_fired.isEmpty());
    tick(start.addSecs(190));
    EXPECT_EQ(firedIds(), QStringList{"eye"});

    EXPECT_FALSE(m_scheduler.pauseJob("missing"));
    EXPECT_FALSE(m_scheduler.resumeJob("missing"));
}

TEST_F(ReminderSchedulerTest, ClockSetBackReschedules)
{
    const QDateTime start = localTime(2024, 6, 10, 10, 0);
    m_now = start;
    ASSERT_TRUE(m_scheduler.addIntervalJob("water", 3600));
    ASSERT_TRUE(m_scheduler.addCronJob("tips", 9, 0));
    EXPECT_EQ(m_scheduler.job("tips").nextRun, localTime(2024, 6, 11, 9, 0));
    tick(start);

    tick(localTime(2024, 6, 10, 8, 0));
    ASSERT_EQ(m_jumps.size(), 1);
    EXPECT_EQ(m_jumps[0], -7200);
    EXPECT_EQ(m_scheduler.job("water").nextRun, localTime(2024, 6, 10, 9, 0));
    EXPECT_EQ(m_scheduler.job("tips").nextRun, localTime(2024, 6, 10, 9, 0));
    EXPECT_TRUE(m_fired.isEmpty());
}

TEST_F(ReminderSchedulerTest, TimezoneChangeKeepsLocalTime)
{
    QList<QPair<int, int>> changes;
    QObject::connect(&m_scheduler, &ReminderScheduler::timezoneChanged,
                     [&changes](int oldOffset, int newOffset) { changes.append(qMakePair(oldOffset, newOffset)); });

    m_now = localTime(2024, 6, 10, 7, 0);
    ASSERT_TRUE(m_scheduler.addCronJob("tips", 9, 0));
    tick(m_now);

    const QTimeZone tokyo(9 * 3600);
    m_scheduler.setTimeZone(tokyo);
    tick(m_now.addSecs(1));

    ASSERT_EQ(changes.size(), 1);
    EXPECT_EQ(changes[0].first, 8 * 3600);
    EXPECT_EQ(changes[0].second, 9 * 3600);
    EXPECT_EQ(m_scheduler.job("tips").nextRun, QDateTime(QDate(2024, 6, 10), QTime(9, 0), tokyo));
    EXPECT_TRUE(m_fired.isEmpty());
    EXPECT_TRUE(m_jumps.isEmpty());
}

TEST_F(ReminderSchedulerTest, RemovesJobsByPrefix)
{
    ASSERT_TRUE(m_scheduler.addIntervalJob("water_reminder", 60));
    ASSERT_TRUE(m_scheduler.addTimeJob("medication_a_0", "09:00"));
    ASSERT_TRUE(m_scheduler.addTimeJob("medication_a_1", "21:00"));

    EXPECT_EQ(m_scheduler.removeJobsWithPrefix("medication_"), 2);
    EXPECT_EQ(m_scheduler.jobIds(), QStringList{"water_reminder"});
    EXPECT_TRUE(m_scheduler.removeJob("water_reminder"));
    EXPECT_FALSE(m_scheduler.removeJob("water_reminder"));

    ASSERT_TRUE(m_scheduler.addIntervalJob("a", 60));
    m_scheduler.clearAllJobs();
    EXPECT_TRUE(m_scheduler.jobs().isEmpty());
}

TEST_F(ReminderSchedulerTest, ReplacingJobKeepsSingleEntry)
{
    ASSERT_TRUE(m_scheduler.addIntervalJob("water", 60));
    ASSERT_TRUE(m_scheduler.addIntervalJob("water", 120));
    EXPECT_EQ(m_scheduler.jobs().size(), 1);
    EXPECT_EQ(m_scheduler.job("water").intervalSecs, 120);
}

#include "reminderscheduler.h"
#include "helpers.h"
#include <QDebug>
#include <QMutexLocker>

namespace {

const int DEFAULT_CHECK_INTERVAL_MS = 1000;
const int MIN_JUMP_TOLERANCE_MS = 5000;

int weekdayIndex(const QString& token)
{
    static const QStringList names {"mon", "tue", "wed", "thu", "fri", "sat", "sun"};
    int index = names.indexOf(token.toLower());
    if (index >= 0) {
        return index;
    }
    bool ok = false;
    int number = token.toInt(&ok);
    if (ok && number >= 0 && number <= 6) {
        return number;
    }
    return -1;
}

}

ReminderScheduler::ReminderScheduler(QObject *parent)
    : QObject(parent)
    , m_checkTimer(new QTimer(this))
    , m_checkIntervalMs(DEFAULT_CHECK_INTERVAL_MS)
    , m_defaultGraceSecs(60)
    , m_lastOffset(0)
{
    m_checkTimer->setInterval(m_checkIntervalMs);
    connect(m_checkTimer, &QTimer::timeout, this, &ReminderScheduler::onTimeout);
}

ReminderScheduler::~ReminderScheduler()
{
    stop();
}

void ReminderScheduler::setCheckInterval(int intervalMs)
{
    if (intervalMs <= 0) {
        return;
    }
    {
        QMutexLocker locker(&m_mutex);
        m_checkIntervalMs = intervalMs;
    }
    // 定时器属于调度线程
    QMetaObject::invokeMethod(m_checkTimer, [this, intervalMs]() {
        m_checkTimer->setInterval(intervalMs);
    });
    qDebug() << "调度检查间隔已更新为：" << intervalMs << "毫秒";
}

int ReminderScheduler::checkInterval() const
{
    QMutexLocker locker(&m_mutex);
    return m_checkIntervalMs;
}

void ReminderScheduler::setMisfireGraceSeconds(int seconds)
{
    QMutexLocker locker(&m_mutex);
    m_defaultGraceSecs = seconds;
}

void ReminderScheduler::setTimeZone(const QTimeZone& zone)
{
    QMutexLocker locker(&m_mutex);
    m_zone = zone;
}

QTimeZone ReminderScheduler::timeZone() const
{
    QMutexLocker locker(&m_mutex);
    return currentZone();
}

void ReminderScheduler::setClock(Clock clock)
{
    QMutexLocker locker(&m_mutex);
    m_clock = clock;
}

QDateTime ReminderScheduler::now() const
{
    QMutexLocker locker(&m_mutex);
    return currentTime();
}

QDateTime ReminderScheduler::currentTime() const
{
    return m_clock ? m_clock().toUTC() : QDateTime::currentDateTimeUtc();
}

QTimeZone ReminderScheduler::currentZone() const
{
    return m_zone.isValid() ? m_zone : QTimeZone::systemTimeZone();
}

bool ReminderScheduler::parseDayOfWeek(const QString& spec, quint8* mask)
{
    const QString trimmed = spec.trimmed();
    if (trimmed.isEmpty() || trimmed == "*") {
        *mask = 0x7F;
        return true;
    }

    quint8 result = 0;
    for (const QString& rawItem : trimmed.split(',')) {
        const QString item = rawItem.trimmed();
        const QStringList bounds = item.split('-');
        if (bounds.size() == 1) {
            int day = weekdayIndex(bounds.at(0).trimmed());
            if (day < 0) {
                return false;
            }
            result |= static_cast<quint8>(1 << day);
        } else if (bounds.size() == 2) {
            int first = weekdayIndex(bounds.at(0).trimmed());
            int last = weekdayIndex(bounds.at(1).trimmed());
            if (first < 0 || last < 0 || first > last) {
                return false;
            }
            for (int day = first; day <= last; ++day) {
                result |= static_cast<quint8>(1 << day);
            }
        } else {
            return false;
        }
    }
    *mask = result;
    return true;
}

QDateTime ReminderScheduler::computeNextRun(const ReminderJob& job, const QDateTime& afterUtc,
                                            const QTimeZone& zone) const
{
    switch (job.kind) {
    case ReminderJob::Kind::Interval: {
        QDateTime next = job.nextRun.isValid() ? job.nextRun : afterUtc.addSecs(job.intervalSecs);
        if (next <= afterUtc) {
            // 多个周期只补一次，直接跳到 after 之后的第一个周期
            qint64 periods = next.secsTo(afterUtc) / job.intervalSecs + 1;
            next = next.addSecs(periods * job.intervalSecs);
        }
        return next;
    }
    case ReminderJob::Kind::Daily: {
        const QDate localDate = afterUtc.toTimeZone(zone).date();
        for (int i = 0; i <= 7; ++i) {
            const QDate date = localDate.addDays(i);
            if (!(job.weekdayMask & (1 << (date.dayOfWeek() - 1)))) {
                continue;
            }
            const QDateTime candidate = QDateTime(date, job.timeOfDay, zone).toUTC();
            if (candidate > afterUtc) {
                return candidate;
            }
        }
        break;
    }
    case ReminderJob::Kind::Monthly: {
        const QDate localDate = afterUtc.toTimeZone(zone).date();
        const QDate firstOfMonth(localDate.year(), localDate.month(), 1);
        for (int i = 0; i <= 12; ++i) {
            const QDate month = firstOfMonth.addMonths(i);
            const int day = qMin(job.dayOfMonth, month.daysInMonth());
            const QDateTime candidate = QDateTime(QDate(month.year(), month.month(), day),
                                                  job.timeOfDay, zone).toUTC();
            if (candidate > afterUtc) {
                return candidate;
            }
        }
        break;
    }
    case ReminderJob::Kind::Once:
        return job.runTime.toUTC();
    }
    return QDateTime();
}

QDateTime ReminderScheduler::latestDueRun(const ReminderJob& job, const QDateTime& nowUtc,
                                         const QTimeZone& zone) const
{
    if (job.kind == ReminderJob::Kind::Once) {
        return job.nextRun;
    }
    if (job.kind == ReminderJob::Kind::Interval) {
        const qint64 periods = job.nextRun.secsTo(nowUtc) / job.intervalSecs;
        return job.nextRun.addSecs(periods * job.intervalSecs);
    }

    QDateTime latest = job.nextRun;
    QDateTime next = computeNextRun(job, latest, zone);
    while (next.isValid() && next <= nowUtc) {
        latest = next;
        next = computeNextRun(job, latest, zone);
    }
    return latest;
}

void ReminderScheduler::insertJob(ReminderJob job)
{
    QMutexLocker locker(&m_mutex);
    const QDateTime now = currentTime();
    job.misfireGraceSecs = job.kind == ReminderJob::Kind::Once ? -1 : m_defaultGraceSecs;
    if (!job.nextRun.isValid()) {
        job.nextRun = computeNextRun(job, now, currentZone());
    }
    if (m_jobs.contains(job.id)) {
        qDebug() << "替换已存在的任务：" << job.id;
    }
    m_jobs.insert(job.id, job);
    qInfo() << "已注册任务" << job.id << "下次运行：" << job.nextRun.toLocalTime().toString(Qt::ISODate);
}

bool ReminderScheduler::addIntervalJob(const QString& id, qint64 intervalSecs, const QDateTime& start)
{
    if (id.isEmpty() || intervalSecs <= 0) {
        qWarning() << "间隔任务参数无效：" << id << intervalSecs;
        return false;
    }

    ReminderJob job;
    job.id = id;
    job.kind = ReminderJob::Kind::Interval;
    job.intervalSecs = intervalSecs;
    QDateTime base = start.isValid() ? start.toUTC() : QDateTime();
    if (!base.isValid()) {
        QMutexLocker locker(&m_mutex);
        base = currentTime();
    }
    job.nextRun = base.addSecs(intervalSecs);
    insertJob(job);
    return true;
}

bool ReminderScheduler::addCronJob(const QString& id, int hour, int minute, const QString& dayOfWeek)
{
    quint8 mask = 0;
    if (id.isEmpty() || !QTime::isValid(hour, minute, 0) || !parseDayOfWeek(dayOfWeek, &mask) || mask == 0) {
        qWarning() << "定时任务参数无效：" << id << hour << minute << dayOfWeek;
        return false;
    }

    ReminderJob job;
    job.id = id;
    job.kind = ReminderJob::Kind::Daily;
    job.timeOfDay = QTime(hour, minute);
    job.weekdayMask = mask;
    insertJob(job);
    return true;
}

bool ReminderScheduler::addTimeJob(const QString& id, const QString& time, const QString& dayOfWeek)
{
    const QTime parsed = parseClockTime(time);
    if (!parsed.isValid()) {
        qWarning() << "时间格式错误：" << time << "（任务" << id << "）";
        return false;
    }
    return addCronJob(id, parsed.hour(), parsed.minute(), dayOfWeek);
}

bool ReminderScheduler::addMonthlyJob(const QString& id, int dayOfMonth, int hour, int minute)
{
    if (id.isEmpty() || dayOfMonth < 1 || dayOfMonth > 31 || !QTime::isValid(hour, minute, 0)) {
        qWarning() << "每月任务参数无效：" << id << dayOfMonth << hour << minute;
        return false;
    }

    ReminderJob job;
    job.id = id;
    job.kind = ReminderJob::Kind::Monthly;
    job.dayOfMonth = dayOfMonth;
    job.timeOfDay = QTime(hour, minute);
    insertJob(job);
    return true;
}

bool ReminderScheduler::addOnceJob(const QString& id, const QDateTime& runTime)
{
    QDateTime now;
    {
        QMutexLocker locker(&m_mutex);
        now = currentTime();
    }
    if (id.isEmpty() || !runTime.isValid() || runTime.toUTC() <= now) {
        qWarning() << "一次性任务时间无效或已过期：" << id << runTime;
        return false;
    }

    ReminderJob job;
    job.id = id;
    job.kind = ReminderJob::Kind::Once;
    job.runTime = runTime.toUTC();
    job.nextRun = job.runTime;
    insertJob(job);
    return true;
}

bool ReminderScheduler::removeJob(const QString& id)
{
    QMutexLocker locker(&m_mutex);
    if (m_jobs.remove(id) == 0) {
        return false;
    }
    qDebug() << "已移除任务：" << id;
    return true;
}

int ReminderScheduler::removeJobsWithPrefix(const QString& prefix)
{
    QMutexLocker locker(&m_mutex);
    int removed = 0;
    for (auto it = m_jobs.begin(); it != m_jobs.end();) {
        if (it.key().startsWith(prefix)) {
            it = m_jobs.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        qDebug() << "已移除" << removed << "个任务，前缀：" << prefix;
    }
    return removed;
}

bool ReminderScheduler::pauseJob(const QString& id)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) {
        return false;
    }
    it->paused = true;
    return true;
}

bool ReminderScheduler::resumeJob(const QString& id)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) {
        return false;
    }
    if (!it->paused) {
        return true;
    }
    it->paused = false;
    if (it->kind != ReminderJob::Kind::Once) {
        it->nextRun = QDateTime();
        it->nextRun = computeNextRun(*it, currentTime(), currentZone());
    }
    return true;
}

void ReminderScheduler::clearAllJobs()
{
    QMutexLocker locker(&m_mutex);
    m_jobs.clear();
    qDebug() << "已清除所有调度任务";
}

bool ReminderScheduler::jobExists(const QString& id) const
{
    QMutexLocker locker(&m_mutex);
    return m_jobs.contains(id);
}

QStringList ReminderScheduler::jobIds() const
{
    QMutexLocker locker(&m_mutex);
    return m_jobs.keys();
}

QList<ReminderJob> ReminderScheduler::jobs() const
{
    QMutexLocker locker(&m_mutex);
    return m_jobs.values();
}

ReminderJob ReminderScheduler::job(const QString& id) const
{
    QMutexLocker locker(&m_mutex);
    return m_jobs.value(id);
}

void ReminderScheduler::startChecking()
{
    qDebug() << "调度线程开始检查任务";
    // 立即执行一次检查
    onTimeout();
    m_checkTimer->start();
}

void ReminderScheduler::stop()
{
    if (m_checkTimer->isActive()) {
        m_checkTimer->stop();
        qDebug() << "调度线程停止检查任务";
    }
}

void ReminderScheduler::onTimeout()
{
    QDateTime now;
    {
        QMutexLocker locker(&m_mutex);
        now = currentTime();
    }
    checkJobs(now);
}

void ReminderScheduler::checkJobs(const QDateTime& now)
{
    const QDateTime nowUtc = now.toUTC();
    QList<Due> fired;
    QList<Due> missed;
    qint64 jumpSecs = 0;
    bool zoneChanged = false;
    int oldOffset = 0;
    int newOffset = 0;

    {
        QMutexLocker locker(&m_mutex);
        const QTimeZone zone = currentZone();
        newOffset = zone.offsetFromUtc(nowUtc);

        if (m_lastTick.isValid()) {
            const qint64 deltaMs = m_lastTick.msecsTo(nowUtc);
            const qint64 tolerance = m_checkIntervalMs + qMax(MIN_JUMP_TOLERANCE_MS, m_checkIntervalMs);
            if (deltaMs > tolerance) {
                jumpSecs = deltaMs / 1000;
            } else if (deltaMs < 0) {
                jumpSecs = qMin<qint64>(deltaMs / 1000, -1);
                // 时钟回拨：间隔任务最多等待一个周期，时刻任务按新时间重算
                for (ReminderJob& job : m_jobs) {
                    if (job.kind == ReminderJob::Kind::Interval) {
                        const QDateTime cap = nowUtc.addSecs(job.intervalSecs);
                        if (job.nextRun > cap) {
                            job.nextRun = cap;
                        }
                    } else if (job.kind != ReminderJob::Kind::Once && !job.paused) {
                        job.nextRun = computeNextRun(job, nowUtc, zone);
                    }
                }
            }

            if (newOffset != m_lastOffset) {
                zoneChanged = true;
                oldOffset = m_lastOffset;
                // 时刻任务保持本地时间不变
                const QDateTime from = deltaMs >= 0 ? m_lastTick : nowUtc;
                for (ReminderJob& job : m_jobs) {
                    if (job.kind == ReminderJob::Kind::Daily || job.kind == ReminderJob::Kind::Monthly) {
                        job.nextRun = computeNextRun(job, from, zone);
                    }
                }
            }
        }
        m_lastTick = nowUtc;
        m_lastOffset = newOffset;

        for (auto it = m_jobs.begin(); it != m_jobs.end();) {
            ReminderJob& job = it.value();
            if (job.paused || !job.nextRun.isValid() || job.nextRun > nowUtc) {
                ++it;
                continue;
            }

            // 错过多个周期时只看最近一次应运行时间
            const QDateTime scheduled = latestDueRun(job, nowUtc, zone);
            const qint64 lateness = scheduled.secsTo(nowUtc);
            if (job.misfireGraceSecs < 0 || lateness <= job.misfireGraceSecs) {
                fired.append({job.id, scheduled});
            } else {
                missed.append({job.id, scheduled});
            }

            if (job.kind == ReminderJob::Kind::Once) {
                it = m_jobs.erase(it);
                continue;
            }
            job.nextRun = computeNextRun(job, nowUtc, zone);
            ++it;
        }
    }

    // 在锁外发信号，接收方可以回调调度器
    if (jumpSecs != 0) {
        qInfo() << "检测到时钟跳变：" << jumpSecs << "秒";
        emit clockJumped(jumpSecs);
    }
    if (zoneChanged) {
        qInfo() << "检测到时区变化：" << oldOffset << "->" << newOffset;
        emit timezoneChanged(oldOffset, newOffset);
    }
    for (const Due& due : missed) {
        qWarning() << "任务错过执行时间：" << due.id << due.scheduledTime.toLocalTime().toString(Qt::ISODate);
        emit jobMissed(due.id, due.scheduledTime);
    }
    for (const Due& due : fired) {
        qDebug() << "触发任务：" << due.id;
        emit jobFired(due.id, due.scheduledTime, nowUtc);
    }
}

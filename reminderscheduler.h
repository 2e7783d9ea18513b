#ifndef REMINDERSCHEDULER_H
#define REMINDERSCHEDULER_H

#include <QObject>
#include <QTimer>
#include <QMutex>
#include <QMap>
#include <QDateTime>
#include <QTimeZone>
#include <QStringList>
#include <functional>

// 调度任务规格（只保存时间规则，触发后由接收方决定做什么）
struct ReminderJob {
    enum class Kind {
        Interval,   // 固定间隔
        Daily,      // 每天固定时刻（可限制星期）
        Monthly,    // 每月固定日期
        Once        // 一次性
    };

    QString id;
    Kind kind = Kind::Interval;
    qint64 intervalSecs = 0;
    QTime timeOfDay;
    quint8 weekdayMask = 0x7F;      // bit0 = 周一 ... bit6 = 周日
    int dayOfMonth = 1;
    QDateTime runTime;
    int misfireGraceSecs = 60;      // < 0 表示不限
    bool paused = false;
    QDateTime nextRun;              // UTC
};

// 提醒调度器（Worker + moveToThread模式）
// 每个检查周期找出到期任务并发出 jobFired，支持错过补发、合并、睡眠唤醒和时区变化
class ReminderScheduler : public QObject
{
    Q_OBJECT
public:
    using Clock = std::function<QDateTime()>;

    explicit ReminderScheduler(QObject *parent = nullptr);
    ~ReminderScheduler() override;

    // 设置检查间隔（毫秒）
    void setCheckInterval(int intervalMs);
    int checkInterval() const;
    // 新任务的默认错过宽限时间（秒）
    void setMisfireGraceSeconds(int seconds);
    // 无效时区表示跟随系统时区
    void setTimeZone(const QTimeZone& zone);
    // 计算时刻任务使用的时区
    QTimeZone timeZone() const;
    // 替换时间来源（默认系统时间）
    void setClock(Clock clock);
    // 调度器当前时间（UTC）
    QDateTime now() const;

    // 第一次触发在 start + interval，start 无效时为当前时间
    bool addIntervalJob(const QString& id, qint64 intervalSecs, const QDateTime& start = QDateTime());
    // dayOfWeek 如 "mon-fri"、"0,2,4"，为空表示每天
    bool addCronJob(const QString& id, int hour, int minute, const QString& dayOfWeek = QString());
    // time 为 "HH:mm"
    bool addTimeJob(const QString& id, const QString& time, const QString& dayOfWeek = QString());
    // 日期超过当月天数时在当月最后一天触发
    bool addMonthlyJob(const QString& id, int dayOfMonth, int hour, int minute);
    // runTime 必须晚于当前时间
    bool addOnceJob(const QString& id, const QDateTime& runTime);

    bool removeJob(const QString& id);
    // 移除所有以 prefix 开头的任务，返回移除数量
    int removeJobsWithPrefix(const QString& prefix);
    bool pauseJob(const QString& id);
    // 从当前时间重新计算下次运行时间，不补发暂停期间的任务
    bool resumeJob(const QString& id);
    void clearAllJobs();

    bool jobExists(const QString& id) const;
    QStringList jobIds() const;
    QList<ReminderJob> jobs() const;
    ReminderJob job(const QString& id) const;

    // 解析星期规则，0 = 周一；非法返回 false
    static bool parseDayOfWeek(const QString& spec, quint8* mask);

signals:
    void jobFired(const QString& jobId, const QDateTime& scheduledTime, const QDateTime& firedAt);
    void jobMissed(const QString& jobId, const QDateTime& scheduledTime);
    // 正数为向前跳跃（睡眠唤醒），负数为时钟回拨
    void clockJumped(qint64 seconds);
    void timezoneChanged(int oldOffsetSecs, int newOffsetSecs);

public slots:
    // 启动检查定时器
    void startChecking();
    // 停止检查定时器
    void stop();
    // 执行一次检查
    void checkJobs(const QDateTime& now);

private slots:
    void onTimeout();

private:
    struct Due {
        QString id;
        QDateTime scheduledTime;
    };

    QDateTime currentTime() const;
    QTimeZone currentZone() const;
    void insertJob(ReminderJob job);
    QDateTime computeNextRun(const ReminderJob& job, const QDateTime& afterUtc, const QTimeZone& zone) const;
    QDateTime latestDueRun(const ReminderJob& job, const QDateTime& nowUtc, const QTimeZone& zone) const;

    QTimer* m_checkTimer;
    mutable QMutex m_mutex;
    QMap<QString, ReminderJob> m_jobs;
    int m_checkIntervalMs;
    int m_defaultGraceSecs;
    QTimeZone m_zone;
    Clock m_clock;
    // 上一次检查的 UTC 时间和时区偏移
    QDateTime m_lastTick;
    int m_lastOffset;
};

#endif // REMINDERSCHEDULER_H

#ifndef REMINDERENGINE_H
#define REMINDERENGINE_H

#include <QObject>
#include <QMap>
#include <QDateTime>
#include <QJsonObject>
#include <functional>
#include "models.h"
#include "notificationdispatcher.h"

class ReminderScheduler;
class ConfigManager;
class ReminderContentProvider;

// 提醒引擎：根据配置注册调度任务，处理触发、稍后提醒、关闭和升级
class ReminderEngine : public QObject
{
    Q_OBJECT
public:
    ReminderEngine(ReminderScheduler* scheduler, ConfigManager* config, QObject *parent = nullptr);

    void setNotificationDispatcher(NotificationDispatcher* dispatcher) { m_dispatcher = dispatcher; }
    void setContentProvider(ReminderContentProvider* provider) { m_contentProvider = provider; }

    // 读取配置和数据库，注册所有已启用的提醒
    void loadReminders();
    // 禁用时移除 <type>_reminder* 任务，启用时按当前配置重新注册
    void updateReminder(const QString& type, bool enabled);
    void reloadAll();
    // 事件新增、修改后重新注册；停用、倒计时或已删除的事件只移除
    void updateEventReminder(const Event& event);
    void removeEventReminder(const QString& eventId);
    // 药物增删后重新注册所有 medication_* 任务
    void reloadMedicationReminders();

    void pauseAll();
    void resumeAll();
    bool isPaused() const { return m_paused; }

    // 使用配置 reminder_engine.snooze_minutes
    bool snooze(const QString& reminderId);
    // minutes <= 0 返回 false
    bool snooze(const QString& reminderId, int minutes);
    bool dismiss(const QString& reminderId);

    QList<ActiveReminder> activeReminders() const;
    ActiveReminder activeReminder(const QString& reminderId) const;

    // 触发一条提醒，同一来源任务仍在显示的提醒会被替换
    QString triggerReminder(const QString& sourceJobId, ReminderType type, const QString& title,
                            const QString& content, ReminderPriority priority);

    static ReminderPriority defaultPriority(ReminderType type);
    // 根据任务 id 推断提醒类型，无法识别返回 false
    static bool reminderTypeForJob(const QString& jobId, ReminderType* type);

signals:
    void reminderTriggered(const QString& type, const QString& title, const QString& content, int priority);
    void activeRemindersChanged();

public slots:
    void onJobFired(const QString& jobId, const QDateTime& scheduledTime, const QDateTime& firedAt);
    void onJobMissed(const QString& jobId, const QDateTime& scheduledTime);
    void onClockJumped(qint64 seconds);
    void onTimezoneChanged(int oldOffsetSecs, int newOffsetSecs);

private:
    // 参数为触发时的本地时间
    using JobHandler = std::function<void(const QDateTime&)>;

    void registerJob(const QString& jobId, bool added, JobHandler handler);
    void removeHandlersWithPrefix(const QString& prefix);

    void setupType(const QString& type);
    void setupWaterReminder();
    void setupStandUpReminder();
    void setupEyeRestReminder();
    void setupNutritionReminder();
    void setupPostureReminder();
    void setupRelaxationReminder();
    void setupNapReminder();
    void setupMedicationReminders();
    void setupPregnancyReminders();
    void setupFetalMovementReminder();
    void setupEventReminder(const Event& event);

    void showReminder(ActiveReminder& reminder, const QString& action);
    void scheduleEscalation(const ActiveReminder& reminder);
    void handleSnoozeFired(const QString& reminderId);
    void handleEscalationFired(const QString& reminderId);
    void cancelPendingJobs(const QString& reminderId);
    void recordHistory(const ActiveReminder& reminder, const QString& action);
    QString contentFor(const QString& contentType);
    QJsonObject engineConfig() const;
    QDateTime schedulerNow() const;
    // 转换到调度器时区的本地时间
    QDateTime schedulerLocal(const QDateTime& dateTime) const;

    ReminderScheduler* m_scheduler;
    ConfigManager* m_config;
    NotificationDispatcher* m_dispatcher;
    ReminderContentProvider* m_contentProvider;
    QMap<QString, JobHandler> m_handlers;
    QMap<QString, ActiveReminder> m_active;
    bool m_paused;
};

#endif // REMINDERENGINE_H

#include "reminderengine.h"
#include "reminderscheduler.h"
#include "remindercontentprovider.h"
#include "configmanager.h"
#include "databasemanager.h"
#include "pregnancycalculator.h"
#include "helpers.h"
#include <QDebug>
#include <QJsonArray>

namespace {

const QString SNOOZE_PREFIX = "snooze_";
const QString ESCALATE_PREFIX = "escalate_";

}

ReminderEngine::ReminderEngine(ReminderScheduler* scheduler, ConfigManager* config, QObject *parent)
    : QObject(parent)
    , m_scheduler(scheduler)
    , m_config(config)
    , m_dispatcher(nullptr)
    , m_contentProvider(nullptr)
    , m_paused(false)
{
}

ReminderPriority ReminderEngine::defaultPriority(ReminderType type)
{
    switch (type) {
    case ReminderType::Medication:
        return ReminderPriority::Urgent;
    case ReminderType::FetalMovement:
    case ReminderType::Nutrition:
    case ReminderType::Nap:
    case ReminderType::Event:
    case ReminderType::Countdown:
    case ReminderType::PregnancyTip:
        return ReminderPriority::Important;
    case ReminderType::Water:
    case ReminderType::StandUp:
    case ReminderType::EyeRest:
        return ReminderPriority::Normal;
    case ReminderType::Posture:
    case ReminderType::Relaxation:
        return ReminderPriority::Suggested;
    }
    return ReminderPriority::Normal;
}

bool ReminderEngine::reminderTypeForJob(const QString& jobId, ReminderType* type)
{
    struct Prefix {
        const char* prefix;
        ReminderType type;
    };
    static const Prefix prefixes[] = {
        {"water_reminder", ReminderType::Water},
        {"stand_up_reminder", ReminderType::StandUp},
        {"eye_rest_reminder", ReminderType::EyeRest},
        {"nutrition_reminder", ReminderType::Nutrition},
        {"posture_reminder", ReminderType::Posture},
        {"relaxation_reminder", ReminderType::Relaxation},
        {"nap_reminder", ReminderType::Nap},
        {"fetal_movement_reminder", ReminderType::FetalMovement},
        {"medication_", ReminderType::Medication},
        {"pregnancy_daily_tip", ReminderType::PregnancyTip},
        {"event_", ReminderType::Event},
    };
    for (const Prefix& item : prefixes) {
        if (jobId.startsWith(QLatin1String(item.prefix))) {
            *type = item.type;
            return true;
        }
    }
    return false;
}

QJsonObject ReminderEngine::engineConfig() const
{
    return m_config->getObject("reminder_engine");
}

QDateTime ReminderEngine::schedulerNow() const
{
    return m_scheduler->now();
}

QDateTime ReminderEngine::schedulerLocal(const QDateTime& dateTime) const
{
    return dateTime.toTimeZone(m_scheduler->timeZone());
}

QString ReminderEngine::contentFor(const QString& contentType)
{
    return m_contentProvider ? m_contentProvider->content(contentType) : fallbackTemplate(contentType);
}

void ReminderEngine::registerJob(const QString& jobId, bool added, JobHandler handler)
{
    if (!added) {
        qWarning() << "提醒任务注册失败：" << jobId;
        return;
    }
    m_handlers.insert(jobId, handler);
}

void ReminderEngine::removeHandlersWithPrefix(const QString& prefix)
{
    m_scheduler->removeJobsWithPrefix(prefix);
    for (auto it = m_handlers.begin(); it != m_handlers.end();) {
        if (it.key().startsWith(prefix)) {
            it = m_handlers.erase(it);
        } else {
            ++it;
        }
    }
}

void ReminderEngine::loadReminders()
{
    m_scheduler->setMisfireGraceSeconds(engineConfig().value("misfire_grace_seconds").toInt(60));

    // 1. 喝水提醒
    if (m_config->get("water_reminder.enabled", false).toBool()) {
        setupWaterReminder();
    }

    // 2. 职场健康提醒
    const QJsonObject workplace = m_config->getObject("workplace_reminders");
    if (workplace.value("stand_up").toObject().value("enabled").toBool(false)) {
        setupStandUpReminder();
    }
    if (workplace.value("eye_rest").toObject().value("enabled").toBool(false)) {
        setupEyeRestReminder();
    }
    if (workplace.value("nutrition").toObject().value("enabled").toBool(false)) {
        setupNutritionReminder();
    }
    if (workplace.value("posture").toObject().value("enabled").toBool(false)) {
        setupPostureReminder();
    }
    if (workplace.value("relaxation").toObject().value("enabled").toBool(false)) {
        setupRelaxationReminder();
    }
    if (workplace.value("nap").toObject().value("enabled").toBool(false)) {
        setupNapReminder();
    }

    // 3. 药物提醒
    setupMedicationReminders();

    // 4. 孕期相关
    const PregnancyConfig pregnancy = m_config->pregnancyConfig();
    if (pregnancy.enabled && pregnancy.lastPeriodDate.isValid()) {
        setupPregnancyReminders();
        if (workplace.value("fetal_movement").toObject().value("enabled").toBool(false)) {
            setupFetalMovementReminder();
        }
    }

    // 5. 自定义事件
    for (const Event& event : DatabaseManager::instance().getEvents()) {
        if (event.enabled && !event.isCountdown) {
            setupEventReminder(event);
        }
    }

    qInfo() << "提醒加载完成，共" << m_handlers.count() << "个任务";
}

void ReminderEngine::setupType(const QString& type)
{
    if (type == "water") {
        setupWaterReminder();
    } else if (type == "stand_up") {
        setupStandUpReminder();
    } else if (type == "eye_rest") {
        setupEyeRestReminder();
    } else if (type == "nutrition") {
        setupNutritionReminder();
    } else if (type == "posture") {
        setupPostureReminder();
    } else if (type == "relaxation") {
        setupRelaxationReminder();
    } else if (type == "nap") {
        setupNapReminder();
    } else if (type == "fetal_movement") {
        setupFetalMovementReminder();
    } else {
        qWarning() << "未知的提醒类型：" << type;
    }
}

void ReminderEngine::updateReminder(const QString& type, bool enabled)
{
    removeHandlersWithPrefix(type + "_reminder");
    if (enabled) {
        setupType(type);
    }
}

void ReminderEngine::reloadAll()
{
    m_scheduler->clearAllJobs();
    m_handlers.clear();
    if (m_dispatcher) {
        for (const QString& id : m_active.keys()) {
            m_dispatcher->withdraw(id);
        }
    }
    m_active.clear();
    emit activeRemindersChanged();
    loadReminders();
}

void ReminderEngine::updateEventReminder(const Event& event)
{
    removeEventReminder(event.id);
    if (event.enabled && !event.isCountdown) {
        setupEventReminder(event);
    }
}

void ReminderEngine::removeEventReminder(const QString& eventId)
{
    const QString jobId = QString("event_%1").arg(eventId);
    m_scheduler->removeJob(jobId);
    m_handlers.remove(jobId);
}

void ReminderEngine::reloadMedicationReminders()
{
    removeHandlersWithPrefix("medication_");
    setupMedicationReminders();
}

void ReminderEngine::pauseAll()
{
    m_paused = true;
    qInfo() << "提醒已暂停";
}

void ReminderEngine::resumeAll()
{
    m_paused = false;
    qInfo() << "提醒已恢复";
}

void ReminderEngine::setupWaterReminder()
{
    const QJsonObject water = m_config->getObject("water_reminder");
    const int interval = water.value("interval_minutes").toInt(45);
    const QString startTime = water.value("start_time").toString("09:00");
    const QString endTime = water.value("end_time").toString("18:00");

    registerJob("water_reminder", m_scheduler->addIntervalJob("water_reminder", interval * 60, schedulerNow()),
                [this, startTime, endTime](const QDateTime& firedAt) {
        if (isWithinTimeRange(startTime, endTime, firedAt.time())) {
            triggerReminder("water_reminder", ReminderType::Water, "💧 喝水时间到！",
                            contentFor("water"), ReminderPriority::Normal);
        }
    });
}

void ReminderEngine::setupStandUpReminder()
{
    const QJsonObject standUp = m_config->getObject("workplace_reminders.stand_up");
    const int interval = standUp.value("interval_minutes").toInt(45);
    const QJsonObject workHours = standUp.value("work_hours").toObject();
    const QString startTime = workHours.value("start").toString("09:00");
    const QString endTime = workHours.value("end").toString("18:00");

    // 午休时间段不提醒
    QString napStart;
    QString napEnd;
    if (standUp.value("exclude_lunch").toBool(false)) {
        const QJsonObject nap = m_config->getObject("workplace_reminders.nap");
        const QTime start = parseClockTime(nap.value("time").toString("12:30"));
        if (start.isValid()) {
            napStart = start.toString(CLOCK_FORMAT);
            napEnd = start.addSecs(nap.value("duration_minutes").toInt(30) * 60).toString(CLOCK_FORMAT);
        }
    }

    registerJob("stand_up_reminder", m_scheduler->addIntervalJob("stand_up_reminder", interval * 60, schedulerNow()),
                [this, startTime, endTime, napStart, napEnd](const QDateTime& firedAt) {
        if (!isWithinTimeRange(startTime, endTime, firedAt.time())) {
            return;
        }
        if (!napStart.isEmpty() && isWithinTimeRange(napStart, napEnd, firedAt.time())) {
            return;
        }
        triggerReminder("stand_up_reminder", ReminderType::StandUp, "💃 该起来活动啦！",
                        contentFor("stand_up"), ReminderPriority::Normal);
    });
}

void ReminderEngine::setupEyeRestReminder()
{
    const int interval = m_config->get("workplace_reminders.eye_rest.interval_minutes", 20).toInt();
    registerJob("eye_rest_reminder", m_scheduler->addIntervalJob("eye_rest_reminder", interval * 60, schedulerNow()),
                [this](const QDateTime&) {
        triggerReminder("eye_rest_reminder", ReminderType::EyeRest, "👀 眼睛休息时间！",
                        contentFor("eye_rest"), ReminderPriority::Normal);
    });
}

void ReminderEngine::setupNutritionReminder()
{
    const QJsonArray snacks = m_config->get("workplace_reminders.nutrition.snacks").toArray();
    for (int i = 0; i < snacks.size(); ++i) {
        const QJsonObject snack = snacks.at(i).toObject();
        const QString jobId = QString("nutrition_reminder_%1").arg(i);
        const QString name = snack.value("name").toString("加餐");
        registerJob(jobId, m_scheduler->addTimeJob(jobId, snack.value("time").toString("10:00"), "mon-fri"),
                    [this, jobId, name](const QDateTime&) {
            triggerReminder(jobId, ReminderType::Nutrition, QString("🍎 %1时间到！").arg(name),
                            contentFor("nutrition"), ReminderPriority::Important);
        });
    }
}

void ReminderEngine::setupPostureReminder()
{
    const int interval = m_config->get("workplace_reminders.posture.interval_minutes", 30).toInt();
    registerJob("posture_reminder", m_scheduler->addIntervalJob("posture_reminder", interval * 60, schedulerNow()),
                [this](const QDateTime&) {
        triggerReminder("posture_reminder", ReminderType::Posture, "🪑 检查一下坐姿吧！",
                        contentFor("posture"), ReminderPriority::Suggested);
    });
}

void ReminderEngine::setupRelaxationReminder()
{
    const QJsonArray times = m_config->get("workplace_reminders.relaxation.times").toArray();
    for (int i = 0; i < times.size(); ++i) {
        const QString jobId = QString("relaxation_reminder_%1").arg(i);
        registerJob(jobId, m_scheduler->addTimeJob(jobId, times.at(i).toString(), "mon-fri"),
                    [this, jobId](const QDateTime&) {
            triggerReminder(jobId, ReminderType::Relaxation, "🧘‍♀️ 放松一下，深呼吸～",
                            contentFor("relaxation"), ReminderPriority::Suggested);
        });
    }
}

void ReminderEngine::setupNapReminder()
{
    const QString napTime = m_config->get("workplace_reminders.nap.time", "12:30").toString();
    registerJob("nap_reminder", m_scheduler->addTimeJob("nap_reminder", napTime, "mon-fri"),
                [this](const QDateTime&) {
        triggerReminder("nap_reminder", ReminderType::Nap, "😴 该午休啦！",
                        contentFor("nap"), ReminderPriority::Important);
    });
}

void ReminderEngine::setupMedicationReminders()
{
    for (const Medication& medication : DatabaseManager::instance().getMedications()) {
        if (!medication.enabled) {
            continue;
        }
        for (int i = 0; i < medication.times.size(); ++i) {
            const QString jobId = QString("medication_%1_%2").arg(medication.id).arg(i);
            registerJob(jobId, m_scheduler->addTimeJob(jobId, medication.times.at(i)),
                        [this, jobId, medication](const QDateTime& firedAt) {
                // 服药周期之外不提醒
                if (!medication.isActiveOn(firedAt.date())) {
                    return;
                }
                QString content = QString("💊 记得吃 %1！\n剂量：%2").arg(medication.name, medication.dosage);
                if (!medication.notes.isEmpty()) {
                    content += QString("\n备注：%1").arg(medication.notes);
                }
                triggerReminder(jobId, ReminderType::Medication, "💊 吃药时间到！", content,
                                ReminderPriority::Urgent);
            });
        }
    }
}

void ReminderEngine::setupPregnancyReminders()
{
    const PregnancyConfig pregnancy = m_config->pregnancyConfig();
    registerJob("pregnancy_daily_tip", m_scheduler->addTimeJob("pregnancy_daily_tip", pregnancy.dailyTipTime),
                [this](const QDateTime& firedAt) {
        const int week = PregnancyCalculator(m_config->pregnancyConfig()).currentWeek(firedAt.date());
        if (week <= 0) {
            return;
        }
        triggerReminder("pregnancy_daily_tip", ReminderType::PregnancyTip,
                        QString("💝 孕 %1 周每日建议").arg(week),
                        contentFor("daily_tips"), ReminderPriority::Important);
    });
}

void ReminderEngine::setupFetalMovementReminder()
{
    const QJsonObject fetal = m_config->getObject("workplace_reminders.fetal_movement");
    const int enableWeek = fetal.value("enable_week").toInt(18);
    const PregnancyConfig pregnancy = m_config->pregnancyConfig();
    const QDate today = schedulerLocal(schedulerNow()).date();
    const int week = PregnancyCalculator(pregnancy).currentWeek(today);
    if (!pregnancy.enabled || week < enableWeek) {
        qDebug() << "当前孕周" << week << "未到胎动记录提醒周数" << enableWeek;
        return;
    }

    const QJsonArray times = fetal.value("times").toArray();
    for (int i = 0; i < times.size(); ++i) {
        const QString jobId = QString("fetal_movement_reminder_%1").arg(i);
        registerJob(jobId, m_scheduler->addTimeJob(jobId, times.at(i).toString()),
                    [this, jobId](const QDateTime&) {
            triggerReminder(jobId, ReminderType::FetalMovement, "👶 记录胎动时间到！",
                            contentFor("fetal_movement"), ReminderPriority::Important);
        });
    }
}

void ReminderEngine::setupEventReminder(const Event& event)
{
    if (!event.remindTime.isValid()) {
        return;
    }

    const QString jobId = QString("event_%1").arg(event.id);
    const QTime time = event.remindTime.time();
    bool added = false;
    switch (event.repeatType) {
    case RepeatType::Once:
        if (event.remindTime.toUTC() <= schedulerNow()) {
            qDebug() << "一次性事件已过期，跳过：" << event.title;
            return;
        }
        added = m_scheduler->addOnceJob(jobId, event.remindTime);
        break;
    case RepeatType::Daily:
        added = m_scheduler->addCronJob(jobId, time.hour(), time.minute());
        break;
    case RepeatType::Workdays:
        added = m_scheduler->addCronJob(jobId, time.hour(), time.minute(), "mon-fri");
        break;
    case RepeatType::Weekly:
        // 使用提醒时间对应的星期几（0 = 周一）
        added = m_scheduler->addCronJob(jobId, time.hour(), time.minute(),
                                        QString::number(event.remindTime.date().dayOfWeek() - 1));
        break;
    case RepeatType::Monthly:
        added = m_scheduler->addMonthlyJob(jobId, event.remindTime.date().day(), time.hour(), time.minute());
        break;
    }

    const QString title = event.title;
    const QString content = event.description.isEmpty() ? QString("事件提醒") : event.description;
    registerJob(jobId, added, [this, jobId, title, content](const QDateTime&) {
        triggerReminder(jobId, ReminderType::Event, title, content, ReminderPriority::Important);
    });
}

void ReminderEngine::onJobFired(const QString& jobId, const QDateTime& scheduledTime, const QDateTime& firedAt)
{
    Q_UNUSED(scheduledTime);
    if (m_paused) {
        qDebug() << "提醒已暂停，忽略任务：" << jobId;
        return;
    }

    if (jobId.startsWith(SNOOZE_PREFIX)) {
        handleSnoozeFired(jobId.mid(SNOOZE_PREFIX.length()));
        return;
    }
    if (jobId.startsWith(ESCALATE_PREFIX)) {
        handleEscalationFired(jobId.mid(ESCALATE_PREFIX.length()));
        return;
    }

    auto it = m_handlers.constFind(jobId);
    if (it == m_handlers.constEnd()) {
        qWarning() << "没有找到任务处理函数：" << jobId;
        return;
    }
    // 一次性任务触发后调度器已移除
    JobHandler handler = it.value();
    if (!m_scheduler->jobExists(jobId)) {
        m_handlers.remove(jobId);
    }
    handler(schedulerLocal(firedAt));
}

void ReminderEngine::onJobMissed(const QString& jobId, const QDateTime& scheduledTime)
{
    ReminderHistoryEntry entry;
    entry.jobId = jobId;
    entry.title = jobId;
    entry.action = "missed";
    entry.occurredAt = schedulerLocal(scheduledTime);

    ReminderType type;
    if (reminderTypeForJob(jobId, &type)) {
        entry.type = reminderTypeToString(type);
        entry.priority = static_cast<int>(defaultPriority(type));
    }
    DatabaseManager::instance().addReminderHistory(entry);
}

void ReminderEngine::onClockJumped(qint64 seconds)
{
    qInfo() << "系统时间跳变" << seconds << "秒（可能是睡眠唤醒），重新检查孕周相关提醒";

    // 日期可能已经变化，胎动提醒需要按新的孕周重新判断
    removeHandlersWithPrefix("fetal_movement_reminder");
    const PregnancyConfig pregnancy = m_config->pregnancyConfig();
    if (pregnancy.enabled && pregnancy.lastPeriodDate.isValid()
        && m_config->get("workplace_reminders.fetal_movement.enabled", false).toBool()) {
        setupFetalMovementReminder();
    }
}

void ReminderEngine::onTimezoneChanged(int oldOffsetSecs, int newOffsetSecs)
{
    qInfo() << "时区变化：UTC 偏移" << oldOffsetSecs / 60 << "分钟 ->" << newOffsetSecs / 60 << "分钟";
}

QString ReminderEngine::triggerReminder(const QString& sourceJobId, ReminderType type, const QString& title,
                                        const QString& content, ReminderPriority priority)
{
    if (m_paused) {
        return QString();
    }

    const QDateTime now = schedulerLocal(schedulerNow());

    // 同一来源的提醒不叠加，替换旧的
    QString reminderId;
    for (auto it = m_active.constBegin(); it != m_active.constEnd(); ++it) {
        if (it.value().sourceJobId == sourceJobId) {
            reminderId = it.key();
            break;
        }
    }

    if (reminderId.isEmpty()) {
        reminderId = generateUniqueId();
    } else {
        cancelPendingJobs(reminderId);
        qDebug() << "替换仍在显示的提醒：" << reminderId << sourceJobId;
    }

    ActiveReminder reminder;
    reminder.id = reminderId;
    reminder.sourceJobId = sourceJobId;
    reminder.type = type;
    reminder.title = title;
    reminder.content = content;
    reminder.priority = priority;
    reminder.firstShownAt = now;
    m_active.insert(reminderId, reminder);

    showReminder(m_active[reminderId], "shown");
    return reminderId;
}

void ReminderEngine::showReminder(ActiveReminder& reminder, const QString& action)
{
    reminder.state = ActiveReminder::State::Showing;
    reminder.lastShownAt = schedulerLocal(schedulerNow());

    if (m_dispatcher) {
        m_dispatcher->notify(reminder);
    }
    emit reminderTriggered(reminderTypeToString(reminder.type), reminder.displayTitle(), reminder.content,
                           static_cast<int>(reminder.priority));
    recordHistory(reminder, action);
    scheduleEscalation(reminder);
    emit activeRemindersChanged();
}

void ReminderEngine::scheduleEscalation(const ActiveReminder& reminder)
{
    const QString jobId = ESCALATE_PREFIX + reminder.id;
    const QJsonObject config = engineConfig();
    const QJsonObject minutesConfig = config.value("escalation_minutes").toObject();

    int minutes = 0;
    if (reminder.priority == ReminderPriority::Urgent) {
        minutes = minutesConfig.value("urgent").toInt(5);
    } else if (reminder.priority == ReminderPriority::Important) {
        minutes = minutesConfig.value("important").toInt(15);
    }

    if (minutes <= 0 || reminder.escalationLevel >= config.value("max_escalations").toInt(3)) {
        m_scheduler->removeJob(jobId);
        return;
    }
    m_scheduler->addOnceJob(jobId, schedulerNow().addSecs(minutes * 60));
}

void ReminderEngine::handleEscalationFired(const QString& reminderId)
{
    auto it = m_active.find(reminderId);
    if (it == m_active.end() || it->state != ActiveReminder::State::Showing) {
        return;
    }
    it->escalationLevel++;
    qInfo() << "提醒未处理，升级提醒：" << it->title << "第" << it->escalationLevel << "次";
    showReminder(*it, "escalated");
}

void ReminderEngine::handleSnoozeFired(const QString& reminderId)
{
    auto it = m_active.find(reminderId);
    if (it == m_active.end()) {
        return;
    }
    showReminder(*it, "shown");
}

bool ReminderEngine::snooze(const QString& reminderId)
{
    return snooze(reminderId, engineConfig().value("snooze_minutes").toInt(10));
}

bool ReminderEngine::snooze(const QString& reminderId, int minutes)
{
    auto it = m_active.find(reminderId);
    if (it == m_active.end() || minutes <= 0) {
        return false;
    }

    const QJsonObject config = engineConfig();
    if (it->snoozeCount >= config.value("max_snooze_count").toInt(3)) {
        qDebug() << "已达到最大稍后提醒次数：" << it->title;
        return false;
    }

    if (!m_scheduler->addOnceJob(SNOOZE_PREFIX + reminderId, schedulerNow().addSecs(minutes * 60))) {
        return false;
    }
    m_scheduler->removeJob(ESCALATE_PREFIX + reminderId);
    it->snoozeCount++;
    it->state = ActiveReminder::State::Snoozed;
    recordHistory(*it, "snoozed");
    if (m_dispatcher) {
        m_dispatcher->withdraw(reminderId);
    }
    emit activeRemindersChanged();
    return true;
}

bool ReminderEngine::dismiss(const QString& reminderId)
{
    auto it = m_active.find(reminderId);
    if (it == m_active.end()) {
        return false;
    }

    cancelPendingJobs(reminderId);
    recordHistory(*it, "dismissed");
    m_active.erase(it);
    if (m_dispatcher) {
        m_dispatcher->withdraw(reminderId);
    }
    emit activeRemindersChanged();
    return true;
}

void ReminderEngine::cancelPendingJobs(const QString& reminderId)
{
    m_scheduler->removeJob(SNOOZE_PREFIX + reminderId);
    m_scheduler->removeJob(ESCALATE_PREFIX + reminderId);
}

void ReminderEngine::recordHistory(const ActiveReminder& reminder, const QString& action)
{
    ReminderHistoryEntry entry;
    entry.reminderId = reminder.id;
    entry.jobId = reminder.sourceJobId;
    entry.type = reminderTypeToString(reminder.type);
    entry.title = reminder.title;
    entry.action = action;
    entry.priority = static_cast<int>(reminder.priority);
    entry.occurredAt = schedulerLocal(schedulerNow());
    DatabaseManager::instance().addReminderHistory(entry);
}

QList<ActiveReminder> ReminderEngine::activeReminders() const
{
    return m_active.values();
}

ActiveReminder ReminderEngine::activeReminder(const QString& reminderId) const
{
    return m_active.value(reminderId);
}

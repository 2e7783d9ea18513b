#ifndef NOTIFICATIONDISPATCHER_H
#define NOTIFICATIONDISPATCHER_H

#include <QString>
#include <QDateTime>
#include "models.h"

// 当前显示中的提醒
struct ActiveReminder {
    enum class State {
        Showing,
        Snoozed
    };

    QString id;
    QString sourceJobId;
    ReminderType type = ReminderType::Water;
    QString title;
    QString content;
    ReminderPriority priority = ReminderPriority::Normal;
    QDateTime firstShownAt;
    QDateTime lastShownAt;
    int escalationLevel = 0;
    int snoozeCount = 0;
    State state = State::Showing;

    // 升级后的标题带上提醒次数
    QString displayTitle() const {
        if (escalationLevel <= 0) {
            return title;
        }
        return QString("⚠️ [第 %1 次提醒] %2").arg(escalationLevel + 1).arg(title);
    }
};

// 通知发送接口（托盘实现，测试中可替换）
class NotificationDispatcher
{
public:
    virtual ~NotificationDispatcher() = default;

    virtual void notify(const ActiveReminder& reminder) = 0;
    // 提醒被关闭或被替换时调用
    virtual void withdraw(const QString& reminderId) { Q_UNUSED(reminderId); }
};

#endif // NOTIFICATIONDISPATCHER_H

#ifndef TRAYICON_H
#define TRAYICON_H

#include <QSystemTrayIcon>
#include <QIcon>
#include "notificationdispatcher.h"

class QMenu;
class QAction;
class ReminderEngine;
class ConfigManager;

// 系统托盘：显示提醒气泡，提供快捷菜单
class TrayIcon : public QSystemTrayIcon, public NotificationDispatcher
{
    Q_OBJECT

public:
    TrayIcon(ReminderEngine* engine, ConfigManager* config, QObject *parent = nullptr);
    ~TrayIcon() override;

    void notify(const ActiveReminder& reminder) override;
    void withdraw(const QString& reminderId) override;

    static QList<int> quickWaterAmounts();
    // 画一个水滴作为默认图标
    static QIcon createDefaultIcon(const QColor& color = QColor("#4A90D9"));

signals:
    void showWindowRequested();
    void showRemindersRequested();
    void waterRecorded(int amount);
    void quitRequested();

private slots:
    void onActivated(QSystemTrayIcon::ActivationReason reason);
    void onTogglePause();
    void rebuildReminderMenu();

private:
    void setupMenu();
    void recordWater(int amount);
    void updateToolTip();

    ReminderEngine* m_engine;
    ConfigManager* m_config;
    QMenu* m_menu;
    QMenu* m_reminderMenu;
    QAction* m_pauseAction;
    QString m_lastMessageId;
};

#endif // TRAYICON_H

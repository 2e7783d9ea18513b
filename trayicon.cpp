#include "trayicon.h"
#include "reminderengine.h"
#include "configmanager.h"
#include "databasemanager.h"
#include "helpers.h"
#include <QApplication>
#include <QMenu>
#include <QAction>
#include <QPainter>
#include <QPainterPath>
#include <QPixmap>
#include <QDebug>

TrayIcon::TrayIcon(ReminderEngine* engine, ConfigManager* config, QObject *parent)
    : QSystemTrayIcon(parent)
    , m_engine(engine)
    , m_config(config)
    , m_menu(new QMenu())
    , m_reminderMenu(nullptr)
    , m_pauseAction(nullptr)
{
    setIcon(createDefaultIcon());
    setupMenu();
    updateToolTip();

    connect(this, &QSystemTrayIcon::activated, this, &TrayIcon::onActivated);
    // 点击气泡打开提醒列表，在列表里稍后提醒或关闭
    connect(this, &QSystemTrayIcon::messageClicked, this, &TrayIcon::showRemindersRequested);
    connect(m_engine, &ReminderEngine::activeRemindersChanged, this, &TrayIcon::rebuildReminderMenu);
}

TrayIcon::~TrayIcon()
{
    // 菜单没有父对象
    delete m_menu;
}

QList<int> TrayIcon::quickWaterAmounts()
{
    return {150, 200, 250, 300, 500};
}

QIcon TrayIcon::createDefaultIcon(const QColor& color)
{
    const int size = 64;
    QPixmap pixmap(size, size);
    pixmap.fill(Qt::transparent);

    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing, true);

    const qreal cx = size / 2.0;
    const qreal top = size * 0.12;
    const qreal bottom = size * 0.88;
    const qreal half = size * 0.32;

    QPainterPath path;
    path.moveTo(cx, top);
    path.cubicTo(cx - half * 0.3, top + size * 0.2, cx - half, bottom - size * 0.3, cx - half, bottom - size * 0.18);
    path.cubicTo(cx - half, bottom + size * 0.02, cx + half, bottom + size * 0.02, cx + half, bottom - size * 0.18);
    path.cubicTo(cx + half, bottom - size * 0.3, cx + half * 0.3, top + size * 0.2, cx, top);

    painter.setBrush(color);
    painter.setPen(QPen(color.darker(120), 2));
    painter.drawPath(path);

    // 高光
    painter.setBrush(QColor(255, 255, 255, 150));
    painter.setPen(Qt::NoPen);
    painter.drawEllipse(QPointF(cx - half * 0.4, bottom - size * 0.3), size * 0.07, size * 0.1);
    painter.end();

    return QIcon(pixmap);
}

void TrayIcon::setupMenu()
{
    m_menu->addAction("显示主窗口", this, &TrayIcon::showWindowRequested);
    m_menu->addSeparator();

    QMenu* waterMenu = m_menu->addMenu("💧 记录喝水");
    for (int amount : quickWaterAmounts()) {
        waterMenu->addAction(QString("%1 ml").arg(amount), this, [this, amount]() {
            recordWater(amount);
        });
    }

    m_reminderMenu = m_menu->addMenu("🔔 当前提醒");
    rebuildReminderMenu();

    m_pauseAction = m_menu->addAction("暂停提醒", this, &TrayIcon::onTogglePause);
    m_menu->addSeparator();
    m_menu->addAction("退出", this, &TrayIcon::quitRequested);

    setContextMenu(m_menu);
}

void TrayIcon::rebuildReminderMenu()
{
    m_reminderMenu->clear();
    const QList<ActiveReminder> reminders = m_engine->activeReminders();
    if (reminders.isEmpty()) {
        QAction* empty = m_reminderMenu->addAction("暂无提醒");
        empty->setEnabled(false);
    }

    for (const ActiveReminder& reminder : reminders) {
        QString label = truncateText(reminder.displayTitle(), 24);
        if (reminder.state == ActiveReminder::State::Snoozed) {
            label += "（稍后）";
        }
        QMenu* item = m_reminderMenu->addMenu(label);
        const QString id = reminder.id;
        item->addAction("稍后提醒", this, [this, id]() {
            if (!m_engine->snooze(id)) {
                showMessage("提示", "已达到最多稍后提醒次数，请处理这条提醒～", QSystemTrayIcon::Information, 3000);
            }
        });
        item->addAction("知道了", this, [this, id]() {
            m_engine->dismiss(id);
        });
    }

    m_reminderMenu->addSeparator();
    m_reminderMenu->addAction("打开提醒列表…", this, &TrayIcon::showRemindersRequested);
    updateToolTip();
}

void TrayIcon::notify(const ActiveReminder& reminder)
{
    if (!m_config->get("notifications.popup", true).toBool()) {
        return;
    }
    if (m_config->get("notifications.sound", true).toBool()) {
        QApplication::beep();
    }

    const int duration = m_config->get("notifications.duration_seconds", 5).toInt() * 1000;
    MessageIcon icon = QSystemTrayIcon::Information;
    if (reminder.priority == ReminderPriority::Urgent || reminder.escalationLevel > 0) {
        icon = QSystemTrayIcon::Warning;
    }

    m_lastMessageId = reminder.id;
    showMessage(reminder.displayTitle(), reminder.content, icon, duration);
}

void TrayIcon::withdraw(const QString& reminderId)
{
    // 系统气泡无法撤回，只清除记录
    if (m_lastMessageId == reminderId) {
        m_lastMessageId.clear();
    }
}

void TrayIcon::onActivated(QSystemTrayIcon::ActivationReason reason)
{
    if (reason == QSystemTrayIcon::Trigger || reason == QSystemTrayIcon::DoubleClick) {
        emit showWindowRequested();
    }
}

void TrayIcon::onTogglePause()
{
    if (m_engine->isPaused()) {
        m_engine->resumeAll();
        m_pauseAction->setText("暂停提醒");
    } else {
        m_engine->pauseAll();
        m_pauseAction->setText("恢复提醒");
    }
    updateToolTip();
}

void TrayIcon::recordWater(int amount)
{
    WaterIntakeRecord record;
    record.id = generateUniqueId();
    record.time = QDateTime::currentDateTime();
    record.amount = amount;
    if (!DatabaseManager::instance().addWaterRecord(record)) {
        qWarning() << "托盘记录喝水失败";
        return;
    }
    emit waterRecorded(amount);
    updateToolTip();
}

void TrayIcon::updateToolTip()
{
    const int total = DatabaseManager::instance().getWaterTotal(QDate::currentDate());
    const int target = m_config->get("water_reminder.daily_target", 1800).toInt();
    QString tip = QString("%1\n今日饮水 %2 / %3 ml").arg(APP_NAME).arg(total).arg(target);
    if (m_engine->isPaused()) {
        tip += "\n提醒已暂停";
    }
    setToolTip(tip);
}

#include <QApplication>
#include <QThread>
#include <QMessageBox>
#include <QFile>
#include <QDebug>
#include "constants.h"
#include "mainwindow.h"
#include "databasemanager.h"
#include "configmanager.h"
#include "llmmanager.h"
#include "keystatusmonitor.h"
#include "aicontentcache.h"
#include "pregnancytips.h"
#include "dietanalyzer.h"
#include "remindercontentprovider.h"
#include "reminderscheduler.h"
#include "reminderengine.h"
#include "trayicon.h"

namespace {

// 加载主题样式表，找不到时使用系统默认样式
void applyTheme(QApplication& app, const QString& theme)
{
    QFile file(resourcesDir() + "/themes/" + theme + ".qss");
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "主题文件不存在：" << file.fileName();
        return;
    }
    app.setStyleSheet(QString::fromUtf8(file.readAll()));
}

}

int main(int argc, char *argv[])
{
    QApplication a(argc, argv);
    a.setApplicationName(APP_NAME);
    a.setApplicationVersion(APP_VERSION);
    a.setOrganizationName(APP_ORGANIZATION);
    // 关闭主窗口后继续在托盘运行
    a.setQuitOnLastWindowClosed(false);

    // 初始化数据库
    if (!DatabaseManager::instance().init()) {
        QMessageBox::critical(nullptr, "初始化失败", "数据库初始化失败，程序将退出！");
        return -1;
    }

    ConfigManager config;
    applyTheme(a, config.get("theme", DEFAULT_THEME).toString());

    // AI 相关
    LlmManager llmManager;
    AIContentCache cache;
    const int expired = cache.clearExpired();
    if (expired > 0) {
        qInfo() << "清理过期 AI 缓存" << expired << "条";
    }
    PregnancyTipsGenerator tipsGenerator(&cache);
    tipsGenerator.setLlmManager(&llmManager);
    DietAnalyzer dietAnalyzer(&cache);
    dietAnalyzer.setLlmManager(&llmManager);
    ReminderContentProvider contentProvider(&config, &cache);
    contentProvider.setLlmManager(&llmManager);
    contentProvider.setTipsGenerator(&tipsGenerator);

    // 创建调度线程和调度器
    QThread* schedulerThread = new QThread;
    ReminderScheduler* scheduler = new ReminderScheduler;
    scheduler->moveToThread(schedulerThread);
    QObject::connect(schedulerThread, &QThread::started, scheduler, &ReminderScheduler::startChecking);

    ReminderEngine engine(scheduler, &config);
    engine.setContentProvider(&contentProvider);
    // 调度器信号在调度线程发出，排队到主线程处理
    QObject::connect(scheduler, &ReminderScheduler::jobFired, &engine, &ReminderEngine::onJobFired, Qt::QueuedConnection);
    QObject::connect(scheduler, &ReminderScheduler::jobMissed, &engine, &ReminderEngine::onJobMissed, Qt::QueuedConnection);
    QObject::connect(scheduler, &ReminderScheduler::clockJumped, &engine, &ReminderEngine::onClockJumped, Qt::QueuedConnection);
    QObject::connect(scheduler, &ReminderScheduler::timezoneChanged, &engine, &ReminderEngine::onTimezoneChanged, Qt::QueuedConnection);

    // 创建主窗口和托盘
    MainWindow w(&engine, &config, &dietAnalyzer, &tipsGenerator);
    TrayIcon tray(&engine, &config);
    engine.setNotificationDispatcher(&tray);
    QObject::connect(&tray, &TrayIcon::showWindowRequested, &w, &MainWindow::showAndRaise);
    QObject::connect(&tray, &TrayIcon::showRemindersRequested, &w, &MainWindow::showActiveReminders);
    QObject::connect(&tray, &TrayIcon::waterRecorded, &w, &MainWindow::refreshWater);
    QObject::connect(&tray, &TrayIcon::quitRequested, &a, &QApplication::quit);

    if (QSystemTrayIcon::isSystemTrayAvailable()) {
        tray.show();
    } else {
        qWarning() << "系统托盘不可用，提醒只显示在主窗口";
    }

    engine.loadReminders();
    schedulerThread->start();

    // 启动时检查 API Key
    KeyStatusMonitor keyMonitor(&llmManager);
    keyMonitor.checkOnStartup([&w](const QStringList& warnings) {
        if (!warnings.isEmpty()) {
            QMessageBox::warning(&w, "API Key 状态", warnings.join("\n"));
        }
    });
    QObject::connect(&llmManager, &LlmManager::keyInvalidated, &tray, [&tray](const QString& provider, const QString& reason) {
        tray.showMessage("API Key 失效", QString("%1：%2，已自动切换到其他提供商").arg(provider, reason),
                         QSystemTrayIcon::Warning);
    });

    w.show();

    // 应用程序退出时停止调度器并清理线程
    int ret = a.exec();
    engine.setNotificationDispatcher(nullptr);
    QMetaObject::invokeMethod(scheduler, "stop", Qt::BlockingQueuedConnection);
    schedulerThread->quit();
    schedulerThread->wait();
    delete scheduler;
    delete schedulerThread;

    DatabaseManager::instance().close();
    return ret;
}

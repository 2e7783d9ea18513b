#ifndef KEYSTATUSMONITOR_H
#define KEYSTATUSMONITOR_H

#include <QObject>
#include <QDateTime>
#include <QStringList>
#include <functional>

class LlmManager;

// 单个提供商的 Key 状态
struct ProviderKeyState {
    QString id;
    QString name;
    bool enabled = false;
    bool hasKey = false;
    bool isActive = false;
    bool valid = false;
    QString error;
    QDateTime checkedAt;
    bool needsAttention = false;
};

// API Key 状态监控：启动检查、过期/余额提醒、配置建议
class KeyStatusMonitor : public QObject
{
    Q_OBJECT
public:
    static const int EXPIRY_WARNING_DAYS = 7;
    static constexpr double LOW_BALANCE_THRESHOLD = 10.0;

    explicit KeyStatusMonitor(LlmManager* manager, QObject *parent = nullptr);

    // 检查所有已启用且配置了 Key 的提供商，回调无效 Key 的警告列表
    void checkOnStartup(std::function<void(const QStringList&)> callback);

    bool shouldRemindExpiry(const QString& provider, const QDateTime& now = QDateTime::currentDateTime()) const;
    QString statusSummary() const;
    QList<ProviderKeyState> allStatus() const;
    QStringList recommendations() const;

signals:
    void warningsReady(const QStringList& warnings);

private:
    LlmManager* m_manager;
};

#endif // KEYSTATUSMONITOR_H

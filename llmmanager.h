#ifndef LLMMANAGER_H
#define LLMMANAGER_H

#include <QObject>
#include <QMap>
#include <QDate>
#include <QJsonObject>
#include <QStringList>
#include <functional>
#include "llmclient.h"

// 提供商概要信息
struct LlmProviderInfo {
    QString id;
    QString name;
    bool enabled = false;
    bool hasKey = false;
    bool keyValid = false;
    bool isActive = false;
};

// 某天的调用统计
struct LlmDailyStats {
    int calls = 0;
    int tokens = 0;
};

// LLM 统一管理器：多提供商切换、自动降级、使用统计（llm_config.json）
class LlmManager : public QObject
{
    Q_OBJECT
public:
    // configPath 为空时使用用户数据目录下的 llm_config.json
    explicit LlmManager(const QString& configPath = QString(), QObject *parent = nullptr);
    ~LlmManager() override;

    static QJsonObject defaultConfig();

    QString configPath() const { return m_configPath; }
    const QJsonObject& config() const { return m_config; }

    // 先调用活跃提供商，失败后按 fallback_order 降级；全部失败返回 all_failed
    void call(const QString& prompt, const LlmCallOptions& options, LlmCallback callback);
    void call(const QString& prompt, LlmCallback callback);

    // 是否存在至少一个已启用且配置了 Key 的客户端
    bool hasClients() const { return !m_clients.isEmpty(); }
    QStringList clientIds() const { return m_clients.keys(); }

    void checkKey(const QString& provider, KeyStatusCallback callback);
    // 检查所有客户端的 Key，全部完成后回调一次
    void checkAllKeys(std::function<void(const QMap<QString, KeyStatus>&)> callback);

    bool setApiKey(const QString& provider, const QString& apiKey);
    QJsonObject providerConfig(const QString& provider) const;
    bool updateProviderConfig(const QString& provider, const QJsonObject& updates);

    QString activeProvider() const;
    bool setActiveProvider(const QString& provider);
    QList<LlmProviderInfo> availableProviders() const;

    QJsonObject usageStats() const;
    LlmDailyStats todayStats(const QDate& today = QDate::currentDate()) const;

    // 替换某个提供商的客户端（接管所有权），nullptr 表示移除
    void setClient(const QString& provider, LlmClient* client);

signals:
    void keyInvalidated(const QString& provider, const QString& reason);

private:
    void loadConfig();
    bool saveConfig() const;
    void initClients();
    LlmClient* createClient(const QString& provider, const QJsonObject& providerConfig);
    void tryProviders(const QStringList& order, int index, const QString& prompt,
                      const LlmCallOptions& options, LlmCallback callback);
    void updateKeyStatus(const QString& provider, const KeyStatus& status);
    void markKeyInvalid(const QString& provider, const QString& reason);
    void recordUsage(const QString& provider, const LlmResponse& response);

    QString m_configPath;
    QJsonObject m_config;
    QMap<QString, LlmClient*> m_clients;
    bool m_closing = false;
};

#endif // LLMMANAGER_H

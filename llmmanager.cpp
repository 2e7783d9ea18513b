#include "llmmanager.h"
#include "openaiclient.h"
#include "qwenclient.h"
#include "constants.h"
#include "helpers.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QPointer>
#include <QDateTime>
#include <memory>

namespace {

QJsonObject providerDefaults(const QString& name, bool enabled, const QString& apiBase, const QString& model)
{
    return QJsonObject {
        {"name", name},
        {"enabled", enabled},
        {"api_key", ""},
        {"api_base", apiBase},
        {"model", model},
        {"max_tokens", 500},
        {"temperature", 0.7},
        {"key_status", QJsonObject{{"valid", false}, {"checked_at", QJsonValue::Null}}}
    };
}

}

LlmManager::LlmManager(const QString& configPath, QObject *parent)
    : QObject(parent)
    , m_configPath(configPath.isEmpty() ? QDir(userDataDir()).filePath(LLM_CONFIG_FILE_NAME) : configPath)
{
    loadConfig();
    initClients();
}

LlmManager::~LlmManager()
{
    // 退出时取消的请求不再回调
    m_closing = true;
    const QMap<QString, LlmClient*> clients = m_clients;
    m_clients.clear();
    qDeleteAll(clients);
}

QJsonObject LlmManager::defaultConfig()
{
    QJsonObject providers {
        {"deepseek", providerDefaults("DeepSeek", true, "https://api.deepseek.com/v1", "deepseek-chat")},
        {"glm4", providerDefaults("智谱 GLM-4", false, "https://open.bigmodel.cn/api/paas/v4", "glm-4")},
        {"qwen", providerDefaults("通义千问", false,
                                  "https://dashscope.aliyuncs.com/api/v1/services/aigc/text-generation",
                                  "qwen-turbo")},
        {"openai", providerDefaults("OpenAI", false, "https://api.openai.com/v1", "gpt-4o-mini")}
    };

    return QJsonObject {
        {"version", "1.0"},
        {"active_provider", "deepseek"},
        {"auto_fallback", true},
        {"fallback_order", QJsonArray{"deepseek", "glm4", "qwen", "openai"}},
        {"providers", providers},
        {"usage_stats", QJsonObject{
             {"total_calls", 0},
             {"total_tokens", 0},
             {"last_call_at", QJsonValue::Null},
             {"daily_stats", QJsonObject()}
         }}
    };
}

void LlmManager::loadConfig()
{
    // 1. 用户目录
    if (QFile::exists(m_configPath)) {
        QJsonObject loaded = loadJson(m_configPath);
        if (!loaded.isEmpty()) {
            m_config = loaded;
            return;
        }
    }

    // 2. 资源目录中的默认配置，复制到用户目录
    const QString bundled = QDir(resourcesDir()).filePath("config/" + LLM_CONFIG_FILE_NAME);
    if (QFile::exists(bundled)) {
        QJsonObject loaded = loadJson(bundled);
        if (!loaded.isEmpty()) {
            m_config = loaded;
            saveConfig();
            return;
        }
    }

    // 3. 内置默认配置
    m_config = defaultConfig();
    saveConfig();
}

bool LlmManager::saveConfig() const
{
    return saveJson(m_configPath, m_config);
}

LlmClient* LlmManager::createClient(const QString& provider, const QJsonObject& providerConfig)
{
    if (provider == "deepseek" || provider == "openai") {
        return new OpenAiCompatibleClient(provider, providerConfig);
    } else if (provider == "glm4") {
        return new Glm4Client(providerConfig);
    } else if (provider == "qwen") {
        return new QwenClient(providerConfig);
    }
    qWarning() << "未知的 LLM 提供商：" << provider;
    return nullptr;
}

void LlmManager::initClients()
{
    // 旧客户端上未完成的请求在删除时失败，回退到新客户端
    const QMap<QString, LlmClient*> oldClients = m_clients;
    m_clients.clear();

    const QJsonObject providers = m_config.value("providers").toObject();
    for (auto it = providers.constBegin(); it != providers.constEnd(); ++it) {
        const QJsonObject providerConfig = it.value().toObject();
        if (!providerConfig.value("enabled").toBool() || providerConfig.value("api_key").toString().isEmpty()) {
            continue;
        }
        LlmClient* client = createClient(it.key(), providerConfig);
        if (client) {
            m_clients.insert(it.key(), client);
        }
    }
    qDebug() << "已初始化 LLM 客户端：" << m_clients.keys();
    qDeleteAll(oldClients);
}

void LlmManager::setClient(const QString& provider, LlmClient* client)
{
    LlmClient* old = m_clients.take(provider);
    if (client) {
        m_clients.insert(provider, client);
    }
    delete old;
}

void LlmManager::call(const QString& prompt, LlmCallback callback)
{
    call(prompt, LlmCallOptions(), callback);
}

void LlmManager::call(const QString& prompt, const LlmCallOptions& options, LlmCallback callback)
{
    const QString primary = activeProvider();
    QStringList order;
    if (m_clients.contains(primary)) {
        order << primary;
    }
    if (m_config.value("auto_fallback").toBool(true)) {
        const QJsonArray fallbackOrder = m_config.value("fallback_order").toArray();
        for (const QJsonValue& value : fallbackOrder) {
            const QString provider = value.toString();
            if (provider != primary && m_clients.contains(provider) && !order.contains(provider)) {
                order << provider;
            }
        }
    }
    tryProviders(order, 0, prompt, options, callback);
}

void LlmManager::tryProviders(const QStringList& order, int index, const QString& prompt,
                              const LlmCallOptions& options, LlmCallback callback)
{
    if (index >= order.size()) {
        LlmResponse response;
        response.success = false;
        response.provider = "none";
        response.model = "none";
        response.errorMessage = "所有 LLM 提供商均不可用";
        response.errorCode = "all_failed";
        callback(response);
        return;
    }

    const QString provider = order.at(index);
    LlmClient* client = m_clients.value(provider);
    if (!client) {
        tryProviders(order, index + 1, prompt, options, callback);
        return;
    }

    QPointer<LlmManager> guard(this);
    client->call(prompt, options, [guard, order, index, prompt, options, callback, provider](const LlmResponse& response) {
        if (!guard || guard->m_closing) {
            return;
        }
        if (response.success) {
            guard->recordUsage(provider, response);
            callback(response);
            return;
        }

        qWarning() << provider << "调用失败：" << response.errorCode << response.errorMessage;
        static const QStringList keyErrors {"invalid_api_key", "insufficient_quota", "missing_api_key"};
        if (keyErrors.contains(response.errorCode)) {
            guard->markKeyInvalid(provider, response.errorCode);
        }
        guard->tryProviders(order, index + 1, prompt, options, callback);
    });
}

void LlmManager::checkKey(const QString& provider, KeyStatusCallback callback)
{
    LlmClient* client = m_clients.value(provider);
    if (!client) {
        KeyStatus status;
        status.valid = false;
        status.checkedAt = QDateTime::currentDateTime();
        status.error = "provider_not_found";
        callback(status);
        return;
    }

    QPointer<LlmManager> guard(this);
    client->checkKeyStatus([guard, provider, callback](const KeyStatus& status) {
        if (guard && guard->m_closing) {
            return;
        }
        if (guard) {
            guard->updateKeyStatus(provider, status);
        }
        callback(status);
    });
}

void LlmManager::checkAllKeys(std::function<void(const QMap<QString, KeyStatus>&)> callback)
{
    const QStringList providers = m_clients.keys();
    if (providers.isEmpty()) {
        callback(QMap<QString, KeyStatus>());
        return;
    }

    auto results = std::make_shared<QMap<QString, KeyStatus>>();
    const int expected = providers.size();
    for (const QString& provider : providers) {
        checkKey(provider, [results, expected, provider, callback](const KeyStatus& status) {
            results->insert(provider, status);
            if (results->size() == expected) {
                callback(*results);
            }
        });
    }
}

void LlmManager::updateKeyStatus(const QString& provider, const KeyStatus& status)
{
    QJsonObject providers = m_config.value("providers").toObject();
    if (!providers.contains(provider)) {
        return;
    }
    QJsonObject providerConfig = providers.value(provider).toObject();
    providerConfig["key_status"] = status.toJson();
    providers[provider] = providerConfig;
    m_config["providers"] = providers;
    saveConfig();
}

void LlmManager::markKeyInvalid(const QString& provider, const QString& reason)
{
    KeyStatus status;
    status.valid = false;
    status.checkedAt = QDateTime::currentDateTime();
    status.error = reason;
    updateKeyStatus(provider, status);
    emit keyInvalidated(provider, reason);
}

bool LlmManager::setApiKey(const QString& provider, const QString& apiKey)
{
    QJsonObject updates {
        {"api_key", apiKey},
        {"enabled", !apiKey.isEmpty()}
    };
    return updateProviderConfig(provider, updates);
}

QJsonObject LlmManager::providerConfig(const QString& provider) const
{
    return m_config.value("providers").toObject().value(provider).toObject();
}

bool LlmManager::updateProviderConfig(const QString& provider, const QJsonObject& updates)
{
    QJsonObject providers = m_config.value("providers").toObject();
    if (!providers.contains(provider)) {
        return false;
    }
    QJsonObject providerConfig = providers.value(provider).toObject();
    for (auto it = updates.constBegin(); it != updates.constEnd(); ++it) {
        providerConfig[it.key()] = it.value();
    }
    providers[provider] = providerConfig;
    m_config["providers"] = providers;
    saveConfig();
    initClients();
    return true;
}

QString LlmManager::activeProvider() const
{
    return m_config.value("active_provider").toString("deepseek");
}

bool LlmManager::setActiveProvider(const QString& provider)
{
    if (!m_config.value("providers").toObject().contains(provider)) {
        return false;
    }
    m_config["active_provider"] = provider;
    return saveConfig();
}

QList<LlmProviderInfo> LlmManager::availableProviders() const
{
    QList<LlmProviderInfo> result;
    const QString active = activeProvider();
    const QJsonObject providers = m_config.value("providers").toObject();
    for (auto it = providers.constBegin(); it != providers.constEnd(); ++it) {
        const QJsonObject providerConfig = it.value().toObject();
        LlmProviderInfo info;
        info.id = it.key();
        info.name = providerConfig.value("name").toString(it.key());
        info.enabled = providerConfig.value("enabled").toBool(false);
        info.hasKey = !providerConfig.value("api_key").toString().isEmpty();
        info.keyValid = providerConfig.value("key_status").toObject().value("valid").toBool(false);
        info.isActive = it.key() == active;
        result.append(info);
    }
    return result;
}

void LlmManager::recordUsage(const QString& provider, const LlmResponse& response)
{
    QJsonObject stats = m_config.value("usage_stats").toObject();
    stats["total_calls"] = stats.value("total_calls").toInt(0) + 1;
    stats["total_tokens"] = stats.value("total_tokens").toInt(0) + response.tokensUsed;
    stats["last_call_at"] = QDateTime::currentDateTime().toString(Qt::ISODate);

    const QString today = QDate::currentDate().toString(DATE_FORMAT);
    QJsonObject dailyStats = stats.value("daily_stats").toObject();
    QJsonObject day = dailyStats.value(today).toObject();
    day["calls"] = day.value("calls").toInt(0) + 1;
    day["tokens"] = day.value("tokens").toInt(0) + response.tokensUsed;

    QJsonObject byProvider = day.value("by_provider").toObject();
    QJsonObject providerStats = byProvider.value(provider).toObject();
    providerStats["calls"] = providerStats.value("calls").toInt(0) + 1;
    providerStats["tokens"] = providerStats.value("tokens").toInt(0) + response.tokensUsed;
    byProvider[provider] = providerStats;
    day["by_provider"] = byProvider;

    dailyStats[today] = day;
    stats["daily_stats"] = dailyStats;
    m_config["usage_stats"] = stats;
    saveConfig();
}

QJsonObject LlmManager::usageStats() const
{
    return m_config.value("usage_stats").toObject();
}

LlmDailyStats LlmManager::todayStats(const QDate& today) const
{
    const QJsonObject day = usageStats().value("daily_stats").toObject()
                                .value(today.toString(DATE_FORMAT)).toObject();
    LlmDailyStats stats;
    stats.calls = day.value("calls").toInt(0);
    stats.tokens = day.value("tokens").toInt(0);
    return stats;
}

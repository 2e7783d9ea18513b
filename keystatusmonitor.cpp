#include "keystatusmonitor.h"
#include "llmmanager.h"
#include <QDebug>
#include <QJsonObject>
#include <QPointer>
#include <memory>

KeyStatusMonitor::KeyStatusMonitor(LlmManager* manager, QObject *parent)
    : QObject(parent)
    , m_manager(manager)
{
}

void KeyStatusMonitor::checkOnStartup(std::function<void(const QStringList&)> callback)
{
    QList<LlmProviderInfo> targets;
    for (const LlmProviderInfo& provider : m_manager->availableProviders()) {
        if (provider.enabled && provider.hasKey) {
            targets.append(provider);
        }
    }
    if (targets.isEmpty()) {
        callback(QStringList());
        emit warningsReady(QStringList());
        return;
    }

    auto warnings = std::make_shared<QStringList>();
    auto pending = std::make_shared<int>(targets.size());
    QPointer<KeyStatusMonitor> guard(this);
    for (const LlmProviderInfo& provider : targets) {
        const QString name = provider.name;
        m_manager->checkKey(provider.id, [guard, warnings, pending, name, callback](const KeyStatus& status) {
            if (!status.valid) {
                const QString error = status.error.isEmpty() ? QString("未知错误") : status.error;
                warnings->append(QString("%1 API Key 无效：%2").arg(name, error));
            }
            if (--(*pending) == 0) {
                if (!warnings->isEmpty()) {
                    qWarning() << "API Key 检查：" << *warnings;
                }
                callback(*warnings);
                if (guard) {
                    emit guard->warningsReady(*warnings);
                }
            }
        });
    }
}

bool KeyStatusMonitor::shouldRemindExpiry(const QString& provider, const QDateTime& now) const
{
    const QJsonObject config = m_manager->providerConfig(provider);
    if (config.isEmpty()) {
        return false;
    }

    const KeyStatus status = KeyStatus::fromJson(config.value("key_status").toObject());
    if (status.expiresAt.isValid() && now.daysTo(status.expiresAt) <= EXPIRY_WARNING_DAYS) {
        return true;
    }
    if (status.hasBalance && status.balance < LOW_BALANCE_THRESHOLD) {
        return true;
    }
    return false;
}

QString KeyStatusMonitor::statusSummary() const
{
    const QString active = m_manager->activeProvider();
    const QJsonObject config = m_manager->providerConfig(active);
    if (config.isEmpty()) {
        return "⚠️ 未配置任何 AI 模型";
    }

    const KeyStatus status = KeyStatus::fromJson(config.value("key_status").toObject());
    const QString name = config.value("name").toString(active);
    if (status.valid) {
        if (status.hasBalance) {
            return QString("✓ %1 正常（余额 ¥%2）").arg(name).arg(status.balance, 0, 'f', 2);
        }
        return QString("✓ %1 正常").arg(name);
    }
    return QString("⚠️ %1 不可用：%2").arg(name, status.error.isEmpty() ? QString("未知错误") : status.error);
}

QList<ProviderKeyState> KeyStatusMonitor::allStatus() const
{
    QList<ProviderKeyState> result;
    for (const LlmProviderInfo& provider : m_manager->availableProviders()) {
        const KeyStatus status = KeyStatus::fromJson(
            m_manager->providerConfig(provider.id).value("key_status").toObject());

        ProviderKeyState state;
        state.id = provider.id;
        state.name = provider.name;
        state.enabled = provider.enabled;
        state.hasKey = provider.hasKey;
        state.isActive = provider.isActive;
        state.valid = status.valid;
        state.error = status.error;
        state.checkedAt = status.checkedAt;
        if (provider.enabled && provider.hasKey) {
            state.needsAttention = !status.valid || shouldRemindExpiry(provider.id);
        }
        result.append(state);
    }
    return result;
}

QStringList KeyStatusMonitor::recommendations() const
{
    QStringList result;
    QStringList validNames;
    for (const LlmProviderInfo& provider : m_manager->availableProviders()) {
        if (provider.enabled && provider.hasKey && provider.keyValid) {
            validNames << provider.name;
        }
    }

    if (validNames.isEmpty()) {
        result << "💡 建议配置至少一个 AI 模型的 API Key";
    } else if (validNames.size() == 1) {
        result << "💡 建议配置备用 AI 模型，以防主模型不可用";
    }

    const QJsonObject activeConfig = m_manager->providerConfig(m_manager->activeProvider());
    if (!activeConfig.isEmpty()
        && !activeConfig.value("key_status").toObject().value("valid").toBool(false)
        && !validNames.isEmpty()) {
        result << QString("💡 当前模型不可用，建议切换到：%1").arg(validNames.join(", "));
    }
    return result;
}

#include "configmanager.h"
#include "constants.h"
#include "helpers.h"
#include <QDebug>
#include <QDir>

ConfigManager::ConfigManager(const QString& filePath)
    : m_filePath(filePath.isEmpty() ? QDir(userDataDir()).filePath(CONFIG_FILE_NAME) : filePath)
{
    load();
}

void ConfigManager::load()
{
    m_config = mergeConfig(defaultConfig(), loadJson(m_filePath));
    qDebug() << "配置已加载：" << m_filePath;
}

bool ConfigManager::save() const
{
    return saveJson(m_filePath, m_config);
}

QJsonValue ConfigManager::get(const QString& key, const QJsonValue& defaultValue) const
{
    const QStringList keys = key.split('.', Qt::SkipEmptyParts);
    if (keys.isEmpty()) {
        return defaultValue;
    }

    QJsonValue value(m_config);
    for (const QString& k : keys) {
        if (!value.isObject()) {
            return defaultValue;
        }
        value = value.toObject().value(k);
    }
    return (value.isUndefined() || value.isNull()) ? defaultValue : value;
}

QJsonObject ConfigManager::getObject(const QString& key) const
{
    return get(key).toObject();
}

bool ConfigManager::set(const QString& key, const QJsonValue& value)
{
    const QStringList keys = key.split('.', Qt::SkipEmptyParts);
    if (keys.isEmpty()) {
        return false;
    }
    m_config = setPath(m_config, keys, value);
    return save();
}

PregnancyConfig ConfigManager::pregnancyConfig() const
{
    return PregnancyConfig::fromJson(getObject("pregnancy"));
}

bool ConfigManager::setPregnancyConfig(const PregnancyConfig& pregnancy)
{
    m_config["pregnancy"] = pregnancy.toJson();
    return save();
}

QJsonObject ConfigManager::mergeConfig(const QJsonObject& defaults, const QJsonObject& loaded)
{
    QJsonObject result = defaults;
    for (auto it = loaded.constBegin(); it != loaded.constEnd(); ++it) {
        const QJsonValue current = result.value(it.key());
        if (current.isObject() && it.value().isObject()) {
            result[it.key()] = mergeConfig(current.toObject(), it.value().toObject());
        } else {
            result[it.key()] = it.value();
        }
    }
    return result;
}

// QJsonObject 是值类型，逐层取出、修改、再写回
QJsonObject ConfigManager::setPath(QJsonObject object, const QStringList& keys, const QJsonValue& value)
{
    const QString& head = keys.first();
    if (keys.size() == 1) {
        object[head] = value;
        return object;
    }
    QJsonObject child = object.value(head).toObject();
    object[head] = setPath(child, keys.mid(1), value);
    return object;
}

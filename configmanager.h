#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include "models.h"

// 用户配置管理（config.json，缺失的键由默认配置补齐）
class ConfigManager
{
public:
    // filePath 为空时使用用户数据目录下的 config.json
    explicit ConfigManager(const QString& filePath = QString());

    // 加载配置：读取失败时使用默认配置
    void load();
    bool save() const;

    const QJsonObject& config() const { return m_config; }
    QString filePath() const { return m_filePath; }

    // 点号分隔的键，如 "water_reminder.interval_minutes"
    QJsonValue get(const QString& key, const QJsonValue& defaultValue = QJsonValue()) const;
    QJsonObject getObject(const QString& key) const;
    // 设置并立即保存，中间层级不存在时自动创建
    bool set(const QString& key, const QJsonValue& value);

    PregnancyConfig pregnancyConfig() const;
    bool setPregnancyConfig(const PregnancyConfig& pregnancy);

    // 递归合并：loaded 覆盖 defaults，两边都是对象时逐层合并
    static QJsonObject mergeConfig(const QJsonObject& defaults, const QJsonObject& loaded);

private:
    static QJsonObject setPath(QJsonObject object, const QStringList& keys, const QJsonValue& value);

    QString m_filePath;
    QJsonObject m_config;
};

#endif // CONFIGMANAGER_H

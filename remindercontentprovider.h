#ifndef REMINDERCONTENTPROVIDER_H
#define REMINDERCONTENTPROVIDER_H

#include <QObject>
#include <QDate>
#include <QSet>
#include <QJsonObject>
#include "constants.h"

class ConfigManager;
class AIContentCache;
class LlmManager;
class PregnancyTipsGenerator;

// 提醒正文：AI 模式允许且有缓存时用 AI 内容，否则用降级模板
class ReminderContentProvider : public QObject
{
    Q_OBJECT
public:
    ReminderContentProvider(ConfigManager* config, AIContentCache* cache, QObject *parent = nullptr);

    void setLlmManager(LlmManager* manager) { m_llmManager = manager; }
    void setTipsGenerator(PregnancyTipsGenerator* generator) { m_tipsGenerator = generator; }

    // contentType：water, stand_up, eye_rest, nutrition, posture, relaxation, nap,
    //              fetal_movement, daily_tips, medication
    QString content(const QString& contentType, const QDate& today = QDate::currentDate());

    QString aiMode() const;
    AiModeOption currentAiMode() const { return aiModeOption(aiMode()); }
    bool isAiEnabled(const QString& contentType) const;
    // 今日是否还有 AI 调用额度
    bool hasAiBudget(const QDate& today = QDate::currentDate()) const;

    // 后台生成下一次使用的 AI 内容
    void prefetch(const QString& contentType, const QDate& today = QDate::currentDate());

    static QString promptFor(const QString& contentType, int pregnancyWeek);

signals:
    void contentPrefetched(const QString& contentType);

private:
    QJsonObject cacheContext(const QDate& today) const;
    int pregnancyWeek(const QDate& today) const;
    QString cachedText(const QString& contentType, const QJsonValue& cached) const;

    ConfigManager* m_config;
    AIContentCache* m_cache;
    LlmManager* m_llmManager;
    PregnancyTipsGenerator* m_tipsGenerator;
    // 正在生成中的类型，避免重复请求
    QSet<QString> m_pending;
};

#endif // REMINDERCONTENTPROVIDER_H

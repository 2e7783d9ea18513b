#include "remindercontentprovider.h"
#include "configmanager.h"
#include "aicontentcache.h"
#include "llmmanager.h"
#include "pregnancycalculator.h"
#include "pregnancytips.h"
#include <QDebug>
#include <QJsonArray>
#include <QPointer>

ReminderContentProvider::ReminderContentProvider(ConfigManager* config, AIContentCache* cache, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_cache(cache)
    , m_llmManager(nullptr)
    , m_tipsGenerator(nullptr)
{
}

QString ReminderContentProvider::aiMode() const
{
    const QString mode = m_config->get("ai_mode", "smart").toString();
    return aiModeNames().contains(mode) ? mode : QString("smart");
}

bool ReminderContentProvider::isAiEnabled(const QString& contentType) const
{
    return currentAiMode().aiTypes.contains(contentType);
}

bool ReminderContentProvider::hasAiBudget(const QDate& today) const
{
    if (!m_llmManager) {
        return false;
    }
    return m_llmManager->todayStats(today).calls < currentAiMode().maxCalls;
}

int ReminderContentProvider::pregnancyWeek(const QDate& today) const
{
    const PregnancyConfig pregnancy = m_config->pregnancyConfig();
    if (!pregnancy.enabled) {
        return 0;
    }
    return qMax(0, PregnancyCalculator(pregnancy).currentWeek(today));
}

QJsonObject ReminderContentProvider::cacheContext(const QDate& today) const
{
    return QJsonObject {
        {"week", pregnancyWeek(today)},
        {"date", today.toString(DATE_FORMAT)}
    };
}

QString ReminderContentProvider::cachedText(const QString& contentType, const QJsonValue& cached) const
{
    if (cached.isString()) {
        return cached.toString();
    }
    if (!cached.isObject()) {
        return QString();
    }

    const QJsonObject obj = cached.toObject();
    if (contentType == "daily_tips") {
        return PregnancyTipsGenerator::formatTips(obj);
    }
    if (contentType == "nutrition" && obj.value("source").toString() == "ai") {
        QStringList names;
        for (const QJsonValue& food : obj.value("foods").toArray()) {
            names << food.toObject().value("name").toString();
        }
        QString text = "🍎 " + obj.value("tip").toString();
        if (!names.isEmpty()) {
            text += "\n建议：" + names.join(" / ");
        }
        return text;
    }
    return QString();
}

QString ReminderContentProvider::content(const QString& contentType, const QDate& today)
{
    const QString fallback = fallbackTemplate(contentType);
    if (!isAiEnabled(contentType)) {
        return fallback;
    }

    QString text;
    if (AIContentCache::rule(contentType).groupBy != AIContentCache::GroupBy::None) {
        text = cachedText(contentType, m_cache->get(contentType, cacheContext(today)));
    }
    // 为下一次提醒准备内容
    prefetch(contentType, today);
    return text.isEmpty() ? fallback : text;
}

void ReminderContentProvider::prefetch(const QString& contentType, const QDate& today)
{
    if (!m_llmManager || !m_llmManager->hasClients() || !isAiEnabled(contentType)
        || m_pending.contains(contentType) || !hasAiBudget(today)) {
        return;
    }

    const QJsonObject context = cacheContext(today);
    const bool cacheable = AIContentCache::rule(contentType).groupBy != AIContentCache::GroupBy::None;
    if (cacheable && !cachedText(contentType, m_cache->get(contentType, context)).isEmpty()) {
        return;
    }

    const int week = context.value("week").toInt();
    QPointer<ReminderContentProvider> guard(this);

    if (contentType == "daily_tips") {
        if (!m_tipsGenerator || week <= 0) {
            return;
        }
        m_pending.insert(contentType);
        m_tipsGenerator->requestDailyTips(week, [guard, contentType](const QJsonObject&) {
            if (guard) {
                guard->m_pending.remove(contentType);
                emit guard->contentPrefetched(contentType);
            }
        }, true, today);
        return;
    }

    if (!cacheable) {
        // 不缓存的类型（如情绪放松）没有地方保存预取结果
        return;
    }

    m_pending.insert(contentType);
    LlmCallOptions options;
    options.maxTokens = 150;
    m_llmManager->call(promptFor(contentType, week), options,
                       [guard, contentType, context](const LlmResponse& response) {
        if (!guard) {
            return;
        }
        guard->m_pending.remove(contentType);
        if (!response.success || response.content.trimmed().isEmpty()) {
            qWarning() << "AI 内容生成失败，继续使用模板：" << contentType << response.errorCode;
            return;
        }

        QJsonValue value = response.content.trimmed();
        if (contentType == "nutrition") {
            value = QJsonObject {
                {"source", "ai"},
                {"foods", PregnancyTipsGenerator::defaultNutritionFoods()},
                {"tip", response.content.trimmed()}
            };
        }
        guard->m_cache->set(contentType, context, value);
        emit guard->contentPrefetched(contentType);
    });
}

QString ReminderContentProvider::promptFor(const QString& contentType, int pregnancyWeek)
{
    const QString who = pregnancyWeek > 0 ? QString("孕 %1 周的准妈妈").arg(pregnancyWeek)
                                          : QString("在办公室工作的准妈妈");
    if (contentType == "nutrition") {
        return QString("请为%1推荐一份办公室加餐，说明营养好处，40字以内，语气温柔亲切，不要使用 Markdown。").arg(who);
    } else if (contentType == "posture") {
        return QString("请给%1写一句坐姿调整提醒，包含一个具体动作，30字以内，语气温柔亲切。").arg(who);
    } else if (contentType == "stand_up") {
        return QString("请给%1写一句起身活动提醒，包含一个适合孕期的简单动作，30字以内，语气温柔亲切。").arg(who);
    } else if (contentType == "relaxation") {
        return QString("请给%1写一句情绪放松提醒，包含一个呼吸或冥想的小练习，30字以内，语气温柔亲切。").arg(who);
    }
    return QString("请给%1写一句温馨的健康提醒，30字以内。").arg(who);
}

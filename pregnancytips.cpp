#include "pregnancytips.h"
#include "aicontentcache.h"
#include "llmmanager.h"
#include "helpers.h"
#include "constants.h"
#include <QDebug>
#include <QJsonArray>
#include <QPointer>

PregnancyTipsGenerator::PregnancyTipsGenerator(AIContentCache* cache, QObject *parent)
    : QObject(parent)
    , m_cache(cache)
    , m_llmManager(nullptr)
{
}

void PregnancyTipsGenerator::requestDailyTips(int week, TipsCallback callback, bool useAi, const QDate& today)
{
    const QJsonObject context {
        {"week", week},
        {"date", today.toString(DATE_FORMAT)},
        {"season", currentSeason(today)}
    };

    const QJsonValue cached = m_cache->get("daily_tips", context);
    if (cached.isObject() && !cached.toObject().isEmpty()) {
        callback(cached.toObject());
        return;
    }

    if (!useAi || !m_llmManager || !m_llmManager->hasClients()) {
        QJsonObject tips = staticTips(week);
        m_cache->set("daily_tips", context, tips);
        callback(tips);
        return;
    }

    const QString prompt = dailyTipsPrompt(week, context.value("season").toString(), today);
    QPointer<PregnancyTipsGenerator> guard(this);
    m_llmManager->call(prompt, [guard, week, context, callback](const LlmResponse& response) {
        QJsonObject tips;
        if (!response.success) {
            qWarning() << "AI 生成建议失败：" << response.errorMessage;
            tips = staticTips(week);
        } else if (!parseJsonObject(response.content, &tips)) {
            qWarning() << "AI 建议不是有效的 JSON，使用静态建议";
            tips = staticTips(week);
        }
        if (guard) {
            guard->m_cache->set("daily_tips", context, tips);
        }
        callback(tips);
    });
}

QJsonObject PregnancyTipsGenerator::nutritionAdvice(int week, const QDate& today)
{
    const QJsonObject context {
        {"week", week},
        {"date", today.toString(DATE_FORMAT)}
    };

    const QJsonValue cached = m_cache->get("nutrition", context);
    if (cached.isObject() && !cached.toObject().isEmpty()) {
        return cached.toObject();
    }

    QJsonObject advice {
        {"foods", defaultNutritionFoods()},
        {"tip", QString("孕 %1 周，注意均衡营养，保持少量多餐～").arg(week)}
    };
    m_cache->set("nutrition", context, advice);
    return advice;
}

QJsonArray PregnancyTipsGenerator::defaultNutritionFoods()
{
    return QJsonArray {
        QJsonObject{{"name", "坚果"}, {"benefit", "补充 DHA 和蛋白质"}, {"amount", "10-15 颗"}},
        QJsonObject{{"name", "水果"}, {"benefit", "补充维生素"}, {"amount", "1 份"}},
        QJsonObject{{"name", "酸奶"}, {"benefit", "补充钙质和益生菌"}, {"amount", "1 杯"}}
    };
}

QJsonObject PregnancyTipsGenerator::staticTips(int week)
{
    if (week <= 13) {
        return QJsonObject {
            {"precautions", "孕早期注意休息，避免剧烈运动，远离烟酒和有害物质"},
            {"activities", "可以进行轻度散步，保持心情愉悦"},
            {"diet_tips", "少量多餐，补充叶酸，多吃新鲜蔬果"},
            {"exercise", "适度散步，避免剧烈运动"},
            {"mood", "保持好心情，适当放松"},
            {"baby_update", "宝宝正在快速发育，各器官开始形成"}
        };
    } else if (week <= 27) {
        return QJsonObject {
            {"precautions", "孕中期相对稳定，但仍需注意定期产检"},
            {"activities", "可以适当增加活动量，进行孕妇瑜伽"},
            {"diet_tips", "注意补充钙、铁，保持均衡饮食"},
            {"exercise", "孕妇瑜伽、游泳都是不错的选择"},
            {"mood", "享受孕期，和宝宝互动"},
            {"baby_update", "宝宝活动增多，可能感受到明显胎动"}
        };
    }
    return QJsonObject {
        {"precautions", "孕晚期注意胎动，准备待产包"},
        {"activities", "适当活动有助于顺产，但避免过度劳累"},
        {"diet_tips", "少食多餐，控制体重，补充蛋白质"},
        {"exercise", "散步为主，避免剧烈运动"},
        {"mood", "放松心情，为分娩做准备"},
        {"baby_update", "宝宝已经基本发育成熟，随时准备出生"}
    };
}

QString PregnancyTipsGenerator::dailyTipsPrompt(int week, const QString& season, const QDate& date)
{
    return QString(
        "你是一位专业的孕期顾问。请为孕 %1 周的准妈妈生成今日建议。\n"
        "\n"
        "当前信息：\n"
        "- 孕周：%1 周\n"
        "- 季节：%2\n"
        "- 日期：%3\n"
        "\n"
        "请生成以下内容，JSON 格式返回：\n"
        "{\n"
        "    \"precautions\": \"今日注意事项（50字内）\",\n"
        "    \"activities\": \"今日可做的事情（50字内）\",\n"
        "    \"diet_tips\": \"饮食建议（50字内）\",\n"
        "    \"exercise\": \"运动建议（30字内）\",\n"
        "    \"mood\": \"情绪调节建议（30字内）\",\n"
        "    \"baby_update\": \"宝宝发育小知识（50字内）\"\n"
        "}\n"
        "\n"
        "要求：\n"
        "1. 内容要针对具体孕周\n"
        "2. 语气温柔亲切\n"
        "3. 建议要具体可执行\n"
        "4. 考虑当前季节特点\n")
        .arg(week)
        .arg(season, date.toString(DATE_FORMAT));
}

QString PregnancyTipsGenerator::formatTips(const QJsonObject& tips)
{
    QStringList lines;
    const QString precautions = tips.value("precautions").toString();
    const QString diet = tips.value("diet_tips").toString();
    const QString baby = tips.value("baby_update").toString();
    if (!precautions.isEmpty()) {
        lines << "📌 " + precautions;
    }
    if (!diet.isEmpty()) {
        lines << "🥗 " + diet;
    }
    if (!baby.isEmpty()) {
        lines << "👶 " + baby;
    }
    return lines.join("\n");
}

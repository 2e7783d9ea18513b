#include "dietanalyzer.h"
#include "aicontentcache.h"
#include "databasemanager.h"
#include "llmmanager.h"
#include "helpers.h"
#include "constants.h"
#include <QDebug>
#include <QJsonArray>
#include <QPointer>
#include <QRegularExpression>
#include <QTime>

namespace {

bool containsAny(const QStringList& foods, const QStringList& keywords)
{
    for (const QString& food : foods) {
        for (const QString& keyword : keywords) {
            if (food.contains(keyword)) {
                return true;
            }
        }
    }
    return false;
}

}

DietAnalyzer::DietAnalyzer(AIContentCache* cache, QObject *parent)
    : QObject(parent)
    , m_cache(cache)
    , m_llmManager(nullptr)
{
}

QStringList DietAnalyzer::parseFoods(const QString& text)
{
    static const QRegularExpression separators("[,，、\\n]+");
    QStringList foods;
    for (const QString& part : text.split(separators, Qt::SkipEmptyParts)) {
        const QString food = part.trimmed();
        if (!food.isEmpty()) {
            foods << food;
        }
    }
    return foods;
}

bool DietAnalyzer::addMeal(const QDate& date, const QString& mealType, const QStringList& foods, const QString& time)
{
    if (foods.isEmpty()) {
        qWarning() << "食物内容为空，不保存饮食记录";
        return false;
    }
    if (!mealTypes().contains(mealType)) {
        qWarning() << "未知的餐食类型：" << mealType;
        return false;
    }

    MealRecord meal;
    meal.type = mealType;
    meal.time = time.isEmpty() ? QTime::currentTime().toString(CLOCK_FORMAT) : time;
    meal.foods = foods;
    if (!DatabaseManager::instance().addMeal(date, meal)) {
        return false;
    }

    // 饮食内容变化后旧的分析不再适用
    QJsonObject context {{"date", date.toString(DATE_FORMAT)}};
    const QString key = m_cache->cacheKey("diet_analysis", context, date);
    if (!key.isEmpty()) {
        DatabaseManager::instance().removeCacheEntry(key);
    }
    return true;
}

void DietAnalyzer::analyze(const QDate& date, ResultCallback callback, int pregnancyWeek)
{
    const DietRecord record = DatabaseManager::instance().getDietRecord(date);
    if (record.meals.isEmpty()) {
        Result result;
        result.errorMessage = "请先记录今日饮食再进行分析";
        callback(result);
        return;
    }

    const QJsonObject context {{"date", date.toString(DATE_FORMAT)}};
    const QJsonValue cached = m_cache->get("diet_analysis", context);
    if (cached.isObject() && !cached.toObject().isEmpty()) {
        finish(date, cached.toObject(), true, callback);
        return;
    }

    if (!m_llmManager || !m_llmManager->hasClients()) {
        finish(date, ruleBasedAnalysis(record), false, callback);
        return;
    }

    QPointer<DietAnalyzer> guard(this);
    m_llmManager->call(analysisPrompt(record, pregnancyWeek),
                       [guard, date, record, context, callback](const LlmResponse& response) {
        if (!guard) {
            return;
        }
        QJsonObject analysis;
        if (response.success && parseJsonObject(response.content, &analysis)) {
            guard->m_cache->set("diet_analysis", context, analysis);
            guard->finish(date, analysis, true, callback);
            return;
        }
        qWarning() << "AI 饮食分析失败，使用规则分析：" << response.errorCode << response.errorMessage;
        guard->finish(date, ruleBasedAnalysis(record), false, callback);
    });
}

void DietAnalyzer::finish(const QDate& date, const QJsonObject& analysis, bool fromAi, ResultCallback callback)
{
    Result result;
    result.analysis = analysis;
    result.fromAi = fromAi;
    result.success = DatabaseManager::instance().updateDietAnalysis(date, analysis);
    if (!result.success) {
        result.errorMessage = "保存分析结果失败";
    }
    callback(result);
}

QJsonObject DietAnalyzer::ruleBasedAnalysis(const DietRecord& record)
{
    QStringList allFoods;
    QStringList recordedTypes;
    for (const MealRecord& meal : record.meals) {
        allFoods << meal.foods;
        recordedTypes << meal.type;
    }

    const bool hasProtein = containsAny(allFoods, {"肉", "鱼", "虾", "蛋", "奶", "豆", "鸡", "牛", "羊"});
    const bool hasVegetable = containsAny(allFoods, {"菜", "蔬", "瓜", "菇", "笋", "萝卜", "西兰花"});
    const bool hasFruit = containsAny(allFoods, {"果", "苹果", "香蕉", "橙", "梨", "莓", "葡萄"});
    const bool hasStaple = containsAny(allFoods, {"饭", "面", "粥", "馒头", "包子", "饼", "薯", "玉米"});

    int mainMeals = 0;
    for (const QString& type : {QString("breakfast"), QString("lunch"), QString("dinner")}) {
        if (recordedTypes.contains(type)) {
            mainMeals++;
        }
    }

    QJsonObject status {
        {"餐次", mainMeals == 3 ? QString("三餐齐全") : QString("已记录 %1/3 正餐").arg(mainMeals)},
        {"蛋白质", hasProtein ? "充足" : "偏少"},
        {"蔬菜", hasVegetable ? "充足" : "偏少"},
        {"水果", hasFruit ? "有摄入" : "未摄入"},
        {"主食", hasStaple ? "有摄入" : "偏少"}
    };

    QJsonArray recommendations;
    if (!hasProtein) {
        recommendations.append(QJsonObject{{"food", "鸡蛋、鱼虾"}, {"benefit", "补充优质蛋白，促进宝宝发育"}});
    }
    if (!hasVegetable) {
        recommendations.append(QJsonObject{{"food", "深绿色蔬菜"}, {"benefit", "补充叶酸和膳食纤维"}});
    }
    if (!hasFruit) {
        recommendations.append(QJsonObject{{"food", "新鲜水果"}, {"benefit", "补充维生素 C"}});
    }
    recommendations.append(QJsonObject{{"food", "牛奶或酸奶"}, {"benefit", "补充钙质"}});

    QString tip;
    if (!recordedTypes.contains("breakfast")) {
        tip = "记得按时吃早餐，保持血糖稳定～";
    } else if (mainMeals < 3) {
        tip = "三餐规律很重要，少量多餐更适合孕期～";
    } else {
        tip = "今天的饮食很规律，继续保持均衡营养～";
    }

    return QJsonObject {
        {"nutrition_status", status},
        {"recommendations", recommendations},
        {"tip", tip}
    };
}

QString DietAnalyzer::analysisPrompt(const DietRecord& record, int pregnancyWeek)
{
    QStringList lines;
    for (const MealRecord& meal : record.meals) {
        lines << QString("- %1（%2）：%3").arg(mealTypeDisplayName(meal.type), meal.time, meal.foods.join("、"));
    }
    const QString weekText = pregnancyWeek > 0 ? QString("孕 %1 周的准妈妈").arg(pregnancyWeek) : QString("准妈妈");

    return QString(
        "你是一位专业的孕期营养师。以下是%1今天的饮食记录：\n"
        "%2\n"
        "\n"
        "请分析营养状况并推荐补充的食物，JSON 格式返回：\n"
        "{\n"
        "    \"nutrition_status\": {\"蛋白质\": \"充足/偏少\", \"蔬菜\": \"...\", \"水果\": \"...\"},\n"
        "    \"recommendations\": [{\"food\": \"食物名\", \"benefit\": \"好处（20字内）\"}],\n"
        "    \"tip\": \"一句温馨提示（30字内）\"\n"
        "}\n")
        .arg(weekText, lines.join("\n"));
}

QString DietAnalyzer::formatAnalysis(const QJsonObject& analysis)
{
    QStringList statusParts;
    const QJsonObject status = analysis.value("nutrition_status").toObject();
    for (auto it = status.constBegin(); it != status.constEnd(); ++it) {
        statusParts << QString("%1: %2").arg(it.key(), it.value().toString());
    }

    QStringList recommendationLines;
    for (const QJsonValue& value : analysis.value("recommendations").toArray()) {
        const QJsonObject item = value.toObject();
        recommendationLines << QString("• %1 - %2").arg(item.value("food").toString(),
                                                       item.value("benefit").toString());
    }

    return QString("【营养状态】\n%1\n\n【推荐食物】\n%2\n\n💡 %3")
        .arg(statusParts.join(" · "), recommendationLines.join("\n"), analysis.value("tip").toString());
}

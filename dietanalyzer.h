#ifndef DIETANALYZER_H
#define DIETANALYZER_H

#include <QObject>
#include <QDate>
#include <QJsonObject>
#include <QStringList>
#include <functional>
#include "models.h"

class AIContentCache;
class LlmManager;

// 饮食记录与营养分析
class DietAnalyzer : public QObject
{
    Q_OBJECT
public:
    struct Result {
        bool success = false;
        QJsonObject analysis;       // nutrition_status, recommendations[{food, benefit}], tip
        QString errorMessage;
        bool fromAi = false;
    };
    using ResultCallback = std::function<void(const Result&)>;

    explicit DietAnalyzer(AIContentCache* cache, QObject *parent = nullptr);

    void setLlmManager(LlmManager* manager) { m_llmManager = manager; }

    // 按 , ， 、 和换行分隔食物
    static QStringList parseFoods(const QString& text);

    // 食物为空或餐食类型未知时返回 false；time 为空时使用当前时间
    bool addMeal(const QDate& date, const QString& mealType, const QStringList& foods,
                 const QString& time = QString());

    // 分析某天的饮食，结果保存到当天的饮食记录
    void analyze(const QDate& date, ResultCallback callback, int pregnancyWeek = -1);

    static QJsonObject ruleBasedAnalysis(const DietRecord& record);
    static QString analysisPrompt(const DietRecord& record, int pregnancyWeek);
    static QString formatAnalysis(const QJsonObject& analysis);

private:
    void finish(const QDate& date, const QJsonObject& analysis, bool fromAi, ResultCallback callback);

    AIContentCache* m_cache;
    LlmManager* m_llmManager;
};

#endif // DIETANALYZER_H

#ifndef PREGNANCYTIPS_H
#define PREGNANCYTIPS_H

#include <QObject>
#include <QDate>
#include <QJsonObject>
#include <QJsonArray>
#include <functional>

class AIContentCache;
class LlmManager;

// 孕期每日建议生成（AI 优先，失败时使用按孕期阶段的静态建议）
class PregnancyTipsGenerator : public QObject
{
    Q_OBJECT
public:
    using TipsCallback = std::function<void(const QJsonObject&)>;

    explicit PregnancyTipsGenerator(AIContentCache* cache, QObject *parent = nullptr);

    void setLlmManager(LlmManager* manager) { m_llmManager = manager; }

    // 每日建议：precautions, activities, diet_tips, exercise, mood, baby_update
    void requestDailyTips(int week, TipsCallback callback, bool useAi = true,
                          const QDate& today = QDate::currentDate());

    // 营养建议：foods[{name, benefit, amount}], tip，按孕周缓存
    QJsonObject nutritionAdvice(int week, const QDate& today = QDate::currentDate());

    static QJsonObject staticTips(int week);
    static QJsonArray defaultNutritionFoods();
    static QString dailyTipsPrompt(int week, const QString& season, const QDate& date);
    // 通知正文用的简短文字
    static QString formatTips(const QJsonObject& tips);

private:
    AIContentCache* m_cache;
    LlmManager* m_llmManager;
};

#endif // PREGNANCYTIPS_H

#include "testutils.h"
#include "pregnancytips.h"
#include "aicontentcache.h"
#include "llmmanager.h"
#include "fakellmclient.h"

class PregnancyTipsTest : public TempDataTest
{
protected:
    QJsonObject request(PregnancyTipsGenerator& generator, int week, bool useAi = true)
    {
        QJsonObject tips;
        generator.requestDailyTips(week, [&tips](const QJsonObject& result) { tips = result; }, useAi, m_today);
        return tips;
    }

    AIContentCache m_cache;
    const QDate m_today {QDate::currentDate()};
};

TEST(PregnancyTipsStaticTest, TipsFollowTrimester)
{
    EXPECT_EQ(PregnancyTipsGenerator::staticTips(8).value("exercise").toString(), "适度散步，避免剧烈运动");
    EXPECT_EQ(PregnancyTipsGenerator::staticTips(13).value("exercise").toString(), "适度散步，避免剧烈运动");
    EXPECT_EQ(PregnancyTipsGenerator::staticTips(14).value("exercise").toString(), "孕妇瑜伽、游泳都是不错的选择");
    EXPECT_EQ(PregnancyTipsGenerator::staticTips(27).value("exercise").toString(), "孕妇瑜伽、游泳都是不错的选择");
    EXPECT_EQ(PregnancyTipsGenerator::staticTips(28).value("exercise").toString(), "散步为主，避免剧烈运动");

    const QJsonObject tips = PregnancyTipsGenerator::staticTips(20);
    for (const char* key : {"precautions", "activities", "diet_tips", "exercise", "mood", "baby_update"}) {
        EXPECT_FALSE(tips.value(key).toString().isEmpty()) << key;
    }
}

TEST(PregnancyTipsStaticTest, FormatsShortNotification)
{
    const QJsonObject tips {
        {"precautions", "注意休息"},
        {"diet_tips", "多吃蔬菜"},
        {"baby_update", "宝宝会打嗝了"},
        {"mood", "开心"}
    };
    EXPECT_EQ(PregnancyTipsGenerator::formatTips(tips), "📌 注意休息\n🥗 多吃蔬菜\n👶 宝宝会打嗝了");
    EXPECT_EQ(PregnancyTipsGenerator::formatTips(QJsonObject{{"diet_tips", "喝汤"}}), "🥗 喝汤");
    EXPECT_TRUE(PregnancyTipsGenerator::formatTips(QJsonObject()).isEmpty());
}

TEST(PregnancyTipsStaticTest, PromptMentionsWeekAndSeason)
{
    const QString prompt = PregnancyTipsGenerator::dailyTipsPrompt(24, "夏季", QDate(2024, 7, 1));
    EXPECT_TRUE(prompt.contains("孕 24 周"));
    EXPECT_TRUE(prompt.contains("季节：夏季"));
    EXPECT_TRUE(prompt.contains("日期：2024-07-01"));
}

TEST_F(PregnancyTipsTest, StaticTipsWithoutLlmAreCached)
{
    PregnancyTipsGenerator generator(&m_cache);
    const QJsonObject tips = request(generator, 10);
    EXPECT_EQ(tips, PregnancyTipsGenerator::staticTips(10));
    EXPECT_EQ(m_cache.stats().byType.value("daily_tips"), 1);
}

TEST_F(PregnancyTipsTest, AiTipsAreCachedForTheDay)
{
    LlmManager manager(path("llm_config.json"));
    auto* client = new FakeLlmClient("DeepSeek");
    client->succeed("```json\n{\"precautions\":\"AI 建议\",\"diet_tips\":\"喝牛奶\"}\n```");
    manager.setClient("deepseek", client);

    PregnancyTipsGenerator generator(&m_cache);
    generator.setLlmManager(&manager);

    QJsonObject tips = request(generator, 20);
    EXPECT_EQ(tips.value("precautions").toString(), "AI 建议");
    EXPECT_EQ(client->prompts.size(), 1);

    tips = request(generator, 20);
    EXPECT_EQ(tips.value("diet_tips").toString(), "喝牛奶");
    EXPECT_EQ(client->prompts.size(), 1);
}

TEST_F(PregnancyTipsTest, InvalidAiReplyFallsBackToStatic)
{
    LlmManager manager(path("llm_config.json"));
    auto* client = new FakeLlmClient("DeepSeek");
    client->succeed("今天记得多休息");
    manager.setClient("deepseek", client);

    PregnancyTipsGenerator generator(&m_cache);
    generator.setLlmManager(&manager);
    EXPECT_EQ(request(generator, 30), PregnancyTipsGenerator::staticTips(30));
}

TEST_F(PregnancyTipsTest, AiSkippedWhenDisabled)
{
    LlmManager manager(path("llm_config.json"));
    auto* client = new FakeLlmClient("DeepSeek");
    client->succeed("{\"precautions\":\"不会用到\"}");
    manager.setClient("deepseek", client);

    PregnancyTipsGenerator generator(&m_cache);
    generator.setLlmManager(&manager);
    EXPECT_EQ(request(generator, 16, false), PregnancyTipsGenerator::staticTips(16));
    EXPECT_TRUE(client->prompts.isEmpty());
}

TEST_F(PregnancyTipsTest, NutritionAdviceCachedByWeek)
{
    PregnancyTipsGenerator generator(&m_cache);
    const QJsonObject advice = generator.nutritionAdvice(22, m_today);
    EXPECT_EQ(advice.value("foods").toArray().size(), 3);
    EXPECT_EQ(advice.value("tip").toString(), "孕 22 周，注意均衡营养，保持少量多餐～");
    EXPECT_EQ(m_cache.stats().byType.value("nutrition"), 1);
    EXPECT_EQ(generator.nutritionAdvice(22, m_today), advice);
    EXPECT_EQ(m_cache.stats().byType.value("nutrition"), 1);
}

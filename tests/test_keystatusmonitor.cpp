#include <gtest/gtest.h>
#include <QTemporaryDir>
#include <QDir>
#include <memory>
#include "keystatusmonitor.h"
#include "llmmanager.h"
#include "fakellmclient.h"

class KeyStatusMonitorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_manager.reset(new LlmManager(QDir(m_dir.path()).filePath("llm_config.json")));
    }

    void setKeyStatus(const QString& provider, const QJsonObject& status)
    {
        ASSERT_TRUE(m_manager->updateProviderConfig(provider, QJsonObject{{"key_status", status}}));
    }

    QTemporaryDir m_dir;
    std::unique_ptr<LlmManager> m_manager;
};

TEST_F(KeyStatusMonitorTest, NothingToCheckWithoutKeys)
{
    KeyStatusMonitor monitor(m_manager.get());
    bool called = false;
    monitor.checkOnStartup([&called](const QStringList& warnings) {
        called = true;
        EXPECT_TRUE(warnings.isEmpty());
    });
    EXPECT_TRUE(called);
    EXPECT_EQ(monitor.statusSummary(), "⚠️ DeepSeek 不可用：未知错误");
    EXPECT_EQ(monitor.recommendations(), QStringList{"💡 建议配置至少一个 AI 模型的 API Key"});
}

TEST_F(KeyStatusMonitorTest, StartupCheckReportsInvalidKeys)
{
    ASSERT_TRUE(m_manager->setApiKey("deepseek", "sk-good"));
    ASSERT_TRUE(m_manager->setApiKey("openai", "sk-bad"));
    auto* good = new FakeLlmClient("DeepSeek");
    auto* bad = new FakeLlmClient("OpenAI");
    good->succeed("你好");
    bad->fail("invalid_api_key");
    m_manager->setClient("deepseek", good);
    m_manager->setClient("openai", bad);

    KeyStatusMonitor monitor(m_manager.get());
    QStringList emitted;
    QObject::connect(&monitor, &KeyStatusMonitor::warningsReady,
                     [&emitted](const QStringList& warnings) { emitted = warnings; });

    QStringList warnings;
    monitor.checkOnStartup([&warnings](const QStringList& result) { warnings = result; });
    EXPECT_EQ(warnings, QStringList{"OpenAI API Key 无效：invalid_api_key"});
    EXPECT_EQ(emitted, warnings);

    EXPECT_EQ(monitor.statusSummary(), "✓ DeepSeek 正常");
    EXPECT_EQ(monitor.recommendations(), QStringList{"💡 建议配置备用 AI 模型，以防主模型不可用"});

    int attention = 0;
    for (const ProviderKeyState& state : monitor.allStatus()) {
        if (state.needsAttention) {
            attention++;
            EXPECT_EQ(state.id, "openai");
        }
    }
    EXPECT_EQ(attention, 1);
}

TEST_F(KeyStatusMonitorTest, SuggestsSwitchingWhenActiveIsInvalid)
{
    ASSERT_TRUE(m_manager->setApiKey("qwen", "sk-qwen"));
    setKeyStatus("qwen", QJsonObject{{"valid", true}});
    setKeyStatus("deepseek", QJsonObject{{"valid", false}, {"error", "invalid_api_key"}});

    KeyStatusMonitor monitor(m_manager.get());
    QStringList recommendations = monitor.recommendations();
    ASSERT_EQ(recommendations.size(), 2);
    EXPECT_EQ(recommendations[1], "💡 当前模型不可用，建议切换到：通义千问");
    EXPECT_EQ(monitor.statusSummary(), "⚠️ DeepSeek 不可用：invalid_api_key");
}

TEST_F(KeyStatusMonitorTest, ExpiryAndBalanceReminders)
{
    const QDateTime now(QDate(2024, 6, 10), QTime(9, 0));

    setKeyStatus("deepseek", QJsonObject{
        {"valid", true},
        {"expires_at", now.addDays(3).toString(Qt::ISODate)}
    });
    KeyStatusMonitor monitor(m_manager.get());
    EXPECT_TRUE(monitor.shouldRemindExpiry("deepseek", now));
    EXPECT_FALSE(monitor.shouldRemindExpiry("deepseek", now.addDays(-30)));

    setKeyStatus("qwen", QJsonObject{{"valid", true}, {"balance", 5.5}});
    EXPECT_TRUE(monitor.shouldRemindExpiry("qwen", now));
    setKeyStatus("qwen", QJsonObject{{"valid", true}, {"balance", 50.0}});
    EXPECT_FALSE(monitor.shouldRemindExpiry("qwen", now));

    EXPECT_FALSE(monitor.shouldRemindExpiry("unknown", now));
}

#include <gtest/gtest.h>
#include <QJsonDocument>
#include "openaiclient.h"
#include "qwenclient.h"

namespace {

QJsonObject providerConfig(const QString& name, const QString& apiKey)
{
    return QJsonObject {
        {"name", name},
        {"api_key", apiKey}
    };
}

QJsonObject decodeSegment(const QString& segment)
{
    const QByteArray raw = QByteArray::fromBase64(segment.toLatin1(), QByteArray::Base64UrlEncoding);
    return QJsonDocument::fromJson(raw).object();
}

} // namespace

TEST(OpenAiCompatibleClientTest, FillsProviderDefaults)
{
    OpenAiCompatibleClient client("deepseek", providerConfig("DeepSeek", "sk-test"));
    EXPECT_EQ(client.model(), "deepseek-chat");
    EXPECT_EQ(client.providerName(), "DeepSeek");
    EXPECT_TRUE(client.isConfigured());

    OpenAiCompatibleClient empty("openai", providerConfig("OpenAI", QString()));
    EXPECT_EQ(empty.model(), "gpt-4o-mini");
    EXPECT_FALSE(empty.isConfigured());
}

TEST(OpenAiCompatibleClientTest, ParsesSuccessfulReply)
{
    OpenAiCompatibleClient client("deepseek", providerConfig("DeepSeek", "sk-test"));
    const QByteArray body = R"({"choices":[{"message":{"role":"assistant","content":"记得喝水"}}],)"
                            R"("usage":{"total_tokens":42}})";

    LlmResponse response = client.parseReply(200, body);
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.content, "记得喝水");
    EXPECT_EQ(response.tokensUsed, 42);
    EXPECT_EQ(response.provider, "DeepSeek");
    EXPECT_EQ(response.model, "deepseek-chat");
}

TEST(OpenAiCompatibleClientTest, MalformedSuccessIsParseError)
{
    OpenAiCompatibleClient client("deepseek", providerConfig("DeepSeek", "sk-test"));
    EXPECT_EQ(client.parseReply(200, "not json").errorCode, "parse_error");
    EXPECT_EQ(client.parseReply(200, R"({"choices":[]})").errorCode, "parse_error");
}

TEST(OpenAiCompatibleClientTest, ReportsApiErrors)
{
    OpenAiCompatibleClient client("openai", providerConfig("OpenAI", "sk-test"));

    LlmResponse response = client.parseReply(401,
        R"({"error":{"message":"Incorrect API key","code":"invalid_api_key"}})");
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.errorCode, "invalid_api_key");
    EXPECT_EQ(response.errorMessage, "Incorrect API key");

    response = client.parseReply(429, R"({"error":{"message":"slow down","type":"rate_limit"}})");
    EXPECT_EQ(response.errorCode, "rate_limit");

    response = client.parseReply(502, "<html>bad gateway</html>");
    EXPECT_EQ(response.errorCode, "http_502");
}

TEST(OpenAiCompatibleClientTest, MissingKeyFailsWithoutRequest)
{
    OpenAiCompatibleClient client("deepseek", providerConfig("DeepSeek", QString()));
    bool called = false;
    client.call("你好", LlmCallOptions(), [&called](const LlmResponse& response) {
        called = true;
        EXPECT_FALSE(response.success);
        EXPECT_EQ(response.errorCode, "missing_api_key");
    });
    EXPECT_TRUE(called);

    KeyStatus status;
    client.checkKeyStatus([&status](const KeyStatus& result) { status = result; });
    EXPECT_FALSE(status.valid);
    EXPECT_EQ(status.error, "missing_api_key");
}

TEST(QwenClientTest, ParsesReplies)
{
    QwenClient client(providerConfig("通义千问", "sk-qwen"));
    EXPECT_EQ(client.model(), "qwen-turbo");

    LlmResponse response = client.parseReply(200,
        R"({"output":{"text":"起来走走"},"usage":{"total_tokens":17}})");
    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.content, "起来走走");
    EXPECT_EQ(response.tokensUsed, 17);

    response = client.parseReply(200, R"({"code":"Arrearage","message":"欠费"})");
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.errorCode, "Arrearage");

    response = client.parseReply(400, R"({"code":"InvalidApiKey","message":"Invalid API-key"})");
    EXPECT_EQ(response.errorCode, "InvalidApiKey");
    EXPECT_EQ(response.errorMessage, "Invalid API-key");

    EXPECT_EQ(client.parseReply(500, "").errorCode, "http_500");
}

TEST(Glm4ClientTest, GeneratesSignedToken)
{
    const qint64 now = 1700000000000;
    QString error;
    const QString token = Glm4Client::generateToken("myid.mysecret", now, &error);
    ASSERT_FALSE(token.isEmpty());
    EXPECT_TRUE(error.isEmpty());

    const QStringList parts = token.split('.');
    ASSERT_EQ(parts.size(), 3);
    EXPECT_FALSE(parts[2].isEmpty());
    EXPECT_FALSE(token.contains('='));

    const QJsonObject header = decodeSegment(parts[0]);
    EXPECT_EQ(header.value("alg").toString(), "HS256");
    EXPECT_EQ(header.value("sign_type").toString(), "SIGN");

    const QJsonObject payload = decodeSegment(parts[1]);
    EXPECT_EQ(payload.value("api_key").toString(), "myid");
    EXPECT_EQ(static_cast<qint64>(payload.value("exp").toDouble()), now / 1000 + 3600);
    EXPECT_EQ(static_cast<qint64>(payload.value("timestamp").toDouble()), now);

    // 同样输入得到同样签名，不同密钥签名不同
    EXPECT_EQ(Glm4Client::generateToken("myid.mysecret", now), token);
    EXPECT_NE(Glm4Client::generateToken("myid.other", now).split('.').at(2), parts[2]);
}

TEST(Glm4ClientTest, RejectsMalformedKey)
{
    QString error;
    EXPECT_TRUE(Glm4Client::generateToken("no-dot-key", 0, &error).isEmpty());
    EXPECT_FALSE(error.isEmpty());
    EXPECT_TRUE(Glm4Client::generateToken("a.b.c", 0).isEmpty());
    EXPECT_TRUE(Glm4Client::generateToken(".secret", 0).isEmpty());

    Glm4Client client(providerConfig("智谱 GLM-4", "no-dot-key"));
    EXPECT_EQ(client.model(), "glm-4");

    LlmResponse response;
    client.call("你好", LlmCallOptions(), [&response](const LlmResponse& result) { response = result; });
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.errorCode, "token_generation_failed");

    KeyStatus status;
    status.valid = true;
    client.checkKeyStatus([&status](const KeyStatus& result) { status = result; });
    EXPECT_FALSE(status.valid);
    EXPECT_EQ(status.error, "invalid_format");
}

TEST(OpenAiCompatibleClientTest, DeletingClientFailsPendingRequest)
{
    QJsonObject config = providerConfig("DeepSeek", "sk-test");
    config["api_base"] = "http://127.0.0.1:9";
    auto* client = new OpenAiCompatibleClient("deepseek", config);

    int calls = 0;
    LlmResponse response;
    client->call("你好", LlmCallOptions(), [&calls, &response](const LlmResponse& result) {
        calls++;
        response = result;
    });
    // 没有事件循环，请求仍在进行中
    EXPECT_EQ(calls, 0);

    delete client;
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.errorCode, "network_error");
}

#ifndef OPENAICLIENT_H
#define OPENAICLIENT_H

#include "llmclient.h"

// OpenAI 兼容接口（DeepSeek、OpenAI）：POST <api_base>/chat/completions
class OpenAiCompatibleClient : public HttpLlmClient
{
    Q_OBJECT
public:
    // providerId：deepseek / openai / glm4，用于补全默认 api_base 和 model
    OpenAiCompatibleClient(const QString& providerId, const QJsonObject& config, QObject *parent = nullptr);

    QString providerId() const { return m_providerId; }

    LlmResponse parseReply(int httpStatus, const QByteArray& body) const override;

protected:
    QUrl endpoint() const override;
    QJsonObject buildPayload(const QString& prompt, const LlmCallOptions& options) const override;
    bool isKeyError(const QString& errorCode) const override;

private:
    QString m_providerId;
};

// 智谱 GLM-4：Key 格式为 "id.secret"，请求使用 HS256 签名的 JWT
class Glm4Client : public OpenAiCompatibleClient
{
    Q_OBJECT
public:
    explicit Glm4Client(const QJsonObject& config, QObject *parent = nullptr);

    // 生成一小时有效的 Token，Key 格式错误时返回空字符串并填写 error
    static QString generateToken(const QString& apiKey, qint64 nowMSecs, QString* error = nullptr);

protected:
    bool authorizationToken(QString* token, LlmResponse* error) const override;
    bool isKeyError(const QString& errorCode) const override;
    bool precheckKey(KeyStatus* status) const override;
};

#endif // OPENAICLIENT_H

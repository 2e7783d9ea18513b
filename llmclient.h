#ifndef LLMCLIENT_H
#define LLMCLIENT_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QJsonObject>
#include <QUrl>
#include <QHash>
#include <functional>

class QNetworkAccessManager;
class QNetworkReply;

// 统一的 LLM 响应格式
struct LlmResponse {
    bool success = false;
    QString content;
    QString provider;
    QString model;
    int tokensUsed = 0;
    QString errorMessage;
    QString errorCode;
};

// 单次调用参数，<= 0 表示使用提供商配置
struct LlmCallOptions {
    int maxTokens = 0;
    double temperature = -1.0;
};

// API Key 状态（保存在 llm_config.json 的 key_status 中）
struct KeyStatus {
    bool valid = false;
    QDateTime checkedAt;
    QString error;
    QString message;
    bool hasBalance = false;
    double balance = 0.0;
    QDateTime expiresAt;

    QJsonObject toJson() const;
    static KeyStatus fromJson(const QJsonObject& obj);
};

using LlmCallback = std::function<void(const LlmResponse&)>;
using KeyStatusCallback = std::function<void(const KeyStatus&)>;

// LLM 客户端基类
class LlmClient : public QObject
{
    Q_OBJECT
public:
    // config：提供商配置，包含 name, api_key, api_base, model, max_tokens, temperature
    explicit LlmClient(const QJsonObject& config, QObject *parent = nullptr);
    ~LlmClient() override = default;

    QString providerName() const;
    QString model() const { return m_model; }
    virtual bool isConfigured() const;

    // 异步调用，callback 总会被调用一次（失败时 success 为 false）
    virtual void call(const QString& prompt, const LlmCallOptions& options, LlmCallback callback) = 0;

    // 发送一个简短的测试请求检查 Key
    virtual void checkKeyStatus(KeyStatusCallback callback);

protected:
    // 该错误码是否说明 Key 本身不可用
    virtual bool isKeyError(const QString& errorCode) const;
    // 发请求之前的本地检查（如 Key 格式），返回 false 时 status 已填好
    virtual bool precheckKey(KeyStatus* status) const;

    LlmResponse createErrorResponse(const QString& errorMessage, const QString& errorCode) const;
    LlmResponse createSuccessResponse(const QString& content, int tokensUsed) const;

    QJsonObject m_config;
    QString m_apiKey;
    QString m_apiBase;
    QString m_model;
    int m_maxTokens;
    double m_temperature;
};

// 基于 HTTP JSON 接口的客户端：统一处理请求、超时和网络错误
class HttpLlmClient : public LlmClient
{
    Q_OBJECT
public:
    HttpLlmClient(const QJsonObject& config, int timeoutMs, QObject *parent = nullptr);
    // 未完成的请求以 network_error 结束
    ~HttpLlmClient() override;

    void call(const QString& prompt, const LlmCallOptions& options, LlmCallback callback) override;

    // 把 HTTP 状态码和响应体转换为统一响应
    virtual LlmResponse parseReply(int httpStatus, const QByteArray& body) const = 0;

protected:
    virtual QUrl endpoint() const = 0;
    virtual QJsonObject buildPayload(const QString& prompt, const LlmCallOptions& options) const = 0;
    // 默认直接使用 API Key，失败时填写 error 并返回 false
    virtual bool authorizationToken(QString* token, LlmResponse* error) const;

    int effectiveMaxTokens(const LlmCallOptions& options) const;
    double effectiveTemperature(const LlmCallOptions& options) const;

private:
    QNetworkAccessManager* m_network;
    int m_timeoutMs;
    QHash<QNetworkReply*, LlmCallback> m_pending;
};

#endif // LLMCLIENT_H

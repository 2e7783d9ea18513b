#include "llmclient.h"
#include <QDebug>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>

QJsonObject KeyStatus::toJson() const
{
    QJsonObject obj {
        {"valid", valid},
        {"checked_at", checkedAt.isValid() ? QJsonValue(checkedAt.toString(Qt::ISODate)) : QJsonValue(QJsonValue::Null)},
        {"error", error.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(error)}
    };
    if (!message.isEmpty()) {
        obj["message"] = message;
    }
    if (hasBalance) {
        obj["balance"] = balance;
    }
    if (expiresAt.isValid()) {
        obj["expires_at"] = expiresAt.toString(Qt::ISODate);
    }
    return obj;
}

KeyStatus KeyStatus::fromJson(const QJsonObject& obj)
{
    KeyStatus status;
    status.valid = obj.value("valid").toBool(false);
    status.checkedAt = QDateTime::fromString(obj.value("checked_at").toString(), Qt::ISODate);
    status.error = obj.value("error").toString();
    status.message = obj.value("message").toString();
    status.hasBalance = obj.value("balance").isDouble();
    status.balance = obj.value("balance").toDouble();
    status.expiresAt = QDateTime::fromString(obj.value("expires_at").toString(), Qt::ISODate);
    return status;
}

LlmClient::LlmClient(const QJsonObject& config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_apiKey(config.value("api_key").toString())
    , m_apiBase(config.value("api_base").toString())
    , m_model(config.value("model").toString())
    , m_maxTokens(config.value("max_tokens").toInt(500))
    , m_temperature(config.value("temperature").toDouble(0.7))
{
}

QString LlmClient::providerName() const
{
    return m_config.value("name").toString("Unknown");
}

bool LlmClient::isConfigured() const
{
    return !m_apiKey.isEmpty() && !m_apiBase.isEmpty();
}

bool LlmClient::isKeyError(const QString& errorCode) const
{
    static const QStringList keyErrors {
        "invalid_api_key",
        "authentication_error",
        "insufficient_quota",
        "invalid_request_error"
    };
    return keyErrors.contains(errorCode);
}

bool LlmClient::precheckKey(KeyStatus* status) const
{
    if (m_apiKey.isEmpty()) {
        status->valid = false;
        status->checkedAt = QDateTime::currentDateTime();
        status->error = "missing_api_key";
        status->message = "API Key 未配置";
        return false;
    }
    return true;
}

void LlmClient::checkKeyStatus(KeyStatusCallback callback)
{
    KeyStatus status;
    if (!precheckKey(&status)) {
        callback(status);
        return;
    }

    LlmCallOptions options;
    options.maxTokens = 5;
    call("你好", options, [this, callback](const LlmResponse& response) {
        KeyStatus result;
        result.checkedAt = QDateTime::currentDateTime();
        if (response.success) {
            result.valid = true;
            result.message = "API Key 有效";
        } else {
            // 超时、网络错误不能说明 Key 无效
            result.valid = !isKeyError(response.errorCode);
            result.error = response.errorCode;
            result.message = response.errorMessage;
        }
        callback(result);
    });
}

LlmResponse LlmClient::createErrorResponse(const QString& errorMessage, const QString& errorCode) const
{
    LlmResponse response;
    response.success = false;
    response.provider = m_config.value("name").toString("unknown");
    response.model = m_model;
    response.errorMessage = errorMessage;
    response.errorCode = errorCode;
    return response;
}

LlmResponse LlmClient::createSuccessResponse(const QString& content, int tokensUsed) const
{
    LlmResponse response;
    response.success = true;
    response.content = content;
    response.provider = m_config.value("name").toString("unknown");
    response.model = m_model;
    response.tokensUsed = tokensUsed;
    return response;
}

HttpLlmClient::HttpLlmClient(const QJsonObject& config, int timeoutMs, QObject *parent)
    : LlmClient(config, parent)
    , m_network(new QNetworkAccessManager(this))
    , m_timeoutMs(timeoutMs)
{
}

HttpLlmClient::~HttpLlmClient()
{
    const QHash<QNetworkReply*, LlmCallback> pending = m_pending;
    m_pending.clear();
    for (auto it = pending.constBegin(); it != pending.constEnd(); ++it) {
        it.key()->disconnect(this);
        it.key()->abort();
        it.value()(createErrorResponse("客户端已关闭，请求被取消", "network_error"));
    }
}

int HttpLlmClient::effectiveMaxTokens(const LlmCallOptions& options) const
{
    return options.maxTokens > 0 ? options.maxTokens : m_maxTokens;
}

double HttpLlmClient::effectiveTemperature(const LlmCallOptions& options) const
{
    return options.temperature >= 0.0 ? options.temperature : m_temperature;
}

bool HttpLlmClient::authorizationToken(QString* token, LlmResponse* error) const
{
    Q_UNUSED(error);
    *token = m_apiKey;
    return true;
}

void HttpLlmClient::call(const QString& prompt, const LlmCallOptions& options, LlmCallback callback)
{
    if (m_apiKey.isEmpty()) {
        callback(createErrorResponse("API Key 未配置", "missing_api_key"));
        return;
    }

    QString token;
    LlmResponse tokenError;
    if (!authorizationToken(&token, &tokenError)) {
        callback(tokenError);
        return;
    }

    QNetworkRequest request(endpoint());
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    request.setRawHeader("Authorization", "Bearer " + token.toUtf8());
    request.setTransferTimeout(m_timeoutMs);

    const QByteArray body = QJsonDocument(buildPayload(prompt, options)).toJson(QJsonDocument::Compact);
    QNetworkReply* reply = m_network->post(request, body);

    m_pending.insert(reply, callback);

    QPointer<HttpLlmClient> guard(this);
    connect(reply, &QNetworkReply::finished, this, [guard, reply]() {
        reply->deleteLater();
        if (!guard || !guard->m_pending.contains(reply)) {
            return;
        }
        const LlmCallback callback = guard->m_pending.take(reply);

        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const QNetworkReply::NetworkError error = reply->error();
        if (error == QNetworkReply::OperationCanceledError || error == QNetworkReply::TimeoutError) {
            callback(guard->createErrorResponse("请求超时", "timeout"));
            return;
        }
        if (status == 0) {
            qWarning() << guard->providerName() << "网络连接失败：" << reply->errorString();
            callback(guard->createErrorResponse("网络连接失败", "network_error"));
            return;
        }
        callback(guard->parseReply(status, reply->readAll()));
    });
}

#include "openaiclient.h"
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMessageAuthenticationCode>
#include <QCryptographicHash>

namespace {

const int OPENAI_TIMEOUT_MS = 30000;
const int GLM4_TIMEOUT_MS = 60000;
const qint64 GLM4_TOKEN_TTL_SECS = 3600;

QJsonObject withDefaults(const QString& providerId, QJsonObject config)
{
    struct ProviderDefaults {
        const char* id;
        const char* apiBase;
        const char* model;
    };
    static const ProviderDefaults defaults[] = {
        {"deepseek", "https://api.deepseek.com/v1", "deepseek-chat"},
        {"openai", "https://api.openai.com/v1", "gpt-4o-mini"},
        {"glm4", "https://open.bigmodel.cn/api/paas/v4", "glm-4"},
    };

    for (const ProviderDefaults& item : defaults) {
        if (providerId != QLatin1String(item.id)) {
            continue;
        }
        if (config.value("api_base").toString().isEmpty()) {
            config["api_base"] = QString::fromLatin1(item.apiBase);
        }
        if (config.value("model").toString().isEmpty()) {
            config["model"] = QString::fromLatin1(item.model);
        }
    }
    return config;
}

QByteArray base64Url(const QByteArray& data)
{
    return data.toBase64(QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals);
}

}

OpenAiCompatibleClient::OpenAiCompatibleClient(const QString& providerId, const QJsonObject& config, QObject *parent)
    : HttpLlmClient(withDefaults(providerId, config),
                    providerId == "glm4" ? GLM4_TIMEOUT_MS : OPENAI_TIMEOUT_MS, parent)
    , m_providerId(providerId)
{
}

QUrl OpenAiCompatibleClient::endpoint() const
{
    return QUrl(m_apiBase + "/chat/completions");
}

QJsonObject OpenAiCompatibleClient::buildPayload(const QString& prompt, const LlmCallOptions& options) const
{
    QJsonArray messages {
        QJsonObject{{"role", "user"}, {"content", prompt}}
    };
    return QJsonObject {
        {"model", m_model},
        {"messages", messages},
        {"max_tokens", effectiveMaxTokens(options)},
        {"temperature", effectiveTemperature(options)}
    };
}

LlmResponse OpenAiCompatibleClient::parseReply(int httpStatus, const QByteArray& body) const
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);

    if (httpStatus == 200) {
        const QJsonArray choices = doc.object().value("choices").toArray();
        if (parseError.error != QJsonParseError::NoError || choices.isEmpty()) {
            return createErrorResponse("响应格式错误", "parse_error");
        }
        const QJsonValue content = choices.first().toObject().value("message").toObject().value("content");
        if (!content.isString()) {
            return createErrorResponse("响应格式错误", "parse_error");
        }
        const int tokens = doc.object().value("usage").toObject().value("total_tokens").toInt(0);
        return createSuccessResponse(content.toString(), tokens);
    }

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return createErrorResponse(QString("HTTP 错误: %1").arg(httpStatus), QString("http_%1").arg(httpStatus));
    }

    const QJsonObject error = doc.object().value("error").toObject();
    QString code = error.value("code").toString();
    if (code.isEmpty()) {
        code = error.value("type").toString("unknown");
    }
    return createErrorResponse(error.value("message").toString("未知错误"), code);
}

bool OpenAiCompatibleClient::isKeyError(const QString& errorCode) const
{
    if (m_providerId == "openai") {
        static const QStringList openAiErrors {"invalid_api_key", "insufficient_quota", "invalid_request_error"};
        return openAiErrors.contains(errorCode);
    }
    return LlmClient::isKeyError(errorCode);
}

Glm4Client::Glm4Client(const QJsonObject& config, QObject *parent)
    : OpenAiCompatibleClient("glm4", config, parent)
{
}

QString Glm4Client::generateToken(const QString& apiKey, qint64 nowMSecs, QString* error)
{
    const QStringList parts = apiKey.split('.');
    if (parts.size() != 2 || parts.at(0).isEmpty() || parts.at(1).isEmpty()) {
        if (error) {
            *error = "API Key 格式不正确，应为 'id.secret'";
        }
        return QString();
    }

    const QJsonObject header {
        {"alg", "HS256"},
        {"sign_type", "SIGN"}
    };
    const QJsonObject payload {
        {"api_key", parts.at(0)},
        {"exp", nowMSecs / 1000 + GLM4_TOKEN_TTL_SECS},
        {"timestamp", nowMSecs}
    };

    const QByteArray signingInput = base64Url(QJsonDocument(header).toJson(QJsonDocument::Compact))
                                    + '.'
                                    + base64Url(QJsonDocument(payload).toJson(QJsonDocument::Compact));
    const QByteArray signature = QMessageAuthenticationCode::hash(signingInput, parts.at(1).toUtf8(),
                                                                  QCryptographicHash::Sha256);
    return QString::fromLatin1(signingInput + '.' + base64Url(signature));
}

bool Glm4Client::authorizationToken(QString* token, LlmResponse* error) const
{
    QString reason;
    *token = generateToken(m_apiKey, QDateTime::currentMSecsSinceEpoch(), &reason);
    if (token->isEmpty()) {
        *error = createErrorResponse(QString("生成 Token 失败: %1").arg(reason), "token_generation_failed");
        return false;
    }
    return true;
}

bool Glm4Client::isKeyError(const QString& errorCode) const
{
    // 探测请求的任何失败都视为 Key 不可用
    Q_UNUSED(errorCode);
    return true;
}

bool Glm4Client::precheckKey(KeyStatus* status) const
{
    if (!LlmClient::precheckKey(status)) {
        return false;
    }
    if (!m_apiKey.contains('.')) {
        status->valid = false;
        status->checkedAt = QDateTime::currentDateTime();
        status->error = "invalid_format";
        status->message = "API Key 格式不正确，应为 'id.secret'";
        return false;
    }
    return true;
}

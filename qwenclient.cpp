#include "qwenclient.h"
#include <QJsonArray>
#include <QJsonDocument>

namespace {

const int QWEN_TIMEOUT_MS = 60000;

QJsonObject withDefaults(QJsonObject config)
{
    if (config.value("api_base").toString().isEmpty()) {
        config["api_base"] = "https://dashscope.aliyuncs.com/api/v1/services/aigc/text-generation";
    }
    if (config.value("model").toString().isEmpty()) {
        config["model"] = "qwen-turbo";
    }
    return config;
}

}

QwenClient::QwenClient(const QJsonObject& config, QObject *parent)
    : HttpLlmClient(withDefaults(config), QWEN_TIMEOUT_MS, parent)
{
}

QUrl QwenClient::endpoint() const
{
    return QUrl(m_apiBase + "/generation");
}

QJsonObject QwenClient::buildPayload(const QString& prompt, const LlmCallOptions& options) const
{
    QJsonArray messages {
        QJsonObject{{"role", "user"}, {"content", prompt}}
    };
    return QJsonObject {
        {"model", m_model},
        {"input", QJsonObject{{"messages", messages}}},
        {"parameters", QJsonObject{
             {"max_tokens", effectiveMaxTokens(options)},
             {"temperature", effectiveTemperature(options)}
         }}
    };
}

LlmResponse QwenClient::parseReply(int httpStatus, const QByteArray& body) const
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    const bool isJson = parseError.error == QJsonParseError::NoError && doc.isObject();
    const QJsonObject data = doc.object();

    if (httpStatus == 200) {
        if (!isJson) {
            return createErrorResponse("响应格式错误", "parse_error");
        }
        // 200 响应中也可能带有错误码
        const QString code = data.value("code").toString();
        if (!code.isEmpty()) {
            return createErrorResponse(data.value("message").toString("未知错误"), code);
        }
        const QString content = data.value("output").toObject().value("text").toString();
        const int tokens = data.value("usage").toObject().value("total_tokens").toInt(0);
        return createSuccessResponse(content, tokens);
    }

    if (!isJson) {
        return createErrorResponse(QString("HTTP 错误: %1").arg(httpStatus), QString("http_%1").arg(httpStatus));
    }
    return createErrorResponse(data.value("message").toString("未知错误"),
                               data.value("code").toString("unknown"));
}

bool QwenClient::isKeyError(const QString& errorCode) const
{
    static const QStringList keyErrors {"InvalidApiKey", "Arrearage", "InvalidParameter"};
    return keyErrors.contains(errorCode);
}

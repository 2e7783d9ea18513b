#ifndef QWENCLIENT_H
#define QWENCLIENT_H

#include "llmclient.h"

// 通义千问 DashScope 接口：POST <api_base>/generation
class QwenClient : public HttpLlmClient
{
    Q_OBJECT
public:
    explicit QwenClient(const QJsonObject& config, QObject *parent = nullptr);

    LlmResponse parseReply(int httpStatus, const QByteArray& body) const override;

protected:
    QUrl endpoint() const override;
    QJsonObject buildPayload(const QString& prompt, const LlmCallOptions& options) const override;
    bool isKeyError(const QString& errorCode) const override;
};

#endif // QWENCLIENT_H

#ifndef FAKELLMCLIENT_H
#define FAKELLMCLIENT_H

#include <QQueue>
#include <QStringList>
#include "llmclient.h"

// 同步回调的假客户端：按顺序返回预设响应，队列为空时返回网络错误
class FakeLlmClient : public LlmClient
{
public:
    explicit FakeLlmClient(const QString& name, QObject *parent = nullptr)
        : LlmClient(QJsonObject{{"name", name}, {"api_key", "fake-key"}, {"api_base", "http://localhost"}}, parent)
    {
    }

    void succeed(const QString& content, int tokens = 10)
    {
        m_responses.enqueue(createSuccessResponse(content, tokens));
    }

    void fail(const QString& errorCode, const QString& message = QString("失败"))
    {
        m_responses.enqueue(createErrorResponse(message, errorCode));
    }

    void call(const QString& prompt, const LlmCallOptions& options, LlmCallback callback) override
    {
        Q_UNUSED(options);
        prompts << prompt;
        if (m_responses.isEmpty()) {
            callback(createErrorResponse("网络连接失败", "network_error"));
            return;
        }
        callback(m_responses.dequeue());
    }

    QStringList prompts;

private:
    QQueue<LlmResponse> m_responses;
};

#endif // FAKELLMCLIENT_H

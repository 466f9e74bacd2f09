#pragma once
#include "adapters/inbound/inbound_adapter.h"

class OpenAIChatAdapter : public IInboundAdapter {
public:
    OpenAIChatAdapter() = default;

    WireFormat format() const override { return WireFormat::OpenAI; }
    Result<ChatRequest> decodeRequest(const QJsonObject& body) override;
    Result<QJsonObject> encodeResponse(const ChatResponse& response) override;
    Result<QList<SseEvent>> encodeStreamEvents(const StreamFrame& frame,
                                               StreamEncodeState& state) override;
    QJsonObject encodeFailure(const DomainFailure& failure) override;

    static QList<Segment> parseContentField(const QJsonValue& content);
    static QList<ToolCall> parseToolCalls(const QJsonArray& toolCalls);
    static QJsonArray serializeToolCalls(const QList<ToolCall>& calls);
    static QString stopCauseToFinishReason(StopCause cause);
    static QString generateChatId();

private:
    static QJsonObject chunk(const StreamEncodeState& state, const QJsonObject& choice);
};

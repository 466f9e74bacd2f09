#pragma once
#include "adapters/inbound/inbound_adapter.h"

class AnthropicAdapter : public IInboundAdapter {
public:
    AnthropicAdapter() = default;

    WireFormat format() const override { return WireFormat::Anthropic; }
    Result<ChatRequest> decodeRequest(const QJsonObject& body) override;
    Result<QJsonObject> encodeResponse(const ChatResponse& response) override;
    Result<QList<SseEvent>> encodeStreamEvents(const StreamFrame& frame,
                                               StreamEncodeState& state) override;
    QJsonObject encodeFailure(const DomainFailure& failure) override;

    static QString errorType(const DomainFailure& failure);

private:
    static QList<Segment> parseContentBlocks(const QJsonValue& content);
    static QList<ToolCall> parseToolUseBlocks(const QJsonArray& blocks);
    static QJsonArray serializeContentBlocks(const QList<Segment>& segments);
    static QJsonArray serializeToolUseBlocks(const QList<ToolCall>& calls);
    static QString stopReasonFromCause(StopCause cause);
    static QString generateMessageId();

    static void ensureStarted(const StreamFrame& frame, StreamEncodeState& state, QList<SseEvent>& out);
    static void closeOpenBlock(StreamEncodeState& state, QList<SseEvent>& out);
};

#pragma once
#include "outbound_adapter.h"

class AnthropicOutbound : public IOutboundAdapter {
public:
    AnthropicOutbound() = default;
    ~AnthropicOutbound() override = default;

    WireFormat format() const override { return WireFormat::Anthropic; }

    Result<QJsonObject> buildBody(const ChatRequest& request) override;
    ProviderRequest buildRequest(const QJsonObject& body, const UpstreamTarget& target) override;
    Result<ChatResponse> parseResponse(const QJsonObject& body) override;
    Result<QList<StreamFrame>> parseChunk(const SseEvent& event) override;
    DomainFailure mapFailure(int httpStatus, const QByteArray& body) override;

    static StopCause stopCauseFromStopReason(const QString& reason);

    static constexpr int kDefaultMaxTokens = 4096;

private:
    QJsonArray buildMessages(const QList<ChatMessage>& items, QString& systemOut) const;
    QJsonArray buildToolDefs(const QList<ToolSpec>& tools) const;
    QJsonArray segmentsToContentBlocks(const QList<Segment>& segments) const;
    ChatChoice parseMessage(const QJsonObject& root) const;
    ToolCall parseToolUseBlock(const QJsonObject& block) const;
    // Anthropic sends exactly one step per event.
    Result<StreamFrame> parseEvent(const SseEvent& event) const;
};

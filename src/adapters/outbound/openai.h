#pragma once
#include "outbound_adapter.h"

class OpenAIOutbound : public IOutboundAdapter {
public:
    OpenAIOutbound() = default;
    ~OpenAIOutbound() override = default;

    WireFormat format() const override { return WireFormat::OpenAI; }

    Result<QJsonObject> buildBody(const ChatRequest& request) override;
    ProviderRequest buildRequest(const QJsonObject& body, const UpstreamTarget& target) override;
    Result<ChatResponse> parseResponse(const QJsonObject& body) override;
    Result<QList<StreamFrame>> parseChunk(const SseEvent& event) override;
    DomainFailure mapFailure(int httpStatus, const QByteArray& body) override;

    static StopCause stopCauseFromFinishReason(const QString& reason);

protected:
    QJsonArray buildMessages(const QList<ChatMessage>& items) const;
    QJsonArray buildToolDefs(const QList<ToolSpec>& tools) const;
    void buildConstraints(QJsonObject& body, const SamplingOptions& constraints) const;
    ChatChoice parseChoice(const QJsonObject& choice) const;
    ToolCall parseToolCall(const QJsonObject& tc) const;
    QList<StreamFrame> parseDeltaChunk(const QJsonObject& delta, int index) const;
};

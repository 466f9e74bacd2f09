#pragma once
#include "adapters/inbound/anthropic.h"
#include "adapters/inbound/openai_chat.h"
#include "adapters/outbound/anthropic.h"
#include "adapters/outbound/openai.h"
#include "conversion/stream_translator.h"
#include <memory>

// Translates bodies between the client's dialect and the provider's.
// When both sides speak the same dialect every operation is a no-op.
class ProtocolConverter {
public:
    ProtocolConverter() = default;

    static bool isPassthrough(WireFormat client, WireFormat provider) { return client == provider; }

    IInboundAdapter* inbound(WireFormat format);
    IOutboundAdapter* outbound(WireFormat format);

    Result<QJsonObject> convertRequest(const QJsonObject& clientBody,
                                       WireFormat client, WireFormat provider);
    ProviderRequest buildUpstreamRequest(const QJsonObject& providerBody,
                                         WireFormat provider, const UpstreamTarget& target);
    Result<QJsonObject> convertResponse(const QJsonObject& providerBody,
                                        WireFormat client, WireFormat provider);

    QJsonObject encodeFailure(const DomainFailure& failure, WireFormat client);
    DomainFailure mapUpstreamFailure(int httpStatus, const QByteArray& body, WireFormat provider);

    std::unique_ptr<StreamTranslator> createStreamTranslator(WireFormat client, WireFormat provider);

private:
    AnthropicAdapter m_anthropicIn;
    OpenAIChatAdapter m_openaiIn;
    AnthropicOutbound m_anthropicOut;
    OpenAIOutbound m_openaiOut;
};

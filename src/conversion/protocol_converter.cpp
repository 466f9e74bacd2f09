#include "conversion/protocol_converter.h"
#include "core/log_manager.h"

IInboundAdapter* ProtocolConverter::inbound(WireFormat format)
{
    if (format == WireFormat::Anthropic)
        return &m_anthropicIn;
    return &m_openaiIn;
}

IOutboundAdapter* ProtocolConverter::outbound(WireFormat format)
{
    if (format == WireFormat::Anthropic)
        return &m_anthropicOut;
    return &m_openaiOut;
}

Result<QJsonObject> ProtocolConverter::convertRequest(const QJsonObject& clientBody,
                                                      WireFormat client, WireFormat provider)
{
    if (isPassthrough(client, provider))
        return clientBody;

    auto semantic = inbound(client)->decodeRequest(clientBody);
    if (!semantic)
        return std::unexpected(semantic.error());

    auto body = outbound(provider)->buildBody(*semantic);
    if (!body)
        return std::unexpected(body.error());

    LOG_CAT_DEBUG(QStringLiteral("dispatch"),
                  QStringLiteral("Converted request %1 -> %2 (%3 messages)")
                      .arg(wireFormatName(client), wireFormatName(provider))
                      .arg(semantic->messages.size()));
    return *body;
}

ProviderRequest ProtocolConverter::buildUpstreamRequest(const QJsonObject& providerBody,
                                                        WireFormat provider,
                                                        const UpstreamTarget& target)
{
    return outbound(provider)->buildRequest(providerBody, target);
}

Result<QJsonObject> ProtocolConverter::convertResponse(const QJsonObject& providerBody,
                                                       WireFormat client, WireFormat provider)
{
    if (isPassthrough(client, provider))
        return providerBody;

    auto semantic = outbound(provider)->parseResponse(providerBody);
    if (!semantic)
        return std::unexpected(semantic.error());
    return inbound(client)->encodeResponse(*semantic);
}

QJsonObject ProtocolConverter::encodeFailure(const DomainFailure& failure, WireFormat client)
{
    return inbound(client)->encodeFailure(failure);
}

DomainFailure ProtocolConverter::mapUpstreamFailure(int httpStatus, const QByteArray& body,
                                                    WireFormat provider)
{
    return outbound(provider)->mapFailure(httpStatus, body);
}

std::unique_ptr<StreamTranslator> ProtocolConverter::createStreamTranslator(WireFormat client,
                                                                            WireFormat provider)
{
    IOutboundAdapter* out = isPassthrough(client, provider) ? nullptr : outbound(provider);
    return std::make_unique<StreamTranslator>(out, inbound(client));
}

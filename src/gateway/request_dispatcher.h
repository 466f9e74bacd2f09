#pragma once
#include "gateway/gateway_stream_session.h"
#include "gateway/inbound_request.h"
#include "gateway/request_tracker.h"
#include "alias/alias_service.h"
#include "conversion/protocol_converter.h"
#include "provider/provider_registry.h"

// Drives one client request through resolution, authentication, the
// middleware chain, protocol conversion and the upstream call, rotating
// keys on auth and quota failures.
class RequestDispatcher {
public:
    RequestDispatcher(AliasService& aliases,
                      ProviderRegistry& providers,
                      MiddlewareChain& chain,
                      ProtocolConverter& converter,
                      IExecutor& executor,
                      RequestTracker* tracker = nullptr);

    // Non-streamed request; the body returned is in the client's dialect.
    Result<QJsonObject> dispatch(const InboundRequest& request);

    // Streamed request. The session is returned unstarted and owned by the
    // caller; connect to it, then call start().
    Result<GatewayStreamSession*> dispatchStream(const InboundRequest& request,
                                                 QObject* parent = nullptr);

    // Error body in the client's dialect.
    QJsonObject errorBody(const DomainFailure& failure, WireFormat clientFormat);

    static QString deriveConversationId(const QJsonObject& body, const QString& clientSupplied);

private:
    struct Prepared {
        RequestContext context;
        ProviderConfig provider;
        AuthParams auth;
        QJsonObject providerBody;
    };

    Result<Prepared> prepare(const InboundRequest& request, bool streaming);
    static UpstreamTarget targetFor(const ProviderConfig& provider, const QString& apiKey, bool stream);
    Result<ProviderResponse> executeWithRotation(const Prepared& prepared, int& attempts);
    void trackFailure(const QString& requestId, const DomainFailure& failure, int attempts);

    AliasService& m_aliases;
    ProviderRegistry& m_providers;
    MiddlewareChain& m_chain;
    ProtocolConverter& m_converter;
    IExecutor& m_executor;
    RequestTracker* m_tracker;
};

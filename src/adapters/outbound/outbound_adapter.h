#pragma once
#include "semantic/ports.h"
#include "semantic/sse_event.h"
#include "semantic/wire_format.h"
#include <QJsonObject>
#include <QMap>
#include <QString>

// Where and how to send one upstream attempt. The body is built once per
// request; the target changes per attempt when the key rotates.
struct UpstreamTarget {
    QString baseUrl;
    QString apiKey;
    QString apiVersion;
    QMap<QString, QString> customHeaders;
    bool stream = false;
    int timeoutMs = 0;
};

// Provider-facing side: renders the provider's request body and parses
// what the provider answers.
class IOutboundAdapter {
public:
    virtual ~IOutboundAdapter() = default;
    virtual WireFormat format() const = 0;

    virtual Result<QJsonObject> buildBody(const ChatRequest& request) = 0;
    virtual ProviderRequest buildRequest(const QJsonObject& body,
                                         const UpstreamTarget& target) = 0;
    virtual Result<ChatResponse> parseResponse(const QJsonObject& body) = 0;
    // One upstream event can carry several steps (text plus parallel tool
    // calls); they come back in the order the client should see them.
    virtual Result<QList<StreamFrame>> parseChunk(const SseEvent& event) = 0;
    virtual DomainFailure mapFailure(int httpStatus, const QByteArray& body) = 0;

    // Appends "/v1" unless the base already carries it, then the endpoint.
    static QString endpointUrl(const QString& baseUrl, const QString& endpoint) {
        QString base = baseUrl;
        while (base.endsWith(QLatin1Char('/')))
            base.chop(1);
        if (!base.endsWith(QStringLiteral("/v1")))
            base += QStringLiteral("/v1");
        return base + endpoint;
    }
};

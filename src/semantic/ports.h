#pragma once
#include "frame.h"
#include "message.h"
#include "failure.h"
#include <expected>
#include <QByteArray>
#include <QMap>

template<typename T>
using Result = std::expected<T, DomainFailure>;

using VoidResult = std::expected<void, DomainFailure>;

class UpstreamStream;

struct ProviderRequest {
    QString method;
    QString url;
    QMap<QString, QString> headers;
    QByteArray body;
    bool stream = false;
    int timeoutMs = 0;
};

struct ProviderResponse {
    int statusCode = 0;
    QMap<QString, QString> headers;
    QByteArray body;
};

// HTTP transport. Non-2xx answers come back as DomainFailure::upstreamHttp
// so callers can inspect the status and body.
class IExecutor {
public:
    virtual ~IExecutor() = default;
    virtual Result<ProviderResponse> execute(
        const ProviderRequest& request) = 0;
    virtual Result<UpstreamStream*> openStream(
        const ProviderRequest& request) = 0;
};

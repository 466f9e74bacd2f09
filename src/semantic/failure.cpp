#include "failure.h"
#include <QJsonDocument>

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::InvalidInput:  return 400;
    case ErrorKind::Unauthorized:  return 401;
    case ErrorKind::Forbidden:     return 403;
    case ErrorKind::NotFound:      return 404;
    case ErrorKind::RateLimited:   return 429;
    case ErrorKind::NotSupported:  return 501;
    case ErrorKind::Unavailable:   return 503;
    case ErrorKind::Timeout:       return 504;
    case ErrorKind::Configuration:
    case ErrorKind::Internal:
    default:                       return 500;
    }
}

QJsonObject DomainFailure::toJson() const {
    QJsonObject err;
    err["code"] = code;
    err["message"] = message;
    err["status"] = httpStatus();
    if (upstreamStatus > 0)
        err["upstream_status"] = upstreamStatus;
    QJsonObject root;
    root["error"] = err;
    return root;
}

ErrorKind DomainFailure::kindForHttpStatus(int status) {
    switch (status) {
    case 400: return ErrorKind::InvalidInput;
    case 401: return ErrorKind::Unauthorized;
    case 403: return ErrorKind::Forbidden;
    case 404: return ErrorKind::NotFound;
    case 429: return ErrorKind::RateLimited;
    case 501: return ErrorKind::NotSupported;
    case 502:
    case 503:
    case 529: return ErrorKind::Unavailable;
    case 504: return ErrorKind::Timeout;
    default:
        if (status >= 500) return ErrorKind::Internal;
        if (status >= 400) return ErrorKind::InvalidInput;
        return ErrorKind::Internal;
    }
}

DomainFailure DomainFailure::invalidInput(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidInput, code, msg, false, false};
}

DomainFailure DomainFailure::unavailable(const QString& msg) {
    return {ErrorKind::Unavailable, "unavailable", msg, true, true};
}

DomainFailure DomainFailure::timeout(const QString& msg) {
    return {ErrorKind::Timeout, "timeout", msg, true, true};
}

DomainFailure DomainFailure::rateLimited(const QString& msg) {
    return {ErrorKind::RateLimited, "rate_limited", msg, true, true};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal", msg, false, false};
}

DomainFailure DomainFailure::circularAlias(const QString& msg) {
    return {ErrorKind::InvalidInput, "circular_alias", msg, false, false};
}

DomainFailure DomainFailure::providerNotConfigured(const QString& provider) {
    return {ErrorKind::NotFound, "provider_not_configured",
            QStringLiteral("Provider '%1' is not configured").arg(provider), false, false};
}

DomainFailure DomainFailure::missingClientKey(const QString& provider) {
    return {ErrorKind::Unauthorized, "missing_client_key",
            QStringLiteral("Provider '%1' uses passthrough authentication but no client API key was supplied")
                .arg(provider),
            false, false};
}

DomainFailure DomainFailure::allKeysExhausted(const QString& provider, int keyCount) {
    return {ErrorKind::RateLimited, "all_keys_exhausted",
            QStringLiteral("All %1 API key(s) for provider '%2' are exhausted").arg(keyCount).arg(provider),
            false, true};
}

DomainFailure DomainFailure::configurationInvalid(const QString& msg) {
    return {ErrorKind::Configuration, "configuration_invalid", msg, false, false};
}

DomainFailure DomainFailure::middlewareFailed(const QString& middleware, const QString& msg) {
    return {ErrorKind::Internal, "middleware_failed",
            QStringLiteral("%1: %2").arg(middleware, msg), false, false};
}

DomainFailure DomainFailure::upstreamHttp(int status, const QByteArray& body) {
    DomainFailure failure;
    failure.kind = kindForHttpStatus(status);
    failure.code = QStringLiteral("upstream.http_%1").arg(status);

    const QJsonDocument doc = QJsonDocument::fromJson(body);
    if (doc.isObject()) {
        const QJsonValue err = doc.object().value(QStringLiteral("error"));
        failure.message = err.isObject()
            ? err.toObject().value(QStringLiteral("message")).toString()
            : err.toString();
    }
    if (failure.message.isEmpty())
        failure.message = QStringLiteral("Upstream returned HTTP %1").arg(status);

    failure.retryable = (failure.kind == ErrorKind::RateLimited ||
                         failure.kind == ErrorKind::Unavailable ||
                         failure.kind == ErrorKind::Timeout);
    failure.temporary = failure.retryable;
    failure.upstreamStatus = status;
    failure.upstreamBody = body;
    return failure;
}

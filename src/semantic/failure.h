#pragma once
#include "types.h"
#include <QByteArray>
#include <QString>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;
    bool        retryable = false;
    bool        temporary = false;
    int         upstreamStatus = 0;   // HTTP status reported by the provider, 0 if none
    QByteArray  upstreamBody;

    int httpStatus() const;
    QJsonObject toJson() const;

    static DomainFailure invalidInput(const QString& code, const QString& msg);
    static DomainFailure unavailable(const QString& msg);
    static DomainFailure timeout(const QString& msg);
    static DomainFailure rateLimited(const QString& msg);
    static DomainFailure internal(const QString& msg);

    static DomainFailure circularAlias(const QString& msg);
    static DomainFailure providerNotConfigured(const QString& provider);
    static DomainFailure missingClientKey(const QString& provider);
    static DomainFailure allKeysExhausted(const QString& provider, int keyCount);
    static DomainFailure configurationInvalid(const QString& msg);
    static DomainFailure middlewareFailed(const QString& middleware, const QString& msg);
    static DomainFailure upstreamHttp(int status, const QByteArray& body);

    static ErrorKind kindForHttpStatus(int status);
};

#pragma once
#include "semantic/ports.h"
#include "semantic/wire_format.h"
#include <QMap>
#include <QSet>
#include <QString>
#include <QStringList>
#include <functional>

// api_key value that selects passthrough authentication.
inline const QString kPassthroughSentinel = QStringLiteral("!PASSTHRU");

struct ProviderConfig {
    QString name;
    QStringList apiKeys;
    QString baseUrl;
    WireFormat apiFormat = WireFormat::OpenAI;
    int timeoutMs = 90000;
    int maxRetries = 2;
    bool passthrough = false;
    QMap<QString, QString> customHeaders;
    QString apiVersion;

    // Builds the key list from a configured api_key value: whitespace
    // separated keys, or the passthrough sentinel.
    static void assignKeys(ProviderConfig& config, const QStringList& rawKeys);
};

// Fails with a configuration_invalid failure describing the first problem.
VoidResult validateProviderConfig(const ProviderConfig& config);

// Credentials handed to the HTTP layer for one logical request.
struct AuthParams {
    QString apiKey;
    bool passthrough = false;
    // Picks another key after a rotation-triggering failure; empty in
    // passthrough mode.
    std::function<Result<QString>(const QSet<QString>& exclude)> nextKey;

    bool canRotate() const { return static_cast<bool>(nextKey); }
};

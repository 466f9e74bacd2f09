#pragma once
#include "alias/alias_table.h"
#include "provider/provider_config.h"
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

struct CacheOptions {
    int aliasTtlSeconds = 300;
    int aliasMaxSize = 1000;
    int aliasMaxChainLength = 8;
};

struct MiddlewareOptions {
    bool debug = false;
    bool thoughtSignatures = true;
    int thoughtSignatureCacheSize = 10000;
    int thoughtSignatureTtlSeconds = 3600;
};

struct LogOptions {
    QString dir;
    QString level = QStringLiteral("info");
};

struct GatewayConfig {
    using ProviderAliases = QMap<QString, QMap<QString, QString>>;

    QString defaultProvider;
    QList<ProviderConfig> providers;     // declaration order
    ProviderAliases aliases;             // provider -> alias -> target
    ProviderAliases fallbackAliases;
    QList<AliasProfile> profiles;        // sorted by name
    CacheOptions cache;
    MiddlewareOptions middleware;
    LogOptions log;

    QStringList providerNames() const {
        QStringList names;
        for (const ProviderConfig& p : providers)
            names.append(p.name);
        return names;
    }

    // The configured default, or the first declared provider.
    QString effectiveDefaultProvider() const {
        if (!defaultProvider.isEmpty())
            return defaultProvider;
        return providers.isEmpty() ? QString() : providers.first().name;
    }
};

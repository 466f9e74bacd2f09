#pragma once
#include "provider_config.h"
#include "key_rotator.h"
#include <QHash>
#include <QList>
#include <atomic>
#include <memory>

// Validated provider configurations plus the rotation state that outlives
// any single configuration snapshot.
class ProviderRegistry {
public:
    ProviderRegistry();

    // Validates every entry first; on failure the current snapshot stays.
    VoidResult load(const QList<ProviderConfig>& configs);

    static VoidResult validate(const QList<ProviderConfig>& configs);

    Result<ProviderConfig> providerConfig(const QString& name) const;
    bool hasProvider(const QString& name) const;
    QStringList providerNames() const;   // declaration order
    QList<ProviderConfig> providers() const;

    Result<AuthParams> getClientAuth(const QString& provider,
                                     const QString& clientApiKey = {});

    KeyRotator& rotator() { return m_rotator; }

private:
    struct Snapshot {
        QList<ProviderConfig> configs;
        QHash<QString, int> index;
    };

    std::atomic<std::shared_ptr<const Snapshot>> m_snapshot;
    KeyRotator m_rotator;
};

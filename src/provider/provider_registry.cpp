#include "provider_registry.h"
#include "core/key_hash.h"
#include "core/log_manager.h"
#include <QSet>

ProviderRegistry::ProviderRegistry()
    : m_snapshot(std::make_shared<const Snapshot>())
{
}

VoidResult ProviderRegistry::validate(const QList<ProviderConfig>& configs)
{
    QSet<QString> names;
    for (const ProviderConfig& config : configs) {
        auto valid = validateProviderConfig(config);
        if (!valid)
            return valid;
        const QString name = config.name.trimmed().toLower();
        if (names.contains(name)) {
            return std::unexpected(DomainFailure::configurationInvalid(
                QStringLiteral("Provider '%1' is declared more than once").arg(name)));
        }
        names.insert(name);
    }
    return {};
}

VoidResult ProviderRegistry::load(const QList<ProviderConfig>& configs)
{
    auto valid = validate(configs);
    if (!valid) {
        LOG_CAT_ERROR(QStringLiteral("config"), valid.error().message);
        return valid;
    }

    auto snapshot = std::make_shared<Snapshot>();
    for (ProviderConfig config : configs) {
        config.name = config.name.trimmed().toLower();
        snapshot->index.insert(config.name, static_cast<int>(snapshot->configs.size()));
        snapshot->configs.append(config);
        LOG_CAT_INFO(QStringLiteral("config"),
                     QStringLiteral("Provider '%1' (%2) at %3: %4")
                         .arg(config.name, wireFormatName(config.apiFormat), config.baseUrl,
                              config.passthrough ? QStringLiteral("passthrough")
                                                 : QStringLiteral("%1 key(s)").arg(config.apiKeys.size())));
    }
    m_snapshot.store(std::move(snapshot));
    return {};
}

Result<ProviderConfig> ProviderRegistry::providerConfig(const QString& name) const
{
    const auto snapshot = m_snapshot.load();
    const auto it = snapshot->index.constFind(name.trimmed().toLower());
    if (it == snapshot->index.constEnd())
        return std::unexpected(DomainFailure::providerNotConfigured(name));
    return snapshot->configs.at(*it);
}

bool ProviderRegistry::hasProvider(const QString& name) const
{
    return m_snapshot.load()->index.contains(name.trimmed().toLower());
}

QStringList ProviderRegistry::providerNames() const
{
    QStringList names;
    for (const ProviderConfig& config : m_snapshot.load()->configs)
        names.append(config.name);
    return names;
}

QList<ProviderConfig> ProviderRegistry::providers() const
{
    return m_snapshot.load()->configs;
}

Result<AuthParams> ProviderRegistry::getClientAuth(const QString& provider,
                                                   const QString& clientApiKey)
{
    auto config = providerConfig(provider);
    if (!config)
        return std::unexpected(config.error());

    AuthParams auth;
    if (config->passthrough) {
        if (clientApiKey.trimmed().isEmpty()) {
            LOG_CAT_WARNING(QStringLiteral("rotation"),
                            QStringLiteral("Passthrough provider '%1' called without a client key").arg(config->name));
            return std::unexpected(DomainFailure::missingClientKey(config->name));
        }
        auth.apiKey = clientApiKey.trimmed();
        auth.passthrough = true;
        return auth;
    }

    const QString name = config->name;
    const QStringList keys = config->apiKeys;
    auto first = m_rotator.next(name, keys);
    if (!first)
        return std::unexpected(first.error());

    auth.apiKey = *first;
    auth.nextKey = [this, name, keys](const QSet<QString>& exclude) {
        return m_rotator.next(name, keys, exclude);
    };
    LOG_CAT_DEBUG(QStringLiteral("rotation"),
                  QStringLiteral("Provider '%1' using key %2").arg(name, apiKeyHash(auth.apiKey)));
    return auth;
}

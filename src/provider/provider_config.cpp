#include "provider_config.h"
#include <QUrl>

void ProviderConfig::assignKeys(ProviderConfig& config, const QStringList& rawKeys)
{
    config.apiKeys.clear();
    config.passthrough = false;
    for (const QString& key : rawKeys) {
        const QString k = key.trimmed();
        if (k == kPassthroughSentinel)
            config.passthrough = true;
        else
            config.apiKeys.append(k);
    }
}

VoidResult validateProviderConfig(const ProviderConfig& config)
{
    auto fail = [&config](const QString& what) -> VoidResult {
        return std::unexpected(DomainFailure::configurationInvalid(
            QStringLiteral("Provider '%1': %2").arg(config.name, what)));
    };

    if (config.name.trimmed().isEmpty())
        return std::unexpected(DomainFailure::configurationInvalid(
            QStringLiteral("Provider entry without a name")));
    if (config.name.contains(QLatin1Char(':')))
        return fail(QStringLiteral("name must not contain ':'"));

    for (const QString& key : config.apiKeys) {
        if (key.trimmed().isEmpty())
            return fail(QStringLiteral("empty API key"));
    }
    if (config.passthrough && !config.apiKeys.isEmpty())
        return fail(QStringLiteral("passthrough mode cannot be combined with static API keys"));
    if (!config.passthrough && config.apiKeys.isEmpty())
        return fail(QStringLiteral("no API key configured (set keys or %1)").arg(kPassthroughSentinel));

    const QUrl url(config.baseUrl);
    if (config.baseUrl.isEmpty() || !url.isValid() || url.scheme().isEmpty() || url.host().isEmpty())
        return fail(QStringLiteral("invalid base_url '%1'").arg(config.baseUrl));
    if (config.timeoutMs <= 0)
        return fail(QStringLiteral("timeout must be positive"));
    if (config.maxRetries < 0)
        return fail(QStringLiteral("max_retries must not be negative"));

    return {};
}

#include "alias_service.h"
#include "core/log_manager.h"

AliasService::AliasService(const AliasCacheSettings& settings)
    : m_table(AliasTable::empty())
{
    configure(settings);
}

void AliasService::configure(const AliasCacheSettings& settings)
{
    m_maxChainLength.store(qMax(1, settings.maxChainLength));
    m_cache.configure(settings.maxSize, settings.ttlSeconds);
}

void AliasService::publish(AliasTablePtr table)
{
    if (!table)
        table = AliasTable::empty();
    const int count = table->aliasCount();
    const QString def = table->defaultProvider();

    // snapshot first, then generation: a reader that sees the new
    // generation is guaranteed to see the new table too
    m_table.store(std::move(table));
    m_cache.invalidateAll();

    LOG_CAT_INFO(QStringLiteral("alias"),
                 QStringLiteral("Alias table published: %1 aliases, default provider '%2'")
                     .arg(count).arg(def));
}

AliasTablePtr AliasService::snapshot() const
{
    return m_table.load();
}

Result<ResolutionResult> AliasService::resolve(const QString& rawModel,
                                               const QString& explicitProvider)
{
    if (rawModel.trimmed().isEmpty()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("missing_model"), QStringLiteral("Request does not name a model")));
    }

    const QString key = ResolutionCache::key(rawModel, explicitProvider);
    const quint64 generation = m_cache.generation();
    if (auto cached = m_cache.get(key))
        return *cached;

    const AliasTablePtr table = m_table.load();
    const ResolutionContext ctx = m_chain.makeContext(rawModel, explicitProvider, table,
                                                      m_maxChainLength.load());
    auto result = m_chain.resolve(ctx);
    if (!result) {
        LOG_CAT_WARNING(QStringLiteral("alias"),
                        QStringLiteral("Resolution of '%1' failed: %2").arg(rawModel, result.error().message));
        return result;
    }

    if (result->wasResolved) {
        LOG_CAT_DEBUG(QStringLiteral("alias"),
                      QStringLiteral("Resolved '%1' -> %2:%3 via %4")
                          .arg(rawModel, result->provider, result->resolvedModel,
                               result->resolutionPath.join(QStringLiteral(" -> "))));
    }
    m_cache.put(key, *result, generation);
    return result;
}

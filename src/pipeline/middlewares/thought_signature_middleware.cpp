#include "thought_signature_middleware.h"
#include "core/log_manager.h"
#include <QMutexLocker>

ThoughtSignatureMiddleware::ThoughtSignatureMiddleware(const ThoughtSignatureSettings& settings)
    : m_settings(settings)
{
}

bool ThoughtSignatureMiddleware::shouldHandle(const QString&, const QString& model) const
{
    return model.contains(QStringLiteral("gemini"), Qt::CaseInsensitive);
}

VoidResult ThoughtSignatureMiddleware::initialize()
{
    if (m_settings.maxConversations <= 0) {
        return std::unexpected(DomainFailure::configurationInvalid(
            QStringLiteral("thought signature cache size must be positive")));
    }
    QMutexLocker locker(&m_mutex);
    m_cache.setMaxCost(m_settings.maxConversations);
    m_ready = true;
    return {};
}

VoidResult ThoughtSignatureMiddleware::cleanup()
{
    QMutexLocker locker(&m_mutex);
    m_cache.clear();
    m_ready = false;
    return {};
}

QVariantMap ThoughtSignatureMiddleware::signaturesFor(const QString& conversationId) const
{
    QMutexLocker locker(&m_mutex);
    Entry* entry = m_cache.object(conversationId);
    if (!entry)
        return {};
    if (entry->expiry.hasExpired()) {
        m_cache.remove(conversationId);
        return {};
    }
    return entry->signatures;
}

int ThoughtSignatureMiddleware::conversationCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_cache.size());
}

void ThoughtSignatureMiddleware::store(const QString& conversationId, const QVariantMap& signatures)
{
    if (conversationId.isEmpty() || signatures.isEmpty())
        return;

    QMutexLocker locker(&m_mutex);
    if (!m_ready)
        return;
    QVariantMap merged;
    if (Entry* existing = m_cache.object(conversationId); existing && !existing->expiry.hasExpired())
        merged = existing->signatures;
    merged = mergeMetadata(merged, signatures);

    const QDeadlineTimer expiry = m_settings.ttlSeconds > 0
        ? QDeadlineTimer(qint64(m_settings.ttlSeconds) * 1000)
        : QDeadlineTimer(QDeadlineTimer::Forever);
    m_cache.insert(conversationId, new Entry{merged, expiry});

    LOG_CAT_DEBUG(QStringLiteral("middleware"),
                  QStringLiteral("Stored %1 thought signature(s) for conversation %2")
                      .arg(merged.size()).arg(conversationId));
}

Result<RequestContext> ThoughtSignatureMiddleware::beforeRequest(RequestContext ctx)
{
    const QVariantMap known = signaturesFor(ctx.conversationId());
    if (known.isEmpty())
        return ctx;

    const QVariantMap merged = mergeMetadata(known, ctx.metadata().value(kThoughtSignaturesKey).toMap());
    return ctx.withMetadata(kThoughtSignaturesKey, merged);
}

Result<ResponseContext> ThoughtSignatureMiddleware::afterResponse(ResponseContext ctx)
{
    store(ctx.request().conversationId(), ctx.metadata().value(kThoughtSignaturesKey).toMap());
    return ctx;
}

VoidResult ThoughtSignatureMiddleware::onStreamComplete(const RequestContext& ctx,
                                                        const QVariantMap& accumulatedMetadata)
{
    store(ctx.conversationId(), accumulatedMetadata.value(kThoughtSignaturesKey).toMap());
    return {};
}

#include "resolution_cache.h"
#include "core/log_manager.h"
#include <QMutexLocker>

ResolutionCache::ResolutionCache(int maxSize, int ttlSeconds)
{
    configure(maxSize, ttlSeconds);
}

QString ResolutionCache::key(const QString& rawModel, const QString& explicitProvider)
{
    return explicitProvider.trimmed().toLower() + QLatin1Char('|') + rawModel.trimmed();
}

void ResolutionCache::configure(int maxSize, int ttlSeconds)
{
    QMutexLocker locker(&m_mutex);
    m_entries.setMaxCost(qMax(0, maxSize));
    m_ttlMs = ttlSeconds > 0 ? qint64(ttlSeconds) * 1000 : 0;
}

void ResolutionCache::setTtlMs(qint64 ttlMs)
{
    QMutexLocker locker(&m_mutex);
    m_ttlMs = qMax<qint64>(0, ttlMs);
}

std::optional<ResolutionResult> ResolutionCache::get(const QString& key) const
{
    const quint64 current = generation();
    QMutexLocker locker(&m_mutex);
    Entry* entry = m_entries.object(key);
    if (!entry)
        return std::nullopt;
    if (entry->generation != current || entry->expiry.hasExpired()) {
        m_entries.remove(key);
        return std::nullopt;
    }
    return entry->result;
}

bool ResolutionCache::put(const QString& key, const ResolutionResult& result, quint64 generation)
{
    QMutexLocker locker(&m_mutex);
    if (generation != this->generation() || m_entries.maxCost() == 0)
        return false;

    auto* entry = new Entry{result,
                            m_ttlMs > 0 ? QDeadlineTimer(m_ttlMs) : QDeadlineTimer(QDeadlineTimer::Forever),
                            generation};
    return m_entries.insert(key, entry);
}

void ResolutionCache::invalidateAll()
{
    quint64 next = 0;
    int dropped = 0;
    {
        QMutexLocker locker(&m_mutex);
        next = m_generation.fetch_add(1, std::memory_order_acq_rel) + 1;
        dropped = static_cast<int>(m_entries.size());
        m_entries.clear();
    }
    LOG_CAT_INFO(QStringLiteral("cache"),
                 QStringLiteral("Resolution cache invalidated (generation %1, %2 entries dropped)")
                     .arg(next).arg(dropped));
}

int ResolutionCache::size() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_entries.size());
}

int ResolutionCache::maxSize() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_entries.maxCost());
}

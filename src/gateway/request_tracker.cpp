#include "request_tracker.h"
#include "core/log_manager.h"
#include <QMutexLocker>

RequestTracker::RequestTracker(int capacity)
    : m_capacity(qMax(1, capacity))
{
}

void RequestTracker::recordResolution(const QString& requestId, const QString& originalModel,
                                      const ResolutionResult& resolution, bool streaming)
{
    TrackedRequest entry;
    entry.requestId = requestId;
    entry.originalModel = originalModel;
    entry.provider = resolution.provider;
    entry.resolvedModel = resolution.resolvedModel;
    entry.wasResolved = resolution.wasResolved;
    entry.streaming = streaming;
    entry.startedAt = QDateTime::currentDateTimeUtc();

    QMutexLocker locker(&m_mutex);
    m_recent.append(entry);
    while (m_recent.size() > m_capacity)
        m_recent.removeFirst();
    m_totals[resolution.provider].requests++;
}

void RequestTracker::recordCompletion(const QString& requestId, bool succeeded,
                                      const QString& errorCode, int attempts)
{
    QMutexLocker locker(&m_mutex);
    for (auto it = m_recent.rbegin(); it != m_recent.rend(); ++it) {
        if (it->requestId != requestId)
            continue;
        if (it->completed)
            return;
        it->completed = true;
        it->succeeded = succeeded;
        it->errorCode = errorCode;
        it->attempts = attempts;
        it->durationMs = it->startedAt.msecsTo(QDateTime::currentDateTimeUtc());
        if (!succeeded)
            m_totals[it->provider].failures++;
        return;
    }
    LOG_CAT_DEBUG(QStringLiteral("dispatch"),
                  QStringLiteral("Completion for untracked request %1").arg(requestId));
}

std::optional<TrackedRequest> RequestTracker::request(const QString& requestId) const
{
    QMutexLocker locker(&m_mutex);
    for (auto it = m_recent.crbegin(); it != m_recent.crend(); ++it) {
        if (it->requestId == requestId)
            return *it;
    }
    return std::nullopt;
}

QList<TrackedRequest> RequestTracker::recent() const
{
    QMutexLocker locker(&m_mutex);
    return m_recent;
}

int RequestTracker::requestCount(const QString& provider) const
{
    QMutexLocker locker(&m_mutex);
    return m_totals.value(provider).requests;
}

int RequestTracker::failureCount(const QString& provider) const
{
    QMutexLocker locker(&m_mutex);
    return m_totals.value(provider).failures;
}

void RequestTracker::clear()
{
    QMutexLocker locker(&m_mutex);
    m_recent.clear();
    m_totals.clear();
}

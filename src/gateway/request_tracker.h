#pragma once
#include "alias/resolution.h"
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QString>
#include <optional>

struct TrackedRequest {
    QString requestId;
    QString originalModel;
    QString provider;
    QString resolvedModel;
    bool wasResolved = false;
    bool streaming = false;
    bool completed = false;
    bool succeeded = false;
    QString errorCode;
    int attempts = 0;
    QDateTime startedAt;
    qint64 durationMs = 0;
};

// Records where each request was routed and how it ended. Keeps the most
// recent requests plus per-provider totals.
class RequestTracker {
public:
    explicit RequestTracker(int capacity = 500);

    void recordResolution(const QString& requestId, const QString& originalModel,
                          const ResolutionResult& resolution, bool streaming);
    void recordCompletion(const QString& requestId, bool succeeded,
                          const QString& errorCode = {}, int attempts = 1);

    std::optional<TrackedRequest> request(const QString& requestId) const;
    QList<TrackedRequest> recent() const;
    int requestCount(const QString& provider) const;
    int failureCount(const QString& provider) const;
    void clear();

private:
    struct ProviderTotals {
        int requests = 0;
        int failures = 0;
    };

    int m_capacity;
    mutable QMutex m_mutex;
    QList<TrackedRequest> m_recent;   // oldest first
    QHash<QString, ProviderTotals> m_totals;
};

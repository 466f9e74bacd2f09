#pragma once
#include "resolution.h"
#include <QCache>
#include <QDeadlineTimer>
#include <QMutex>
#include <atomic>
#include <optional>

// Bounded LRU cache of resolution results. Every entry is stamped with the
// generation it was computed under; invalidateAll() bumps the generation so
// results computed against an older alias table are never returned or stored.
class ResolutionCache {
public:
    explicit ResolutionCache(int maxSize = 1000, int ttlSeconds = 300);

    static QString key(const QString& rawModel, const QString& explicitProvider);

    std::optional<ResolutionResult> get(const QString& key) const;

    // Returns false when the generation moved on since the caller started.
    bool put(const QString& key, const ResolutionResult& result, quint64 generation);
    bool put(const QString& key, const ResolutionResult& result) {
        return put(key, result, generation());
    }

    void invalidateAll();

    quint64 generation() const { return m_generation.load(std::memory_order_acquire); }
    int size() const;
    int maxSize() const;

    void configure(int maxSize, int ttlSeconds);
    void setTtlMs(qint64 ttlMs);

private:
    struct Entry {
        ResolutionResult result;
        QDeadlineTimer expiry;
        quint64 generation = 0;
    };

    mutable QMutex m_mutex;
    mutable QCache<QString, Entry> m_entries;
    qint64 m_ttlMs = 0;
    std::atomic<quint64> m_generation{1};
};

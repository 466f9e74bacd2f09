#pragma once
#include "semantic/ports.h"
#include <QHash>
#include <QMutex>
#include <QSet>
#include <QStringList>
#include <memory>

// Round-robin cursor per provider, shared by all requests to that provider.
class KeyRotator {
public:
    KeyRotator() = default;
    KeyRotator(const KeyRotator&) = delete;
    KeyRotator& operator=(const KeyRotator&) = delete;

    // Returns the key under the cursor and advances it, skipping excluded
    // keys. Fails once the exclusion set covers every key.
    Result<QString> next(const QString& provider,
                         const QStringList& keys,
                         const QSet<QString>& exclude = {});

    int cursor(const QString& provider) const;
    void forget(const QString& provider);

private:
    struct RotationState {
        QMutex mutex;
        quint64 index = 0;
    };

    std::shared_ptr<RotationState> stateFor(const QString& provider);

    mutable QMutex m_statesMutex;
    QHash<QString, std::shared_ptr<RotationState>> m_states;
};

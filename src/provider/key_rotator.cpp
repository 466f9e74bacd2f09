#include "key_rotator.h"
#include "core/key_hash.h"
#include "core/log_manager.h"
#include <QMutexLocker>

std::shared_ptr<KeyRotator::RotationState> KeyRotator::stateFor(const QString& provider)
{
    QMutexLocker locker(&m_statesMutex);
    auto it = m_states.find(provider);
    if (it == m_states.end())
        it = m_states.insert(provider, std::make_shared<RotationState>());
    return it.value();
}

Result<QString> KeyRotator::next(const QString& provider,
                                 const QStringList& keys,
                                 const QSet<QString>& exclude)
{
    const int count = static_cast<int>(keys.size());
    if (count == 0 || exclude.size() >= count) {
        LOG_CAT_WARNING(QStringLiteral("rotation"),
                        QStringLiteral("All %1 key(s) for provider '%2' exhausted").arg(count).arg(provider));
        return std::unexpected(DomainFailure::allKeysExhausted(provider, count));
    }

    auto state = stateFor(provider);
    for (int attempt = 0; attempt < count; ++attempt) {
        QString key;
        {
            QMutexLocker locker(&state->mutex);
            key = keys.at(static_cast<int>(state->index % count));
            state->index = (state->index + 1) % count;
        }
        if (!exclude.contains(key)) {
            if (!exclude.isEmpty()) {
                LOG_CAT_INFO(QStringLiteral("rotation"),
                             QStringLiteral("Provider '%1' rotated to key %2 (%3 excluded)")
                                 .arg(provider, apiKeyHash(key)).arg(exclude.size()));
            }
            return key;
        }
    }

    // exclusion set names keys outside this list but still covers all of it
    LOG_CAT_WARNING(QStringLiteral("rotation"),
                    QStringLiteral("All %1 key(s) for provider '%2' exhausted").arg(count).arg(provider));
    return std::unexpected(DomainFailure::allKeysExhausted(provider, count));
}

int KeyRotator::cursor(const QString& provider) const
{
    std::shared_ptr<RotationState> state;
    {
        QMutexLocker locker(&m_statesMutex);
        state = m_states.value(provider);
    }
    if (!state)
        return 0;
    QMutexLocker locker(&state->mutex);
    return static_cast<int>(state->index);
}

void KeyRotator::forget(const QString& provider)
{
    QMutexLocker locker(&m_statesMutex);
    m_states.remove(provider);
}

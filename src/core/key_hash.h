#pragma once
#include <QCryptographicHash>
#include <QString>

// Short, stable identifier for an API key that is safe to write to logs.
inline QString apiKeyHash(const QString& key)
{
    if (key.isEmpty())
        return QStringLiteral("REDACTED");
    const QByteArray digest = QCryptographicHash::hash(key.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(digest.toHex().left(8));
}

#include "rotation_policy.h"
#include <QString>
#include <QStringList>

namespace rotation_policy {

bool isQuotaError(const QByteArray& body)
{
    static const QStringList markers = {
        QStringLiteral("insufficient_quota"),
        QStringLiteral("insufficient quota"),
        QStringLiteral("quota exceeded"),
        QStringLiteral("exceeded your current quota"),
        QStringLiteral("billing"),
    };
    const QString text = QString::fromUtf8(body).toLower();
    for (const QString& marker : markers) {
        if (text.contains(marker))
            return true;
    }
    return false;
}

bool shouldRotate(int httpStatus, const QByteArray& body)
{
    if (httpStatus == 401 || httpStatus == 403 || httpStatus == 429)
        return true;
    return httpStatus >= 400 && httpStatus < 500 && isQuotaError(body);
}

}

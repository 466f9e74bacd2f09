#pragma once
#include <QByteArray>

namespace rotation_policy {

// Statuses after which the same request is retried with another key.
bool shouldRotate(int httpStatus, const QByteArray& body);

bool isQuotaError(const QByteArray& body);

}

#pragma once
#include "semantic/wire_format.h"
#include <QJsonObject>
#include <QString>
#include <QVariantMap>

// One client request as handed over by the transport, before resolution.
struct InboundRequest {
    WireFormat clientFormat = WireFormat::OpenAI;
    QJsonObject body;
    QString clientApiKey;
    QString explicitProvider;
    QString conversationId;
    QString requestId;
    QVariantMap metadata;
};

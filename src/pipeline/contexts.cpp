#include "contexts.h"

QVariantMap mergeMetadata(QVariantMap base, const QVariantMap& extra)
{
    for (auto it = extra.constBegin(); it != extra.constEnd(); ++it) {
        const QVariant existing = base.value(it.key());
        if (existing.typeId() == QMetaType::QVariantMap && it.value().typeId() == QMetaType::QVariantMap)
            base.insert(it.key(), mergeMetadata(existing.toMap(), it.value().toMap()));
        else
            base.insert(it.key(), it.value());
    }
    return base;
}

// ---------------------------------------------------------------------------
// RequestContext
// ---------------------------------------------------------------------------

RequestContext::RequestContext(QJsonObject body,
                               QString provider,
                               QString model,
                               QString requestId,
                               QString conversationId,
                               QVariantMap metadata,
                               QString clientApiKey,
                               WireFormat clientFormat)
    : m_body(std::move(body))
    , m_provider(std::move(provider))
    , m_model(std::move(model))
    , m_originalModel(m_model)
    , m_requestId(std::move(requestId))
    , m_conversationId(std::move(conversationId))
    , m_metadata(std::move(metadata))
    , m_clientApiKey(std::move(clientApiKey))
    , m_clientFormat(clientFormat)
{
}

RequestContext RequestContext::withUpdates(const Updates& updates) const
{
    RequestContext copy = *this;
    if (updates.body)
        copy.m_body = *updates.body;
    if (updates.messages)
        copy.m_body.insert(QStringLiteral("messages"), *updates.messages);
    if (updates.provider)
        copy.m_provider = *updates.provider;
    if (updates.model)
        copy.m_model = *updates.model;
    if (updates.conversationId)
        copy.m_conversationId = *updates.conversationId;
    if (updates.metadata)
        copy.m_metadata = *updates.metadata;
    return copy;
}

RequestContext RequestContext::withMetadata(const QString& key, const QVariant& value) const
{
    QVariantMap metadata = m_metadata;
    metadata.insert(key, value);
    Updates updates;
    updates.metadata = metadata;
    return withUpdates(updates);
}

RequestContext RequestContext::withOriginalModel(const QString& originalModel) const
{
    RequestContext copy = *this;
    copy.m_originalModel = originalModel;
    return copy;
}

// ---------------------------------------------------------------------------
// ResponseContext
// ---------------------------------------------------------------------------

ResponseContext::ResponseContext(QJsonObject body, RequestContext request,
                                 bool streaming, QVariantMap metadata)
    : m_body(std::move(body))
    , m_request(std::move(request))
    , m_streaming(streaming)
    , m_metadata(std::move(metadata))
{
}

ResponseContext ResponseContext::withUpdates(const Updates& updates) const
{
    ResponseContext copy = *this;
    if (updates.body)
        copy.m_body = *updates.body;
    if (updates.metadata)
        copy.m_metadata = *updates.metadata;
    return copy;
}

// ---------------------------------------------------------------------------
// StreamChunkContext
// ---------------------------------------------------------------------------

StreamChunkContext::StreamChunkContext(QString event, QJsonObject delta, QByteArray rawData,
                                       RequestContext request, QVariantMap accumulatedMetadata,
                                       bool isComplete)
    : m_event(std::move(event))
    , m_delta(std::move(delta))
    , m_rawData(std::move(rawData))
    , m_request(std::move(request))
    , m_accumulatedMetadata(std::move(accumulatedMetadata))
    , m_isComplete(isComplete)
{
}

StreamChunkContext StreamChunkContext::withUpdates(const Updates& updates) const
{
    StreamChunkContext copy = *this;
    if (updates.event)
        copy.m_event = *updates.event;
    if (updates.delta)
        copy.m_delta = *updates.delta;
    if (updates.accumulatedMetadata)
        copy.m_accumulatedMetadata = mergeMetadata(m_accumulatedMetadata, *updates.accumulatedMetadata);
    return copy;
}

#pragma once
#include "semantic/wire_format.h"
#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QVariantMap>
#include <optional>

// Merges extra into base. Nested maps are merged key by key, so a merge
// never removes anything that was already present.
QVariantMap mergeMetadata(QVariantMap base, const QVariantMap& extra);

// Snapshot of one in-flight request. The body is in the client's wire
// format. Copies are cheap; use withUpdates() to derive a modified one.
class RequestContext {
public:
    struct Updates {
        std::optional<QJsonObject> body;
        std::optional<QJsonArray> messages;
        std::optional<QString> provider;
        std::optional<QString> model;
        std::optional<QString> conversationId;
        std::optional<QVariantMap> metadata;
    };

    RequestContext() = default;
    RequestContext(QJsonObject body,
                   QString provider,
                   QString model,
                   QString requestId,
                   QString conversationId = {},
                   QVariantMap metadata = {},
                   QString clientApiKey = {},
                   WireFormat clientFormat = WireFormat::OpenAI);

    const QJsonObject& body() const { return m_body; }
    QJsonArray messages() const { return m_body.value(QStringLiteral("messages")).toArray(); }
    const QString& provider() const { return m_provider; }
    const QString& model() const { return m_model; }
    const QString& originalModel() const { return m_originalModel; }
    const QString& requestId() const { return m_requestId; }
    const QString& conversationId() const { return m_conversationId; }
    const QVariantMap& metadata() const { return m_metadata; }
    const QString& clientApiKey() const { return m_clientApiKey; }
    WireFormat clientFormat() const { return m_clientFormat; }
    bool isStreaming() const { return m_body.value(QStringLiteral("stream")).toBool(); }

    RequestContext withUpdates(const Updates& updates) const;
    RequestContext withMetadata(const QString& key, const QVariant& value) const;
    RequestContext withOriginalModel(const QString& originalModel) const;

private:
    QJsonObject m_body;
    QString m_provider;
    QString m_model;
    QString m_originalModel;
    QString m_requestId;
    QString m_conversationId;
    QVariantMap m_metadata;
    QString m_clientApiKey;
    WireFormat m_clientFormat = WireFormat::OpenAI;
};

// A non-streamed response, already in the client's wire format.
class ResponseContext {
public:
    struct Updates {
        std::optional<QJsonObject> body;
        std::optional<QVariantMap> metadata;
    };

    ResponseContext() = default;
    ResponseContext(QJsonObject body, RequestContext request,
                    bool streaming = false, QVariantMap metadata = {});

    const QJsonObject& body() const { return m_body; }
    const RequestContext& request() const { return m_request; }
    bool isStreaming() const { return m_streaming; }
    const QVariantMap& metadata() const { return m_metadata; }

    ResponseContext withUpdates(const Updates& updates) const;

private:
    QJsonObject m_body;
    RequestContext m_request;
    bool m_streaming = false;
    QVariantMap m_metadata;
};

// One streamed event in the client's wire format. accumulatedMetadata
// carries everything gathered so far in this stream.
class StreamChunkContext {
public:
    struct Updates {
        std::optional<QString> event;
        std::optional<QJsonObject> delta;
        std::optional<QVariantMap> accumulatedMetadata;
    };

    StreamChunkContext() = default;
    StreamChunkContext(QString event, QJsonObject delta, QByteArray rawData,
                       RequestContext request, QVariantMap accumulatedMetadata,
                       bool isComplete);

    const QString& event() const { return m_event; }
    const QJsonObject& delta() const { return m_delta; }
    const QByteArray& rawData() const { return m_rawData; }
    const RequestContext& request() const { return m_request; }
    const QVariantMap& accumulatedMetadata() const { return m_accumulatedMetadata; }
    bool isComplete() const { return m_isComplete; }

    // Accumulated metadata is merged, never replaced.
    StreamChunkContext withUpdates(const Updates& updates) const;

private:
    QString m_event;
    QJsonObject m_delta;
    QByteArray m_rawData;
    RequestContext m_request;
    QVariantMap m_accumulatedMetadata;
    bool m_isComplete = false;
};

#pragma once
#include "pipeline/middleware.h"
#include <QCache>
#include <QDeadlineTimer>
#include <QMutex>

inline const QString kThoughtSignaturesKey = QStringLiteral("thought_signatures");

struct ThoughtSignatureSettings {
    int maxConversations = 10000;
    int ttlSeconds = 3600;
};

// Gemini rejects follow-up tool-calling turns unless each earlier tool call
// carries the thought signature it was issued with. Signatures seen in a
// response are kept per conversation and handed back on the next request.
class ThoughtSignatureMiddleware : public IMiddleware {
public:
    explicit ThoughtSignatureMiddleware(const ThoughtSignatureSettings& settings = {});

    QString name() const override { return "thought_signatures"; }
    bool shouldHandle(const QString& provider, const QString& model) const override;

    Result<RequestContext> beforeRequest(RequestContext ctx) override;
    Result<ResponseContext> afterResponse(ResponseContext ctx) override;
    VoidResult onStreamComplete(const RequestContext& ctx,
                                const QVariantMap& accumulatedMetadata) override;

    VoidResult initialize() override;
    VoidResult cleanup() override;

    // tool call id -> signature
    QVariantMap signaturesFor(const QString& conversationId) const;
    int conversationCount() const;

private:
    struct Entry {
        QVariantMap signatures;
        QDeadlineTimer expiry;
    };

    void store(const QString& conversationId, const QVariantMap& signatures);

    ThoughtSignatureSettings m_settings;
    mutable QMutex m_mutex;
    mutable QCache<QString, Entry> m_cache;
    bool m_ready = false;
};

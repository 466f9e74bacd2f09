#pragma once
#include "pipeline/middleware.h"

class DebugMiddleware : public IMiddleware {
public:
    explicit DebugMiddleware(bool enabled = false) : m_enabled(enabled) {}
    QString name() const override { return "debug"; }
    bool shouldHandle(const QString& provider, const QString& model) const override;
    Result<RequestContext> beforeRequest(RequestContext ctx) override;
    Result<ResponseContext> afterResponse(ResponseContext ctx) override;
    Result<StreamChunkContext> onStreamChunk(StreamChunkContext ctx) override;
    VoidResult onStreamComplete(const RequestContext& ctx,
                                const QVariantMap& accumulatedMetadata) override;

private:
    bool m_enabled;
};

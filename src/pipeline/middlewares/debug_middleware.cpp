#include "debug_middleware.h"
#include "core/log_manager.h"
#include <QJsonDocument>

bool DebugMiddleware::shouldHandle(const QString&, const QString&) const {
    return m_enabled;
}

Result<RequestContext> DebugMiddleware::beforeRequest(RequestContext ctx) {
    LOG_DEBUG(QStringLiteral("[Debug] Request %1: provider=%2, model=%3 (requested %4), messages=%5, stream=%6")
        .arg(ctx.requestId(), ctx.provider(), ctx.model(), ctx.originalModel())
        .arg(ctx.messages().size())
        .arg(ctx.isStreaming()));
    return ctx;
}

Result<ResponseContext> DebugMiddleware::afterResponse(ResponseContext ctx) {
    LOG_DEBUG(QStringLiteral("[Debug] Response %1: %2 bytes")
        .arg(ctx.request().requestId())
        .arg(QJsonDocument(ctx.body()).toJson(QJsonDocument::Compact).size()));
    return ctx;
}

Result<StreamChunkContext> DebugMiddleware::onStreamChunk(StreamChunkContext ctx) {
    LOG_DEBUG(QStringLiteral("[Debug] Chunk %1: event=%2, final=%3")
        .arg(ctx.request().requestId(), ctx.event().isEmpty() ? QStringLiteral("message") : ctx.event())
        .arg(ctx.isComplete()));
    return ctx;
}

VoidResult DebugMiddleware::onStreamComplete(const RequestContext& ctx,
                                             const QVariantMap& accumulatedMetadata) {
    LOG_DEBUG(QStringLiteral("[Debug] Stream %1 complete, metadata keys: %2")
        .arg(ctx.requestId(), accumulatedMetadata.keys().join(QStringLiteral(","))));
    return {};
}

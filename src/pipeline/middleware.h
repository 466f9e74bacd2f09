#pragma once
#include "contexts.h"
#include "semantic/ports.h"

// A pluggable processing stage. Hooks return a new context rather than
// modifying their input; a failure aborts the rest of the phase.
class IMiddleware {
public:
    virtual ~IMiddleware() = default;
    virtual QString name() const = 0;

    virtual bool shouldHandle(const QString& provider, const QString& model) const {
        Q_UNUSED(provider);
        Q_UNUSED(model);
        return true;
    }

    virtual Result<RequestContext> beforeRequest(RequestContext ctx) {
        return ctx;
    }
    virtual Result<ResponseContext> afterResponse(ResponseContext ctx) {
        return ctx;
    }
    virtual Result<StreamChunkContext> onStreamChunk(StreamChunkContext ctx) {
        return ctx;
    }
    virtual VoidResult onStreamComplete(const RequestContext& ctx,
                                        const QVariantMap& accumulatedMetadata) {
        Q_UNUSED(ctx);
        Q_UNUSED(accumulatedMetadata);
        return {};
    }

    virtual VoidResult initialize() { return {}; }
    virtual VoidResult cleanup() { return {}; }
};

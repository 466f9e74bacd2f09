#include "middleware_chain.h"
#include "core/log_manager.h"
#include <exception>

MiddlewareChain::~MiddlewareChain()
{
    if (m_initialized)
        cleanup();
}

VoidResult MiddlewareChain::addMiddleware(std::unique_ptr<IMiddleware> mw)
{
    if (!mw)
        return std::unexpected(DomainFailure::internal(QStringLiteral("null middleware")));
    if (m_initialized) {
        return std::unexpected(DomainFailure::configurationInvalid(
            QStringLiteral("Cannot add middleware '%1' after the chain was initialized").arg(mw->name())));
    }
    m_middlewares.push_back(std::move(mw));
    return {};
}

QStringList MiddlewareChain::middlewareNames() const
{
    QStringList names;
    for (const auto& mw : m_middlewares)
        names.append(mw->name());
    return names;
}

VoidResult MiddlewareChain::initialize()
{
    if (m_initialized)
        return {};

    for (const auto& mw : m_middlewares) {
        VoidResult result;
        try {
            result = mw->initialize();
        } catch (const std::exception& e) {
            result = std::unexpected(DomainFailure::middlewareFailed(mw->name(), QString::fromUtf8(e.what())));
        }
        if (!result) {
            LOG_CAT_ERROR(QStringLiteral("middleware"),
                          QStringLiteral("Middleware '%1' failed to initialize: %2")
                              .arg(mw->name(), result.error().message));
            return std::unexpected(DomainFailure::configurationInvalid(
                QStringLiteral("Middleware '%1' failed to initialize: %2")
                    .arg(mw->name(), result.error().message)));
        }
        LOG_CAT_DEBUG(QStringLiteral("middleware"),
                      QStringLiteral("Middleware '%1' initialized").arg(mw->name()));
    }
    m_initialized = true;
    return {};
}

void MiddlewareChain::cleanup()
{
    for (auto it = m_middlewares.rbegin(); it != m_middlewares.rend(); ++it) {
        IMiddleware* mw = it->get();
        VoidResult result;
        try {
            result = mw->cleanup();
        } catch (const std::exception& e) {
            result = std::unexpected(DomainFailure::middlewareFailed(mw->name(), QString::fromUtf8(e.what())));
        }
        if (!result) {
            LOG_CAT_WARNING(QStringLiteral("middleware"),
                            QStringLiteral("Middleware '%1' cleanup failed: %2")
                                .arg(mw->name(), result.error().message));
        }
    }
    m_initialized = false;
}

QList<IMiddleware*> MiddlewareChain::applicable(const RequestContext& ctx) const
{
    QList<IMiddleware*> result;
    for (const auto& mw : m_middlewares) {
        if (mw->shouldHandle(ctx.provider(), ctx.model()))
            result.append(mw.get());
    }
    return result;
}

void MiddlewareChain::logFailure(const IMiddleware* mw, const char* phase,
                                 const RequestContext& ctx, const DomainFailure& failure) const
{
    LOG_CAT_ERROR(QStringLiteral("middleware"),
                  QStringLiteral("Middleware '%1' failed in %2 [provider=%3 model=%4 request_id=%5]: %6")
                      .arg(mw->name(), QString::fromLatin1(phase), ctx.provider(), ctx.model(),
                           ctx.requestId(), failure.message));
}

template<typename Ctx, typename Hook>
Result<Ctx> MiddlewareChain::runPhase(const char* phase, const RequestContext& owner,
                                      Ctx ctx, Hook hook) const
{
    const QList<IMiddleware*> stages = applicable(owner);
    for (IMiddleware* mw : stages) {
        Result<Ctx> next = std::unexpected(DomainFailure::internal(QStringLiteral("unreachable")));
        try {
            next = hook(mw, std::move(ctx));
        } catch (const std::exception& e) {
            next = std::unexpected(DomainFailure::middlewareFailed(mw->name(), QString::fromUtf8(e.what())));
        }
        if (!next) {
            logFailure(mw, phase, owner, next.error());
            return next;
        }
        ctx = std::move(*next);
    }
    return ctx;
}

Result<RequestContext> MiddlewareChain::processRequest(RequestContext ctx) const
{
    const RequestContext owner = ctx;
    return runPhase("before_request", owner, std::move(ctx),
                    [](IMiddleware* mw, RequestContext c) { return mw->beforeRequest(std::move(c)); });
}

Result<ResponseContext> MiddlewareChain::processResponse(ResponseContext ctx) const
{
    const RequestContext owner = ctx.request();
    return runPhase("after_response", owner, std::move(ctx),
                    [](IMiddleware* mw, ResponseContext c) { return mw->afterResponse(std::move(c)); });
}

Result<StreamChunkContext> MiddlewareChain::processStreamChunk(StreamChunkContext ctx) const
{
    const RequestContext owner = ctx.request();
    return runPhase("on_stream_chunk", owner, std::move(ctx),
                    [](IMiddleware* mw, StreamChunkContext c) { return mw->onStreamChunk(std::move(c)); });
}

VoidResult MiddlewareChain::processStreamComplete(const RequestContext& ctx,
                                                  const QVariantMap& accumulatedMetadata) const
{
    const QList<IMiddleware*> stages = applicable(ctx);
    for (IMiddleware* mw : stages) {
        VoidResult result;
        try {
            result = mw->onStreamComplete(ctx, accumulatedMetadata);
        } catch (const std::exception& e) {
            result = std::unexpected(DomainFailure::middlewareFailed(mw->name(), QString::fromUtf8(e.what())));
        }
        if (!result) {
            logFailure(mw, "on_stream_complete", ctx, result.error());
            return result;
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// StreamCompletionGuard
// ---------------------------------------------------------------------------

StreamCompletionGuard::StreamCompletionGuard(const MiddlewareChain& chain, RequestContext request)
    : m_chain(chain)
    , m_request(std::move(request))
{
}

StreamCompletionGuard::~StreamCompletionGuard()
{
    if (!m_finished) {
        LOG_CAT_DEBUG(QStringLiteral("stream"),
                      QStringLiteral("Stream %1 ended before its final chunk; finalizing")
                          .arg(m_request.requestId()));
        // already logged by the chain; nothing to propagate to from here
        (void)finish();
    }
}

void StreamCompletionGuard::accumulate(const QVariantMap& metadata)
{
    m_accumulated = mergeMetadata(m_accumulated, metadata);
}

VoidResult StreamCompletionGuard::finish()
{
    if (m_finished)
        return {};
    m_finished = true;
    return m_chain.processStreamComplete(m_request, m_accumulated);
}

#pragma once
#include "middleware.h"
#include <QList>
#include <QStringList>
#include <memory>
#include <vector>

class MiddlewareChain {
public:
    MiddlewareChain() = default;
    ~MiddlewareChain();
    MiddlewareChain(const MiddlewareChain&) = delete;
    MiddlewareChain& operator=(const MiddlewareChain&) = delete;

    // Only allowed before initialize().
    VoidResult addMiddleware(std::unique_ptr<IMiddleware> mw);

    // Registration order; the first failure aborts and is returned.
    VoidResult initialize();
    // Reverse registration order; failures are logged, never returned.
    void cleanup();

    bool isInitialized() const { return m_initialized; }
    QStringList middlewareNames() const;
    int size() const { return static_cast<int>(m_middlewares.size()); }

    Result<RequestContext> processRequest(RequestContext ctx) const;
    Result<ResponseContext> processResponse(ResponseContext ctx) const;
    Result<StreamChunkContext> processStreamChunk(StreamChunkContext ctx) const;
    VoidResult processStreamComplete(const RequestContext& ctx,
                                     const QVariantMap& accumulatedMetadata) const;

private:
    QList<IMiddleware*> applicable(const RequestContext& ctx) const;

    template<typename Ctx, typename Hook>
    Result<Ctx> runPhase(const char* phase, const RequestContext& owner, Ctx ctx, Hook hook) const;

    void logFailure(const IMiddleware* mw, const char* phase,
                    const RequestContext& ctx, const DomainFailure& failure) const;

    std::vector<std::unique_ptr<IMiddleware>> m_middlewares;
    bool m_initialized = false;
};

// Runs processStreamComplete() exactly once: when finish() is called, or
// when the guard is destroyed without it (client went away mid-stream).
class StreamCompletionGuard {
public:
    StreamCompletionGuard(const MiddlewareChain& chain, RequestContext request);
    ~StreamCompletionGuard();
    StreamCompletionGuard(const StreamCompletionGuard&) = delete;
    StreamCompletionGuard& operator=(const StreamCompletionGuard&) = delete;

    void accumulate(const QVariantMap& metadata);
    const QVariantMap& accumulated() const { return m_accumulated; }
    const RequestContext& request() const { return m_request; }

    VoidResult finish();
    bool isFinished() const { return m_finished; }

private:
    const MiddlewareChain& m_chain;
    RequestContext m_request;
    QVariantMap m_accumulated;
    bool m_finished = false;
};

#include "gateway_stream_session.h"
#include "conversion/thought_signatures.h"
#include "core/key_hash.h"
#include "core/log_manager.h"
#include "pipeline/middlewares/thought_signature_middleware.h"
#include "provider/rotation_policy.h"

GatewayStreamSession::GatewayStreamSession(const MiddlewareChain& chain,
                                           RequestContext request,
                                           AuthParams auth,
                                           std::unique_ptr<StreamTranslator> translator,
                                           WireFormat providerFormat,
                                           Opener opener,
                                           QObject* parent)
    : QObject(parent)
    , m_chain(chain)
    , m_guard(chain, std::move(request))
    , m_auth(std::move(auth))
    , m_translator(std::move(translator))
    , m_providerFormat(providerFormat)
    , m_opener(std::move(opener))
{
    Q_ASSERT(m_translator);
    Q_ASSERT(m_opener);
}

GatewayStreamSession::~GatewayStreamSession()
{
    releaseUpstream();
    // m_guard runs the completion hook if the stream never reached an end
}

void GatewayStreamSession::start()
{
    if (m_done || m_upstream)
        return;
    openUpstream(m_auth.apiKey);
}

void GatewayStreamSession::abort()
{
    if (m_done)
        return;
    LOG_CAT_INFO(QStringLiteral("stream"),
                 QStringLiteral("Client disconnected [request_id=%1]").arg(request().requestId()));
    complete();
}

bool GatewayStreamSession::openUpstream(const QString& apiKey)
{
    m_currentKey = apiKey;
    ++m_attempts;

    auto opened = m_opener(apiKey);
    if (!opened) {
        onUpstreamFailed(opened.error());
        return false;
    }

    m_upstream = *opened;
    m_upstream->setParent(this);
    connect(m_upstream, &UpstreamStream::dataReceived,
            this, &GatewayStreamSession::onUpstreamData);
    connect(m_upstream, &UpstreamStream::finished,
            this, &GatewayStreamSession::onUpstreamFinished);
    connect(m_upstream, &UpstreamStream::failed,
            this, &GatewayStreamSession::onUpstreamFailed);
    m_upstream->start();
    return true;
}

void GatewayStreamSession::releaseUpstream()
{
    if (!m_upstream)
        return;
    UpstreamStream* upstream = m_upstream;
    m_upstream = nullptr;
    disconnect(upstream, nullptr, this, nullptr);
    upstream->abort();
    upstream->deleteLater();
}

void GatewayStreamSession::onUpstreamData(const QByteArray& data)
{
    if (m_done)
        return;
    m_receivedData = true;

    const QList<SseEvent> events = m_parser.feed(data);
    for (const SseEvent& event : events) {
        if (m_done)
            return;   // anything after the terminal event is dropped
        handleUpstreamEvent(event);
    }
}

void GatewayStreamSession::onUpstreamFinished()
{
    if (m_done)
        return;

    for (const SseEvent& event : m_parser.flush()) {
        if (m_done)
            return;
        handleUpstreamEvent(event);
    }
    if (m_done)
        return;

    LOG_CAT_DEBUG(QStringLiteral("stream"),
                  QStringLiteral("Upstream closed without a terminal event [request_id=%1]")
                      .arg(request().requestId()));
    forward(m_translator->finish());
    complete();
}

void GatewayStreamSession::onUpstreamFailed(const DomainFailure& failure)
{
    if (m_done)
        return;

    // Before the first byte the request can still go out with another key.
    if (!m_receivedData && m_auth.canRotate() && failure.upstreamStatus > 0
        && rotation_policy::shouldRotate(failure.upstreamStatus, failure.upstreamBody)) {
        m_triedKeys.insert(m_currentKey);
        LOG_CAT_WARNING(QStringLiteral("rotation"),
                        QStringLiteral("Stream for %1 failed with HTTP %2 on key %3, rotating")
                            .arg(request().provider())
                            .arg(failure.upstreamStatus)
                            .arg(apiKeyHash(m_currentKey)));
        auto next = m_auth.nextKey(m_triedKeys);
        if (next) {
            releaseUpstream();
            m_parser = SseEventParser();
            openUpstream(*next);
            return;
        }
        fail(next.error());
        return;
    }

    fail(failure);
}

void GatewayStreamSession::handleUpstreamEvent(const SseEvent& event)
{
    if (m_providerFormat == WireFormat::OpenAI && !event.isDone()) {
        const QVariantMap signatures = thought_signatures::extract(event.json());
        if (!signatures.isEmpty())
            m_guard.accumulate({{kThoughtSignaturesKey, signatures}});
    }

    auto translated = m_translator->translate(event);
    if (!translated) {
        fail(translated.error());
        return;
    }
    forward(*translated);
    if (!m_done && m_translator->isFinished())
        complete();
}

void GatewayStreamSession::forward(const QList<SseEvent>& events)
{
    for (const SseEvent& event : events) {
        if (m_done)
            return;

        const bool terminal = StreamTranslator::isTerminal(event);
        const QJsonObject delta = event.json();
        StreamChunkContext ctx(event.event, delta, event.serialize(),
                               m_guard.request(), m_guard.accumulated(), terminal);

        auto processed = m_chain.processStreamChunk(ctx);
        if (!processed) {
            // The chain has already logged the failing middleware. The
            // terminal event of this batch, if any, is never sent, so the
            // error events take its place.
            const DomainFailure failure = processed.error();
            const QList<SseEvent> errorEvents = m_translator->failureEventsReplacingTerminal(failure);
            for (const SseEvent& e : errorEvents)
                emit chunkReady(e.serialize());
            emit failed(failure);
            complete();
            return;
        }

        m_guard.accumulate(processed->accumulatedMetadata());

        const bool unchanged = processed->event() == event.event && processed->delta() == delta;
        emit chunkReady(unchanged ? event.serialize()
                                  : SseEvent::fromJson(processed->event(), processed->delta()).serialize());

        if (terminal) {
            complete();
            return;
        }
    }
}

void GatewayStreamSession::fail(const DomainFailure& failure)
{
    if (m_done)
        return;
    LOG_CAT_ERROR(QStringLiteral("stream"),
                  QStringLiteral("Stream failed [%1] %2 [provider=%3 model=%4 request_id=%5]")
                      .arg(failure.code, failure.message, request().provider(),
                           request().model(), request().requestId()));

    const QList<SseEvent> events = m_translator->failureEvents(failure);
    for (const SseEvent& event : events)
        emit chunkReady(event.serialize());
    emit failed(failure);
    complete();
}

void GatewayStreamSession::complete()
{
    if (m_done)
        return;
    m_done = true;
    releaseUpstream();

    auto result = m_guard.finish();
    if (!result) {
        LOG_CAT_WARNING(QStringLiteral("stream"),
                        QStringLiteral("Stream completion hook failed: %1").arg(result.error().message));
    }
    emit finished();
}

#pragma once
#include "conversion/sse_event_parser.h"
#include "conversion/stream_translator.h"
#include "pipeline/middleware_chain.h"
#include "provider/provider_config.h"
#include "semantic/upstream_stream.h"
#include <QObject>
#include <QPointer>
#include <QSet>
#include <functional>
#include <memory>

// Relays one upstream stream to the client: parses upstream SSE, converts
// each event to the client's dialect, runs the stream-chunk middleware and
// emits the resulting bytes. Completion middleware runs exactly once, on
// the terminal event, on failure, on abort() or on destruction.
class GatewayStreamSession : public QObject {
    Q_OBJECT
public:
    // Opens the upstream with the given key; the stream is not started yet.
    using Opener = std::function<Result<UpstreamStream*>(const QString& apiKey)>;

    GatewayStreamSession(const MiddlewareChain& chain,
                         RequestContext request,
                         AuthParams auth,
                         std::unique_ptr<StreamTranslator> translator,
                         WireFormat providerFormat,
                         Opener opener,
                         QObject* parent = nullptr);
    ~GatewayStreamSession() override;

    // Connect to the signals first.
    void start();
    // Client went away. Completion middleware still runs.
    void abort();

    bool isFinished() const { return m_done; }
    const RequestContext& request() const { return m_guard.request(); }
    const QVariantMap& accumulatedMetadata() const { return m_guard.accumulated(); }
    QString currentKey() const { return m_currentKey; }
    int attempts() const { return m_attempts; }

signals:
    void chunkReady(const QByteArray& sseData);
    void failed(const DomainFailure& failure);
    void finished();

private slots:
    void onUpstreamData(const QByteArray& data);
    void onUpstreamFinished();
    void onUpstreamFailed(const DomainFailure& failure);

private:
    bool openUpstream(const QString& apiKey);
    void releaseUpstream();
    void handleUpstreamEvent(const SseEvent& event);
    void forward(const QList<SseEvent>& events);
    void fail(const DomainFailure& failure);
    void complete();

    const MiddlewareChain& m_chain;
    StreamCompletionGuard m_guard;
    AuthParams m_auth;
    std::unique_ptr<StreamTranslator> m_translator;
    WireFormat m_providerFormat;
    Opener m_opener;

    QPointer<UpstreamStream> m_upstream;
    SseEventParser m_parser;
    QString m_currentKey;
    QSet<QString> m_triedKeys;
    int m_attempts = 0;
    bool m_receivedData = false;
    bool m_done = false;
};

#include <QTest>
#include <QSignalSpy>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QPointer>
#include "gateway/request_dispatcher.h"

// Upstream stream driven by the test.
class ScriptedStream : public UpstreamStream {
    Q_OBJECT
public:
    using UpstreamStream::UpstreamStream;

    void start() override { started = true; }
    void abort() override { aborted = true; }

    void push(const QByteArray& bytes) { emit dataReceived(bytes); }
    void end() { emit finished(); }

    bool started = false;
    bool aborted = false;
};

namespace {

const QByteArray kOpenAIResponse = R"({
    "id": "chatcmpl-1", "object": "chat.completion", "model": "gpt-4o",
    "choices": [{"index": 0, "finish_reason": "stop",
                 "message": {"role": "assistant", "content": "pong"}}],
    "usage": {"prompt_tokens": 1, "completion_tokens": 1, "total_tokens": 2}
})";

// Answers calls from a script, one entry per call. Records the key of
// every attempt.
class ScriptedExecutor : public IExecutor {
public:
    struct Step {
        int status = 200;
        QByteArray body;
    };

    QList<Step> script;
    // Runs before each scripted answer, with the zero-based call number.
    std::function<void(int)> onCall;
    QStringList keysUsed;
    QList<ProviderRequest> requests;
    QList<QPointer<ScriptedStream>> streams;

    Result<ProviderResponse> execute(const ProviderRequest& request) override {
        auto step = next(request);
        if (step.status >= 400)
            return std::unexpected(DomainFailure::upstreamHttp(step.status, step.body));
        return ProviderResponse{step.status, {}, step.body};
    }

    Result<UpstreamStream*> openStream(const ProviderRequest& request) override {
        auto step = next(request);
        if (step.status >= 400)
            return std::unexpected(DomainFailure::upstreamHttp(step.status, step.body));
        auto* stream = new ScriptedStream;
        streams.append(stream);
        return stream;
    }

private:
    Step next(const ProviderRequest& request) {
        requests.append(request);
        QString key = request.headers.value(QStringLiteral("Authorization"));
        key.remove(QStringLiteral("Bearer "));
        if (key.isEmpty())
            key = request.headers.value(QStringLiteral("x-api-key"));
        keysUsed.append(key);
        if (onCall)
            onCall(static_cast<int>(keysUsed.size()) - 1);
        return script.isEmpty() ? Step{200, kOpenAIResponse} : script.takeFirst();
    }
};

// Counts hook invocations and records stream events as the chain sees them.
class RecordingMiddleware : public IMiddleware {
public:
    int completions = 0;
    QStringList chunkEvents;
    QString lastCompletedRequest;

    QString name() const override { return QStringLiteral("recorder"); }

    Result<RequestContext> beforeRequest(RequestContext ctx) override {
        return ctx.withMetadata(QStringLiteral("recorded"), true);
    }

    Result<ResponseContext> afterResponse(ResponseContext ctx) override {
        QJsonObject body = ctx.body();
        body.insert(QStringLiteral("x_recorded"), ctx.request().metadata().value(QStringLiteral("recorded")).toBool());
        return ctx.withUpdates({body, std::nullopt});
    }

    Result<StreamChunkContext> onStreamChunk(StreamChunkContext ctx) override {
        chunkEvents.append(ctx.event().isEmpty() ? QStringLiteral("data") : ctx.event());
        return ctx;
    }

    VoidResult onStreamComplete(const RequestContext& ctx, const QVariantMap&) override {
        ++completions;
        lastCompletedRequest = ctx.requestId();
        return {};
    }
};

// Rejects the chunk that ends the stream.
class RejectTerminalChunkMiddleware : public IMiddleware {
public:
    QString name() const override { return QStringLiteral("reject_terminal"); }

    Result<StreamChunkContext> onStreamChunk(StreamChunkContext ctx) override {
        if (ctx.isComplete())
            return std::unexpected(DomainFailure::internal(QStringLiteral("terminal chunk rejected")));
        return ctx;
    }
};

ProviderConfig provider(const QString& name, const QStringList& keys, WireFormat format = WireFormat::OpenAI)
{
    ProviderConfig config;
    config.name = name;
    config.baseUrl = QStringLiteral("https://%1.example.com/v1").arg(name);
    config.apiFormat = format;
    ProviderConfig::assignKeys(config, keys);
    return config;
}

InboundRequest chatRequest(const QString& model, bool stream = false)
{
    InboundRequest request;
    request.clientFormat = WireFormat::OpenAI;
    request.requestId = QStringLiteral("req-1");
    request.body = QJsonObject{
        {QStringLiteral("model"), model},
        {QStringLiteral("messages"), QJsonArray{QJsonObject{{QStringLiteral("role"), QStringLiteral("user")},
                                                            {QStringLiteral("content"), QStringLiteral("ping")}}}},
        {QStringLiteral("stream"), stream},
    };
    return request;
}

struct Fixture {
    AliasService aliases;
    ProviderRegistry providers;
    MiddlewareChain chain;
    ProtocolConverter converter;
    ScriptedExecutor executor;
    RequestTracker tracker;
    RecordingMiddleware* recorder = nullptr;
    std::unique_ptr<RequestDispatcher> dispatcher;

    explicit Fixture(const QList<ProviderConfig>& configs,
                     std::unique_ptr<IMiddleware> extra = nullptr) {
        QStringList names;
        for (const ProviderConfig& c : configs)
            names.append(c.name);
        aliases.publish(AliasTable::build(names, names.first(), {}, {}, 1));
        if (!providers.load(configs))
            qFatal("fixture providers rejected");

        auto owned = std::make_unique<RecordingMiddleware>();
        recorder = owned.get();
        if (!chain.addMiddleware(std::move(owned)))
            qFatal("fixture chain rejected");
        if (extra && !chain.addMiddleware(std::move(extra)))
            qFatal("fixture chain rejected");
        if (!chain.initialize())
            qFatal("fixture chain rejected");

        dispatcher = std::make_unique<RequestDispatcher>(aliases, providers, chain, converter,
                                                         executor, &tracker);
    }
};

}

class TestDispatcher : public QObject {
    Q_OBJECT

private slots:
    void testDispatchRunsMiddlewareBothWays() {
        Fixture f({provider(QStringLiteral("openai"), {QStringLiteral("k1")})});
        auto result = f.dispatcher->dispatch(chatRequest(QStringLiteral("gpt-4o")));
        QVERIFY(result.has_value());
        QVERIFY((*result)[QStringLiteral("x_recorded")].toBool());
        QCOMPARE(f.executor.requests.size(), 1);
        QCOMPARE(f.executor.requests[0].url, QStringLiteral("https://openai.example.com/v1/chat/completions"));

        const QJsonObject sent = QJsonDocument::fromJson(f.executor.requests[0].body).object();
        QVERIFY(!sent.contains(QStringLiteral("stream")));

        auto tracked = f.tracker.request(QStringLiteral("req-1"));
        QVERIFY(tracked.has_value());
        QVERIFY(tracked->succeeded);
        QCOMPARE(tracked->provider, QStringLiteral("openai"));
    }

    void testRotatesOnAuthAndRateLimit() {
        Fixture f({provider(QStringLiteral("openai"),
                            {QStringLiteral("k1"), QStringLiteral("k2"), QStringLiteral("k3")})});
        f.executor.script = {{401, R"({"error":{"message":"bad key"}})"},
                             {429, R"({"error":{"message":"slow down"}})"},
                             {200, kOpenAIResponse}};

        auto result = f.dispatcher->dispatch(chatRequest(QStringLiteral("gpt-4o")));
        QVERIFY(result.has_value());
        QCOMPARE(f.executor.keysUsed,
                 QStringList({QStringLiteral("k1"), QStringLiteral("k2"), QStringLiteral("k3")}));
        QCOMPARE(f.tracker.request(QStringLiteral("req-1"))->attempts, 3);
    }

    void testRotationExcludesEveryFailedKey() {
        Fixture f({provider(QStringLiteral("openai"),
                            {QStringLiteral("k1"), QStringLiteral("k2"), QStringLiteral("k3")})});
        f.executor.script = {{401, R"({"error":{"message":"bad key"}})"},
                             {429, R"({"error":{"message":"slow down"}})"},
                             {200, kOpenAIResponse}};
        // Other traffic moves the shared cursor back to k1 before each
        // rotation, so only the exclusion set keeps failed keys out.
        f.executor.onCall = [&f](int call) {
            const int skips = call == 0 ? 2 : 1;
            for (int i = 0; i < skips; ++i)
                QVERIFY(f.providers.getClientAuth(QStringLiteral("openai")).has_value());
        };

        auto result = f.dispatcher->dispatch(chatRequest(QStringLiteral("gpt-4o")));
        QVERIFY(result.has_value());
        QCOMPARE(f.executor.keysUsed,
                 QStringList({QStringLiteral("k1"), QStringLiteral("k2"), QStringLiteral("k3")}));
        QCOMPARE(f.tracker.request(QStringLiteral("req-1"))->attempts, 3);

        // the same pick made directly: {k1, k2} leaves only k3
        auto auth = f.providers.getClientAuth(QStringLiteral("openai"));
        QVERIFY(auth.has_value() && auth->canRotate());
        QCOMPARE(*auth->nextKey({QStringLiteral("k1"), QStringLiteral("k2")}), QStringLiteral("k3"));
        QVERIFY(!auth->nextKey({QStringLiteral("k1"), QStringLiteral("k2"), QStringLiteral("k3")}).has_value());
    }

    void testProfileOverridesProviderTimeout() {
        Fixture f({provider(QStringLiteral("openai"), {QStringLiteral("k1")})});
        AliasProfile work;
        work.name = QStringLiteral("work");
        work.aliases = {{QStringLiteral("fast"), QStringLiteral("openai:gpt-4o-mini")}};
        work.timeoutMs = 7000;
        f.aliases.publish(AliasTable::build({QStringLiteral("openai")}, QStringLiteral("openai"),
                                            {}, {}, 2, {work}));

        QVERIFY(f.dispatcher->dispatch(chatRequest(QStringLiteral("work:fast"))).has_value());
        QVERIFY(f.dispatcher->dispatch(chatRequest(QStringLiteral("gpt-4o"))).has_value());

        QCOMPARE(f.executor.requests.size(), 2);
        const QJsonObject sent = QJsonDocument::fromJson(f.executor.requests[0].body).object();
        QCOMPARE(sent[QStringLiteral("model")].toString(), QStringLiteral("gpt-4o-mini"));
        QCOMPARE(f.executor.requests[0].timeoutMs, 7000);
        QCOMPARE(f.executor.requests[1].timeoutMs, 90000);
    }

    void testAllKeysExhausted() {
        Fixture f({provider(QStringLiteral("openai"),
                            {QStringLiteral("k1"), QStringLiteral("k2"), QStringLiteral("k3")})});
        f.executor.script = {{429, {}}, {429, {}}, {429, {}}, {200, kOpenAIResponse}};

        auto result = f.dispatcher->dispatch(chatRequest(QStringLiteral("gpt-4o")));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().code, QStringLiteral("all_keys_exhausted"));
        QCOMPARE(f.executor.keysUsed.size(), 3);
        QCOMPARE(QSet<QString>(f.executor.keysUsed.cbegin(), f.executor.keysUsed.cend()).size(), 3);

        auto tracked = f.tracker.request(QStringLiteral("req-1"));
        QVERIFY(!tracked->succeeded);
        QCOMPARE(tracked->errorCode, QStringLiteral("all_keys_exhausted"));
        QCOMPARE(f.tracker.failureCount(QStringLiteral("openai")), 1);
        QCOMPARE(f.tracker.requestCount(QStringLiteral("openai")), 1);
    }

    void testQuotaBodyRotatesOtherClientErrorsDoNot() {
        Fixture f({provider(QStringLiteral("openai"), {QStringLiteral("k1"), QStringLiteral("k2")})});
        f.executor.script = {{400, R"({"error":{"code":"insufficient_quota","message":"quota"}})"},
                             {400, R"({"error":{"message":"messages must not be empty"}})"}};

        auto result = f.dispatcher->dispatch(chatRequest(QStringLiteral("gpt-4o")));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().upstreamStatus, 400);
        QCOMPARE(result.error().code, QStringLiteral("openai.http_400"));
        QCOMPARE(f.executor.keysUsed.size(), 2);
    }

    void testServerErrorIsNotRotated() {
        Fixture f({provider(QStringLiteral("openai"), {QStringLiteral("k1"), QStringLiteral("k2")})});
        f.executor.script = {{503, {}}};
        auto result = f.dispatcher->dispatch(chatRequest(QStringLiteral("gpt-4o")));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Unavailable);
        QCOMPARE(f.executor.keysUsed.size(), 1);
    }

    void testPassthroughUsesClientKeyWithoutRotation() {
        Fixture f({provider(QStringLiteral("poe"), {QStringLiteral("!PASSTHRU")})});
        InboundRequest request = chatRequest(QStringLiteral("gpt-4o"));
        request.clientApiKey = QStringLiteral("client-key");
        f.executor.script = {{401, {}}};

        auto result = f.dispatcher->dispatch(request);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Unauthorized);
        QCOMPARE(f.executor.keysUsed, QStringList({QStringLiteral("client-key")}));
    }

    void testPassthroughWithoutClientKeyNeverCallsUpstream() {
        Fixture f({provider(QStringLiteral("poe"), {QStringLiteral("!PASSTHRU")})});
        auto result = f.dispatcher->dispatch(chatRequest(QStringLiteral("gpt-4o")));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().code, QStringLiteral("missing_client_key"));
        QVERIFY(f.executor.requests.isEmpty());

        const QJsonObject body = f.dispatcher->errorBody(result.error(), WireFormat::OpenAI);
        QCOMPARE(body[QStringLiteral("error")].toObject()[QStringLiteral("code")].toString(),
                 QStringLiteral("missing_client_key"));
    }

    void testConversionToAnthropicProvider() {
        Fixture f({provider(QStringLiteral("anthropic"), {QStringLiteral("a1")}, WireFormat::Anthropic)});
        f.executor.script = {{200, R"({"id":"msg_1","type":"message","role":"assistant","model":"claude",
                                      "content":[{"type":"text","text":"hi"}],"stop_reason":"end_turn",
                                      "usage":{"input_tokens":2,"output_tokens":1}})"}};

        auto result = f.dispatcher->dispatch(chatRequest(QStringLiteral("claude")));
        QVERIFY(result.has_value());
        QCOMPARE(f.executor.requests[0].headers.value(QStringLiteral("x-api-key")), QStringLiteral("a1"));
        QVERIFY(f.executor.requests[0].url.endsWith(QStringLiteral("/v1/messages")));
        QCOMPARE((*result)[QStringLiteral("object")].toString(), QStringLiteral("chat.completion"));
        QCOMPARE((*result)[QStringLiteral("choices")].toArray()[0].toObject()
                     [QStringLiteral("message")].toObject()[QStringLiteral("content")].toString(),
                 QStringLiteral("hi"));
    }

    void testDeriveConversationId() {
        QCOMPARE(RequestDispatcher::deriveConversationId({}, QStringLiteral("given")), QStringLiteral("given"));
        const QJsonObject body = chatRequest(QStringLiteral("m")).body;
        const QString derived = RequestDispatcher::deriveConversationId(body, {});
        QVERIFY(derived.startsWith(QStringLiteral("conv-")));
        QCOMPARE(RequestDispatcher::deriveConversationId(body, {}), derived);
        QVERIFY(RequestDispatcher::deriveConversationId({}, {}).isEmpty());
    }

    void testStreamCompletesOnce() {
        Fixture f({provider(QStringLiteral("openai"), {QStringLiteral("k1")})});
        auto session = f.dispatcher->dispatchStream(chatRequest(QStringLiteral("gpt-4o"), true));
        QVERIFY(session.has_value());
        std::unique_ptr<GatewayStreamSession> owned(*session);

        QSignalSpy chunks(owned.get(), &GatewayStreamSession::chunkReady);
        QSignalSpy finished(owned.get(), &GatewayStreamSession::finished);
        owned->start();
        QCOMPARE(f.executor.streams.size(), 1);
        ScriptedStream* upstream = f.executor.streams[0];
        QVERIFY(upstream->started);

        upstream->push("data: {\"id\":\"c\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"a\"}}]}\n\n");
        upstream->push("data: {\"id\":\"c\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"b\"}}]}\n\ndata: [DO");
        upstream->push("NE]\n\n");

        QCOMPARE(chunks.count(), 3);
        QCOMPARE(chunks.last().first().toByteArray(), QByteArray("data: [DONE]\n\n"));
        QCOMPARE(finished.count(), 1);
        QCOMPARE(f.recorder->completions, 1);
        QVERIFY(owned->isFinished());

        // a late close changes nothing
        owned->abort();
        owned.reset();
        QCOMPARE(f.recorder->completions, 1);
        QVERIFY(f.tracker.request(QStringLiteral("req-1"))->succeeded);
    }

    void testTerminalChunkFailureStillEndsClientStream() {
        Fixture f({provider(QStringLiteral("openai"), {QStringLiteral("k1")})},
                  std::make_unique<RejectTerminalChunkMiddleware>());
        auto session = f.dispatcher->dispatchStream(chatRequest(QStringLiteral("gpt-4o"), true));
        QVERIFY(session.has_value());
        std::unique_ptr<GatewayStreamSession> owned(*session);

        QSignalSpy chunks(owned.get(), &GatewayStreamSession::chunkReady);
        QSignalSpy failed(owned.get(), &GatewayStreamSession::failed);
        owned->start();
        f.executor.streams[0]->push(
            "data: {\"id\":\"c\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"a\"}}]}\n\n"
            "data: [DONE]\n\n");

        QCOMPARE(failed.count(), 1);
        QCOMPARE(chunks.count(), 3);
        const QByteArray error = chunks.at(1).first().toByteArray();
        QVERIFY(error.contains("terminal chunk rejected"));
        QCOMPARE(chunks.last().first().toByteArray(), QByteArray("data: [DONE]\n\n"));
        QCOMPARE(f.recorder->completions, 1);
        QVERIFY(owned->isFinished());
    }

    void testStreamChunksAreConvertedBeforeMiddleware() {
        Fixture f({provider(QStringLiteral("openai"), {QStringLiteral("k1")})});
        InboundRequest request = chatRequest(QStringLiteral("gpt-4o"), true);
        request.clientFormat = WireFormat::Anthropic;
        request.body.insert(QStringLiteral("max_tokens"), 64);

        auto session = f.dispatcher->dispatchStream(request);
        QVERIFY(session.has_value());
        std::unique_ptr<GatewayStreamSession> owned(*session);
        owned->start();

        const QJsonObject sent = QJsonDocument::fromJson(f.executor.requests[0].body).object();
        QVERIFY(sent[QStringLiteral("stream")].toBool());
        QCOMPARE(sent[QStringLiteral("messages")].toArray()[0].toObject()
                     [QStringLiteral("content")].toString(),
                 QStringLiteral("ping"));

        ScriptedStream* upstream = f.executor.streams[0];
        upstream->push("data: {\"id\":\"c\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"a\"}}]}\n\n"
                       "data: {\"id\":\"c\",\"choices\":[{\"index\":0,\"delta\":{},\"finish_reason\":\"stop\"}]}\n\n"
                       "data: [DONE]\n\n");

        QCOMPARE(f.recorder->chunkEvents,
                 QStringList({QStringLiteral("message_start"), QStringLiteral("content_block_start"),
                              QStringLiteral("content_block_delta"), QStringLiteral("content_block_stop"),
                              QStringLiteral("message_delta"), QStringLiteral("message_stop")}));
        QCOMPARE(f.recorder->completions, 1);
    }

    void testClientDisconnectRunsCompletion() {
        Fixture f({provider(QStringLiteral("openai"), {QStringLiteral("k1")})});
        auto session = f.dispatcher->dispatchStream(chatRequest(QStringLiteral("gpt-4o"), true));
        QVERIFY(session.has_value());
        std::unique_ptr<GatewayStreamSession> owned(*session);
        owned->start();
        f.executor.streams[0]->push("data: {\"choices\":[{\"index\":0,\"delta\":{\"content\":\"a\"}}]}\n\n");

        QPointer<ScriptedStream> upstream = f.executor.streams[0];
        owned->abort();
        QCOMPARE(f.recorder->completions, 1);
        QVERIFY(!upstream || upstream->aborted);

        owned.reset();
        QCOMPARE(f.recorder->completions, 1);
    }

    void testDestroyedSessionStillCompletes() {
        Fixture f({provider(QStringLiteral("openai"), {QStringLiteral("k1")})});
        {
            auto session = f.dispatcher->dispatchStream(chatRequest(QStringLiteral("gpt-4o"), true));
            QVERIFY(session.has_value());
            std::unique_ptr<GatewayStreamSession> owned(*session);
            owned->start();
        }
        QCOMPARE(f.recorder->completions, 1);
        QCOMPARE(f.recorder->lastCompletedRequest, QStringLiteral("req-1"));
    }

    void testStreamRotatesBeforeFirstByte() {
        Fixture f({provider(QStringLiteral("openai"), {QStringLiteral("k1"), QStringLiteral("k2")})});
        f.executor.script = {{429, {}}, {200, {}}};

        auto session = f.dispatcher->dispatchStream(chatRequest(QStringLiteral("gpt-4o"), true));
        QVERIFY(session.has_value());
        std::unique_ptr<GatewayStreamSession> owned(*session);
        QSignalSpy failed(owned.get(), &GatewayStreamSession::failed);
        owned->start();

        QCOMPARE(f.executor.keysUsed, QStringList({QStringLiteral("k1"), QStringLiteral("k2")}));
        QCOMPARE(owned->currentKey(), QStringLiteral("k2"));
        QCOMPARE(owned->attempts(), 2);
        QCOMPARE(failed.count(), 0);
        QCOMPARE(f.executor.streams.size(), 1);
    }

    void testStreamOutlivesDispatcher() {
        Fixture f({provider(QStringLiteral("openai"), {QStringLiteral("k1"), QStringLiteral("k2")})});
        f.executor.script = {{429, {}}, {200, {}}};

        auto session = f.dispatcher->dispatchStream(chatRequest(QStringLiteral("gpt-4o"), true));
        QVERIFY(session.has_value());
        std::unique_ptr<GatewayStreamSession> owned(*session);
        f.dispatcher.reset();

        QSignalSpy chunks(owned.get(), &GatewayStreamSession::chunkReady);
        QSignalSpy finished(owned.get(), &GatewayStreamSession::finished);
        owned->start();
        QCOMPARE(f.executor.keysUsed, QStringList({QStringLiteral("k1"), QStringLiteral("k2")}));
        QCOMPARE(f.executor.streams.size(), 1);
        QVERIFY(f.executor.requests[1].url.endsWith(QStringLiteral("/chat/completions")));

        f.executor.streams[0]->push("data: {\"id\":\"c\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"a\"}}]}\n\n"
                                    "data: [DONE]\n\n");
        QCOMPARE(chunks.count(), 2);
        QCOMPARE(finished.count(), 1);
        QVERIFY(f.tracker.request(QStringLiteral("req-1"))->succeeded);
    }

    void testStreamExhaustionReportsFailure() {
        Fixture f({provider(QStringLiteral("openai"), {QStringLiteral("k1"), QStringLiteral("k2")})});
        f.executor.script = {{401, {}}, {403, {}}};

        auto session = f.dispatcher->dispatchStream(chatRequest(QStringLiteral("gpt-4o"), true));
        QVERIFY(session.has_value());
        std::unique_ptr<GatewayStreamSession> owned(*session);
        QSignalSpy chunks(owned.get(), &GatewayStreamSession::chunkReady);
        QSignalSpy failed(owned.get(), &GatewayStreamSession::failed);
        owned->start();

        QCOMPARE(failed.count(), 1);
        QVERIFY(chunks.first().first().toByteArray().contains("all_keys_exhausted"));
        QCOMPARE(f.recorder->completions, 1);

        auto tracked = f.tracker.request(QStringLiteral("req-1"));
        QCOMPARE(tracked->errorCode, QStringLiteral("all_keys_exhausted"));
        QCOMPARE(tracked->attempts, 2);
    }

    void testUpstreamClosedWithoutTerminalEvent() {
        Fixture f({provider(QStringLiteral("openai"), {QStringLiteral("k1")})});
        InboundRequest request = chatRequest(QStringLiteral("gpt-4o"), true);
        request.clientFormat = WireFormat::Anthropic;
        auto session = f.dispatcher->dispatchStream(request);
        QVERIFY(session.has_value());
        std::unique_ptr<GatewayStreamSession> owned(*session);
        QSignalSpy finished(owned.get(), &GatewayStreamSession::finished);
        owned->start();

        ScriptedStream* upstream = f.executor.streams[0];
        upstream->push("data: {\"choices\":[{\"index\":0,\"delta\":{\"content\":\"a\"}}]}\n\n");
        upstream->end();

        QCOMPARE(finished.count(), 1);
        QCOMPARE(f.recorder->chunkEvents.last(), QStringLiteral("message_stop"));
        QCOMPARE(f.recorder->completions, 1);
    }
};

QTEST_MAIN(TestDispatcher)
#include "tst_dispatcher.moc"

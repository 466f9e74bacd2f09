#include "request_dispatcher.h"
#include "conversion/thought_signatures.h"
#include "core/key_hash.h"
#include "core/log_manager.h"
#include "pipeline/middlewares/thought_signature_middleware.h"
#include "provider/rotation_policy.h"
#include <QCryptographicHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QUuid>

namespace {

QString firstUserText(const QJsonArray& messages)
{
    for (const QJsonValue& mv : messages) {
        const QJsonObject msg = mv.toObject();
        if (msg.value(QStringLiteral("role")).toString() != QStringLiteral("user"))
            continue;
        const QJsonValue content = msg.value(QStringLiteral("content"));
        if (content.isString())
            return content.toString();
        QString text;
        for (const QJsonValue& part : content.toArray()) {
            const QJsonObject p = part.toObject();
            if (p.value(QStringLiteral("type")).toString() == QStringLiteral("text"))
                text += p.value(QStringLiteral("text")).toString();
        }
        return text;
    }
    return {};
}

} // namespace

RequestDispatcher::RequestDispatcher(AliasService& aliases,
                                     ProviderRegistry& providers,
                                     MiddlewareChain& chain,
                                     ProtocolConverter& converter,
                                     IExecutor& executor,
                                     RequestTracker* tracker)
    : m_aliases(aliases)
    , m_providers(providers)
    , m_chain(chain)
    , m_converter(converter)
    , m_executor(executor)
    , m_tracker(tracker)
{
}

QString RequestDispatcher::deriveConversationId(const QJsonObject& body, const QString& clientSupplied)
{
    if (!clientSupplied.isEmpty())
        return clientSupplied;

    const QString userId = body.value(QStringLiteral("metadata")).toObject()
                               .value(QStringLiteral("user_id")).toString();
    if (!userId.isEmpty())
        return userId;

    const QString user = body.value(QStringLiteral("user")).toString();
    if (!user.isEmpty())
        return user;

    const QString text = firstUserText(body.value(QStringLiteral("messages")).toArray());
    if (text.isEmpty())
        return {};
    const QByteArray digest = QCryptographicHash::hash(text.toUtf8(), QCryptographicHash::Sha256);
    return QStringLiteral("conv-") + QString::fromLatin1(digest.toHex().left(16));
}

QJsonObject RequestDispatcher::errorBody(const DomainFailure& failure, WireFormat clientFormat)
{
    return m_converter.encodeFailure(failure, clientFormat);
}

UpstreamTarget RequestDispatcher::targetFor(const ProviderConfig& provider,
                                            const QString& apiKey, bool stream)
{
    UpstreamTarget target;
    target.baseUrl = provider.baseUrl;
    target.apiKey = apiKey;
    target.apiVersion = provider.apiVersion;
    target.customHeaders = provider.customHeaders;
    target.stream = stream;
    target.timeoutMs = provider.timeoutMs;
    return target;
}

void RequestDispatcher::trackFailure(const QString& requestId, const DomainFailure& failure, int attempts)
{
    if (m_tracker)
        m_tracker->recordCompletion(requestId, false, failure.code, attempts);
}

Result<RequestDispatcher::Prepared> RequestDispatcher::prepare(const InboundRequest& request,
                                                               bool streaming)
{
    const QString requestId = request.requestId.isEmpty()
        ? QUuid::createUuid().toString(QUuid::WithoutBraces) : request.requestId;
    const QString rawModel = request.body.value(QStringLiteral("model")).toString();

    // 1. resolve
    auto resolved = m_aliases.resolve(rawModel, request.explicitProvider);
    if (!resolved) {
        LOG_CAT_WARNING(QStringLiteral("dispatch"),
                        QStringLiteral("Resolution of '%1' failed [request_id=%2]: %3")
                            .arg(rawModel, requestId, resolved.error().message));
        return std::unexpected(resolved.error());
    }
    const ResolutionResult& resolution = *resolved;
    if (m_tracker)
        m_tracker->recordResolution(requestId, rawModel, resolution, streaming);

    // 2. provider
    auto provider = m_providers.providerConfig(resolution.provider);
    if (!provider) {
        const DomainFailure failure = DomainFailure::providerNotConfigured(resolution.provider);
        trackFailure(requestId, failure, 0);
        return std::unexpected(failure);
    }

    // profile overrides apply to this request only
    ProviderConfig effective = *provider;
    if (!resolution.profile.isEmpty()) {
        if (const auto profile = m_aliases.snapshot()->profile(resolution.profile)) {
            effective.timeoutMs = profile->timeoutMs.value_or(effective.timeoutMs);
            effective.maxRetries = profile->maxRetries.value_or(effective.maxRetries);
        }
    }

    // 3. credentials
    auto auth = m_providers.getClientAuth(provider->name, request.clientApiKey);
    if (!auth) {
        trackFailure(requestId, auth.error(), 0);
        return std::unexpected(auth.error());
    }

    // 4. context
    QJsonObject body = request.body;
    body[QStringLiteral("model")] = resolution.resolvedModel;
    RequestContext ctx(body, provider->name, resolution.resolvedModel, requestId,
                       deriveConversationId(request.body, request.conversationId),
                       request.metadata, request.clientApiKey, request.clientFormat);
    ctx = ctx.withOriginalModel(rawModel);

    LOG_CAT_INFO(QStringLiteral("dispatch"),
                 QStringLiteral("%1 -> %2:%3%4 [request_id=%5]")
                     .arg(rawModel, provider->name, resolution.resolvedModel,
                          resolution.wasResolved ? QStringLiteral(" (alias)") : QString(),
                          requestId));

    // 5. request middleware
    auto processed = m_chain.processRequest(ctx);
    if (!processed) {
        trackFailure(requestId, processed.error(), 0);
        return std::unexpected(processed.error());
    }
    ctx = *processed;

    // 6. conversion
    QJsonObject clientBody = ctx.body();
    clientBody[QStringLiteral("model")] = ctx.model();
    auto converted = m_converter.convertRequest(clientBody, ctx.clientFormat(), provider->apiFormat);
    if (!converted) {
        trackFailure(requestId, converted.error(), 0);
        return std::unexpected(converted.error());
    }

    QJsonObject providerBody = *converted;
    if (streaming) {
        providerBody[QStringLiteral("stream")] = true;
    } else {
        providerBody.remove(QStringLiteral("stream"));
        providerBody.remove(QStringLiteral("stream_options"));
    }

    if (provider->apiFormat == WireFormat::OpenAI) {
        const QVariantMap signatures = ctx.metadata().value(kThoughtSignaturesKey).toMap();
        providerBody = thought_signatures::inject(providerBody, signatures);
    }

    return Prepared{ctx, effective, *auth, providerBody};
}

Result<ProviderResponse> RequestDispatcher::executeWithRotation(const Prepared& prepared, int& attempts)
{
    const QString& providerName = prepared.provider.name;
    QSet<QString> exclude;
    QString key = prepared.auth.apiKey;

    while (true) {
        ++attempts;
        const ProviderRequest upstream = m_converter.buildUpstreamRequest(
            prepared.providerBody, prepared.provider.apiFormat,
            targetFor(prepared.provider, key, false));

        auto response = m_executor.execute(upstream);
        if (response)
            return response;

        DomainFailure failure = response.error();
        if (failure.upstreamStatus > 0) {
            failure = m_converter.mapUpstreamFailure(failure.upstreamStatus, failure.upstreamBody,
                                                     prepared.provider.apiFormat);
        }

        if (!prepared.auth.canRotate() || failure.upstreamStatus == 0
            || !rotation_policy::shouldRotate(failure.upstreamStatus, failure.upstreamBody)) {
            return std::unexpected(failure);
        }

        exclude.insert(key);
        LOG_CAT_WARNING(QStringLiteral("rotation"),
                        QStringLiteral("%1 answered HTTP %2 for key %3 [request_id=%4], rotating (%5 excluded)")
                            .arg(providerName)
                            .arg(failure.upstreamStatus)
                            .arg(apiKeyHash(key), prepared.context.requestId())
                            .arg(exclude.size()));

        auto next = prepared.auth.nextKey(exclude);
        if (!next)
            return std::unexpected(next.error());
        key = *next;
    }
}

Result<QJsonObject> RequestDispatcher::dispatch(const InboundRequest& request)
{
    auto prepared = prepare(request, false);
    if (!prepared)
        return std::unexpected(prepared.error());

    const RequestContext& ctx = prepared->context;
    const WireFormat providerFormat = prepared->provider.apiFormat;

    int attempts = 0;
    auto response = executeWithRotation(*prepared, attempts);
    if (!response) {
        LOG_CAT_ERROR(QStringLiteral("dispatch"),
                      QStringLiteral("Upstream call failed [%1] %2 [provider=%3 model=%4 request_id=%5]")
                          .arg(response.error().code, response.error().message, ctx.provider(),
                               ctx.model(), ctx.requestId()));
        trackFailure(ctx.requestId(), response.error(), attempts);
        return std::unexpected(response.error());
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(response->body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        const DomainFailure failure = DomainFailure::internal(
            QStringLiteral("Provider returned a body that is not a JSON object"));
        trackFailure(ctx.requestId(), failure, attempts);
        return std::unexpected(failure);
    }

    QVariantMap responseMetadata;
    if (providerFormat == WireFormat::OpenAI) {
        const QVariantMap signatures = thought_signatures::extract(doc.object());
        if (!signatures.isEmpty())
            responseMetadata.insert(kThoughtSignaturesKey, signatures);
    }

    auto clientBody = m_converter.convertResponse(doc.object(), ctx.clientFormat(), providerFormat);
    if (!clientBody) {
        trackFailure(ctx.requestId(), clientBody.error(), attempts);
        return std::unexpected(clientBody.error());
    }

    auto processed = m_chain.processResponse(ResponseContext(*clientBody, ctx, false, responseMetadata));
    if (!processed) {
        trackFailure(ctx.requestId(), processed.error(), attempts);
        return std::unexpected(processed.error());
    }

    if (m_tracker)
        m_tracker->recordCompletion(ctx.requestId(), true, {}, attempts);
    return processed->body();
}

Result<GatewayStreamSession*> RequestDispatcher::dispatchStream(const InboundRequest& request,
                                                                QObject* parent)
{
    auto prepared = prepare(request, true);
    if (!prepared)
        return std::unexpected(prepared.error());

    const Prepared p = *prepared;
    const WireFormat providerFormat = p.provider.apiFormat;

    // The session may outlive this dispatcher; it only needs the converter
    // and executor, which outlive both.
    ProtocolConverter& converter = m_converter;
    IExecutor& executor = m_executor;
    GatewayStreamSession::Opener opener = [&converter, &executor, p](const QString& apiKey)
        -> Result<UpstreamStream*> {
        const ProviderRequest upstream = converter.buildUpstreamRequest(
            p.providerBody, p.provider.apiFormat, targetFor(p.provider, apiKey, true));
        auto stream = executor.openStream(upstream);
        if (!stream) {
            DomainFailure failure = stream.error();
            if (failure.upstreamStatus > 0) {
                failure = converter.mapUpstreamFailure(failure.upstreamStatus, failure.upstreamBody,
                                                       p.provider.apiFormat);
            }
            return std::unexpected(failure);
        }
        return *stream;
    };

    auto* session = new GatewayStreamSession(
        m_chain, p.context, p.auth,
        m_converter.createStreamTranslator(p.context.clientFormat(), providerFormat),
        providerFormat, std::move(opener), parent);

    if (m_tracker) {
        RequestTracker* tracker = m_tracker;
        const QString requestId = p.context.requestId();
        auto failedCode = std::make_shared<QString>();
        QObject::connect(session, &GatewayStreamSession::failed, session,
                         [failedCode](const DomainFailure& failure) { *failedCode = failure.code; });
        QObject::connect(session, &GatewayStreamSession::finished, session,
                         [tracker, requestId, failedCode, session]() {
                             tracker->recordCompletion(requestId, failedCode->isEmpty(),
                                                       *failedCode, session->attempts());
                         });
    }
    return session;
}

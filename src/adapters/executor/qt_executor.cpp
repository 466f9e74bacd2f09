#include "qt_executor.h"
#include "core/log_manager.h"
#include <QEventLoop>
#include <QTimer>
#include <QUrl>

// ---------------------------------------------------------------------------
// NetworkUpstreamStream
// ---------------------------------------------------------------------------

NetworkUpstreamStream::NetworkUpstreamStream(QNetworkReply* reply, QObject* parent)
    : UpstreamStream(parent)
    , m_reply(reply)
{
    Q_ASSERT(m_reply);
    m_reply->setParent(this);
}

NetworkUpstreamStream::~NetworkUpstreamStream()
{
    if (m_reply) {
        disconnect(m_reply, nullptr, this, nullptr);
        m_reply->abort();
    }
}

void NetworkUpstreamStream::start()
{
    if (m_started || !m_reply)
        return;
    m_started = true;

    connect(m_reply, &QNetworkReply::readyRead,
            this, &NetworkUpstreamStream::onReadyRead);
    connect(m_reply, &QNetworkReply::finished,
            this, &NetworkUpstreamStream::onFinished);
    connect(m_reply, &QNetworkReply::errorOccurred,
            this, &NetworkUpstreamStream::onErrorOccurred);

    // Bytes that arrived while the executor waited for the first chunk
    if (m_reply->bytesAvailable() > 0)
        onReadyRead();
    if (m_reply && m_reply->isFinished()) {
        if (m_reply->error() != QNetworkReply::NoError)
            onErrorOccurred(m_reply->error());
        else
            onFinished();
    }
}

void NetworkUpstreamStream::abort()
{
    m_done = true;
    if (m_reply) {
        disconnect(m_reply, nullptr, this, nullptr);
        m_reply->abort();
    }
}

void NetworkUpstreamStream::onReadyRead()
{
    if (m_done || !m_reply)
        return;
    const QByteArray data = m_reply->readAll();
    if (!data.isEmpty())
        emit dataReceived(data);
}

void NetworkUpstreamStream::onFinished()
{
    if (m_done || !m_reply)
        return;
    if (m_reply->error() != QNetworkReply::NoError)
        return;   // reported through errorOccurred
    onReadyRead();
    m_done = true;
    emit finished();
}

void NetworkUpstreamStream::onErrorOccurred(QNetworkReply::NetworkError code)
{
    if (m_done || !m_reply)
        return;
    m_done = true;

    const int status = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const DomainFailure failure = status >= 400
        ? DomainFailure::upstreamHttp(status, m_reply->readAll())
        : QtExecutor::networkFailure(code, m_reply->errorString());

    LOG_CAT_ERROR(QStringLiteral("stream"),
                  QStringLiteral("Upstream stream error [%1]: %2").arg(failure.code, failure.message));
    emit failed(failure);
}

// ---------------------------------------------------------------------------
// QtExecutor
// ---------------------------------------------------------------------------

QtExecutor::QtExecutor(const QSslConfiguration& sslConfig)
    : m_sslConfig(sslConfig)
{
}

DomainFailure QtExecutor::networkFailure(QNetworkReply::NetworkError code, const QString& errorString)
{
    switch (code) {
    case QNetworkReply::OperationCanceledError:
    case QNetworkReply::TimeoutError:
        return DomainFailure::timeout(QStringLiteral("Upstream timed out: %1").arg(errorString));

    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
        return DomainFailure::unavailable(QStringLiteral("Network error: %1").arg(errorString));

    case QNetworkReply::SslHandshakeFailedError:
        return DomainFailure::unavailable(QStringLiteral("TLS handshake failed: %1").arg(errorString));

    default:
        return DomainFailure::internal(
            QStringLiteral("Network error (%1): %2").arg(static_cast<int>(code)).arg(errorString));
    }
}

QNetworkRequest QtExecutor::buildQtRequest(const ProviderRequest& request) const
{
    QNetworkRequest req{QUrl{request.url}};
    req.setSslConfiguration(m_sslConfig);

    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!req.hasRawHeader("Content-Type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    if (request.stream)
        req.setRawHeader("Accept", "text/event-stream");

    req.setTransferTimeout(request.timeoutMs > 0 ? request.timeoutMs : m_requestTimeout);
    return req;
}

QNetworkReply* QtExecutor::send(const ProviderRequest& request)
{
    const QNetworkRequest req = buildQtRequest(request);
    const QString method = request.method.trimmed().toUpper();
    if (method == QStringLiteral("GET"))
        return m_nam.get(req);
    if (method == QStringLiteral("POST") || method.isEmpty())
        return m_nam.post(req, request.body);
    return m_nam.sendCustomRequest(req, method.toUtf8(), request.body);
}

std::optional<DomainFailure> QtExecutor::checkReplyError(QNetworkReply* reply) const
{
    if (!reply)
        return DomainFailure::internal(QStringLiteral("null reply"));

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 400)
        return DomainFailure::upstreamHttp(status, reply->readAll());
    if (reply->error() != QNetworkReply::NoError)
        return networkFailure(reply->error(), reply->errorString());
    return std::nullopt;
}

Result<ProviderResponse> QtExecutor::execute(const ProviderRequest& request)
{
    QNetworkReply* reply = send(request);
    const int timeout = request.timeoutMs > 0 ? request.timeoutMs : m_requestTimeout;

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeoutTimer.start(timeout);
    loop.exec();

    if (reply->isRunning()) {
        reply->abort();
        reply->deleteLater();
        return std::unexpected(DomainFailure::timeout(
            QStringLiteral("Request to %1 timed out after %2 ms").arg(request.url).arg(timeout)));
    }

    if (auto err = checkReplyError(reply)) {
        reply->deleteLater();
        return std::unexpected(*err);
    }

    ProviderResponse resp;
    resp.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    resp.body = reply->readAll();
    for (const auto& header : reply->rawHeaderList())
        resp.headers[QString::fromUtf8(header)] = QString::fromUtf8(reply->rawHeader(header));

    reply->deleteLater();
    return resp;
}

Result<UpstreamStream*> QtExecutor::openStream(const ProviderRequest& request)
{
    QNetworkReply* reply = send(request);

    // Wait for the first bytes so HTTP errors surface here, where the
    // caller can still rotate keys.
    QEventLoop loop;
    bool gotData = false;
    QObject::connect(reply, &QNetworkReply::readyRead, &loop, [&]() {
        gotData = true;
        loop.quit();
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeoutTimer.start(m_connectionTimeout);
    loop.exec();

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 400 && reply->isRunning()) {
        // error bodies are short; collect the whole body before reporting
        QEventLoop bodyLoop;
        QObject::connect(reply, &QNetworkReply::finished, &bodyLoop, &QEventLoop::quit);
        QTimer::singleShot(m_connectionTimeout, &bodyLoop, &QEventLoop::quit);
        bodyLoop.exec();
    }

    if (!reply->isRunning()) {
        if (auto err = checkReplyError(reply)) {
            reply->abort();
            reply->deleteLater();
            return std::unexpected(*err);
        }
    } else if (!gotData) {
        reply->abort();
        reply->deleteLater();
        return std::unexpected(DomainFailure::timeout(
            QStringLiteral("No response from %1 within %2 ms").arg(request.url).arg(m_connectionTimeout)));
    }

    return new NetworkUpstreamStream(reply);
}

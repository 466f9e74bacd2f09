#pragma once
#include "semantic/ports.h"
#include "semantic/upstream_stream.h"
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QPointer>
#include <QSslConfiguration>
#include <optional>

// Streaming body of a QNetworkReply, delivered as raw bytes.
class NetworkUpstreamStream : public UpstreamStream {
    Q_OBJECT
public:
    explicit NetworkUpstreamStream(QNetworkReply* reply, QObject* parent = nullptr);
    ~NetworkUpstreamStream() override;

    void start() override;
    void abort() override;

private slots:
    void onReadyRead();
    void onFinished();
    void onErrorOccurred(QNetworkReply::NetworkError code);

private:
    QPointer<QNetworkReply> m_reply;
    bool m_started = false;
    bool m_done = false;
};

// Blocking HTTP transport on QNetworkAccessManager. Must be used from the
// thread that owns it.
class QtExecutor : public IExecutor {
public:
    explicit QtExecutor(const QSslConfiguration& sslConfig = QSslConfiguration::defaultConfiguration());

    Result<ProviderResponse> execute(const ProviderRequest& request) override;
    Result<UpstreamStream*> openStream(const ProviderRequest& request) override;

    void setRequestTimeout(int ms) { m_requestTimeout = ms; }
    void setConnectionTimeout(int ms) { m_connectionTimeout = ms; }

    static DomainFailure networkFailure(QNetworkReply::NetworkError code, const QString& errorString);

private:
    QNetworkAccessManager m_nam;
    QSslConfiguration m_sslConfig;
    int m_requestTimeout = 120000;
    int m_connectionTimeout = 30000;

    QNetworkRequest buildQtRequest(const ProviderRequest& request) const;
    QNetworkReply* send(const ProviderRequest& request);
    std::optional<DomainFailure> checkReplyError(QNetworkReply* reply) const;
};

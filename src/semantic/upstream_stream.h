#pragma once
#include "failure.h"
#include <QByteArray>
#include <QObject>

// An open streaming response from a provider. Raw bytes are delivered as
// they arrive; the consumer connects first and then calls start().
class UpstreamStream : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~UpstreamStream() override = default;

    virtual void start() = 0;
    virtual void abort() = 0;

signals:
    void dataReceived(const QByteArray& data);
    void finished();
    void failed(const DomainFailure& failure);
};

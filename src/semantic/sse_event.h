#pragma once
#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

struct SseEvent {
    QString event;
    QByteArray data;

    bool isDone() const { return data.trimmed() == "[DONE]"; }

    QJsonObject json() const {
        const QJsonDocument doc = QJsonDocument::fromJson(data);
        return doc.isObject() ? doc.object() : QJsonObject();
    }

    QByteArray serialize() const {
        QByteArray out;
        if (!event.isEmpty())
            out += "event: " + event.toUtf8() + '\n';
        out += "data: " + data + "\n\n";
        return out;
    }

    static SseEvent fromJson(const QString& event, const QJsonObject& payload) {
        return SseEvent{event, QJsonDocument(payload).toJson(QJsonDocument::Compact)};
    }

    static SseEvent done() {
        return SseEvent{QString(), QByteArrayLiteral("[DONE]")};
    }
};

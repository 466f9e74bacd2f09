#include "conversion/thought_signatures.h"
#include <QJsonArray>

namespace {

QString signatureOf(const QJsonObject& toolCall)
{
    return toolCall.value(QStringLiteral("extra_content")).toObject()
        .value(QStringLiteral("google")).toObject()
        .value(QStringLiteral("thought_signature")).toString();
}

} // namespace

namespace thought_signatures {

QVariantMap extract(const QJsonObject& openaiBody)
{
    QVariantMap signatures;
    const QJsonArray choices = openaiBody.value(QStringLiteral("choices")).toArray();
    for (const QJsonValue& cv : choices) {
        const QJsonObject choice = cv.toObject();
        QJsonObject holder = choice.value(QStringLiteral("message")).toObject();
        if (holder.isEmpty())
            holder = choice.value(QStringLiteral("delta")).toObject();

        const QJsonArray toolCalls = holder.value(QStringLiteral("tool_calls")).toArray();
        for (const QJsonValue& tv : toolCalls) {
            const QJsonObject tc = tv.toObject();
            const QString id = tc.value(QStringLiteral("id")).toString();
            const QString signature = signatureOf(tc);
            if (!id.isEmpty() && !signature.isEmpty())
                signatures.insert(id, signature);
        }
    }
    return signatures;
}

QJsonObject inject(QJsonObject openaiBody, const QVariantMap& signatures)
{
    if (signatures.isEmpty())
        return openaiBody;

    QJsonArray messages = openaiBody.value(QStringLiteral("messages")).toArray();
    bool changed = false;
    for (qsizetype i = 0; i < messages.size(); ++i) {
        QJsonObject msg = messages.at(i).toObject();
        if (msg.value(QStringLiteral("role")).toString() != QStringLiteral("assistant"))
            continue;

        QJsonArray toolCalls = msg.value(QStringLiteral("tool_calls")).toArray();
        bool msgChanged = false;
        for (qsizetype j = 0; j < toolCalls.size(); ++j) {
            QJsonObject tc = toolCalls.at(j).toObject();
            const QString id = tc.value(QStringLiteral("id")).toString();
            if (id.isEmpty() || !signatures.contains(id) || !signatureOf(tc).isEmpty())
                continue;

            QJsonObject google;
            google[QStringLiteral("thought_signature")] = signatures.value(id).toString();
            QJsonObject extra = tc.value(QStringLiteral("extra_content")).toObject();
            extra[QStringLiteral("google")] = google;
            tc[QStringLiteral("extra_content")] = extra;
            toolCalls[j] = tc;
            msgChanged = true;
        }
        if (msgChanged) {
            msg[QStringLiteral("tool_calls")] = toolCalls;
            messages[i] = msg;
            changed = true;
        }
    }

    if (changed)
        openaiBody[QStringLiteral("messages")] = messages;
    return openaiBody;
}

} // namespace thought_signatures

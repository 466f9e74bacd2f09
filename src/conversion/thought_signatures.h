#pragma once
#include <QJsonObject>
#include <QVariantMap>

// Gemini models served through an OpenAI-compatible endpoint return a
// "thought signature" per tool call that must be echoed back on the next
// turn. These helpers move signatures between provider bodies and the
// middleware metadata map, keyed by tool call id.
namespace thought_signatures {

// Collects signatures from a response body or a stream chunk.
QVariantMap extract(const QJsonObject& openaiBody);

// Attaches stored signatures to assistant tool calls of a request body.
QJsonObject inject(QJsonObject openaiBody, const QVariantMap& signatures);

} // namespace thought_signatures

#pragma once
#include "types.h"
#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>
#include <optional>

// Provider-neutral form of one chat exchange. Both dialects decode into
// these types and encode from them when the client and provider differ.

struct MediaRef {
    QString mimeType;
    QString uri;
    QByteArray inlineData;
};

// One piece of message content. Structured segments carry JSON the two
// dialects have no common representation for (thinking blocks).
struct Segment {
    SegmentKind kind = SegmentKind::Text;
    QString text;
    MediaRef media;
    QJsonObject structured;

    static Segment fromText(const QString& text) {
        return Segment{SegmentKind::Text, text, {}, {}};
    }
    static Segment fromMedia(const MediaRef& ref) {
        return Segment{SegmentKind::Media, {}, ref, {}};
    }
    static Segment fromStructured(const QJsonObject& obj) {
        return Segment{SegmentKind::Structured, {}, {}, obj};
    }
};

// Concatenated text of the text segments; media and structured ones are skipped.
inline QString joinedText(const QList<Segment>& segments)
{
    QString text;
    for (const Segment& seg : segments) {
        if (seg.kind == SegmentKind::Text)
            text += seg.text;
    }
    return text;
}

struct ToolSpec {
    QString name;
    QString description;
    QJsonObject parameters;   // JSON schema
};

struct ToolCall {
    QString callId;
    QString name;
    QString args;   // JSON-encoded arguments
};

// One streamed fragment of a tool call. callId and name are only present on
// the first fragment of each call.
struct ToolCallDelta {
    int index = 0;
    QString callId;
    QString name;
    QString argsPatch;
};

struct SamplingOptions {
    std::optional<double> temperature;
    std::optional<double> topP;
    std::optional<int> topK;
    std::optional<int> maxTokens;
    std::optional<int> maxCompletionTokens;
    std::optional<int> seed;
    std::optional<double> frequencyPenalty;
    std::optional<double> presencePenalty;
    QStringList stopSequences;
    QString toolChoice;   // "auto", "none", "required" or a tool name
};

// role is "system", "user", "assistant" or "tool".
struct ChatMessage {
    QString role;
    QList<Segment> content;
    QList<ToolCall> toolCalls;
    QString toolCallId;   // set on "tool" messages
};

struct ChatRequest {
    QString model;
    QList<ChatMessage> messages;
    SamplingOptions sampling;
    QList<ToolSpec> tools;
    bool stream = false;
    QMap<QString, QString> metadata;   // "user" carries the end-user id
};

struct TokenUsage {
    int promptTokens = 0;
    int completionTokens = 0;
    int totalTokens = 0;
};

struct ChatChoice {
    int index = 0;
    QString role;
    QList<Segment> output;
    QList<ToolCall> toolCalls;
    StopCause stopCause = StopCause::Completed;
};

struct ChatResponse {
    QString responseId;
    QString model;
    QList<ChatChoice> choices;
    TokenUsage usage;
};

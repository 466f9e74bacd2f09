#include "anthropic.h"
#include <QJsonArray>
#include <QJsonDocument>

namespace {

const QString kDefaultApiVersion = QStringLiteral("2023-06-01");

StreamFrame emptyDelta()
{
    StreamFrame frame;
    frame.type = FrameType::Delta;
    return frame;
}

} // namespace

StopCause AnthropicOutbound::stopCauseFromStopReason(const QString& reason)
{
    if (reason == QStringLiteral("max_tokens"))
        return StopCause::Length;
    if (reason == QStringLiteral("tool_use"))
        return StopCause::ToolCall;
    if (reason == QStringLiteral("refusal"))
        return StopCause::ContentFilter;
    return StopCause::Completed;
}

Result<QJsonObject> AnthropicOutbound::buildBody(const ChatRequest& request)
{
    if (request.model.isEmpty()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("missing_model"), QStringLiteral("No model to send upstream")));
    }

    QJsonObject body;
    body[QStringLiteral("model")] = request.model;

    QString systemPrompt;
    QJsonArray messages = buildMessages(request.messages, systemPrompt);
    body[QStringLiteral("messages")] = messages;

    if (!systemPrompt.isEmpty()) {
        body[QStringLiteral("system")] = systemPrompt;
    }

    if (!request.tools.isEmpty()) {
        body[QStringLiteral("tools")] = buildToolDefs(request.tools);
    }

    // max_tokens is required by the Messages API
    int maxTokens = request.sampling.maxTokens.value_or(
                        request.sampling.maxCompletionTokens.value_or(kDefaultMaxTokens));
    body[QStringLiteral("max_tokens")] = maxTokens;

    if (request.sampling.temperature.has_value()) {
        body[QStringLiteral("temperature")] = request.sampling.temperature.value();
    }
    if (request.sampling.topP.has_value()) {
        body[QStringLiteral("top_p")] = request.sampling.topP.value();
    }
    if (request.sampling.topK.has_value()) {
        body[QStringLiteral("top_k")] = request.sampling.topK.value();
    }
    if (!request.sampling.stopSequences.isEmpty()) {
        QJsonArray stopArr;
        for (const auto& s : request.sampling.stopSequences) {
            stopArr.append(s);
        }
        body[QStringLiteral("stop_sequences")] = stopArr;
    }

    const QString& choice = request.sampling.toolChoice;
    if (!choice.isEmpty() && !request.tools.isEmpty()) {
        QJsonObject tc;
        if (choice == QStringLiteral("auto") || choice == QStringLiteral("none")) {
            tc[QStringLiteral("type")] = choice;
        } else if (choice == QStringLiteral("required")) {
            tc[QStringLiteral("type")] = QStringLiteral("any");
        } else {
            tc[QStringLiteral("type")] = QStringLiteral("tool");
            tc[QStringLiteral("name")] = choice;
        }
        body[QStringLiteral("tool_choice")] = tc;
    }

    const QString user = request.metadata.value(QStringLiteral("user"));
    if (!user.isEmpty()) {
        QJsonObject metadata;
        metadata[QStringLiteral("user_id")] = user;
        body[QStringLiteral("metadata")] = metadata;
    }

    if (request.stream) {
        body[QStringLiteral("stream")] = true;
    }
    return body;
}

ProviderRequest AnthropicOutbound::buildRequest(const QJsonObject& body, const UpstreamTarget& target)
{
    ProviderRequest pr;
    pr.method = QStringLiteral("POST");
    pr.url = endpointUrl(target.baseUrl, QStringLiteral("/messages"));
    pr.headers[QStringLiteral("x-api-key")] = target.apiKey;
    pr.headers[QStringLiteral("anthropic-version")] =
        target.apiVersion.isEmpty() ? kDefaultApiVersion : target.apiVersion;
    pr.headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    for (auto it = target.customHeaders.constBegin(); it != target.customHeaders.constEnd(); ++it)
        pr.headers[it.key()] = it.value();

    pr.stream = target.stream;
    pr.timeoutMs = target.timeoutMs;
    pr.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    return pr;
}

Result<ChatResponse> AnthropicOutbound::parseResponse(const QJsonObject& root)
{
    if (!root.value(QStringLiteral("content")).isArray()) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("Messages response carries no 'content' array")));
    }

    ChatResponse sr;
    sr.responseId = root.value(QStringLiteral("id")).toString();
    sr.model = root.value(QStringLiteral("model")).toString();

    sr.choices.append(parseMessage(root));

    QJsonObject usage = root.value(QStringLiteral("usage")).toObject();
    sr.usage.promptTokens = usage.value(QStringLiteral("input_tokens")).toInt();
    sr.usage.completionTokens = usage.value(QStringLiteral("output_tokens")).toInt();
    sr.usage.totalTokens = sr.usage.promptTokens + sr.usage.completionTokens;

    return sr;
}

Result<QList<StreamFrame>> AnthropicOutbound::parseChunk(const SseEvent& event)
{
    auto frame = parseEvent(event);
    if (!frame)
        return std::unexpected(frame.error());
    return QList<StreamFrame>{*frame};
}

Result<StreamFrame> AnthropicOutbound::parseEvent(const SseEvent& event) const
{
    if (event.data.trimmed().isEmpty())
        return emptyDelta();

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(event.data, &err);
    if (err.error != QJsonParseError::NoError) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("Failed to parse Anthropic chunk JSON: ") + err.errorString()));
    }

    QJsonObject root = doc.object();
    QString eventType = root.value(QStringLiteral("type")).toString();
    if (eventType.isEmpty())
        eventType = event.event;

    if (eventType == QStringLiteral("message_start")) {
        StreamFrame frame;
        frame.type = FrameType::Started;
        QJsonObject message = root.value(QStringLiteral("message")).toObject();
        frame.responseId = message.value(QStringLiteral("id")).toString();
        frame.model = message.value(QStringLiteral("model")).toString();
        QJsonObject usage = message.value(QStringLiteral("usage")).toObject();
        frame.usageDelta.promptTokens = usage.value(QStringLiteral("input_tokens")).toInt();
        return frame;
    }

    if (eventType == QStringLiteral("content_block_start")) {
        QJsonObject contentBlock = root.value(QStringLiteral("content_block")).toObject();
        QString blockType = contentBlock.value(QStringLiteral("type")).toString();
        if (blockType == QStringLiteral("tool_use")) {
            StreamFrame frame;
            frame.type = FrameType::ToolDelta;
            frame.toolDelta.index = root.value(QStringLiteral("index")).toInt();
            frame.toolDelta.callId = contentBlock.value(QStringLiteral("id")).toString();
            frame.toolDelta.name = contentBlock.value(QStringLiteral("name")).toString();
            return frame;
        }
        if (blockType == QStringLiteral("text")) {
            const QString text = contentBlock.value(QStringLiteral("text")).toString();
            StreamFrame frame = emptyDelta();
            if (!text.isEmpty())
                frame.deltaSegments.append(Segment::fromText(text));
            return frame;
        }
        return emptyDelta();
    }

    if (eventType == QStringLiteral("content_block_delta")) {
        QJsonObject delta = root.value(QStringLiteral("delta")).toObject();
        QString deltaType = delta.value(QStringLiteral("type")).toString();

        if (deltaType == QStringLiteral("text_delta")) {
            StreamFrame frame = emptyDelta();
            frame.deltaSegments.append(Segment::fromText(delta.value(QStringLiteral("text")).toString()));
            return frame;
        }

        if (deltaType == QStringLiteral("input_json_delta")) {
            StreamFrame frame;
            frame.type = FrameType::ToolDelta;
            frame.toolDelta.index = root.value(QStringLiteral("index")).toInt();
            frame.toolDelta.argsPatch = delta.value(QStringLiteral("partial_json")).toString();
            return frame;
        }

        // thinking and signature deltas have no chat-completions form
        return emptyDelta();
    }

    if (eventType == QStringLiteral("message_delta")) {
        StreamFrame frame;
        frame.type = FrameType::UsageDelta;
        QJsonObject delta = root.value(QStringLiteral("delta")).toObject();
        QJsonObject usage = root.value(QStringLiteral("usage")).toObject();
        frame.usageDelta.completionTokens = usage.value(QStringLiteral("output_tokens")).toInt();
        if (usage.contains(QStringLiteral("input_tokens")))
            frame.usageDelta.promptTokens = usage.value(QStringLiteral("input_tokens")).toInt();

        QString stopReason = delta.value(QStringLiteral("stop_reason")).toString();
        if (!stopReason.isEmpty())
            frame.stopCause = stopCauseFromStopReason(stopReason);
        return frame;
    }

    if (eventType == QStringLiteral("message_stop")) {
        StreamFrame frame;
        frame.type = FrameType::Finished;
        frame.isFinal = true;
        return frame;
    }

    if (eventType == QStringLiteral("error")) {
        QJsonObject errorObj = root.value(QStringLiteral("error")).toObject();
        StreamFrame frame;
        frame.type = FrameType::Failed;
        const QString errorType = errorObj.value(QStringLiteral("type")).toString();
        frame.failure = errorType == QStringLiteral("overloaded_error")
            ? DomainFailure::unavailable(errorObj.value(QStringLiteral("message")).toString())
            : DomainFailure::internal(errorObj.value(QStringLiteral("message")).toString());
        if (!errorType.isEmpty())
            frame.failure.code = errorType;
        frame.failure.upstreamBody = event.data;
        frame.isFinal = true;
        return frame;
    }

    // content_block_stop, ping and unknown events
    return emptyDelta();
}

DomainFailure AnthropicOutbound::mapFailure(int httpStatus, const QByteArray& body)
{
    DomainFailure failure = DomainFailure::upstreamHttp(httpStatus, body);

    // {"type":"error","error":{"type":"...","message":"..."}}
    const QJsonObject errorObj = QJsonDocument::fromJson(body).object()
                                     .value(QStringLiteral("error")).toObject();
    const QString code = errorObj.value(QStringLiteral("type")).toString();
    failure.code = code.isEmpty() ? QStringLiteral("anthropic.http_%1").arg(httpStatus) : code;
    return failure;
}

// ---------------------------------------------------------------------------
// Private helpers
// ---------------------------------------------------------------------------

QJsonArray AnthropicOutbound::buildMessages(const QList<ChatMessage>& items, QString& systemOut) const
{
    QJsonArray messages;
    systemOut.clear();

    for (const auto& item : items) {
        // Extract system messages separately
        if (item.role == QStringLiteral("system")) {
            for (const auto& seg : item.content) {
                if (seg.kind == SegmentKind::Text) {
                    if (!systemOut.isEmpty()) {
                        systemOut += QStringLiteral("\n");
                    }
                    systemOut += seg.text;
                }
            }
            continue;
        }

        QJsonObject msg;

        // "tool" items become tool_result blocks in a user turn; consecutive
        // results share one turn.
        if (item.role == QStringLiteral("tool")) {
            msg[QStringLiteral("role")] = QStringLiteral("user");
            QJsonArray contentArr;
            if (!messages.isEmpty()) {
                const QJsonObject prev = messages.last().toObject();
                const QJsonArray prevContent = prev.value(QStringLiteral("content")).toArray();
                if (prev.value(QStringLiteral("role")).toString() == QStringLiteral("user")
                    && !prevContent.isEmpty()
                    && prevContent.last().toObject().value(QStringLiteral("type")).toString()
                           == QStringLiteral("tool_result")) {
                    contentArr = prevContent;
                    messages.removeLast();
                }
            }
            QJsonObject toolResult;
            toolResult[QStringLiteral("type")] = QStringLiteral("tool_result");
            toolResult[QStringLiteral("tool_use_id")] = item.toolCallId;
            QString textContent;
            for (const auto& seg : item.content) {
                if (seg.kind == SegmentKind::Text) {
                    textContent += seg.text;
                }
            }
            toolResult[QStringLiteral("content")] = textContent;
            contentArr.append(toolResult);
            msg[QStringLiteral("content")] = contentArr;
        } else {
            msg[QStringLiteral("role")] = item.role;

            QJsonArray contentArr = segmentsToContentBlocks(item.content);

            // Add tool_use blocks for tool calls (assistant messages)
            for (const auto& tc : item.toolCalls) {
                QJsonObject toolUse;
                toolUse[QStringLiteral("type")] = QStringLiteral("tool_use");
                toolUse[QStringLiteral("id")] = tc.callId;
                toolUse[QStringLiteral("name")] = tc.name;
                QJsonDocument argsDoc = QJsonDocument::fromJson(tc.args.toUtf8());
                if (argsDoc.isObject()) {
                    toolUse[QStringLiteral("input")] = argsDoc.object();
                } else {
                    toolUse[QStringLiteral("input")] = QJsonObject();
                }
                contentArr.append(toolUse);
            }

            msg[QStringLiteral("content")] = contentArr;
        }

        messages.append(msg);
    }

    return messages;
}

QJsonArray AnthropicOutbound::buildToolDefs(const QList<ToolSpec>& tools) const
{
    QJsonArray arr;
    for (const auto& tool : tools) {
        QJsonObject toolObj;
        toolObj[QStringLiteral("name")] = tool.name;
        toolObj[QStringLiteral("description")] = tool.description;
        toolObj[QStringLiteral("input_schema")] = tool.parameters;
        arr.append(toolObj);
    }
    return arr;
}

QJsonArray AnthropicOutbound::segmentsToContentBlocks(const QList<Segment>& segments) const
{
    QJsonArray arr;
    for (const auto& seg : segments) {
        if (seg.kind == SegmentKind::Text) {
            QJsonObject block;
            block[QStringLiteral("type")] = QStringLiteral("text");
            block[QStringLiteral("text")] = seg.text;
            arr.append(block);
        } else if (seg.kind == SegmentKind::Media) {
            QJsonObject block;
            block[QStringLiteral("type")] = QStringLiteral("image");
            QJsonObject source;
            if (!seg.media.inlineData.isEmpty()) {
                source[QStringLiteral("type")] = QStringLiteral("base64");
                source[QStringLiteral("media_type")] = seg.media.mimeType;
                source[QStringLiteral("data")] = QString::fromLatin1(seg.media.inlineData.toBase64());
            } else if (!seg.media.uri.isEmpty()) {
                source[QStringLiteral("type")] = QStringLiteral("url");
                source[QStringLiteral("url")] = seg.media.uri;
            }
            block[QStringLiteral("source")] = source;
            arr.append(block);
        } else if (seg.kind == SegmentKind::Structured) {
            arr.append(seg.structured);
        }
    }
    return arr;
}

ChatChoice AnthropicOutbound::parseMessage(const QJsonObject& root) const
{
    ChatChoice c;
    c.index = 0;
    c.role = root.value(QStringLiteral("role")).toString(QStringLiteral("assistant"));

    QJsonArray content = root.value(QStringLiteral("content")).toArray();
    for (const QJsonValue& blockVal : content) {
        QJsonObject block = blockVal.toObject();
        QString type = block.value(QStringLiteral("type")).toString();

        if (type == QStringLiteral("text")) {
            c.output.append(Segment::fromText(block.value(QStringLiteral("text")).toString()));
        } else if (type == QStringLiteral("thinking") || type == QStringLiteral("redacted_thinking")) {
            c.output.append(Segment::fromStructured(block));
        } else if (type == QStringLiteral("tool_use")) {
            c.toolCalls.append(parseToolUseBlock(block));
        }
    }

    c.stopCause = stopCauseFromStopReason(root.value(QStringLiteral("stop_reason")).toString());

    return c;
}

ToolCall AnthropicOutbound::parseToolUseBlock(const QJsonObject& block) const
{
    ToolCall call;
    call.callId = block.value(QStringLiteral("id")).toString();
    call.name = block.value(QStringLiteral("name")).toString();
    QJsonObject input = block.value(QStringLiteral("input")).toObject();
    call.args = QString::fromUtf8(QJsonDocument(input).toJson(QJsonDocument::Compact));
    return call;
}

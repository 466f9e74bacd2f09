#include "adapters/inbound/anthropic.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QUuid>

QString AnthropicAdapter::generateMessageId()
{
    return QStringLiteral("msg_") + QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString AnthropicAdapter::stopReasonFromCause(StopCause cause)
{
    switch (cause) {
    case StopCause::Completed:     return QStringLiteral("end_turn");
    case StopCause::Length:        return QStringLiteral("max_tokens");
    case StopCause::ContentFilter: return QStringLiteral("refusal");
    case StopCause::ToolCall:      return QStringLiteral("tool_use");
    }
    return QStringLiteral("end_turn");
}

QList<Segment> AnthropicAdapter::parseContentBlocks(const QJsonValue& content)
{
    QList<Segment> segments;
    if (content.isString()) {
        segments.append(Segment::fromText(content.toString()));
    } else if (content.isArray()) {
        const QJsonArray blocks = content.toArray();
        for (const QJsonValue& bv : blocks) {
            const QJsonObject block = bv.toObject();
            const QString type = block[QStringLiteral("type")].toString();
            if (type == QStringLiteral("text")) {
                segments.append(Segment::fromText(block[QStringLiteral("text")].toString()));
            } else if (type == QStringLiteral("image")) {
                const QJsonObject source = block[QStringLiteral("source")].toObject();
                MediaRef ref;
                ref.mimeType = source[QStringLiteral("media_type")].toString();
                const QString sourceType = source[QStringLiteral("type")].toString();
                if (sourceType == QStringLiteral("base64")) {
                    ref.inlineData = QByteArray::fromBase64(
                        source[QStringLiteral("data")].toString().toUtf8());
                } else if (sourceType == QStringLiteral("url")) {
                    ref.uri = source[QStringLiteral("url")].toString();
                }
                segments.append(Segment::fromMedia(ref));
            } else if (type == QStringLiteral("thinking") || type == QStringLiteral("redacted_thinking")) {
                segments.append(Segment::fromStructured(block));
            }
        }
    }
    return segments;
}

QList<ToolCall> AnthropicAdapter::parseToolUseBlocks(const QJsonArray& blocks)
{
    QList<ToolCall> calls;
    for (const QJsonValue& bv : blocks) {
        const QJsonObject block = bv.toObject();
        if (block[QStringLiteral("type")].toString() == QStringLiteral("tool_use")) {
            ToolCall call;
            call.callId = block[QStringLiteral("id")].toString();
            call.name = block[QStringLiteral("name")].toString();
            call.args = QString::fromUtf8(
                QJsonDocument(block[QStringLiteral("input")].toObject()).toJson(QJsonDocument::Compact));
            calls.append(call);
        }
    }
    return calls;
}

QJsonArray AnthropicAdapter::serializeContentBlocks(const QList<Segment>& segments)
{
    QJsonArray blocks;
    for (const Segment& seg : segments) {
        if (seg.kind == SegmentKind::Text) {
            QJsonObject block;
            block[QStringLiteral("type")] = QStringLiteral("text");
            block[QStringLiteral("text")] = seg.text;
            blocks.append(block);
        } else if (seg.kind == SegmentKind::Media) {
            QJsonObject block;
            block[QStringLiteral("type")] = QStringLiteral("image");
            QJsonObject source;
            if (!seg.media.inlineData.isEmpty()) {
                source[QStringLiteral("type")] = QStringLiteral("base64");
                source[QStringLiteral("media_type")] = seg.media.mimeType;
                source[QStringLiteral("data")] = QString::fromUtf8(seg.media.inlineData.toBase64());
            } else {
                source[QStringLiteral("type")] = QStringLiteral("url");
                source[QStringLiteral("url")] = seg.media.uri;
            }
            block[QStringLiteral("source")] = source;
            blocks.append(block);
        } else if (seg.kind == SegmentKind::Structured) {
            blocks.append(seg.structured);
        }
    }
    return blocks;
}

QJsonArray AnthropicAdapter::serializeToolUseBlocks(const QList<ToolCall>& calls)
{
    QJsonArray blocks;
    for (const ToolCall& call : calls) {
        QJsonObject block;
        block[QStringLiteral("type")] = QStringLiteral("tool_use");
        block[QStringLiteral("id")] = call.callId;
        block[QStringLiteral("name")] = call.name;
        const QJsonDocument argsDoc = QJsonDocument::fromJson(call.args.toUtf8());
        block[QStringLiteral("input")] = argsDoc.isObject()
            ? QJsonValue(argsDoc.object()) : QJsonValue(call.args);
        blocks.append(block);
    }
    return blocks;
}

Result<ChatRequest> AnthropicAdapter::decodeRequest(const QJsonObject& root)
{
    if (!root.value(QStringLiteral("messages")).isArray()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_request"),
            QStringLiteral("Anthropic request must carry a 'messages' array")));
    }

    ChatRequest req;
    req.model = root[QStringLiteral("model")].toString();

    // System prompt is top-level in this dialect
    if (root.contains(QStringLiteral("system"))) {
        const QJsonValue sysVal = root[QStringLiteral("system")];
        ChatMessage sysItem;
        sysItem.role = QStringLiteral("system");
        if (sysVal.isString()) {
            sysItem.content.append(Segment::fromText(sysVal.toString()));
        } else if (sysVal.isArray()) {
            const QJsonArray sysBlocks = sysVal.toArray();
            for (const QJsonValue& bv : sysBlocks) {
                const QJsonObject block = bv.toObject();
                if (block[QStringLiteral("type")].toString() == QStringLiteral("text")) {
                    sysItem.content.append(Segment::fromText(block[QStringLiteral("text")].toString()));
                }
            }
        }
        if (!sysItem.content.isEmpty())
            req.messages.append(sysItem);
    }

    const QJsonArray msgs = root[QStringLiteral("messages")].toArray();
    for (const QJsonValue& mv : msgs) {
        const QJsonObject m = mv.toObject();
        const QString role = m[QStringLiteral("role")].toString();
        const QJsonValue contentVal = m[QStringLiteral("content")];

        if (contentVal.isString()) {
            ChatMessage item;
            item.role = role;
            item.content.append(Segment::fromText(contentVal.toString()));
            req.messages.append(item);
            continue;
        }

        const QJsonArray blocks = contentVal.toArray();

        // Each tool_result becomes its own "tool" item so it can be
        // addressed by call id in the chat dialect.
        for (const QJsonValue& bv : blocks) {
            const QJsonObject block = bv.toObject();
            if (block[QStringLiteral("type")].toString() != QStringLiteral("tool_result"))
                continue;
            ChatMessage toolItem;
            toolItem.role = QStringLiteral("tool");
            toolItem.toolCallId = block[QStringLiteral("tool_use_id")].toString();
            const QJsonValue resultContent = block[QStringLiteral("content")];
            if (resultContent.isString()) {
                toolItem.content.append(Segment::fromText(resultContent.toString()));
            } else {
                for (const QJsonValue& rc : resultContent.toArray()) {
                    const QJsonObject rcObj = rc.toObject();
                    if (rcObj[QStringLiteral("type")].toString() == QStringLiteral("text"))
                        toolItem.content.append(Segment::fromText(rcObj[QStringLiteral("text")].toString()));
                }
            }
            req.messages.append(toolItem);
        }

        ChatMessage item;
        item.role = role;
        item.content = parseContentBlocks(contentVal);
        item.toolCalls = parseToolUseBlocks(blocks);
        if (!item.content.isEmpty() || !item.toolCalls.isEmpty())
            req.messages.append(item);
    }

    if (root.contains(QStringLiteral("max_tokens")))
        req.sampling.maxTokens = root[QStringLiteral("max_tokens")].toInt();
    if (root.contains(QStringLiteral("temperature")))
        req.sampling.temperature = root[QStringLiteral("temperature")].toDouble();
    if (root.contains(QStringLiteral("top_p")))
        req.sampling.topP = root[QStringLiteral("top_p")].toDouble();
    if (root.contains(QStringLiteral("top_k")))
        req.sampling.topK = root[QStringLiteral("top_k")].toInt();
    const QJsonArray stopArr = root[QStringLiteral("stop_sequences")].toArray();
    for (const QJsonValue& sv : stopArr)
        req.sampling.stopSequences.append(sv.toString());

    const QJsonObject toolChoice = root[QStringLiteral("tool_choice")].toObject();
    const QString choiceType = toolChoice[QStringLiteral("type")].toString();
    if (choiceType == QStringLiteral("any"))
        req.sampling.toolChoice = QStringLiteral("required");
    else if (choiceType == QStringLiteral("tool"))
        req.sampling.toolChoice = toolChoice[QStringLiteral("name")].toString();
    else
        req.sampling.toolChoice = choiceType;

    const QJsonArray tools = root[QStringLiteral("tools")].toArray();
    for (const QJsonValue& tv : tools) {
        const QJsonObject t = tv.toObject();
        ToolSpec tool;
        tool.name = t[QStringLiteral("name")].toString();
        tool.description = t[QStringLiteral("description")].toString();
        tool.parameters = t[QStringLiteral("input_schema")].toObject();
        req.tools.append(tool);
    }

    req.stream = root[QStringLiteral("stream")].toBool();

    const QString userId = root[QStringLiteral("metadata")].toObject()[QStringLiteral("user_id")].toString();
    if (!userId.isEmpty())
        req.metadata[QStringLiteral("user")] = userId;

    return req;
}

Result<QJsonObject> AnthropicAdapter::encodeResponse(const ChatResponse& response)
{
    QJsonObject root;
    root[QStringLiteral("id")] = response.responseId.isEmpty()
        ? generateMessageId() : response.responseId;
    root[QStringLiteral("type")] = QStringLiteral("message");
    root[QStringLiteral("role")] = QStringLiteral("assistant");
    root[QStringLiteral("model")] = response.model;

    QJsonArray contentBlocks;
    if (!response.choices.isEmpty()) {
        const ChatChoice& cand = response.choices.first();
        contentBlocks = serializeContentBlocks(cand.output);

        const QJsonArray toolBlocks = serializeToolUseBlocks(cand.toolCalls);
        for (const QJsonValue& tb : toolBlocks)
            contentBlocks.append(tb);

        root[QStringLiteral("stop_reason")] = stopReasonFromCause(cand.stopCause);
    } else {
        root[QStringLiteral("stop_reason")] = QStringLiteral("end_turn");
    }
    root[QStringLiteral("stop_sequence")] = QJsonValue::Null;
    root[QStringLiteral("content")] = contentBlocks;

    QJsonObject usage;
    usage[QStringLiteral("input_tokens")] = response.usage.promptTokens;
    usage[QStringLiteral("output_tokens")] = response.usage.completionTokens;
    root[QStringLiteral("usage")] = usage;

    return root;
}

void AnthropicAdapter::ensureStarted(const StreamFrame& frame, StreamEncodeState& state,
                                     QList<SseEvent>& out)
{
    if (state.started)
        return;
    state.started = true;
    if (state.responseId.isEmpty())
        state.responseId = frame.responseId.isEmpty() ? generateMessageId() : frame.responseId;
    if (state.model.isEmpty())
        state.model = frame.model;

    QJsonObject message;
    message[QStringLiteral("id")] = state.responseId;
    message[QStringLiteral("type")] = QStringLiteral("message");
    message[QStringLiteral("role")] = QStringLiteral("assistant");
    message[QStringLiteral("model")] = state.model;
    message[QStringLiteral("content")] = QJsonArray();
    message[QStringLiteral("stop_reason")] = QJsonValue::Null;
    message[QStringLiteral("stop_sequence")] = QJsonValue::Null;
    QJsonObject usage;
    usage[QStringLiteral("input_tokens")] = frame.usageDelta.promptTokens;
    usage[QStringLiteral("output_tokens")] = 0;
    message[QStringLiteral("usage")] = usage;

    QJsonObject event;
    event[QStringLiteral("type")] = QStringLiteral("message_start");
    event[QStringLiteral("message")] = message;
    out.append(SseEvent::fromJson(QStringLiteral("message_start"), event));
}

void AnthropicAdapter::closeOpenBlock(StreamEncodeState& state, QList<SseEvent>& out)
{
    if (state.openBlock < 0)
        return;
    QJsonObject blockStop;
    blockStop[QStringLiteral("type")] = QStringLiteral("content_block_stop");
    blockStop[QStringLiteral("index")] = state.openBlock;
    out.append(SseEvent::fromJson(QStringLiteral("content_block_stop"), blockStop));
    state.openBlock = -1;
}

Result<QList<SseEvent>> AnthropicAdapter::encodeStreamEvents(const StreamFrame& frame,
                                                             StreamEncodeState& state)
{
    QList<SseEvent> out;
    if (state.finished)
        return out;

    switch (frame.type) {
    case FrameType::Started:
        ensureStarted(frame, state, out);
        break;

    case FrameType::Delta: {
        QString text;
        for (const Segment& seg : frame.deltaSegments) {
            if (seg.kind == SegmentKind::Text)
                text += seg.text;
        }
        if (text.isEmpty())
            break;
        ensureStarted(frame, state, out);
        if (state.openBlock < 0 || !state.openBlockIsText) {
            closeOpenBlock(state, out);
            state.openBlock = state.nextBlock++;
            state.openBlockIsText = true;
            QJsonObject blockStart;
            blockStart[QStringLiteral("type")] = QStringLiteral("content_block_start");
            blockStart[QStringLiteral("index")] = state.openBlock;
            QJsonObject contentBlock;
            contentBlock[QStringLiteral("type")] = QStringLiteral("text");
            contentBlock[QStringLiteral("text")] = QString();
            blockStart[QStringLiteral("content_block")] = contentBlock;
            out.append(SseEvent::fromJson(QStringLiteral("content_block_start"), blockStart));
        }
        QJsonObject event;
        event[QStringLiteral("type")] = QStringLiteral("content_block_delta");
        event[QStringLiteral("index")] = state.openBlock;
        QJsonObject delta;
        delta[QStringLiteral("type")] = QStringLiteral("text_delta");
        delta[QStringLiteral("text")] = text;
        event[QStringLiteral("delta")] = delta;
        out.append(SseEvent::fromJson(QStringLiteral("content_block_delta"), event));
        break;
    }

    case FrameType::ToolDelta: {
        ensureStarted(frame, state, out);
        const ToolCallDelta& ad = frame.toolDelta;
        if (!ad.callId.isEmpty() || !state.toolIndex.contains(ad.index)) {
            closeOpenBlock(state, out);
            state.openBlock = state.nextBlock++;
            state.openBlockIsText = false;
            state.toolIndex.insert(ad.index, state.openBlock);
            QJsonObject blockStart;
            blockStart[QStringLiteral("type")] = QStringLiteral("content_block_start");
            blockStart[QStringLiteral("index")] = state.openBlock;
            QJsonObject contentBlock;
            contentBlock[QStringLiteral("type")] = QStringLiteral("tool_use");
            contentBlock[QStringLiteral("id")] = ad.callId;
            contentBlock[QStringLiteral("name")] = ad.name;
            contentBlock[QStringLiteral("input")] = QJsonObject();
            blockStart[QStringLiteral("content_block")] = contentBlock;
            out.append(SseEvent::fromJson(QStringLiteral("content_block_start"), blockStart));
        }
        if (!ad.argsPatch.isEmpty()) {
            QJsonObject event;
            event[QStringLiteral("type")] = QStringLiteral("content_block_delta");
            event[QStringLiteral("index")] = state.toolIndex.value(ad.index);
            QJsonObject delta;
            delta[QStringLiteral("type")] = QStringLiteral("input_json_delta");
            delta[QStringLiteral("partial_json")] = ad.argsPatch;
            event[QStringLiteral("delta")] = delta;
            out.append(SseEvent::fromJson(QStringLiteral("content_block_delta"), event));
        }
        break;
    }

    case FrameType::UsageDelta:
        if (frame.usageDelta.promptTokens > 0)
            state.usage.promptTokens = frame.usageDelta.promptTokens;
        if (frame.usageDelta.completionTokens > 0)
            state.usage.completionTokens = frame.usageDelta.completionTokens;
        break;

    case FrameType::Finished: {
        ensureStarted(frame, state, out);
        closeOpenBlock(state, out);
        if (frame.usageDelta.completionTokens > 0)
            state.usage.completionTokens = frame.usageDelta.completionTokens;

        QJsonObject msgDelta;
        msgDelta[QStringLiteral("type")] = QStringLiteral("message_delta");
        QJsonObject delta;
        delta[QStringLiteral("stop_reason")] = stopReasonFromCause(frame.stopCause.value_or(StopCause::Completed));
        delta[QStringLiteral("stop_sequence")] = QJsonValue::Null;
        msgDelta[QStringLiteral("delta")] = delta;
        QJsonObject usage;
        usage[QStringLiteral("output_tokens")] = state.usage.completionTokens;
        msgDelta[QStringLiteral("usage")] = usage;
        out.append(SseEvent::fromJson(QStringLiteral("message_delta"), msgDelta));

        QJsonObject msgStop;
        msgStop[QStringLiteral("type")] = QStringLiteral("message_stop");
        out.append(SseEvent::fromJson(QStringLiteral("message_stop"), msgStop));
        state.finished = true;
        break;
    }

    case FrameType::Failed: {
        out.append(SseEvent::fromJson(QStringLiteral("error"), encodeFailure(frame.failure)));
        state.finished = true;
        break;
    }
    }

    return out;
}

QString AnthropicAdapter::errorType(const DomainFailure& failure)
{
    switch (failure.kind) {
    case ErrorKind::InvalidInput:  return QStringLiteral("invalid_request_error");
    case ErrorKind::Unauthorized:  return QStringLiteral("authentication_error");
    case ErrorKind::Forbidden:     return QStringLiteral("permission_error");
    case ErrorKind::NotFound:      return QStringLiteral("not_found_error");
    case ErrorKind::RateLimited:   return QStringLiteral("rate_limit_error");
    case ErrorKind::Unavailable:   return QStringLiteral("overloaded_error");
    default:                       return QStringLiteral("api_error");
    }
}

QJsonObject AnthropicAdapter::encodeFailure(const DomainFailure& failure)
{
    QJsonObject root;
    root[QStringLiteral("type")] = QStringLiteral("error");
    QJsonObject errorObj;
    errorObj[QStringLiteral("type")] = errorType(failure);
    errorObj[QStringLiteral("message")] = failure.message;
    if (!failure.code.isEmpty())
        errorObj[QStringLiteral("code")] = failure.code;
    root[QStringLiteral("error")] = errorObj;
    return root;
}

#include "adapters/inbound/openai_chat.h"
#include <QDateTime>
#include <QJsonArray>
#include <QUuid>

QString OpenAIChatAdapter::generateChatId()
{
    return QStringLiteral("chatcmpl-") + QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString OpenAIChatAdapter::stopCauseToFinishReason(StopCause cause)
{
    switch (cause) {
    case StopCause::Completed:     return QStringLiteral("stop");
    case StopCause::Length:        return QStringLiteral("length");
    case StopCause::ContentFilter: return QStringLiteral("content_filter");
    case StopCause::ToolCall:      return QStringLiteral("tool_calls");
    }
    return QStringLiteral("stop");
}

QList<Segment> OpenAIChatAdapter::parseContentField(const QJsonValue& content)
{
    QList<Segment> segments;
    if (content.isString()) {
        segments.append(Segment::fromText(content.toString()));
    } else if (content.isArray()) {
        const QJsonArray parts = content.toArray();
        for (const QJsonValue& pv : parts) {
            const QJsonObject p = pv.toObject();
            const QString type = p[QStringLiteral("type")].toString();
            if (type == QStringLiteral("text")) {
                segments.append(Segment::fromText(p[QStringLiteral("text")].toString()));
            } else if (type == QStringLiteral("image_url")) {
                const QJsonObject imgObj = p[QStringLiteral("image_url")].toObject();
                MediaRef ref;
                ref.uri = imgObj[QStringLiteral("url")].toString();
                ref.mimeType = QStringLiteral("image/*");
                segments.append(Segment::fromMedia(ref));
            }
        }
    }
    return segments;
}

QList<ToolCall> OpenAIChatAdapter::parseToolCalls(const QJsonArray& toolCalls)
{
    QList<ToolCall> calls;
    for (const QJsonValue& tcv : toolCalls) {
        const QJsonObject tc = tcv.toObject();
        ToolCall call;
        call.callId = tc[QStringLiteral("id")].toString();
        const QJsonObject fn = tc[QStringLiteral("function")].toObject();
        call.name = fn[QStringLiteral("name")].toString();
        call.args = fn[QStringLiteral("arguments")].toString();
        calls.append(call);
    }
    return calls;
}

QJsonArray OpenAIChatAdapter::serializeToolCalls(const QList<ToolCall>& calls)
{
    QJsonArray arr;
    for (const ToolCall& call : calls) {
        QJsonObject tcObj;
        tcObj[QStringLiteral("id")] = call.callId;
        tcObj[QStringLiteral("type")] = QStringLiteral("function");
        QJsonObject fn;
        fn[QStringLiteral("name")] = call.name;
        fn[QStringLiteral("arguments")] = call.args;
        tcObj[QStringLiteral("function")] = fn;
        arr.append(tcObj);
    }
    return arr;
}

Result<ChatRequest> OpenAIChatAdapter::decodeRequest(const QJsonObject& root)
{
    if (!root.value(QStringLiteral("messages")).isArray()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_request"),
            QStringLiteral("Chat completion request must carry a 'messages' array")));
    }

    ChatRequest req;
    req.model = root[QStringLiteral("model")].toString();

    const QJsonArray msgs = root[QStringLiteral("messages")].toArray();
    for (const QJsonValue& mv : msgs) {
        const QJsonObject m = mv.toObject();
        ChatMessage item;
        item.role = m[QStringLiteral("role")].toString();
        if (item.role == QStringLiteral("developer"))
            item.role = QStringLiteral("system");
        item.content = parseContentField(m[QStringLiteral("content")]);

        if (m.contains(QStringLiteral("tool_calls")))
            item.toolCalls = parseToolCalls(m[QStringLiteral("tool_calls")].toArray());
        if (m.contains(QStringLiteral("tool_call_id")))
            item.toolCallId = m[QStringLiteral("tool_call_id")].toString();

        req.messages.append(item);
    }

    if (root.contains(QStringLiteral("temperature")))
        req.sampling.temperature = root[QStringLiteral("temperature")].toDouble();
    if (root.contains(QStringLiteral("top_p")))
        req.sampling.topP = root[QStringLiteral("top_p")].toDouble();
    if (root.contains(QStringLiteral("max_tokens")))
        req.sampling.maxTokens = root[QStringLiteral("max_tokens")].toInt();
    if (root.contains(QStringLiteral("max_completion_tokens")))
        req.sampling.maxCompletionTokens = root[QStringLiteral("max_completion_tokens")].toInt();
    if (root.contains(QStringLiteral("seed")))
        req.sampling.seed = root[QStringLiteral("seed")].toInt();
    if (root.contains(QStringLiteral("frequency_penalty")))
        req.sampling.frequencyPenalty = root[QStringLiteral("frequency_penalty")].toDouble();
    if (root.contains(QStringLiteral("presence_penalty")))
        req.sampling.presencePenalty = root[QStringLiteral("presence_penalty")].toDouble();
    if (root.contains(QStringLiteral("stop"))) {
        const QJsonValue stopVal = root[QStringLiteral("stop")];
        if (stopVal.isString()) {
            req.sampling.stopSequences.append(stopVal.toString());
        } else if (stopVal.isArray()) {
            for (const QJsonValue& sv : stopVal.toArray())
                req.sampling.stopSequences.append(sv.toString());
        }
    }

    const QJsonValue toolChoice = root[QStringLiteral("tool_choice")];
    if (toolChoice.isString()) {
        req.sampling.toolChoice = toolChoice.toString();
    } else if (toolChoice.isObject()) {
        req.sampling.toolChoice = toolChoice.toObject()[QStringLiteral("function")]
                                         .toObject()[QStringLiteral("name")].toString();
    }

    const QJsonArray tools = root[QStringLiteral("tools")].toArray();
    for (const QJsonValue& tv : tools) {
        const QJsonObject t = tv.toObject();
        if (t[QStringLiteral("type")].toString() == QStringLiteral("function")) {
            const QJsonObject fn = t[QStringLiteral("function")].toObject();
            ToolSpec tool;
            tool.name = fn[QStringLiteral("name")].toString();
            tool.description = fn[QStringLiteral("description")].toString();
            tool.parameters = fn[QStringLiteral("parameters")].toObject();
            req.tools.append(tool);
        }
    }

    req.stream = root[QStringLiteral("stream")].toBool();

    const QString user = root[QStringLiteral("user")].toString();
    if (!user.isEmpty())
        req.metadata[QStringLiteral("user")] = user;

    return req;
}

Result<QJsonObject> OpenAIChatAdapter::encodeResponse(const ChatResponse& response)
{
    QJsonObject root;
    root[QStringLiteral("id")] = response.responseId.isEmpty()
        ? generateChatId() : response.responseId;
    root[QStringLiteral("object")] = QStringLiteral("chat.completion");
    root[QStringLiteral("model")] = response.model;
    root[QStringLiteral("created")] = static_cast<qint64>(QDateTime::currentSecsSinceEpoch());

    QJsonArray choices;
    for (const ChatChoice& cand : response.choices) {
        QJsonObject choice;
        choice[QStringLiteral("index")] = cand.index;

        QJsonObject message;
        message[QStringLiteral("role")] = cand.role.isEmpty()
            ? QStringLiteral("assistant") : cand.role;

        QString textContent;
        for (const Segment& seg : cand.output) {
            if (seg.kind == SegmentKind::Text)
                textContent += seg.text;
        }
        if (textContent.isEmpty() && !cand.toolCalls.isEmpty())
            message[QStringLiteral("content")] = QJsonValue::Null;
        else
            message[QStringLiteral("content")] = textContent;

        if (!cand.toolCalls.isEmpty())
            message[QStringLiteral("tool_calls")] = serializeToolCalls(cand.toolCalls);

        choice[QStringLiteral("message")] = message;
        choice[QStringLiteral("finish_reason")] = stopCauseToFinishReason(cand.stopCause);
        choices.append(choice);
    }
    root[QStringLiteral("choices")] = choices;

    QJsonObject usage;
    usage[QStringLiteral("prompt_tokens")] = response.usage.promptTokens;
    usage[QStringLiteral("completion_tokens")] = response.usage.completionTokens;
    usage[QStringLiteral("total_tokens")] = response.usage.totalTokens > 0
        ? response.usage.totalTokens
        : response.usage.promptTokens + response.usage.completionTokens;
    root[QStringLiteral("usage")] = usage;

    return root;
}

QJsonObject OpenAIChatAdapter::chunk(const StreamEncodeState& state, const QJsonObject& choice)
{
    QJsonObject root;
    root[QStringLiteral("id")] = state.responseId;
    root[QStringLiteral("object")] = QStringLiteral("chat.completion.chunk");
    root[QStringLiteral("created")] = static_cast<qint64>(QDateTime::currentSecsSinceEpoch());
    root[QStringLiteral("model")] = state.model;
    QJsonArray choices;
    if (!choice.isEmpty())
        choices.append(choice);
    root[QStringLiteral("choices")] = choices;
    return root;
}

Result<QList<SseEvent>> OpenAIChatAdapter::encodeStreamEvents(const StreamFrame& frame,
                                                              StreamEncodeState& state)
{
    QList<SseEvent> out;
    if (state.finished)
        return out;

    if (state.responseId.isEmpty())
        state.responseId = frame.responseId.isEmpty() ? generateChatId() : frame.responseId;
    if (state.model.isEmpty())
        state.model = frame.model;

    QJsonObject choice;
    choice[QStringLiteral("index")] = frame.choiceIndex;
    choice[QStringLiteral("finish_reason")] = QJsonValue::Null;

    switch (frame.type) {
    case FrameType::Started: {
        if (state.started)
            break;
        state.started = true;
        QJsonObject delta;
        delta[QStringLiteral("role")] = QStringLiteral("assistant");
        delta[QStringLiteral("content")] = QString();
        choice[QStringLiteral("delta")] = delta;
        out.append(SseEvent::fromJson(QString(), chunk(state, choice)));
        break;
    }
    case FrameType::Delta: {
        QString text;
        for (const Segment& seg : frame.deltaSegments) {
            if (seg.kind == SegmentKind::Text)
                text += seg.text;
        }
        if (text.isEmpty())
            break;
        state.started = true;
        QJsonObject delta;
        delta[QStringLiteral("content")] = text;
        choice[QStringLiteral("delta")] = delta;
        out.append(SseEvent::fromJson(QString(), chunk(state, choice)));
        break;
    }
    case FrameType::ToolDelta: {
        state.started = true;
        const ToolCallDelta& ad = frame.toolDelta;
        if (!state.toolIndex.contains(ad.index))
            state.toolIndex.insert(ad.index, state.toolCount++);

        QJsonObject tc;
        tc[QStringLiteral("index")] = state.toolIndex.value(ad.index);
        if (!ad.callId.isEmpty()) {
            tc[QStringLiteral("id")] = ad.callId;
            tc[QStringLiteral("type")] = QStringLiteral("function");
        }
        QJsonObject fn;
        if (!ad.name.isEmpty())
            fn[QStringLiteral("name")] = ad.name;
        fn[QStringLiteral("arguments")] = ad.argsPatch;
        tc[QStringLiteral("function")] = fn;

        QJsonObject delta;
        delta[QStringLiteral("tool_calls")] = QJsonArray{tc};
        choice[QStringLiteral("delta")] = delta;
        out.append(SseEvent::fromJson(QString(), chunk(state, choice)));
        break;
    }
    case FrameType::UsageDelta: {
        if (frame.usageDelta.promptTokens > 0)
            state.usage.promptTokens = frame.usageDelta.promptTokens;
        if (frame.usageDelta.completionTokens > 0)
            state.usage.completionTokens = frame.usageDelta.completionTokens;
        break;
    }
    case FrameType::Finished: {
        choice[QStringLiteral("delta")] = QJsonObject();
        choice[QStringLiteral("finish_reason")] =
            stopCauseToFinishReason(frame.stopCause.value_or(StopCause::Completed));
        QJsonObject last = chunk(state, choice);
        if (state.usage.promptTokens > 0 || state.usage.completionTokens > 0) {
            QJsonObject usage;
            usage[QStringLiteral("prompt_tokens")] = state.usage.promptTokens;
            usage[QStringLiteral("completion_tokens")] = state.usage.completionTokens;
            usage[QStringLiteral("total_tokens")] = state.usage.promptTokens + state.usage.completionTokens;
            last[QStringLiteral("usage")] = usage;
        }
        out.append(SseEvent::fromJson(QString(), last));
        out.append(SseEvent::done());
        state.finished = true;
        break;
    }
    case FrameType::Failed: {
        out.append(SseEvent::fromJson(QString(), encodeFailure(frame.failure)));
        out.append(SseEvent::done());
        state.finished = true;
        break;
    }
    }

    return out;
}

QJsonObject OpenAIChatAdapter::encodeFailure(const DomainFailure& failure)
{
    QJsonObject root;
    QJsonObject errorObj;
    errorObj[QStringLiteral("message")] = failure.message;
    QString type;
    switch (failure.kind) {
    case ErrorKind::Unauthorized: type = QStringLiteral("authentication_error"); break;
    case ErrorKind::Forbidden:    type = QStringLiteral("permission_error"); break;
    case ErrorKind::NotFound:     type = QStringLiteral("not_found_error"); break;
    case ErrorKind::RateLimited:  type = QStringLiteral("rate_limit_error"); break;
    case ErrorKind::InvalidInput: type = QStringLiteral("invalid_request_error"); break;
    default:                      type = QStringLiteral("server_error"); break;
    }
    errorObj[QStringLiteral("type")] = type;
    errorObj[QStringLiteral("code")] = failure.code;
    root[QStringLiteral("error")] = errorObj;
    return root;
}

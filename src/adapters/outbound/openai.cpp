#include "openai.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <algorithm>

StopCause OpenAIOutbound::stopCauseFromFinishReason(const QString& reason)
{
    if (reason == QStringLiteral("length"))
        return StopCause::Length;
    if (reason == QStringLiteral("content_filter"))
        return StopCause::ContentFilter;
    if (reason == QStringLiteral("tool_calls") || reason == QStringLiteral("function_call"))
        return StopCause::ToolCall;
    return StopCause::Completed;
}

Result<QJsonObject> OpenAIOutbound::buildBody(const ChatRequest& request)
{
    if (request.model.isEmpty()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("missing_model"), QStringLiteral("No model to send upstream")));
    }

    QJsonObject body;
    body[QStringLiteral("model")] = request.model;
    body[QStringLiteral("messages")] = buildMessages(request.messages);

    if (!request.tools.isEmpty()) {
        body[QStringLiteral("tools")] = buildToolDefs(request.tools);
    }

    if (request.stream) {
        body[QStringLiteral("stream")] = true;
        QJsonObject streamOptions;
        streamOptions[QStringLiteral("include_usage")] = true;
        body[QStringLiteral("stream_options")] = streamOptions;
    }

    const QString user = request.metadata.value(QStringLiteral("user"));
    if (!user.isEmpty())
        body[QStringLiteral("user")] = user;

    buildConstraints(body, request.sampling);
    return body;
}

ProviderRequest OpenAIOutbound::buildRequest(const QJsonObject& body, const UpstreamTarget& target)
{
    ProviderRequest pr;
    pr.method = QStringLiteral("POST");
    pr.url = endpointUrl(target.baseUrl, QStringLiteral("/chat/completions"));
    pr.headers[QStringLiteral("Authorization")] = QStringLiteral("Bearer ") + target.apiKey;
    pr.headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    for (auto it = target.customHeaders.constBegin(); it != target.customHeaders.constEnd(); ++it)
        pr.headers[it.key()] = it.value();

    pr.stream = target.stream;
    pr.timeoutMs = target.timeoutMs;
    pr.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    return pr;
}

Result<ChatResponse> OpenAIOutbound::parseResponse(const QJsonObject& root)
{
    if (!root.value(QStringLiteral("choices")).isArray()) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("Chat completion response carries no 'choices' array")));
    }

    ChatResponse sr;
    sr.responseId = root.value(QStringLiteral("id")).toString();
    sr.model = root.value(QStringLiteral("model")).toString();

    QJsonArray choices = root.value(QStringLiteral("choices")).toArray();
    for (const QJsonValue& cv : choices) {
        sr.choices.append(parseChoice(cv.toObject()));
    }

    QJsonObject usage = root.value(QStringLiteral("usage")).toObject();
    sr.usage.promptTokens = usage.value(QStringLiteral("prompt_tokens")).toInt();
    sr.usage.completionTokens = usage.value(QStringLiteral("completion_tokens")).toInt();
    sr.usage.totalTokens = usage.value(QStringLiteral("total_tokens")).toInt();

    return sr;
}

Result<QList<StreamFrame>> OpenAIOutbound::parseChunk(const SseEvent& event)
{
    if (event.isDone()) {
        StreamFrame frame;
        frame.type = FrameType::Finished;
        frame.isFinal = true;
        return QList<StreamFrame>{frame};
    }

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(event.data, &err);
    if (err.error != QJsonParseError::NoError) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("Failed to parse OpenAI chunk JSON: ") + err.errorString()));
    }

    QJsonObject root = doc.object();
    if (root.contains(QStringLiteral("error"))) {
        StreamFrame frame;
        frame.type = FrameType::Failed;
        const QJsonObject errorObj = root.value(QStringLiteral("error")).toObject();
        frame.failure = DomainFailure::unavailable(errorObj.value(QStringLiteral("message")).toString());
        frame.failure.upstreamBody = event.data;
        frame.isFinal = true;
        return QList<StreamFrame>{frame};
    }

    QJsonArray choices = root.value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty()) {
        QJsonObject usage = root.value(QStringLiteral("usage")).toObject();
        StreamFrame frame;
        frame.type = usage.isEmpty() ? FrameType::Delta : FrameType::UsageDelta;
        frame.responseId = root.value(QStringLiteral("id")).toString();
        frame.model = root.value(QStringLiteral("model")).toString();
        frame.usageDelta.promptTokens = usage.value(QStringLiteral("prompt_tokens")).toInt();
        frame.usageDelta.completionTokens = usage.value(QStringLiteral("completion_tokens")).toInt();
        frame.usageDelta.totalTokens = usage.value(QStringLiteral("total_tokens")).toInt();
        return QList<StreamFrame>{frame};
    }

    QJsonObject choiceObj = choices.first().toObject();
    int index = choiceObj.value(QStringLiteral("index")).toInt();
    QJsonObject delta = choiceObj.value(QStringLiteral("delta")).toObject();

    QList<StreamFrame> frames = parseDeltaChunk(delta, index);
    for (StreamFrame& frame : frames) {
        frame.responseId = root.value(QStringLiteral("id")).toString();
        frame.model = root.value(QStringLiteral("model")).toString();
    }

    // The finish chunk is not the end of the stream: usage and [DONE] follow.
    const QJsonValue finishReason = choiceObj.value(QStringLiteral("finish_reason"));
    if (finishReason.isString() && !finishReason.toString().isEmpty())
        frames.last().stopCause = stopCauseFromFinishReason(finishReason.toString());

    return frames;
}

DomainFailure OpenAIOutbound::mapFailure(int httpStatus, const QByteArray& body)
{
    DomainFailure failure = DomainFailure::upstreamHttp(httpStatus, body);
    if (failure.message == QStringLiteral("Upstream returned HTTP %1").arg(httpStatus))
        failure.message = QStringLiteral("OpenAI API error (HTTP %1)").arg(httpStatus);
    failure.code = QStringLiteral("openai.http_%1").arg(httpStatus);
    return failure;
}

// ---------------------------------------------------------------------------
// Protected helpers
// ---------------------------------------------------------------------------

QJsonArray OpenAIOutbound::buildMessages(const QList<ChatMessage>& items) const
{
    QJsonArray messages;
    for (const auto& item : items) {
        QJsonObject msg;
        msg[QStringLiteral("role")] = item.role;

        if (item.role == QStringLiteral("tool")) {
            msg[QStringLiteral("tool_call_id")] = item.toolCallId;
            QString textContent;
            for (const auto& seg : item.content) {
                if (seg.kind == SegmentKind::Text) {
                    textContent += seg.text;
                }
            }
            msg[QStringLiteral("content")] = textContent;
        } else if (std::all_of(item.content.cbegin(), item.content.cend(),
                               [](const Segment& s) { return s.kind != SegmentKind::Media; })) {
            QString textContent;
            for (const auto& seg : item.content) {
                if (seg.kind == SegmentKind::Text)
                    textContent += seg.text;
            }
            if (textContent.isEmpty() && !item.toolCalls.isEmpty())
                msg[QStringLiteral("content")] = QJsonValue::Null;
            else
                msg[QStringLiteral("content")] = textContent;
        } else {
            QJsonArray contentArr;
            for (const auto& seg : item.content) {
                QJsonObject part;
                if (seg.kind == SegmentKind::Text) {
                    part[QStringLiteral("type")] = QStringLiteral("text");
                    part[QStringLiteral("text")] = seg.text;
                } else if (seg.kind == SegmentKind::Media) {
                    part[QStringLiteral("type")] = QStringLiteral("image_url");
                    QJsonObject imageUrl;
                    if (!seg.media.uri.isEmpty()) {
                        imageUrl[QStringLiteral("url")] = seg.media.uri;
                    } else if (!seg.media.inlineData.isEmpty()) {
                        QString dataUri = QStringLiteral("data:") + seg.media.mimeType
                                          + QStringLiteral(";base64,")
                                          + QString::fromLatin1(seg.media.inlineData.toBase64());
                        imageUrl[QStringLiteral("url")] = dataUri;
                    }
                    part[QStringLiteral("image_url")] = imageUrl;
                } else {
                    // thinking blocks have no chat-completions equivalent
                    continue;
                }
                contentArr.append(part);
            }
            msg[QStringLiteral("content")] = contentArr;
        }

        if (!item.toolCalls.isEmpty()) {
            QJsonArray tcArr;
            for (const auto& tc : item.toolCalls) {
                QJsonObject tcObj;
                tcObj[QStringLiteral("id")] = tc.callId;
                tcObj[QStringLiteral("type")] = QStringLiteral("function");
                QJsonObject fn;
                fn[QStringLiteral("name")] = tc.name;
                fn[QStringLiteral("arguments")] = tc.args;
                tcObj[QStringLiteral("function")] = fn;
                tcArr.append(tcObj);
            }
            msg[QStringLiteral("tool_calls")] = tcArr;
        }

        messages.append(msg);
    }
    return messages;
}

QJsonArray OpenAIOutbound::buildToolDefs(const QList<ToolSpec>& tools) const
{
    QJsonArray arr;
    for (const auto& tool : tools) {
        QJsonObject toolObj;
        toolObj[QStringLiteral("type")] = QStringLiteral("function");
        QJsonObject fn;
        fn[QStringLiteral("name")] = tool.name;
        fn[QStringLiteral("description")] = tool.description;
        fn[QStringLiteral("parameters")] = tool.parameters;
        toolObj[QStringLiteral("function")] = fn;
        arr.append(toolObj);
    }
    return arr;
}

void OpenAIOutbound::buildConstraints(QJsonObject& body, const SamplingOptions& constraints) const
{
    if (constraints.temperature.has_value()) {
        body[QStringLiteral("temperature")] = constraints.temperature.value();
    }
    if (constraints.topP.has_value()) {
        body[QStringLiteral("top_p")] = constraints.topP.value();
    }
    if (constraints.maxTokens.has_value()) {
        body[QStringLiteral("max_tokens")] = constraints.maxTokens.value();
    }
    if (constraints.maxCompletionTokens.has_value()) {
        body[QStringLiteral("max_completion_tokens")] = constraints.maxCompletionTokens.value();
    }
    if (constraints.seed.has_value()) {
        body[QStringLiteral("seed")] = constraints.seed.value();
    }
    if (constraints.frequencyPenalty.has_value()) {
        body[QStringLiteral("frequency_penalty")] = constraints.frequencyPenalty.value();
    }
    if (constraints.presencePenalty.has_value()) {
        body[QStringLiteral("presence_penalty")] = constraints.presencePenalty.value();
    }
    if (!constraints.toolChoice.isEmpty()) {
        const QString& choice = constraints.toolChoice;
        if (choice == QStringLiteral("auto") || choice == QStringLiteral("none")
            || choice == QStringLiteral("required")) {
            body[QStringLiteral("tool_choice")] = choice;
        } else {
            QJsonObject fn;
            fn[QStringLiteral("name")] = choice;
            QJsonObject tc;
            tc[QStringLiteral("type")] = QStringLiteral("function");
            tc[QStringLiteral("function")] = fn;
            body[QStringLiteral("tool_choice")] = tc;
        }
    }
    if (!constraints.stopSequences.isEmpty()) {
        QJsonArray stopArr;
        for (const auto& s : constraints.stopSequences) {
            stopArr.append(s);
        }
        body[QStringLiteral("stop")] = stopArr;
    }
}

ChatChoice OpenAIOutbound::parseChoice(const QJsonObject& choice) const
{
    ChatChoice c;
    c.index = choice.value(QStringLiteral("index")).toInt();

    QJsonObject msg = choice.value(QStringLiteral("message")).toObject();
    c.role = msg.value(QStringLiteral("role")).toString(QStringLiteral("assistant"));

    QJsonValue contentVal = msg.value(QStringLiteral("content"));
    if (contentVal.isString()) {
        c.output.append(Segment::fromText(contentVal.toString()));
    } else if (contentVal.isArray()) {
        QJsonArray contentArr = contentVal.toArray();
        for (const QJsonValue& part : contentArr) {
            QJsonObject partObj = part.toObject();
            QString type = partObj.value(QStringLiteral("type")).toString();
            if (type == QStringLiteral("text")) {
                c.output.append(Segment::fromText(partObj.value(QStringLiteral("text")).toString()));
            }
        }
    }

    QJsonArray toolCalls = msg.value(QStringLiteral("tool_calls")).toArray();
    for (const QJsonValue& tcv : toolCalls) {
        c.toolCalls.append(parseToolCall(tcv.toObject()));
    }

    c.stopCause = stopCauseFromFinishReason(
        choice.value(QStringLiteral("finish_reason")).toString());

    return c;
}

ToolCall OpenAIOutbound::parseToolCall(const QJsonObject& tc) const
{
    ToolCall call;
    call.callId = tc.value(QStringLiteral("id")).toString();
    QJsonObject fn = tc.value(QStringLiteral("function")).toObject();
    call.name = fn.value(QStringLiteral("name")).toString();
    call.args = fn.value(QStringLiteral("arguments")).toString();
    return call;
}

QList<StreamFrame> OpenAIOutbound::parseDeltaChunk(const QJsonObject& delta, int index) const
{
    QList<StreamFrame> frames;

    QString content = delta.value(QStringLiteral("content")).toString();
    if (!content.isEmpty()) {
        StreamFrame frame;
        frame.choiceIndex = index;
        frame.type = FrameType::Delta;
        frame.deltaSegments.append(Segment::fromText(content));
        frames.append(frame);
    }

    // Parallel calls may all arrive in a single delta.
    const QJsonArray toolCallsDelta = delta.value(QStringLiteral("tool_calls")).toArray();
    for (const QJsonValue& tcv : toolCallsDelta) {
        const QJsonObject tcObj = tcv.toObject();
        StreamFrame frame;
        frame.choiceIndex = index;
        frame.type = FrameType::ToolDelta;
        frame.toolDelta.index = tcObj.value(QStringLiteral("index")).toInt();
        frame.toolDelta.callId = tcObj.value(QStringLiteral("id")).toString();
        QJsonObject fn = tcObj.value(QStringLiteral("function")).toObject();
        frame.toolDelta.name = fn.value(QStringLiteral("name")).toString();
        frame.toolDelta.argsPatch = fn.value(QStringLiteral("arguments")).toString();
        frames.append(frame);
    }

    if (frames.isEmpty()) {
        // role-only or empty delta
        StreamFrame frame;
        frame.choiceIndex = index;
        frame.type = delta.contains(QStringLiteral("role")) ? FrameType::Started : FrameType::Delta;
        frames.append(frame);
    }
    return frames;
}

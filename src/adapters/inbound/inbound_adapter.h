#pragma once
#include "semantic/ports.h"
#include "semantic/sse_event.h"
#include "semantic/wire_format.h"
#include <QHash>
#include <QJsonObject>
#include <QList>

// Per-stream bookkeeping for rendering frames in the client's dialect.
// One instance lives for exactly one stream.
struct StreamEncodeState {
    QString responseId;
    QString model;
    bool started = false;
    bool finished = false;
    int openBlock = -1;          // index of the open content block, -1 if none
    bool openBlockIsText = false;
    int nextBlock = 0;
    QHash<int, int> toolIndex;   // upstream tool index -> client tool index
    int toolCount = 0;
    TokenUsage usage;
};

// Client-facing side: decodes what the client sent and renders what the
// client receives.
class IInboundAdapter {
public:
    virtual ~IInboundAdapter() = default;
    virtual WireFormat format() const = 0;
    virtual Result<ChatRequest> decodeRequest(const QJsonObject& body) = 0;
    virtual Result<QJsonObject> encodeResponse(const ChatResponse& response) = 0;
    virtual Result<QList<SseEvent>> encodeStreamEvents(const StreamFrame& frame,
                                                       StreamEncodeState& state) = 0;
    virtual QJsonObject encodeFailure(const DomainFailure& failure) = 0;
};

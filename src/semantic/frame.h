#pragma once
#include "failure.h"
#include "message.h"
#include "types.h"
#include <QList>
#include <QString>
#include <optional>

// One provider-neutral streaming step, produced by an outbound adapter from
// an upstream event and rendered by an inbound adapter for the client.
struct StreamFrame {
    FrameType type = FrameType::Delta;
    int choiceIndex = 0;
    QString responseId;
    QString model;
    QList<Segment> deltaSegments;
    ToolCallDelta toolDelta;
    TokenUsage usageDelta;
    std::optional<StopCause> stopCause;   // set once the provider reports why it stopped
    DomainFailure failure;
    bool isFinal = false;
};

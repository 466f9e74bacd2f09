#pragma once
#include "adapters/inbound/inbound_adapter.h"
#include "adapters/outbound/outbound_adapter.h"
#include <QList>
#include <optional>

// Rewrites one upstream event stream into the client's dialect. With no
// outbound adapter the stream is passed through unchanged.
class StreamTranslator {
public:
    StreamTranslator(IOutboundAdapter* outbound, IInboundAdapter* inbound);

    bool isPassthrough() const { return m_outbound == nullptr; }
    bool isFinished() const { return m_finished; }

    Result<QList<SseEvent>> translate(const SseEvent& upstream);

    // Closes a stream whose upstream ended without a terminal event.
    QList<SseEvent> finish();

    // Client-dialect events reporting a failure and ending the stream.
    QList<SseEvent> failureEvents(const DomainFailure& failure);
    // Same, for a stream whose terminal event was produced here but never
    // reached the client. Works after isFinished().
    QList<SseEvent> failureEventsReplacingTerminal(const DomainFailure& failure);

    // message_stop, [DONE] and error events end a stream in either dialect.
    static bool isTerminal(const SseEvent& event);

private:
    IOutboundAdapter* m_outbound;
    IInboundAdapter* m_inbound;
    StreamEncodeState m_state;
    std::optional<StopCause> m_stopCause;
    bool m_finished = false;
};

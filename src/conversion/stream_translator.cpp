#include "conversion/stream_translator.h"

StreamTranslator::StreamTranslator(IOutboundAdapter* outbound, IInboundAdapter* inbound)
    : m_outbound(outbound)
    , m_inbound(inbound)
{
    Q_ASSERT(m_inbound);
}

bool StreamTranslator::isTerminal(const SseEvent& event)
{
    if (event.isDone())
        return true;
    QString type = event.event;
    if (type.isEmpty())
        type = event.json().value(QStringLiteral("type")).toString();
    return type == QStringLiteral("message_stop") || type == QStringLiteral("error");
}

Result<QList<SseEvent>> StreamTranslator::translate(const SseEvent& upstream)
{
    if (m_finished)
        return QList<SseEvent>();

    if (isPassthrough()) {
        if (isTerminal(upstream))
            m_finished = true;
        return QList<SseEvent>{upstream};
    }

    auto parsed = m_outbound->parseChunk(upstream);
    if (!parsed)
        return std::unexpected(parsed.error());

    QList<SseEvent> out;
    for (StreamFrame frame : *parsed) {
        if (frame.stopCause)
            m_stopCause = frame.stopCause;

        if (frame.type == FrameType::Delta && frame.deltaSegments.isEmpty())
            continue;

        if (frame.type == FrameType::Finished && !frame.stopCause)
            frame.stopCause = m_stopCause;

        auto events = m_inbound->encodeStreamEvents(frame, m_state);
        if (!events)
            return std::unexpected(events.error());
        out.append(*events);

        if (frame.type == FrameType::Finished || frame.type == FrameType::Failed) {
            m_finished = true;
            break;
        }
    }
    return out;
}

QList<SseEvent> StreamTranslator::finish()
{
    if (m_finished)
        return {};
    m_finished = true;
    if (isPassthrough())
        return {};

    StreamFrame frame;
    frame.type = FrameType::Finished;
    frame.stopCause = m_stopCause;
    frame.isFinal = true;
    auto events = m_inbound->encodeStreamEvents(frame, m_state);
    return events ? *events : QList<SseEvent>();
}

QList<SseEvent> StreamTranslator::failureEvents(const DomainFailure& failure)
{
    if (m_finished)
        return {};
    m_finished = true;

    StreamFrame frame;
    frame.type = FrameType::Failed;
    frame.failure = failure;
    frame.isFinal = true;
    auto events = m_inbound->encodeStreamEvents(frame, m_state);
    return events ? *events : QList<SseEvent>();
}

QList<SseEvent> StreamTranslator::failureEventsReplacingTerminal(const DomainFailure& failure)
{
    m_finished = true;
    m_state.finished = false;

    StreamFrame frame;
    frame.type = FrameType::Failed;
    frame.failure = failure;
    frame.isFinal = true;
    auto events = m_inbound->encodeStreamEvents(frame, m_state);
    m_state.finished = true;
    return events ? *events : QList<SseEvent>();
}

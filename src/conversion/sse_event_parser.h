#pragma once
#include "semantic/sse_event.h"
#include <QByteArray>
#include <QList>

// Incremental server-sent-events parser. Bytes may arrive split anywhere;
// complete events are returned as soon as their terminating blank line is
// seen.
class SseEventParser {
public:
    QList<SseEvent> feed(const QByteArray& bytes);

    // Emits a trailing event that was not terminated by a blank line.
    QList<SseEvent> flush();

    bool hasPending() const { return !m_buffer.isEmpty(); }

private:
    QByteArray m_buffer;

    static bool parseBlock(const QByteArray& block, SseEvent& out);
};

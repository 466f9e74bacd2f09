#include "conversion/sse_event_parser.h"

QList<SseEvent> SseEventParser::feed(const QByteArray& bytes)
{
    m_buffer.append(bytes);

    QList<SseEvent> events;
    while (true) {
        // Events end at a blank line. The longer "\r\n\r\n" delimiter is
        // checked first to avoid partial matches.
        qsizetype delimPos = -1;
        qsizetype delimLen = 0;

        const qsizetype crlfPos = m_buffer.indexOf("\r\n\r\n");
        const qsizetype lfPos = m_buffer.indexOf("\n\n");

        if (crlfPos >= 0 && (lfPos < 0 || crlfPos <= lfPos)) {
            delimPos = crlfPos;
            delimLen = 4;
        } else if (lfPos >= 0) {
            delimPos = lfPos;
            delimLen = 2;
        }

        if (delimPos < 0)
            break;

        const QByteArray block = m_buffer.left(delimPos);
        m_buffer.remove(0, delimPos + delimLen);

        SseEvent event;
        if (parseBlock(block, event))
            events.append(event);
    }
    return events;
}

QList<SseEvent> SseEventParser::flush()
{
    QList<SseEvent> events;
    if (m_buffer.trimmed().isEmpty()) {
        m_buffer.clear();
        return events;
    }
    SseEvent event;
    if (parseBlock(m_buffer, event))
        events.append(event);
    m_buffer.clear();
    return events;
}

bool SseEventParser::parseBlock(const QByteArray& block, SseEvent& out)
{
    QString eventType;
    QList<QByteArray> dataLines;

    const QList<QByteArray> lines = block.split('\n');
    for (const QByteArray& rawLine : lines) {
        QByteArray line = rawLine;
        if (line.endsWith('\r'))
            line.chop(1);

        if (line.isEmpty() || line.startsWith(':'))
            continue;   // blank or keepalive comment

        if (line.startsWith("event:")) {
            eventType = QString::fromUtf8(line.mid(6).trimmed());
        } else if (line.startsWith("data:")) {
            QByteArray value = line.mid(5);
            if (value.startsWith(' '))
                value.remove(0, 1);
            dataLines.append(value);
        }
        // id: and retry: are not used; unknown fields are ignored
    }

    // An event with no data carries nothing to forward
    if (dataLines.isEmpty())
        return false;

    out.event = eventType;
    out.data = dataLines.join('\n');
    return true;
}

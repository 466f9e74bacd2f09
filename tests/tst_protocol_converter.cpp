#include <QTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include "conversion/protocol_converter.h"

namespace {

QJsonObject anthropicRequest()
{
    return QJsonDocument::fromJson(R"({
        "model": "claude-3-5-sonnet",
        "max_tokens": 256,
        "system": "Be terse.",
        "messages": [{"role": "user", "content": [{"type": "text", "text": "Hi"}]}],
        "stream": true
    })").object();
}

QStringList translatedNames(StreamTranslator& translator, const QList<SseEvent>& upstream)
{
    QStringList names;
    for (const SseEvent& event : upstream) {
        auto out = translator.translate(event);
        if (!out)
            return {QStringLiteral("<error>")};
        for (const SseEvent& e : *out)
            names.append(e.isDone() ? QStringLiteral("[DONE]") : e.event);
    }
    return names;
}

}

class TestProtocolConverter : public QObject {
    Q_OBJECT

private slots:
    void testPassthroughIsNoOp() {
        ProtocolConverter converter;
        QVERIFY(ProtocolConverter::isPassthrough(WireFormat::OpenAI, WireFormat::OpenAI));

        const QJsonObject body{{QStringLiteral("model"), QStringLiteral("gpt-4o")},
                               {QStringLiteral("custom_field"), 1}};
        auto request = converter.convertRequest(body, WireFormat::OpenAI, WireFormat::OpenAI);
        QVERIFY(request.has_value());
        QCOMPARE(*request, body);

        auto response = converter.convertResponse(body, WireFormat::Anthropic, WireFormat::Anthropic);
        QCOMPARE(*response, body);

        auto translator = converter.createStreamTranslator(WireFormat::OpenAI, WireFormat::OpenAI);
        QVERIFY(translator->isPassthrough());
        const SseEvent raw{QString(), R"({"anything":true})"};
        auto out = translator->translate(raw);
        QCOMPARE(out->size(), 1);
        QCOMPARE(out->first().data, raw.data);
    }

    void testAnthropicRequestToOpenAI() {
        ProtocolConverter converter;
        auto body = converter.convertRequest(anthropicRequest(), WireFormat::Anthropic, WireFormat::OpenAI);
        QVERIFY(body.has_value());

        const QJsonArray messages = (*body)[QStringLiteral("messages")].toArray();
        QCOMPARE(messages.size(), 2);
        QCOMPARE(messages[0].toObject()[QStringLiteral("role")].toString(), QStringLiteral("system"));
        QCOMPARE(messages[0].toObject()[QStringLiteral("content")].toString(), QStringLiteral("Be terse."));
        QCOMPARE(messages[1].toObject()[QStringLiteral("content")].toString(), QStringLiteral("Hi"));
        QCOMPARE((*body)[QStringLiteral("max_tokens")].toInt(), 256);
        QVERIFY((*body)[QStringLiteral("stream")].toBool());
    }

    void testOpenAIRequestToAnthropic() {
        ProtocolConverter converter;
        const QJsonObject request = QJsonDocument::fromJson(R"({
            "model": "claude-3-5-sonnet",
            "messages": [{"role": "system", "content": "S"}, {"role": "user", "content": "Q"}]
        })").object();
        auto body = converter.convertRequest(request, WireFormat::OpenAI, WireFormat::Anthropic);
        QVERIFY(body.has_value());
        QCOMPARE((*body)[QStringLiteral("system")].toString(), QStringLiteral("S"));
        QCOMPARE((*body)[QStringLiteral("messages")].toArray().size(), 1);
        QCOMPARE((*body)[QStringLiteral("max_tokens")].toInt(), AnthropicOutbound::kDefaultMaxTokens);
    }

    void testMalformedRequestIsRejected() {
        ProtocolConverter converter;
        auto body = converter.convertRequest(QJsonObject{{QStringLiteral("model"), QStringLiteral("x")}},
                                             WireFormat::Anthropic, WireFormat::OpenAI);
        QVERIFY(!body.has_value());
        QCOMPARE(body.error().kind, ErrorKind::InvalidInput);
    }

    void testOpenAIResponseToAnthropic() {
        ProtocolConverter converter;
        const QJsonObject upstream = QJsonDocument::fromJson(R"({
            "id": "chatcmpl-1", "model": "gpt-4o",
            "choices": [{"index": 0, "finish_reason": "stop",
                         "message": {"role": "assistant", "content": "Hello"}}],
            "usage": {"prompt_tokens": 5, "completion_tokens": 1, "total_tokens": 6}
        })").object();

        auto body = converter.convertResponse(upstream, WireFormat::Anthropic, WireFormat::OpenAI);
        QVERIFY(body.has_value());
        QCOMPARE((*body)[QStringLiteral("type")].toString(), QStringLiteral("message"));
        QCOMPARE((*body)[QStringLiteral("stop_reason")].toString(), QStringLiteral("end_turn"));
        QCOMPARE((*body)[QStringLiteral("content")].toArray()[0].toObject()[QStringLiteral("text")].toString(),
                 QStringLiteral("Hello"));
        QCOMPARE((*body)[QStringLiteral("usage")].toObject()[QStringLiteral("input_tokens")].toInt(), 5);
    }

    void testOpenAIStreamToAnthropic() {
        ProtocolConverter converter;
        auto translator = converter.createStreamTranslator(WireFormat::Anthropic, WireFormat::OpenAI);
        QVERIFY(!translator->isPassthrough());

        const QStringList names = translatedNames(*translator, {
            SseEvent{QString(), R"({"id":"c1","model":"gpt-4o","choices":[{"index":0,"delta":{"role":"assistant"}}]})"},
            SseEvent{QString(), R"({"id":"c1","choices":[{"index":0,"delta":{"content":"Hel"}}]})"},
            SseEvent{QString(), R"({"id":"c1","choices":[{"index":0,"delta":{"content":"lo"}}]})"},
            SseEvent{QString(), R"({"id":"c1","choices":[{"index":0,"delta":{},"finish_reason":"length"}]})"},
            SseEvent::done(),
        });
        QCOMPARE(names, QStringList({QStringLiteral("message_start"),
                                     QStringLiteral("content_block_start"),
                                     QStringLiteral("content_block_delta"),
                                     QStringLiteral("content_block_delta"),
                                     QStringLiteral("content_block_stop"),
                                     QStringLiteral("message_delta"),
                                     QStringLiteral("message_stop")}));
        QVERIFY(translator->isFinished());
        QVERIFY(translator->finish().isEmpty());
    }

    void testParallelToolCallsInOneDelta() {
        ProtocolConverter converter;
        auto translator = converter.createStreamTranslator(WireFormat::Anthropic, WireFormat::OpenAI);

        QList<SseEvent> out;
        const QList<SseEvent> upstream = {
            SseEvent{QString(), R"({"id":"c1","model":"gemini-2.5-pro","choices":[{"index":0,"delta":{"role":"assistant"}}]})"},
            SseEvent{QString(), R"({"id":"c1","choices":[{"index":0,"delta":{"tool_calls":[
                {"index":0,"id":"call_a","type":"function","function":{"name":"weather","arguments":"{\"city\":\"Oslo\"}"}},
                {"index":1,"id":"call_b","type":"function","function":{"name":"time","arguments":"{}"}}]},
                "finish_reason":"tool_calls"}]})"},
            SseEvent::done(),
        };
        for (const SseEvent& event : upstream) {
            auto events = translator->translate(event);
            QVERIFY(events.has_value());
            out.append(*events);
        }

        QStringList toolIds;
        QList<int> blockIndexes;
        for (const SseEvent& e : out) {
            if (e.event != QStringLiteral("content_block_start"))
                continue;
            const QJsonObject block = e.json()[QStringLiteral("content_block")].toObject();
            QCOMPARE(block[QStringLiteral("type")].toString(), QStringLiteral("tool_use"));
            toolIds.append(block[QStringLiteral("id")].toString());
            blockIndexes.append(e.json()[QStringLiteral("index")].toInt());
        }
        QCOMPARE(toolIds, QStringList({QStringLiteral("call_a"), QStringLiteral("call_b")}));
        QCOMPARE(blockIndexes, QList<int>({0, 1}));

        const SseEvent& messageDelta = out[out.size() - 2];
        QCOMPARE(messageDelta.event, QStringLiteral("message_delta"));
        QCOMPARE(messageDelta.json()[QStringLiteral("delta")].toObject()[QStringLiteral("stop_reason")].toString(),
                 QStringLiteral("tool_use"));
        QCOMPARE(out.last().event, QStringLiteral("message_stop"));
    }

    void testAnthropicStreamToOpenAI() {
        ProtocolConverter converter;
        auto translator = converter.createStreamTranslator(WireFormat::OpenAI, WireFormat::Anthropic);

        QList<SseEvent> out;
        const QList<SseEvent> upstream = {
            SseEvent{QStringLiteral("message_start"),
                     R"({"type":"message_start","message":{"id":"msg_1","model":"claude","usage":{"input_tokens":3}}})"},
            SseEvent{QStringLiteral("content_block_start"),
                     R"({"type":"content_block_start","index":0,"content_block":{"type":"text","text":""}})"},
            SseEvent{QStringLiteral("content_block_delta"),
                     R"({"type":"content_block_delta","index":0,"delta":{"type":"text_delta","text":"Hi"}})"},
            SseEvent{QStringLiteral("message_delta"),
                     R"({"type":"message_delta","delta":{"stop_reason":"end_turn"},"usage":{"output_tokens":2}})"},
            SseEvent{QStringLiteral("message_stop"), R"({"type":"message_stop"})"},
        };
        for (const SseEvent& event : upstream) {
            auto events = translator->translate(event);
            QVERIFY(events.has_value());
            out.append(*events);
        }

        QCOMPARE(out.size(), 4);
        QCOMPARE(out[0].json()[QStringLiteral("id")].toString(), QStringLiteral("msg_1"));
        QCOMPARE(out[1].json()[QStringLiteral("choices")].toArray()[0].toObject()
                     [QStringLiteral("delta")].toObject()[QStringLiteral("content")].toString(),
                 QStringLiteral("Hi"));
        QCOMPARE(out[2].json()[QStringLiteral("choices")].toArray()[0].toObject()
                     [QStringLiteral("finish_reason")].toString(),
                 QStringLiteral("stop"));
        QVERIFY(out[3].isDone());
    }

    void testTruncatedStreamIsClosed() {
        ProtocolConverter converter;
        auto translator = converter.createStreamTranslator(WireFormat::Anthropic, WireFormat::OpenAI);
        QVERIFY(translator->translate(SseEvent{QString(),
            R"({"choices":[{"index":0,"delta":{"content":"x"}}]})"}).has_value());

        QStringList names;
        for (const SseEvent& e : translator->finish())
            names.append(e.event);
        QCOMPARE(names.last(), QStringLiteral("message_stop"));
        QVERIFY(translator->translate(SseEvent::done())->isEmpty());
    }

    void testFailureEventsInClientDialect() {
        ProtocolConverter converter;
        auto translator = converter.createStreamTranslator(WireFormat::Anthropic, WireFormat::OpenAI);
        const QList<SseEvent> events =
            translator->failureEvents(DomainFailure::rateLimited(QStringLiteral("slow down")));
        QCOMPARE(events.size(), 1);
        QCOMPARE(events[0].event, QStringLiteral("error"));
        QVERIFY(translator->failureEvents(DomainFailure::internal(QStringLiteral("again"))).isEmpty());
    }

    void testFailureCanReplaceUndeliveredTerminal() {
        ProtocolConverter converter;
        auto translator = converter.createStreamTranslator(WireFormat::Anthropic, WireFormat::OpenAI);
        QVERIFY(translator->translate(SseEvent{QString(),
            R"({"choices":[{"index":0,"delta":{"content":"x"}}]})"}).has_value());
        QVERIFY(!translator->translate(SseEvent::done())->isEmpty());
        QVERIFY(translator->isFinished());
        QVERIFY(translator->failureEvents(DomainFailure::internal(QStringLiteral("late"))).isEmpty());

        const QList<SseEvent> events = translator->failureEventsReplacingTerminal(
            DomainFailure::internal(QStringLiteral("late")));
        QCOMPARE(events.size(), 1);
        QCOMPARE(events[0].event, QStringLiteral("error"));
        QVERIFY(translator->translate(SseEvent::done())->isEmpty());
    }

    void testUpstreamFailureMapping() {
        ProtocolConverter converter;
        const DomainFailure failure = converter.mapUpstreamFailure(
            429, R"({"error":{"message":"quota"}})", WireFormat::OpenAI);
        QCOMPARE(failure.kind, ErrorKind::RateLimited);

        const QJsonObject encoded = converter.encodeFailure(failure, WireFormat::Anthropic);
        QCOMPARE(encoded[QStringLiteral("error")].toObject()[QStringLiteral("type")].toString(),
                 QStringLiteral("rate_limit_error"));
    }
};

QTEST_MAIN(TestProtocolConverter)
#include "tst_protocol_converter.moc"

#include <drogon/drogon_test.h>
#include "../adapters/StreamReconstructor.h"
#include "../utils/JsonUtils.h"

using namespace anthropic;

namespace {

Json::Value chunk(const std::string& json) {
    Json::Value value;
    jsonutil::parse(json, value);
    return value;
}

PacingOptions noPacing() {
    return PacingOptions::toolCallDefaults(false);
}

/**
 * 检查事件序列语法：一个 message_start 开头，块按 index 递增且 start/stop 配对，
 * 以 message_delta + message_stop 结尾
 */
bool wellFormed(const std::vector<StreamEvent>& events) {
    if (events.size() < 3 || !std::holds_alternative<MessageStart>(events.front())) {
        return false;
    }
    int expectedIndex = 0;
    bool open = false;
    for (size_t i = 1; i + 2 < events.size(); ++i) {
        const auto& e = events[i];
        if (const auto* start = std::get_if<ContentBlockStart>(&e)) {
            if (open || start->index != expectedIndex) return false;
            open = true;
        } else if (const auto* delta = std::get_if<ContentBlockDelta>(&e)) {
            if (!open || delta->index != expectedIndex) return false;
        } else if (const auto* stop = std::get_if<ContentBlockStop>(&e)) {
            if (!open || stop->index != expectedIndex) return false;
            open = false;
            ++expectedIndex;
        } else {
            return false;
        }
    }
    return !open &&
           std::holds_alternative<MessageDelta>(events[events.size() - 2]) &&
           std::holds_alternative<MessageStop>(events.back());
}

/// 发送若干事件后模拟客户端断开
class DisconnectingSink : public CollectorSink {
public:
    explicit DisconnectingSink(size_t limit) : limit_(limit) {}
    bool isValid() const override { return getEvents().size() < limit_; }

private:
    size_t limit_;
};

}

DROGON_TEST(StreamReconstructor_TextOnly)
{
    CollectorSink sink;
    ToolPhraseTable phrases;
    StreamReconstructor reconstructor(sink, "claude-3-5-sonnet-20241022", phrases, noPacing());
    reconstructor.run({
        chunk(R"({"choices":[{"delta":{"role":"assistant","content":"Hel"}}]})"),
        chunk(R"({"choices":[{"delta":{"content":"lo"}}]})"),
        chunk(R"({"choices":[{"delta":{},"finish_reason":"stop"}],"usage":{"prompt_tokens":9,"completion_tokens":2}})"),
    });

    const auto& events = sink.getEvents();
    CHECK(wellFormed(events));
    CHECK(sink.getText(0) == "Hello");
    const auto& start = std::get<MessageStart>(events.front());
    CHECK(start.model == "claude-3-5-sonnet-20241022");
    CHECK(start.id.rfind("msg_", 0) == 0);

    const auto& delta = std::get<MessageDelta>(events[events.size() - 2]);
    CHECK(delta.stopReason == "end_turn");
    CHECK(delta.usage.inputTokens == 9);
    CHECK(delta.usage.outputTokens == 2);
    CHECK(!sink.isClosed());
}

DROGON_TEST(StreamReconstructor_ToolCallFragmentsAccumulate)
{
    CollectorSink sink;
    ToolPhraseTable phrases;
    StreamReconstructor reconstructor(sink, "m", phrases, noPacing());
    reconstructor.run({
        chunk(R"({"choices":[{"delta":{"tool_calls":[{"index":0,"id":"call_9","function":{"name":"get_weather"}}]}}]})"),
        chunk(R"({"choices":[{"delta":{"tool_calls":[{"index":0,"function":{"arguments":"{\"loc"}}]}}]})"),
        chunk(R"({"choices":[{"delta":{"tool_calls":[{"index":0,"function":{"arguments":"\":\"NYC\"}"}}]}}]})"),
        chunk(R"({"choices":[{"delta":{},"finish_reason":"tool_calls"}]})"),
    });

    REQUIRE(reconstructor.toolCalls().size() == 1);
    CHECK(reconstructor.toolCalls().at(0).arguments == R"({"loc":"NYC"})");

    const auto& events = sink.getEvents();
    CHECK(wellFormed(events));
    // 说明短句在 index 0，工具调用在 index 1
    CHECK(sink.getText(0) == phrases.phraseFor("get_weather"));
    CHECK(sink.getPartialJson(1) == R"({"loc":"NYC"})");

    bool sawToolStart = false;
    for (const auto& e : events) {
        if (const auto* start = std::get_if<ContentBlockStart>(&e)) {
            if (const auto* use = std::get_if<ToolUseBlock>(&start->block)) {
                sawToolStart = true;
                CHECK(start->index == 1);
                CHECK(use->id == "call_9");
                CHECK(use->name == "get_weather");
                CHECK(use->input.empty());
            }
        }
    }
    CHECK(sawToolStart);
    CHECK(std::get<MessageDelta>(events[events.size() - 2]).stopReason == "tool_use");
}

DROGON_TEST(StreamReconstructor_TextThenToolsKeepsIndexOrder)
{
    CollectorSink sink;
    ToolPhraseTable phrases;
    StreamReconstructor reconstructor(sink, "m", phrases, noPacing());
    reconstructor.run({
        chunk(R"({"choices":[{"delta":{"content":"Checking."}}]})"),
        chunk(R"({"choices":[{"delta":{"tool_calls":[{"index":1,"function":{"name":"Read","arguments":"{\"path\":\"a\"}"}}]}}]})"),
        chunk(R"({"choices":[{"delta":{"tool_calls":[{"index":0,"function":{"name":"LS","arguments":"{}"}}]}}]})"),
        chunk(R"({"choices":[{"delta":{"tool_calls":[{"index":2,"function":{"arguments":"{}"}}]}}]})"),
    });

    CHECK(wellFormed(sink.getEvents()));
    CHECK(sink.getText(0) == "Checking.");
    // index 最小的已命名调用决定说明短句
    CHECK(sink.getText(1) == phrases.phraseFor("LS"));
    CHECK(sink.getPartialJson(2) == "{}");
    CHECK(sink.getPartialJson(3) == R"({"path":"a"})");
    // 未命名的分片不产生内容块
    CHECK(sink.getPartialJson(4).empty());
}

DROGON_TEST(StreamReconstructor_EmptyStreamStillWellFormed)
{
    CollectorSink sink;
    ToolPhraseTable phrases;
    StreamReconstructor reconstructor(sink, "m", phrases, noPacing());
    reconstructor.run({});

    auto names = sink.getEventNames();
    REQUIRE(names.size() == 3);
    CHECK(names[0] == "message_start");
    CHECK(names[1] == "message_delta");
    CHECK(names[2] == "message_stop");
}

DROGON_TEST(StreamReconstructor_StopsAfterDisconnect)
{
    DisconnectingSink sink(2);
    ToolPhraseTable phrases;
    StreamReconstructor reconstructor(sink, "m", phrases, noPacing());
    reconstructor.run({
        chunk(R"({"choices":[{"delta":{"content":"a"}}]})"),
        chunk(R"({"choices":[{"delta":{"content":"b"}}]})"),
        chunk(R"({"choices":[{"delta":{"content":"c"}}]})"),
    });
    CHECK(sink.getEvents().size() == 2);
}

DROGON_TEST(StreamReconstructor_RecoverToolInput)
{
    CHECK(StreamReconstructor::recoverToolInput("").isObject());
    CHECK(StreamReconstructor::recoverToolInput("").empty());
    CHECK(StreamReconstructor::recoverToolInput(R"({"a":1})")["a"].asInt() == 1);
    CHECK(StreamReconstructor::recoverToolInput(R"({"location":"Bos)")["location"].asString() == "Bos");
    CHECK(StreamReconstructor::recoverToolInput(R"({"location":"San)")["location"].asString() == "San Francisco, CA");
    CHECK(StreamReconstructor::recoverToolInput("{garbage")["location"].asString() == "San Francisco, CA");
}

DROGON_TEST(StreamEventEmitter_SlicesByCodePoint)
{
    auto pieces = StreamEventEmitter::slice("héllo wörld", 5);
    REQUIRE(pieces.size() == 3);
    CHECK(pieces[0] == "héllo");
    CHECK(pieces[1] == " wörl");
    CHECK(pieces[2] == "d");
    CHECK(StreamEventEmitter::slice("", 5).empty());
}

DROGON_TEST(StreamEventEmitter_ReplayMessage)
{
    MessageResponse message;
    message.id = "msg_1";
    message.model = "m";
    message.content.emplace_back(TextBlock{"Let me search."});
    ServerToolUseBlock use;
    use.id = "srvtoolu_1";
    use.name = "web_search";
    use.input["query"] = "weather";
    message.content.emplace_back(use);
    WebSearchToolResultBlock result;
    result.toolUseId = "srvtoolu_1";
    message.content.emplace_back(result);
    message.usage.inputTokens = 5;
    message.usage.outputTokens = 7;

    CollectorSink sink;
    StreamEventEmitter emitter(sink, PacingOptions::replayDefaults(false));
    emitter.replayMessage(message);

    CHECK(wellFormed(sink.getEvents()));
    CHECK(sink.getText(0) == "Let me search.");
    CHECK(sink.getPartialJson(1) == R"({"query":"weather"})");
    const auto& start = std::get<MessageStart>(sink.getEvents().front());
    CHECK(start.usage.inputTokens == 5);
    CHECK(start.usage.outputTokens == 0);
}

DROGON_TEST(StreamReconstructor_UnnamedToolCallsEndTurn)
{
    CollectorSink sink;
    ToolPhraseTable phrases;
    StreamReconstructor reconstructor(sink, "m", phrases, noPacing());
    reconstructor.run({
        chunk(R"({"choices":[{"delta":{"content":"hmm"}}]})"),
        chunk(R"({"choices":[{"delta":{"tool_calls":[{"index":0,"function":{"arguments":"{}"}}]}}]})"),
        chunk(R"({"choices":[{"delta":{},"finish_reason":"tool_calls"}],"usage":{"prompt_tokens":3000000000,"completion_tokens":1}})"),
    });

    const auto& events = sink.getEvents();
    CHECK(wellFormed(events));
    for (const auto& e : events) {
        if (const auto* start = std::get_if<ContentBlockStart>(&e)) {
            CHECK(!std::holds_alternative<ToolUseBlock>(start->block));
        }
    }
    const auto& delta = std::get<MessageDelta>(events[events.size() - 2]);
    CHECK(delta.stopReason == "end_turn");
    CHECK(delta.usage.inputTokens == 0);
    CHECK(delta.usage.outputTokens == 1);
}

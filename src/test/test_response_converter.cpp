#include <drogon/drogon_test.h>
#include "../adapters/ResponseConverter.h"
#include "../adapters/ThinkingExtractor.h"
#include "../utils/JsonUtils.h"

using namespace anthropic;

namespace {

Json::Value backendResponse(const std::string& json) {
    Json::Value value;
    jsonutil::parse(json, value);
    return value;
}

}

DROGON_TEST(ResponseConverter_FinishReasonMapping)
{
    CHECK(ResponseConverter::mapFinishReason("stop") == "end_turn");
    CHECK(ResponseConverter::mapFinishReason("length") == "max_tokens");
    CHECK(ResponseConverter::mapFinishReason("tool_calls") == "tool_use");
    CHECK(ResponseConverter::mapFinishReason("function_call") == "tool_use");
    CHECK(ResponseConverter::mapFinishReason("content_filter") == "end_turn");
    CHECK(ResponseConverter::mapFinishReason("") == "end_turn");
}

DROGON_TEST(ResponseConverter_TextAndUsage)
{
    auto body = backendResponse(R"({
        "choices":[{"message":{"role":"assistant","content":"Hi there"},"finish_reason":"length"}],
        "usage":{"prompt_tokens":12,"completion_tokens":3}
    })");
    MessageResponse out;
    auto err = ResponseConverter::convert(body, "claude-3-5-sonnet-20241022", out);
    REQUIRE(!err.has_value());
    CHECK(out.model == "claude-3-5-sonnet-20241022");
    CHECK(out.id.rfind("msg_", 0) == 0);
    REQUIRE(out.content.size() == 1);
    CHECK(std::get<TextBlock>(out.content[0]).text == "Hi there");
    CHECK(out.stopReason == "max_tokens");
    CHECK(out.usage.inputTokens == 12);
    CHECK(out.usage.outputTokens == 3);
}

DROGON_TEST(ResponseConverter_ToolCallsAndBadArguments)
{
    auto body = backendResponse(R"({
        "choices":[{"message":{"content":null,"tool_calls":[
            {"id":"call_1","type":"function","function":{"name":"get_weather","arguments":"{\"location\":\"NYC\"}"}},
            {"id":"call_2","type":"function","function":{"name":"broken","arguments":"{not json"}}
        ]},"finish_reason":"tool_calls"}]
    })");
    MessageResponse out;
    REQUIRE(!ResponseConverter::convert(body, "m", out).has_value());
    REQUIRE(out.content.size() == 2);

    const auto& first = std::get<ToolUseBlock>(out.content[0]);
    CHECK(first.id == "call_1");
    CHECK(first.input["location"].asString() == "NYC");

    const auto& second = std::get<ToolUseBlock>(out.content[1]);
    CHECK(second.name == "broken");
    CHECK(second.input["arguments"].asString() == "{not json");
    CHECK(out.stopReason == "tool_use");
}

DROGON_TEST(ResponseConverter_MissingChoicesIsError)
{
    MessageResponse out;
    auto err = ResponseConverter::convert(backendResponse(R"({"choices":[]})"), "m", out);
    REQUIRE(err.has_value());
    CHECK(err->apiType() == "api_error");

    err = ResponseConverter::convert(backendResponse("[1,2]"), "m", out);
    CHECK(err.has_value());
}

DROGON_TEST(ResponseConverter_EmptyContentGetsEmptyTextBlock)
{
    MessageResponse out;
    auto body = backendResponse(R"({"choices":[{"message":{"content":""},"finish_reason":"stop"}]})");
    REQUIRE(!ResponseConverter::convert(body, "m", out).has_value());
    REQUIRE(out.content.size() == 1);
    CHECK(std::get<TextBlock>(out.content[0]).text.empty());
}

DROGON_TEST(ResponseConverter_ThinkingBlockFirst)
{
    const std::string text =
        "Let me think about the weather carefully. The pressure is dropping fast. "
        "Clouds are building in the west. Therefore it will rain today.";
    Json::Value body(Json::objectValue);
    body["choices"][0]["message"]["content"] = text;
    body["choices"][0]["finish_reason"] = "stop";

    HeuristicThinkingExtractor extractor;
    MessageResponse out;
    REQUIRE(!ResponseConverter::convert(body, "m", out, &extractor).has_value());
    REQUIRE(out.content.size() == 2);
    CHECK(std::holds_alternative<ThinkingBlock>(out.content[0]));
    CHECK(std::holds_alternative<TextBlock>(out.content[1]));
}

DROGON_TEST(ResponseConverter_OutOfRangeUsageIgnored)
{
    auto body = backendResponse(R"({
        "choices":[{"message":{"content":"ok"},"finish_reason":"stop"}],
        "usage":{"prompt_tokens":3000000000,"completion_tokens":4}
    })");
    MessageResponse out;
    std::optional<error::AppError> err;
    CHECK_NOTHROW(err = ResponseConverter::convert(body, "m", out));
    CHECK(!err.has_value());
    CHECK(out.usage.inputTokens == 0);
    CHECK(out.usage.outputTokens == 4);
}

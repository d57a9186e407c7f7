#include <drogon/drogon_test.h>
#include "../adapters/RequestConverter.h"

using namespace anthropic;

namespace {

MessageRequest simpleRequest(int maxTokens) {
    MessageRequest request;
    request.model = "claude-3-5-sonnet-20241022";
    request.maxTokens = maxTokens;
    request.system = "be brief";
    Message msg;
    msg.role = "user";
    msg.plainText = true;
    msg.content.emplace_back(TextBlock{"hello"});
    request.messages.push_back(msg);
    return request;
}

ModelMapping gpt4o(int limit) {
    return ModelMapping{"claude-3-5-sonnet-20241022", "gpt-4o", limit, ""};
}

}

DROGON_TEST(RequestConverter_ClampsMaxTokens)
{
    CHECK(RequestConverter::clampMaxTokens(100, 4096) == 100);
    CHECK(RequestConverter::clampMaxTokens(10000, 4096) == 4096);
    CHECK(RequestConverter::clampMaxTokens(20000, 32000) == RequestConverter::kHardMaxTokens);

    auto body = RequestConverter::buildChatRequest(simpleRequest(50000), gpt4o(16000));
    CHECK(body["max_tokens"].asInt() == 8192);
}

DROGON_TEST(RequestConverter_SystemFirstAndModelMapped)
{
    auto request = simpleRequest(256);
    request.temperature = 0.5;
    request.stopSequences = {"END"};
    auto body = RequestConverter::buildChatRequest(request, gpt4o(4096));

    CHECK(body["model"].asString() == "gpt-4o");
    REQUIRE(body["messages"].size() == 2);
    CHECK(body["messages"][0]["role"].asString() == "system");
    CHECK(body["messages"][0]["content"].asString() == "be brief");
    CHECK(body["messages"][1]["content"].asString() == "hello");
    CHECK(body["temperature"].asDouble() == 0.5);
    CHECK(body["stop"][0].asString() == "END");
    CHECK(!body["stream"].asBool());
}

DROGON_TEST(RequestConverter_ToolsWithoutSchemaDropped)
{
    auto request = simpleRequest(256);
    ToolDefinition search;
    search.name = "web_search";
    search.type = "web_search_20250305";
    request.tools.push_back(search);

    auto body = RequestConverter::buildChatRequest(request, gpt4o(4096));
    CHECK(!body.isMember("tools"));
    CHECK(!body.isMember("tool_choice"));

    ToolDefinition weather;
    weather.name = "get_weather";
    weather.description = "Weather lookup";
    Json::Value schema(Json::objectValue);
    schema["type"] = "object";
    weather.inputSchema = schema;
    request.tools.push_back(weather);

    body = RequestConverter::buildChatRequest(request, gpt4o(4096));
    REQUIRE(body["tools"].size() == 1);
    CHECK(body["tools"][0]["type"].asString() == "function");
    CHECK(body["tools"][0]["function"]["name"].asString() == "get_weather");
    CHECK(body["tools"][0]["function"]["parameters"]["type"].asString() == "object");
    CHECK(body["tool_choice"].asString() == "auto");
}

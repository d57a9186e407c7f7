#include <drogon/drogon_test.h>
#include "../adapters/ContentCodec.h"
#include "../protocol/AnthropicJson.h"
#include "../utils/JsonUtils.h"

using namespace anthropic;

DROGON_TEST(ContentCodec_PlainTextRoundTrip)
{
    Message msg;
    msg.role = "user";
    msg.plainText = true;
    msg.content.emplace_back(TextBlock{"hello world"});

    auto encoded = codec::encodeMessage(msg);
    REQUIRE(encoded.size() == 1);
    CHECK(encoded[0]["role"].asString() == "user");
    CHECK(encoded[0]["content"].asString() == "hello world");

    auto decoded = codec::decodeContent(encoded[0]["content"]);
    REQUIRE(decoded.size() == 1);
    const auto* text = std::get_if<TextBlock>(&decoded[0]);
    REQUIRE(text != nullptr);
    CHECK(text->text == "hello world");
}

DROGON_TEST(ContentCodec_Base64ImageBecomesDataUri)
{
    ImageBlock image;
    image.sourceType = "base64";
    image.mediaType = "image/png";
    image.data = "iVBORw0KGgo=";

    auto part = codec::encodeContentPart(image);
    REQUIRE(part.has_value());
    CHECK((*part)["type"].asString() == "image_url");
    CHECK((*part)["image_url"]["url"].asString() == "data:image/png;base64,iVBORw0KGgo=");
}

DROGON_TEST(ContentCodec_ToolUseBecomesToolCalls)
{
    Message msg;
    msg.role = "assistant";
    msg.content.emplace_back(TextBlock{"checking"});
    ToolUseBlock use;
    use.id = "toolu_1";
    use.name = "get_weather";
    use.input["location"] = "NYC";
    msg.content.emplace_back(use);

    auto encoded = codec::encodeMessage(msg);
    REQUIRE(encoded.size() == 1);
    CHECK(encoded[0]["role"].asString() == "assistant");
    CHECK(encoded[0]["content"].asString() == "checking");
    REQUIRE(encoded[0]["tool_calls"].size() == 1);
    CHECK(encoded[0]["tool_calls"][0]["id"].asString() == "toolu_1");
    CHECK(encoded[0]["tool_calls"][0]["function"]["name"].asString() == "get_weather");
    CHECK(encoded[0]["tool_calls"][0]["function"]["arguments"].asString() == R"({"location":"NYC"})");
}

DROGON_TEST(ContentCodec_ToolResultsBecomeToolMessages)
{
    Message msg;
    msg.role = "user";
    ToolResultBlock first;
    first.toolUseId = "toolu_1";
    first.content = "sunny";
    ToolResultBlock second;
    second.toolUseId = "toolu_2";
    second.content = Json::Value(Json::arrayValue);
    Json::Value item(Json::objectValue);
    item["type"] = "text";
    item["text"] = "rainy";
    second.content.append(item);
    msg.content.emplace_back(first);
    msg.content.emplace_back(second);

    auto encoded = codec::encodeMessage(msg);
    REQUIRE(encoded.size() == 2);
    CHECK(encoded[0]["role"].asString() == "tool");
    CHECK(encoded[0]["tool_call_id"].asString() == "toolu_1");
    CHECK(encoded[0]["content"].asString() == "sunny");
    CHECK(encoded[1]["tool_call_id"].asString() == "toolu_2");
    CHECK(encoded[1]["content"].asString().find("rainy") != std::string::npos);
}

DROGON_TEST(ContentCodec_UnknownBlocksDropped)
{
    Json::Value raw(Json::objectValue);
    raw["type"] = "mystery";
    auto block = parseContentBlock(raw);
    CHECK(blockTypeName(block) == "mystery");
    CHECK(!codec::encodeContentPart(block).has_value());
}

DROGON_TEST(ContentCodec_UrlImageUsedDirectly)
{
    ImageBlock image;
    image.sourceType = "url";
    image.url = "https://example.com/cat.png";

    auto part = codec::encodeContentPart(image);
    REQUIRE(part.has_value());
    CHECK((*part)["image_url"]["url"].asString() == "https://example.com/cat.png");
    CHECK((*part)["image_url"]["detail"].asString() == "auto");
}

DROGON_TEST(ContentCodec_UnsupportedImageSourceOmitted)
{
    ImageBlock image;
    image.sourceType = "file";
    image.mediaType = "image/png";
    CHECK(!codec::encodeContentPart(image).has_value());

    Message msg;
    msg.role = "user";
    msg.content.emplace_back(TextBlock{"look"});
    msg.content.emplace_back(image);
    auto encoded = codec::encodeMessage(msg);
    REQUIRE(encoded.size() == 1);
    REQUIRE(encoded[0]["content"].size() == 1);
    CHECK(encoded[0]["content"][0]["type"].asString() == "text");
}

DROGON_TEST(ContentCodec_DocumentPlaceholders)
{
    DocumentBlock pdf;
    pdf.sourceType = "base64";
    pdf.mediaType = "application/pdf";
    auto part = codec::encodeContentPart(pdf);
    REQUIRE(part.has_value());
    CHECK((*part)["type"].asString() == "text");
    CHECK((*part)["text"].asString() == "[Document: application/pdf]");

    DocumentBlock other;
    other.sourceType = "url";
    auto fallback = codec::encodeContentPart(other);
    REQUIRE(fallback.has_value());
    CHECK((*fallback)["text"].asString() == "[Document content]");
}

DROGON_TEST(ContentCodec_ThinkingBecomesText)
{
    ThinkingBlock thinking;
    thinking.thinking = "step one";
    auto part = codec::encodeContentPart(thinking);
    REQUIRE(part.has_value());
    CHECK((*part)["text"].asString() == "[Thinking: step one]");
}

DROGON_TEST(ContentCodec_ToolRoleMessageAccepted)
{
    Json::Value body;
    REQUIRE(jsonutil::parse(R"({
        "model": "claude-3-5-sonnet-20241022",
        "max_tokens": 64,
        "messages": [
            {"role": "user", "content": "weather?"},
            {"role": "tool", "content": [
                {"type": "tool_result", "tool_use_id": "toolu_9", "content": "sunny"}
            ]}
        ]
    })", body));

    MessageRequest request;
    auto err = parseMessageRequest(body, request);
    CHECK(!err.has_value());
    REQUIRE(request.messages.size() == 2);
    CHECK(request.messages[1].role == "tool");

    auto encoded = codec::encodeMessage(request.messages[1]);
    REQUIRE(encoded.size() == 1);
    CHECK(encoded[0]["role"].asString() == "tool");
    CHECK(encoded[0]["tool_call_id"].asString() == "toolu_9");
    CHECK(encoded[0]["content"].asString() == "sunny");
}

DROGON_TEST(ContentCodec_OtherRolesRejected)
{
    Json::Value body;
    REQUIRE(jsonutil::parse(
        R"({"model":"m","max_tokens":8,"messages":[{"role":"system","content":"x"}]})", body));
    MessageRequest request;
    auto err = parseMessageRequest(body, request);
    REQUIRE(err.has_value());
    CHECK(err->toJson()["error"]["type"].asString() == "invalid_request_error");
}

DROGON_TEST(ContentCodec_OversizedMaxTokensRejected)
{
    Json::Value body;
    REQUIRE(jsonutil::parse(
        R"({"model":"m","max_tokens":3000000000,"messages":[{"role":"user","content":"hi"}]})", body));
    MessageRequest request;
    std::optional<error::AppError> err;
    CHECK_NOTHROW(err = parseMessageRequest(body, request));
    REQUIRE(err.has_value());
    CHECK(err->message == "max_tokens must be a positive integer");
    CHECK(err->toJson()["error"]["type"].asString() == "invalid_request_error");
}

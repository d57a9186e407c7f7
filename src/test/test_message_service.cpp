#include <drogon/drogon_test.h>
#include "../services/MessageService.h"
#include "../protocol/AnthropicJson.h"
#include "../utils/JsonUtils.h"
#include <stdexcept>

using namespace anthropic;

namespace {

class ScriptedBackend : public IChatBackend {
public:
    provider::ProviderResult completeResult = provider::ProviderResult::fail(provider::ProviderError::network("down"));
    provider::ProviderResult streamResult = provider::ProviderResult::fail(provider::ProviderError::network("down"));
    std::vector<Json::Value> requests;

    provider::ProviderResult complete(const Json::Value& request) override {
        requests.push_back(request);
        return completeResult;
    }
    provider::ProviderResult stream(const Json::Value& request) override {
        requests.push_back(request);
        return streamResult;
    }
    std::string name() const override { return "scripted"; }
};

Json::Value parse(const std::string& text) {
    Json::Value v;
    jsonutil::parse(text, v);
    return v;
}

MessageRequest request(const std::string& json) {
    MessageRequest out;
    auto err = parseMessageRequest(parse(json), out);
    if (err) {
        throw std::runtime_error(err->message);
    }
    return out;
}

struct Fixture {
    ModelsManager models;
    ScriptedBackend backend;
    CharRatioTokenEstimator estimator;
    ToolPhraseTable phrases;

    Fixture() { models.loadDefaults(); }

    MessageService make(MessageServiceOptions options = {}) {
        options.pacingEnabled = false;
        return MessageService(models, backend, nullptr, estimator, phrases,
                              makeThinkingExtractor("heuristic"), options);
    }
};

}

DROGON_TEST(MessageService_CreateMessageConvertsBackendReply)
{
    Fixture f;
    f.backend.completeResult = provider::ProviderResult::success(parse(R"({
        "choices":[{"message":{"content":"Hello!"},"finish_reason":"stop"}],
        "usage":{"prompt_tokens":4,"completion_tokens":2}
    })"));
    auto service = f.make();

    MessageResponse out;
    auto err = service.createMessage(
        request(R"({"model":"claude-3-5-sonnet-20241022","max_tokens":20000,
                    "messages":[{"role":"user","content":"hi"}]})"),
        out);
    REQUIRE(!err.has_value());
    REQUIRE(f.backend.requests.size() == 1);
    CHECK(f.backend.requests[0]["model"].asString() == "gpt-4o");
    CHECK(f.backend.requests[0]["max_tokens"].asInt() == 8192);
    CHECK(out.model == "claude-3-5-sonnet-20241022");
    CHECK(std::get<TextBlock>(out.content[0]).text == "Hello!");
    CHECK(out.usage.outputTokens == 2);
}

DROGON_TEST(MessageService_UnknownModelListsAvailable)
{
    Fixture f;
    auto service = f.make();
    ResolvedModel resolved;
    auto err = service.resolveModel(
        request(R"({"model":"gpt-9","max_tokens":5,"messages":[{"role":"user","content":"hi"}]})"),
        true, resolved);
    REQUIRE(err.has_value());
    CHECK(err->httpStatus() == 400);
    CHECK(err->message.find("Model gpt-9 is not supported. Available models: claude-3-5-sonnet-20241022") == 0);
    CHECK(f.backend.requests.empty());
}

DROGON_TEST(MessageService_RouterPicksLongContextModel)
{
    Fixture f;
    MessageServiceOptions options;
    options.routerEnabled = true;
    options.router.defaultModel = "claude-3-5-sonnet-20241022";
    options.router.longContext = "claude-3-opus-20240229";
    options.router.longContextThreshold = 10;
    auto service = f.make(options);

    ResolvedModel resolved;
    auto err = service.resolveModel(
        request(R"({"model":"claude-3-5-sonnet-20241022","max_tokens":5,
                    "messages":[{"role":"user","content":"this message is long enough to exceed ten tokens for sure"}]})"),
        true, resolved);
    REQUIRE(!err.has_value());
    CHECK(resolved.responseModel == "claude-3-opus-20240229");
    CHECK(resolved.mapping.targetModelId == "gpt-4-turbo");

    err = service.resolveModel(
        request(R"({"model":"claude-3-5-sonnet-20241022","max_tokens":5,
                    "messages":[{"role":"user","content":"this message is long enough to exceed ten tokens for sure"}]})"),
        false, resolved);
    REQUIRE(!err.has_value());
    CHECK(resolved.responseModel == "claude-3-5-sonnet-20241022");
}

DROGON_TEST(MessageService_StreamFailureBecomesErrorEvent)
{
    Fixture f;
    auto service = f.make();
    auto req = request(R"({"model":"claude-3-5-sonnet-20241022","max_tokens":5,"stream":true,
                           "messages":[{"role":"user","content":"hi"}]})");
    ResolvedModel resolved;
    REQUIRE(!service.resolveModel(req, true, resolved).has_value());

    CollectorSink sink;
    service.streamMessage(req, resolved, sink);
    CHECK(sink.hasError());
    CHECK(sink.isClosed());
    REQUIRE(sink.getEvents().size() == 1);
    const auto& error = std::get<StreamError>(sink.getEvents()[0]);
    CHECK(error.type == "api_error");
    CHECK(error.message == "down");
    CHECK(f.backend.requests[0]["stream"].asBool());
}

DROGON_TEST(MessageService_StreamSuccess)
{
    Fixture f;
    f.backend.streamResult = provider::ProviderResult::successChunks({
        parse(R"({"choices":[{"delta":{"content":"Hi"}}]})"),
        parse(R"({"choices":[{"delta":{},"finish_reason":"length"}]})"),
    });
    auto service = f.make();
    auto req = request(R"({"model":"claude-3-5-sonnet-20241022","max_tokens":5,"stream":true,
                           "messages":[{"role":"user","content":"hi"}]})");
    ResolvedModel resolved;
    REQUIRE(!service.resolveModel(req, true, resolved).has_value());

    CollectorSink sink;
    service.streamMessage(req, resolved, sink);
    CHECK(!sink.hasError());
    CHECK(sink.isClosed());
    CHECK(sink.getText(0) == "Hi");
    auto names = sink.getEventNames();
    CHECK(names.front() == "message_start");
    CHECK(names.back() == "message_stop");
    const auto& delta = std::get<MessageDelta>(sink.getEvents()[sink.getEvents().size() - 2]);
    CHECK(delta.stopReason == "max_tokens");
}

DROGON_TEST(MessageService_CountTokens)
{
    Fixture f;
    auto service = f.make();
    int tokens = 0;

    auto err = service.countTokens(parse(R"({"model":"claude-3-5-sonnet-20241022"})"), tokens);
    REQUIRE(err.has_value());
    CHECK(err->message == "Missing required fields: model and messages are required");

    err = service.countTokens(parse(R"({"model":"nope","messages":[{"role":"user","content":"hi"}]})"), tokens);
    REQUIRE(err.has_value());
    CHECK(err->message == "Model nope is not supported");

    err = service.countTokens(
        parse(R"({"model":"claude-3-5-sonnet-20241022","system":"abcd","messages":[{"role":"user","content":"abcdefgh"}]})"),
        tokens);
    REQUIRE(!err.has_value());
    CHECK(tokens == 3);
}

DROGON_TEST(MessageService_BatchItem)
{
    Fixture f;
    f.backend.completeResult = provider::ProviderResult::success(parse(R"({
        "choices":[{"message":{"content":"ok"},"finish_reason":"stop"}]
    })"));
    auto service = f.make();

    Json::Value message;
    auto err = service.runBatchItem(
        parse(R"({"model":"claude-3-5-haiku-20241022","max_tokens":5,"messages":[{"role":"user","content":"hi"}]})"),
        message);
    REQUIRE(!err.has_value());
    CHECK(message["type"].asString() == "message");
    CHECK(message["model"].asString() == "claude-3-5-haiku-20241022");
    CHECK(message["content"][0]["text"].asString() == "ok");

    err = service.runBatchItem(
        parse(R"({"model":"other","max_tokens":5,"messages":[{"role":"user","content":"hi"}]})"), message);
    REQUIRE(err.has_value());
    CHECK(err->message == "Model other not supported");
}

DROGON_TEST(MessageService_BatchItemOversizedMaxTokensIsInvalidRequest)
{
    Fixture f;
    auto service = f.make();

    Json::Value message;
    std::optional<error::AppError> err;
    CHECK_NOTHROW(err = service.runBatchItem(
        parse(R"({"model":"claude-3-5-haiku-20241022","max_tokens":3000000000,"messages":[{"role":"user","content":"hi"}]})"),
        message));
    REQUIRE(err.has_value());
    CHECK(err->httpStatus() == 400);
    CHECK(err->toJson()["error"]["type"].asString() == "invalid_request_error");
    CHECK(f.backend.requests.empty());
}

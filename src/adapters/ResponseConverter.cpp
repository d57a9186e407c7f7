#include "ResponseConverter.h"
#include "ContentCodec.h"
#include "ThinkingExtractor.h"
#include <utils/IdGenerator.h>
#include <utils/JsonUtils.h>
#include <drogon/drogon.h>

std::string ResponseConverter::mapFinishReason(const std::string& finishReason) {
    if (finishReason == "stop") return "end_turn";
    if (finishReason == "length") return "max_tokens";
    if (finishReason == "tool_calls" || finishReason == "function_call") return "tool_use";
    if (finishReason == "content_filter") return "end_turn";
    return "end_turn";
}

Json::Value ResponseConverter::parseToolArguments(const std::string& raw) {
    Json::Value parsed;
    if (jsonutil::parse(raw, parsed) && parsed.isObject()) {
        return parsed;
    }
    LOG_WARN << "[响应转换] 工具参数不是合法 JSON 对象, 原样包装";
    Json::Value wrapped(Json::objectValue);
    wrapped["arguments"] = raw;
    return wrapped;
}

std::optional<error::AppError> ResponseConverter::convert(const Json::Value& backendResponse,
                                                          const std::string& model,
                                                          anthropic::MessageResponse& out,
                                                          const IThinkingExtractor* thinking) {
    if (!backendResponse.isObject()) {
        LOG_ERROR << "[响应转换] 后端响应不是 JSON 对象";
        return error::AppError::providerError("No choices in backend response");
    }
    const Json::Value& choices = backendResponse["choices"];
    if (!choices.isArray() || choices.empty() || !choices[0].isObject()) {
        LOG_ERROR << "[响应转换] 后端响应缺少 choices";
        return error::AppError::providerError("No choices in backend response");
    }
    const Json::Value& choice = choices[0];
    const Json::Value message = choice["message"].isObject() ? choice["message"] : Json::Value(Json::objectValue);

    out = anthropic::MessageResponse{};
    out.id = ids::messageId();
    out.model = model;

    std::string text;
    for (const auto& block : codec::decodeContent(message["content"])) {
        if (const auto* t = std::get_if<anthropic::TextBlock>(&block)) {
            text += t->text;
        }
    }

    if (thinking) {
        ThinkingSplit split = thinking->extract(text, message);
        if (split.found) {
            LOG_DEBUG << "[响应转换] 提取思考内容 (" << thinking->name() << ")";
            out.content.emplace_back(anthropic::ThinkingBlock{split.thinking, ""});
        }
        text = split.text;
    }
    if (!text.empty()) {
        out.content.emplace_back(anthropic::TextBlock{text});
    }

    if (message["tool_calls"].isArray()) {
        for (const auto& call : message["tool_calls"]) {
            anthropic::ToolUseBlock use;
            if (!call.isObject()) continue;
            use.id = jsonutil::getString(call, "id");
            if (use.id.empty()) {
                use.id = ids::toolUseId();
            }
            use.name = jsonutil::getString(call["function"], "name");
            use.input = parseToolArguments(jsonutil::getString(call["function"], "arguments"));
            out.content.emplace_back(std::move(use));
        }
    }

    if (out.content.empty()) {
        out.content.emplace_back(anthropic::TextBlock{""});
    }

    out.stopReason = mapFinishReason(jsonutil::getString(choice, "finish_reason"));
    const Json::Value& usage = backendResponse["usage"];
    if (usage.isObject()) {
        if (usage["prompt_tokens"].isInt()) {
            out.usage.inputTokens = usage["prompt_tokens"].asInt();
        }
        if (usage["completion_tokens"].isInt()) {
            out.usage.outputTokens = usage["completion_tokens"].asInt();
        }
    }
    return std::nullopt;
}

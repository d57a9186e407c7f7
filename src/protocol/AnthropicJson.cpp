#include "AnthropicJson.h"
#include <utils/JsonUtils.h>
#include <drogon/drogon.h>

namespace anthropic {

using jsonutil::getString;

namespace {

Json::Value sourceJson(const std::string& sourceType,
                       const std::string& mediaType,
                       const std::string& data,
                       const std::string& url) {
    Json::Value source(Json::objectValue);
    source["type"] = sourceType;
    if (sourceType == "url") {
        source["url"] = url;
    } else {
        if (!mediaType.empty()) source["media_type"] = mediaType;
        if (!data.empty()) source["data"] = data;
    }
    return source;
}

Json::Value objectOrEmpty(const Json::Value& v) {
    return v.isObject() ? v : Json::Value(Json::objectValue);
}

std::optional<error::AppError> parseTool(const Json::Value& value, size_t index, ToolDefinition& tool) {
    if (!value.isObject()) {
        return error::AppError::badRequest("tools[" + std::to_string(index) + "] must be an object");
    }
    tool.name = getString(value, "name");
    tool.type = getString(value, "type");
    tool.description = getString(value, "description");
    if (tool.name.empty()) {
        return error::AppError::badRequest("tools[" + std::to_string(index) + "].name is required");
    }
    if (value.isMember("input_schema") && value["input_schema"].isObject()) {
        tool.inputSchema = value["input_schema"];
    }
    return std::nullopt;
}

} // namespace

ContentBlock parseContentBlock(const Json::Value& value) {
    if (!value.isObject()) {
        return UnknownBlock{"", value};
    }
    const std::string type = getString(value, "type");

    if (type == "text") {
        return TextBlock{getString(value, "text")};
    }
    if (type == "image") {
        const Json::Value& source = value["source"];
        ImageBlock image;
        image.sourceType = getString(source, "type");
        image.mediaType = getString(source, "media_type");
        image.data = getString(source, "data");
        image.url = getString(source, "url");
        return image;
    }
    if (type == "document") {
        const Json::Value& source = value["source"];
        return DocumentBlock{getString(source, "type"), getString(source, "media_type")};
    }
    if (type == "thinking") {
        return ThinkingBlock{getString(value, "thinking"), getString(value, "signature")};
    }
    if (type == "tool_use") {
        return ToolUseBlock{getString(value, "id"), getString(value, "name"), objectOrEmpty(value["input"])};
    }
    if (type == "tool_result") {
        ToolResultBlock result;
        result.toolUseId = getString(value, "tool_use_id");
        result.content = value.isMember("content") ? value["content"] : Json::Value("");
        result.isError = value.get("is_error", false).asBool();
        return result;
    }
    if (type == "server_tool_use") {
        return ServerToolUseBlock{getString(value, "id"), getString(value, "name"), objectOrEmpty(value["input"])};
    }
    if (type == "web_search_tool_result") {
        WebSearchToolResultBlock block;
        block.toolUseId = getString(value, "tool_use_id");
        if (value["content"].isArray()) {
            for (const auto& item : value["content"]) {
                WebSearchResult r;
                r.title = getString(item, "title");
                r.url = getString(item, "url");
                r.encryptedContent = getString(item, "encrypted_content");
                r.pageAge = getString(item, "page_age");
                block.results.push_back(std::move(r));
            }
        }
        return block;
    }
    return UnknownBlock{type, value};
}

std::vector<ContentBlock> parseContent(const Json::Value& content, bool& plainText) {
    std::vector<ContentBlock> blocks;
    plainText = false;
    if (content.isString()) {
        plainText = true;
        blocks.emplace_back(TextBlock{content.asString()});
        return blocks;
    }
    if (content.isArray()) {
        for (const auto& item : content) {
            blocks.push_back(parseContentBlock(item));
        }
    }
    return blocks;
}

std::string parseSystemText(const Json::Value& system) {
    if (system.isString()) {
        return system.asString();
    }
    if (!system.isArray()) {
        return "";
    }
    std::string text;
    bool first = true;
    for (const auto& item : system) {
        std::string part;
        if (item.isString()) {
            part = item.asString();
        } else if (item.isObject() && getString(item, "type") == "text") {
            part = getString(item, "text");
        } else {
            continue;
        }
        if (!first) text += "\n";
        text += part;
        first = false;
    }
    return text;
}

std::optional<error::AppError> parseMessageRequest(const Json::Value& body, MessageRequest& out) {
    if (!body.isObject()) {
        return error::AppError::badRequest("Request body must be a JSON object");
    }
    if (!body.isMember("model") || !body.isMember("messages") || !body.isMember("max_tokens")) {
        return error::AppError::badRequest(
            "Missing required fields: model, messages, and max_tokens are required");
    }
    if (!body["model"].isString() || body["model"].asString().empty()) {
        return error::AppError::badRequest("model must be a non-empty string");
    }
    if (!body["messages"].isArray() || body["messages"].empty()) {
        return error::AppError::badRequest("Messages must be a non-empty array");
    }
    if (!body["max_tokens"].isInt() || body["max_tokens"].asInt() < 1) {
        return error::AppError::badRequest("max_tokens must be a positive integer");
    }

    out = MessageRequest{};
    out.model = body["model"].asString();
    out.maxTokens = body["max_tokens"].asInt();

    const Json::Value& messages = body["messages"];
    for (Json::ArrayIndex i = 0; i < messages.size(); ++i) {
        const Json::Value& m = messages[i];
        const std::string role = getString(m, "role");
        if (role != "user" && role != "assistant" && role != "tool") {
            return error::AppError::badRequest(
                "messages[" + std::to_string(i) + "].role must be 'user', 'assistant' or 'tool'");
        }
        if (!m.isMember("content") || !(m["content"].isString() || m["content"].isArray())) {
            return error::AppError::badRequest(
                "messages[" + std::to_string(i) + "].content must be a string or an array");
        }
        Message message;
        message.role = role;
        message.content = parseContent(m["content"], message.plainText);
        out.messages.push_back(std::move(message));
    }

    if (body.isMember("system")) {
        out.system = parseSystemText(body["system"]);
    }
    if (body.isMember("temperature") && body["temperature"].isNumeric()) {
        out.temperature = body["temperature"].asDouble();
    }
    if (body.isMember("top_p") && body["top_p"].isNumeric()) {
        out.topP = body["top_p"].asDouble();
    }
    if (body["stop_sequences"].isArray()) {
        for (const auto& s : body["stop_sequences"]) {
            if (s.isString()) out.stopSequences.push_back(s.asString());
        }
    }
    if (body.isMember("tools")) {
        if (!body["tools"].isArray()) {
            return error::AppError::badRequest("tools must be an array");
        }
        for (Json::ArrayIndex i = 0; i < body["tools"].size(); ++i) {
            ToolDefinition tool;
            if (auto err = parseTool(body["tools"][i], i, tool)) {
                return err;
            }
            out.tools.push_back(std::move(tool));
        }
    }
    out.stream = body.get("stream", false).asBool();

    const Json::Value& thinking = body["thinking"];
    if (thinking.isObject()) {
        out.thinking.declared = true;
        out.thinking.enabled = getString(thinking, "type") == "enabled";
        out.thinking.budgetTokens = thinking.get("budget_tokens", 0).asInt();
    }

    LOG_DEBUG << "[协议A] 解析请求: model=" << out.model
              << ", messages=" << out.messages.size()
              << ", tools=" << out.tools.size()
              << ", stream=" << out.stream;
    return std::nullopt;
}

Json::Value toJson(const ContentBlock& block) {
    return std::visit([](auto&& arg) -> Json::Value {
        using T = std::decay_t<decltype(arg)>;
        Json::Value out(Json::objectValue);
        if constexpr (std::is_same_v<T, TextBlock>) {
            out["type"] = "text";
            out["text"] = arg.text;
        } else if constexpr (std::is_same_v<T, ImageBlock>) {
            out["type"] = "image";
            out["source"] = sourceJson(arg.sourceType, arg.mediaType, arg.data, arg.url);
        } else if constexpr (std::is_same_v<T, DocumentBlock>) {
            out["type"] = "document";
            out["source"] = sourceJson(arg.sourceType, arg.mediaType, "", "");
        } else if constexpr (std::is_same_v<T, ThinkingBlock>) {
            out["type"] = "thinking";
            out["thinking"] = arg.thinking;
            if (!arg.signature.empty()) out["signature"] = arg.signature;
        } else if constexpr (std::is_same_v<T, ToolUseBlock>) {
            out["type"] = "tool_use";
            out["id"] = arg.id;
            out["name"] = arg.name;
            out["input"] = arg.input;
        } else if constexpr (std::is_same_v<T, ToolResultBlock>) {
            out["type"] = "tool_result";
            out["tool_use_id"] = arg.toolUseId;
            out["content"] = arg.content;
            if (arg.isError) out["is_error"] = true;
        } else if constexpr (std::is_same_v<T, ServerToolUseBlock>) {
            out["type"] = "server_tool_use";
            out["id"] = arg.id;
            out["name"] = arg.name;
            out["input"] = arg.input;
        } else if constexpr (std::is_same_v<T, WebSearchToolResultBlock>) {
            out["type"] = "web_search_tool_result";
            out["tool_use_id"] = arg.toolUseId;
            out["content"] = Json::Value(Json::arrayValue);
            for (const auto& r : arg.results) {
                Json::Value item(Json::objectValue);
                item["type"] = "web_search_result";
                item["title"] = r.title;
                item["url"] = r.url;
                item["encrypted_content"] = r.encryptedContent;
                item["page_age"] = r.pageAge;
                out["content"].append(item);
            }
        } else if constexpr (std::is_same_v<T, UnknownBlock>) {
            out = arg.raw;
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled content block");
        }
        return out;
    }, block);
}

Json::Value toJson(const Usage& usage) {
    Json::Value out(Json::objectValue);
    out["input_tokens"] = usage.inputTokens;
    out["output_tokens"] = usage.outputTokens;
    if (usage.webSearchRequests.has_value()) {
        out["server_tool_use"]["web_search_requests"] = *usage.webSearchRequests;
    }
    return out;
}

Json::Value toJson(const MessageResponse& response) {
    Json::Value out(Json::objectValue);
    out["id"] = response.id;
    out["type"] = "message";
    out["role"] = "assistant";
    out["model"] = response.model;
    out["content"] = Json::Value(Json::arrayValue);
    for (const auto& block : response.content) {
        out["content"].append(toJson(block));
    }
    out["stop_reason"] = response.stopReason;
    out["stop_sequence"] = response.stopSequence ? Json::Value(*response.stopSequence) : Json::Value();
    out["usage"] = toJson(response.usage);
    return out;
}

Json::Value toJson(const StreamEvent& event) {
    Json::Value out(Json::objectValue);
    out["type"] = eventName(event);
    std::visit([&out](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, MessageStart>) {
            Json::Value message(Json::objectValue);
            message["id"] = arg.id;
            message["type"] = "message";
            message["role"] = "assistant";
            message["model"] = arg.model;
            message["content"] = Json::Value(Json::arrayValue);
            message["stop_reason"] = Json::Value();
            message["stop_sequence"] = Json::Value();
            message["usage"] = toJson(arg.usage);
            out["message"] = message;
        } else if constexpr (std::is_same_v<T, ContentBlockStart>) {
            out["index"] = arg.index;
            out["content_block"] = toJson(arg.block);
        } else if constexpr (std::is_same_v<T, ContentBlockDelta>) {
            out["index"] = arg.index;
            Json::Value delta(Json::objectValue);
            if (const auto* text = std::get_if<TextDelta>(&arg.delta)) {
                delta["type"] = "text_delta";
                delta["text"] = text->text;
            } else if (const auto* json = std::get_if<InputJsonDelta>(&arg.delta)) {
                delta["type"] = "input_json_delta";
                delta["partial_json"] = json->partialJson;
            }
            out["delta"] = delta;
        } else if constexpr (std::is_same_v<T, ContentBlockStop>) {
            out["index"] = arg.index;
        } else if constexpr (std::is_same_v<T, MessageDelta>) {
            out["delta"]["stop_reason"] = arg.stopReason;
            out["delta"]["stop_sequence"] = arg.stopSequence ? Json::Value(*arg.stopSequence) : Json::Value();
            out["usage"] = toJson(arg.usage);
        } else if constexpr (std::is_same_v<T, MessageStop>) {
            // 只有 type
        } else if constexpr (std::is_same_v<T, StreamError>) {
            out["error"]["type"] = arg.type;
            out["error"]["message"] = arg.message;
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled stream event");
        }
    }, event);
    return out;
}

std::string encodeSse(const StreamEvent& event) {
    return "event: " + eventName(event) + "\ndata: " + jsonutil::toCompactString(toJson(event)) + "\n\n";
}

} // namespace anthropic

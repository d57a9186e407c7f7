#include "ContentCodec.h"
#include <utils/JsonUtils.h>
#include <drogon/drogon.h>

namespace codec {

using namespace anthropic;

namespace {

Json::Value textPart(const std::string& text) {
    Json::Value part(Json::objectValue);
    part["type"] = "text";
    part["text"] = text;
    return part;
}

std::string backendRole(const std::string& role) {
    return role == "user" ? "user" : "assistant";
}

} // namespace

std::optional<Json::Value> encodeContentPart(const ContentBlock& block) {
    return std::visit([](auto&& arg) -> std::optional<Json::Value> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, TextBlock>) {
            return textPart(arg.text);
        } else if constexpr (std::is_same_v<T, ImageBlock>) {
            std::string url;
            if (arg.sourceType == "base64") {
                url = "data:" + arg.mediaType + ";base64," + arg.data;
            } else if (arg.sourceType == "url") {
                url = arg.url;
            } else {
                LOG_WARN << "[内容编解码] 不支持的图片来源: " << arg.sourceType;
                return std::nullopt;
            }
            Json::Value part(Json::objectValue);
            part["type"] = "image_url";
            part["image_url"]["url"] = url;
            part["image_url"]["detail"] = "auto";
            return part;
        } else if constexpr (std::is_same_v<T, DocumentBlock>) {
            if (arg.sourceType == "base64") {
                return textPart("[Document: " + arg.mediaType + "]");
            }
            return textPart("[Document content]");
        } else if constexpr (std::is_same_v<T, ThinkingBlock>) {
            return textPart("[Thinking: " + arg.thinking + "]");
        } else if constexpr (std::is_same_v<T, ToolUseBlock> ||
                             std::is_same_v<T, ToolResultBlock>) {
            // 由 encodeMessage 单独处理
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, ServerToolUseBlock> ||
                             std::is_same_v<T, WebSearchToolResultBlock>) {
            LOG_WARN << "[内容编解码] 丢弃服务端工具块: " << blockTypeName(ContentBlock(arg));
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, UnknownBlock>) {
            LOG_WARN << "[内容编解码] 丢弃未知内容块: " << arg.type;
            return std::nullopt;
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled content block");
        }
    }, block);
}

Json::Value encodeToolCall(const ToolUseBlock& block) {
    Json::Value call(Json::objectValue);
    call["id"] = block.id;
    call["type"] = "function";
    call["function"]["name"] = block.name;
    call["function"]["arguments"] = jsonutil::toCompactString(block.input);
    return call;
}

std::string stringifyToolResultContent(const Json::Value& content) {
    if (content.isString()) {
        return content.asString();
    }
    if (content.isNull()) {
        return "";
    }
    return jsonutil::toCompactString(content);
}

Json::Value encodeToolResult(const ToolResultBlock& block) {
    Json::Value msg(Json::objectValue);
    msg["role"] = "tool";
    msg["tool_call_id"] = block.toolUseId;
    msg["content"] = stringifyToolResultContent(block.content);
    return msg;
}

std::string joinedText(const Message& message) {
    std::string text;
    bool first = true;
    for (const auto& block : message.content) {
        if (const auto* t = std::get_if<TextBlock>(&block)) {
            if (!first) text += "\n";
            text += t->text;
            first = false;
        }
    }
    return text;
}

std::vector<Json::Value> encodeMessage(const Message& message) {
    std::vector<Json::Value> out;
    const std::string role = backendRole(message.role);

    if (message.plainText) {
        Json::Value msg(Json::objectValue);
        msg["role"] = role;
        msg["content"] = joinedText(message);
        out.push_back(std::move(msg));
        return out;
    }

    std::vector<const ToolUseBlock*> toolUses;
    std::vector<const ToolResultBlock*> toolResults;
    for (const auto& block : message.content) {
        if (const auto* use = std::get_if<ToolUseBlock>(&block)) {
            toolUses.push_back(use);
        } else if (const auto* result = std::get_if<ToolResultBlock>(&block)) {
            toolResults.push_back(result);
        }
    }

    if (!toolUses.empty()) {
        Json::Value msg(Json::objectValue);
        msg["role"] = "assistant";
        msg["content"] = joinedText(message);
        msg["tool_calls"] = Json::Value(Json::arrayValue);
        for (const auto* use : toolUses) {
            msg["tool_calls"].append(encodeToolCall(*use));
        }
        out.push_back(std::move(msg));
        return out;
    }

    for (const auto* result : toolResults) {
        out.push_back(encodeToolResult(*result));
    }

    Json::Value parts(Json::arrayValue);
    for (const auto& block : message.content) {
        if (auto part = encodeContentPart(block)) {
            parts.append(*part);
        }
    }

    if (!toolResults.empty()) {
        // 与工具结果同一轮的其余内容作为后续 user 消息
        if (!parts.empty()) {
            Json::Value msg(Json::objectValue);
            msg["role"] = "user";
            msg["content"] = parts;
            out.push_back(std::move(msg));
        }
        return out;
    }

    Json::Value msg(Json::objectValue);
    msg["role"] = role;
    if (parts.empty()) {
        msg["content"] = "";
    } else {
        msg["content"] = parts;
    }
    out.push_back(std::move(msg));
    return out;
}

std::vector<ContentBlock> decodeContent(const Json::Value& content) {
    std::vector<ContentBlock> blocks;
    if (content.isString()) {
        if (!content.asString().empty()) {
            blocks.emplace_back(TextBlock{content.asString()});
        }
        return blocks;
    }
    if (!content.isArray()) {
        return blocks;
    }
    for (const auto& part : content) {
        const std::string type = jsonutil::getString(part, "type");
        if (type == "text") {
            blocks.emplace_back(TextBlock{jsonutil::getString(part, "text")});
        } else {
            LOG_WARN << "[内容编解码] 忽略后端 content part: " << type;
        }
    }
    return blocks;
}

} // namespace codec

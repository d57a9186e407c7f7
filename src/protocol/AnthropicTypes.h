#ifndef ANTHROPIC_TYPES_H
#define ANTHROPIC_TYPES_H

#include <json/json.h>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

/**
 * @brief 协议 A（Messages API）的内部表示
 *
 * 入站 JSON 在边界处解析为这些类型，内部只处理强类型的内容块。
 * 未识别的块类型落入 UnknownBlock，由调用方显式决定丢弃还是透传。
 */
namespace anthropic {

// ========== 内容块 ==========

struct TextBlock {
    std::string text;
};

/**
 * @brief 图片块
 *
 * sourceType: "base64" 时使用 mediaType + data，"url" 时使用 url。
 */
struct ImageBlock {
    std::string sourceType;
    std::string mediaType;
    std::string data;
    std::string url;
};

struct DocumentBlock {
    std::string sourceType;
    std::string mediaType;
};

struct ThinkingBlock {
    std::string thinking;
    std::string signature;
};

struct ToolUseBlock {
    std::string id;
    std::string name;
    Json::Value input{Json::objectValue};
};

/**
 * @brief 工具结果块
 *
 * content 保持原始 JSON（字符串或块数组），编码时再决定如何展平。
 */
struct ToolResultBlock {
    std::string toolUseId;
    Json::Value content;
    bool isError = false;
};

struct ServerToolUseBlock {
    std::string id;
    std::string name;
    Json::Value input{Json::objectValue};
};

struct WebSearchResult {
    std::string title;
    std::string url;
    std::string encryptedContent;
    std::string pageAge;
};

struct WebSearchToolResultBlock {
    std::string toolUseId;
    std::vector<WebSearchResult> results;
};

/**
 * @brief 未识别的块类型，保留原始 JSON
 */
struct UnknownBlock {
    std::string type;
    Json::Value raw;
};

using ContentBlock = std::variant<
    TextBlock,
    ImageBlock,
    DocumentBlock,
    ThinkingBlock,
    ToolUseBlock,
    ToolResultBlock,
    ServerToolUseBlock,
    WebSearchToolResultBlock,
    UnknownBlock
>;

/// 穷举 visit 的编译期兜底
template <class>
inline constexpr bool kAlwaysFalse = false;

/**
 * @brief 内容块的协议类型名
 */
inline std::string blockTypeName(const ContentBlock& block) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, TextBlock>) return "text";
        else if constexpr (std::is_same_v<T, ImageBlock>) return "image";
        else if constexpr (std::is_same_v<T, DocumentBlock>) return "document";
        else if constexpr (std::is_same_v<T, ThinkingBlock>) return "thinking";
        else if constexpr (std::is_same_v<T, ToolUseBlock>) return "tool_use";
        else if constexpr (std::is_same_v<T, ToolResultBlock>) return "tool_result";
        else if constexpr (std::is_same_v<T, ServerToolUseBlock>) return "server_tool_use";
        else if constexpr (std::is_same_v<T, WebSearchToolResultBlock>) return "web_search_tool_result";
        else if constexpr (std::is_same_v<T, UnknownBlock>) return arg.type;
        else static_assert(kAlwaysFalse<T>, "unhandled content block");
    }, block);
}

// ========== 消息与请求 ==========

struct Message {
    std::string role;                       // "user" / "assistant"
    std::vector<ContentBlock> content;
    bool plainText = false;                 // content 原始为字符串
};

/**
 * @brief 工具定义
 *
 * type 为空表示自定义工具；服务端工具（如 web_search_20250305）携带 type。
 * inputSchema 缺失的自定义工具不会被转发到后端。
 */
struct ToolDefinition {
    std::string name;
    std::string description;
    std::string type;
    std::optional<Json::Value> inputSchema;
};

/**
 * @brief thinking 配置
 *
 * declared: 请求携带了 thinking 字段（路由与思考提取依据）；enabled: type == "enabled"。
 */
/**
 * @brief 是否为服务端联网搜索工具（type 形如 web_search_YYYYMMDD，name 为 web_search）
 */
inline bool isWebSearchTool(const ToolDefinition& tool) {
    return tool.name == "web_search" && tool.type.rfind("web_search_", 0) == 0;
}

struct ThinkingConfig {
    bool declared = false;
    bool enabled = false;
    int budgetTokens = 0;
};

struct MessageRequest {
    std::string model;
    std::vector<Message> messages;
    std::string system;
    int maxTokens = 0;
    std::optional<double> temperature;
    std::optional<double> topP;
    std::vector<std::string> stopSequences;
    std::vector<ToolDefinition> tools;
    bool stream = false;
    ThinkingConfig thinking;
};

struct Usage {
    int inputTokens = 0;
    int outputTokens = 0;
    std::optional<int> webSearchRequests;
};

struct MessageResponse {
    std::string id;
    std::string model;
    std::vector<ContentBlock> content;
    std::string stopReason = "end_turn";
    std::optional<std::string> stopSequence;
    Usage usage;
};

} // namespace anthropic

#endif // ANTHROPIC_TYPES_H

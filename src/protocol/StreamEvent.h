#ifndef STREAM_EVENT_H
#define STREAM_EVENT_H

#include <protocol/AnthropicTypes.h>
#include <optional>
#include <string>
#include <variant>

/**
 * @brief 协议 A 流式事件模型
 *
 * 每个事件在线上编码为 `event: <name>\ndata: <json>\n\n`。
 * 合法序列：一个 message_start，每个 index 依次 start、若干 delta、stop（index 递增），
 * 一个 message_delta，一个 message_stop。
 */
namespace anthropic {

struct MessageStart {
    std::string id;
    std::string model;
    Usage usage;
};

/**
 * @brief 内容块开始
 *
 * tool_use / server_tool_use 在此时 input 为空对象，参数通过 input_json_delta 补齐。
 */
struct ContentBlockStart {
    int index = 0;
    ContentBlock block;
};

struct TextDelta {
    std::string text;
};

struct InputJsonDelta {
    std::string partialJson;
};

struct ContentBlockDelta {
    int index = 0;
    std::variant<TextDelta, InputJsonDelta> delta;
};

struct ContentBlockStop {
    int index = 0;
};

struct MessageDelta {
    std::string stopReason;
    std::optional<std::string> stopSequence;
    Usage usage;
};

struct MessageStop {};

/**
 * @brief 流开始后发生的错误，以 event: error 带内发送
 */
struct StreamError {
    std::string type;
    std::string message;
};

using StreamEvent = std::variant<
    MessageStart,
    ContentBlockStart,
    ContentBlockDelta,
    ContentBlockStop,
    MessageDelta,
    MessageStop,
    StreamError
>;

inline bool isTerminalEvent(const StreamEvent& event) {
    return std::holds_alternative<MessageStop>(event) ||
           std::holds_alternative<StreamError>(event);
}

/**
 * @brief SSE event 名称
 */
inline std::string eventName(const StreamEvent& event) {
    if (std::holds_alternative<MessageStart>(event)) return "message_start";
    if (std::holds_alternative<ContentBlockStart>(event)) return "content_block_start";
    if (std::holds_alternative<ContentBlockDelta>(event)) return "content_block_delta";
    if (std::holds_alternative<ContentBlockStop>(event)) return "content_block_stop";
    if (std::holds_alternative<MessageDelta>(event)) return "message_delta";
    if (std::holds_alternative<MessageStop>(event)) return "message_stop";
    if (std::holds_alternative<StreamError>(event)) return "error";
    return "unknown";
}

} // namespace anthropic

#endif // STREAM_EVENT_H

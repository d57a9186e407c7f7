#ifndef CONTENT_CODEC_H
#define CONTENT_CODEC_H

#include <protocol/AnthropicTypes.h>
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief 内容块编解码（协议 A ⇄ 协议 B）
 *
 * 协议 A → 协议 B:
 * - text      → 字符串（原始 content 为字符串时）或 {type:"text"} part
 * - image     → image_url part（base64 转 data URI，url 直接使用）
 * - document  → 文本占位 part
 * - tool_use  → assistant 消息的 tool_calls[]
 * - tool_result → 每个块一条 role=tool 消息
 * - 其余类型在边界处丢弃并记录告警
 *
 * 协议 B → 协议 A: content 字符串或 text parts 还原为 text 块。
 */
namespace codec {

/**
 * @brief 单个块编码为协议 B 的 content part；无对应表示时返回 nullopt
 */
std::optional<Json::Value> encodeContentPart(const anthropic::ContentBlock& block);

/**
 * @brief 将一条协议 A 消息编码为一条或多条协议 B 消息（顺序保持）
 */
std::vector<Json::Value> encodeMessage(const anthropic::Message& message);

/**
 * @brief tool_use 块 → tool_calls 条目，arguments 为 input 的紧凑 JSON
 */
Json::Value encodeToolCall(const anthropic::ToolUseBlock& block);

/**
 * @brief tool_result 块 → role=tool 消息
 */
Json::Value encodeToolResult(const anthropic::ToolResultBlock& block);

/**
 * @brief 工具结果内容展平为字符串（非字符串内容序列化为 JSON）
 */
std::string stringifyToolResultContent(const Json::Value& content);

/**
 * @brief 协议 B 的 content（字符串或 parts 数组）→ 协议 A 文本块
 */
std::vector<anthropic::ContentBlock> decodeContent(const Json::Value& content);

/**
 * @brief 取协议 A 消息中的纯文本（text 块以 "\n" 连接）
 */
std::string joinedText(const anthropic::Message& message);

} // namespace codec

#endif // CONTENT_CODEC_H

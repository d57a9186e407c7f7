#ifndef ANTHROPIC_JSON_H
#define ANTHROPIC_JSON_H

#include <protocol/AnthropicTypes.h>
#include <protocol/StreamEvent.h>
#include <utils/Errors.h>
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief 协议 A 的 JSON 边界
 *
 * 入站：Json::Value → MessageRequest / ContentBlock（含请求校验）。
 * 出站：MessageResponse / StreamEvent → Json::Value / SSE 文本。
 */
namespace anthropic {

/**
 * @brief 解析单个内容块；未知类型返回 UnknownBlock
 */
ContentBlock parseContentBlock(const Json::Value& value);

/**
 * @brief 解析消息 content（字符串或块数组）
 *
 * @param plainText 输出：content 是否为字符串
 */
std::vector<ContentBlock> parseContent(const Json::Value& content, bool& plainText);

/**
 * @brief system 字段（字符串或文本块数组）展平为文本，多段以 "\n" 连接
 */
std::string parseSystemText(const Json::Value& system);

/**
 * @brief 解析并校验 Messages 请求体
 *
 * 校验 model / messages / max_tokens 必填、messages 非空数组、role 合法。
 * 模型是否受支持由调用方结合模型注册表判断。
 *
 * @return 校验失败时返回 invalid_request_error
 */
std::optional<error::AppError> parseMessageRequest(const Json::Value& body, MessageRequest& out);

Json::Value toJson(const ContentBlock& block);
Json::Value toJson(const Usage& usage);
Json::Value toJson(const MessageResponse& response);
Json::Value toJson(const StreamEvent& event);

/**
 * @brief 编码为一条 SSE 记录：`event: <name>\ndata: <json>\n\n`
 */
std::string encodeSse(const StreamEvent& event);

} // namespace anthropic

#endif // ANTHROPIC_JSON_H

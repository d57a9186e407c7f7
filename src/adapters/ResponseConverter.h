#ifndef RESPONSE_CONVERTER_H
#define RESPONSE_CONVERTER_H

#include <protocol/AnthropicTypes.h>
#include <utils/Errors.h>
#include <json/json.h>
#include <optional>
#include <string>

class IThinkingExtractor;

/**
 * @brief 协议 B 非流式响应 → 协议 A 消息
 *
 * 内容顺序：[thinking]、text、tool_use*；无任何内容时补一个空 text 块。
 */
class ResponseConverter {
public:
    /**
     * @param backendResponse 后端响应 JSON
     * @param model 回写到响应中的协议 A 模型名
     * @param thinking 思考提取策略；nullptr 表示不提取
     * @return 响应缺少 choices[0] 时返回 api_error
     */
    static std::optional<error::AppError> convert(const Json::Value& backendResponse,
                                                  const std::string& model,
                                                  anthropic::MessageResponse& out,
                                                  const IThinkingExtractor* thinking = nullptr);

    /**
     * @brief stop→end_turn, length→max_tokens, tool_calls→tool_use, 其余→end_turn
     */
    static std::string mapFinishReason(const std::string& finishReason);

    /**
     * @brief 工具参数字符串解析为对象；失败或非对象时包装为 {"arguments": raw}
     */
    static Json::Value parseToolArguments(const std::string& raw);
};

#endif // RESPONSE_CONVERTER_H

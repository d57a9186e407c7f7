#ifndef REQUEST_CONVERTER_H
#define REQUEST_CONVERTER_H

#include <protocol/AnthropicTypes.h>
#include <modelsManager/Model.h>
#include <json/json.h>

/**
 * @brief 协议 A 请求 → 协议 B Chat Completions 请求
 */
class RequestConverter {
public:
    /// 后端输出上限的硬性天花板
    static constexpr int kHardMaxTokens = 8192;

    /**
     * @brief 构建后端请求体
     *
     * - system（若有）作为第一条 system 消息
     * - 各消息经 ContentCodec 编码，顺序保持
     * - max_tokens = min(请求值, 映射上限, kHardMaxTokens)
     * - 无有效工具时不输出 tools / tool_choice
     */
    static Json::Value buildChatRequest(const anthropic::MessageRequest& request,
                                        const ModelMapping& mapping);

    static int clampMaxTokens(int requested, int modelLimit);

    /**
     * @brief 工具定义 → function 工具；缺少 input_schema 时返回 null
     */
    static Json::Value convertTool(const anthropic::ToolDefinition& tool);
};

#endif // REQUEST_CONVERTER_H

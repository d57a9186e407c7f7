#pragma once

#include <protocol/AnthropicTypes.h>
#include <utils/TokenEstimator.h>
#include "Model.h"
#include <string>

/**
 * @brief 模型路由
 *
 * 按固定优先级选择实际使用的模型（首个命中生效，未配置的路由跳过）：
 * 1. 恰好一个联网搜索工具且 system 含搜索助手标记 → webSearch
 * 2. 估算 token 数 > longContextThreshold → longContext
 * 3. 请求模型名包含 "haiku" → background
 * 4. 请求声明了 thinking → think
 * 5. 其余 → default
 *
 * 路由过程中的任何异常（含计数失败）都回退到 default。
 */
class ModelRouter {
public:
    static constexpr const char* kWebSearchSystemMarker =
        "You are an assistant for performing a web search tool use";
    static constexpr const char* kBackgroundMarker = "haiku";

    static std::string route(const anthropic::MessageRequest& request,
                             const RouterPolicy& policy,
                             const ITokenEstimator& estimator);

    static bool isWebSearchRoute(const anthropic::MessageRequest& request);

private:
    static std::string routeUnchecked(const anthropic::MessageRequest& request,
                                      const RouterPolicy& policy,
                                      const ITokenEstimator& estimator);
};

#include "ModelRouter.h"
#include <drogon/drogon.h>
#include <exception>

bool ModelRouter::isWebSearchRoute(const anthropic::MessageRequest& request)
{
    return request.tools.size() == 1 &&
           anthropic::isWebSearchTool(request.tools.front()) &&
           request.system.find(kWebSearchSystemMarker) != std::string::npos;
}

std::string ModelRouter::route(const anthropic::MessageRequest& request,
                               const RouterPolicy& policy,
                               const ITokenEstimator& estimator)
{
    try {
        return routeUnchecked(request, policy, estimator);
    } catch (const std::exception& e) {
        LOG_ERROR << "[模型路由] 路由异常, 回退默认模型 " << policy.defaultModel << ": " << e.what();
        return policy.defaultModel;
    }
}

std::string ModelRouter::routeUnchecked(const anthropic::MessageRequest& request,
                                        const RouterPolicy& policy,
                                        const ITokenEstimator& estimator)
{
    if (policy.webSearch && isWebSearchRoute(request)) {
        LOG_INFO << "[模型路由] 联网搜索 → " << *policy.webSearch;
        return *policy.webSearch;
    }

    if (policy.longContext) {
        const int tokenCount = tokens::countRequestTokens(request, estimator);
        LOG_DEBUG << "[模型路由] 估算 token: " << tokenCount;
        if (tokenCount > policy.longContextThreshold) {
            LOG_INFO << "[模型路由] 长上下文 " << tokenCount << " > " << policy.longContextThreshold
                     << " → " << *policy.longContext;
            return *policy.longContext;
        }
    }

    if (policy.background && request.model.find(kBackgroundMarker) != std::string::npos) {
        LOG_INFO << "[模型路由] 后台模型 → " << *policy.background;
        return *policy.background;
    }

    if (policy.think && request.thinking.declared) {
        LOG_INFO << "[模型路由] 思考模式 → " << *policy.think;
        return *policy.think;
    }

    LOG_DEBUG << "[模型路由] 默认模型 → " << policy.defaultModel;
    return policy.defaultModel;
}

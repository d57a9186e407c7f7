#ifndef MESSAGE_SERVICE_H
#define MESSAGE_SERVICE_H

#include <adapters/IEventSink.h>
#include <adapters/ThinkingExtractor.h>
#include <adapters/ToolPhraseTable.h>
#include <apipoint/ChatBackend.h>
#include <modelsManager/ModelsManager.h>
#include <protocol/AnthropicTypes.h>
#include <utils/Errors.h>
#include <utils/TokenEstimator.h>
#include <webSearch/WebSearchOrchestrator.h>
#include <memory>
#include <optional>
#include <string>

struct MessageServiceOptions {
    bool routerEnabled = false;     // false 时直接使用请求中的模型
    RouterPolicy router;
    bool pacingEnabled = true;
};

/**
 * @brief 路由与模型解析结果
 */
struct ResolvedModel {
    std::string responseModel;      // 回复中的 model（路由后的协议 A 模型名）
    ModelMapping mapping;
};

/**
 * @brief 消息服务
 *
 * Controller 与批处理共用的编排层：
 * 1. 校验请求并解析模型（可选路由）
 * 2. 联网搜索流程交给 WebSearchOrchestrator
 * 3. 其余请求经 RequestConverter → 后端 → ResponseConverter / StreamReconstructor
 */
class MessageService {
public:
    MessageService(ModelsManager& models,
                   IChatBackend& backend,
                   WebSearchOrchestrator* webSearch,
                   const ITokenEstimator& estimator,
                   const ToolPhraseTable& phrases,
                   std::unique_ptr<IThinkingExtractor> thinking,
                   MessageServiceOptions options);

    MessageService(const MessageService&) = delete;
    MessageService& operator=(const MessageService&) = delete;

    /**
     * @brief 解析模型：开启路由时先路由，再查模型表
     *
     * @return 模型未注册时返回 invalid_request_error（附可用模型列表）
     */
    std::optional<error::AppError> resolveModel(const anthropic::MessageRequest& request,
                                                bool route,
                                                ResolvedModel& out) const;

    /**
     * @brief 一次性调用：路由 + 转换 + 后端 + 响应转换
     */
    std::optional<error::AppError> createMessage(const anthropic::MessageRequest& request,
                                                 anthropic::MessageResponse& out);

    /**
     * @brief 在已解析的模型上执行一次性调用
     */
    std::optional<error::AppError> createMessage(const anthropic::MessageRequest& request,
                                                 const ResolvedModel& model,
                                                 anthropic::MessageResponse& out);

    /**
     * @brief 流式调用，事件写入 sink，结束后关闭 sink
     *
     * 此时响应头已发出，失败以 error 事件告知客户端。
     */
    void streamMessage(const anthropic::MessageRequest& request,
                       const ResolvedModel& model,
                       IEventSink& sink);

    /**
     * @brief count_tokens：请求体只需 model 与 messages
     */
    std::optional<error::AppError> countTokens(const Json::Value& body, int& inputTokens) const;

    /**
     * @brief 批处理单项：不做路由，模型必须已注册
     */
    std::optional<error::AppError> runBatchItem(const Json::Value& params, Json::Value& message);

    const ModelsManager& models() const { return models_; }

private:
    const IThinkingExtractor* thinkingFor(const anthropic::MessageRequest& request) const;

    ModelsManager& models_;
    IChatBackend& backend_;
    WebSearchOrchestrator* webSearch_;
    const ITokenEstimator& estimator_;
    const ToolPhraseTable& phrases_;
    std::unique_ptr<IThinkingExtractor> thinking_;
    MessageServiceOptions options_;
};

#endif // MESSAGE_SERVICE_H

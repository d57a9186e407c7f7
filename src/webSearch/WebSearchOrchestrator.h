#ifndef WEB_SEARCH_ORCHESTRATOR_H
#define WEB_SEARCH_ORCHESTRATOR_H

#include "SearchResultParser.h"
#include <apipoint/ChatBackend.h>
#include <apipoint/SearchProvider.h>
#include <protocol/AnthropicTypes.h>
#include <utils/EphemeralCache.h>
#include <utils/Errors.h>
#include <utils/TokenEstimator.h>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

enum class WebSearchPhase {
    None,       // 不是搜索流程
    Initiate,   // 第一阶段：发起搜索
    Consume     // 第二阶段：根据工具结果生成回答
};

struct WebSearchOptions {
    int topK = 10;
    int summaryMaxTokens = 1000;
    double summaryTemperature = 0.7;
};

/**
 * @brief 第二阶段使用的结果条目（链接 + 缓存补全的内容）
 */
struct EnrichedResult {
    std::string title;
    std::string url;
    std::string content;
    bool cached = false;
};

/**
 * @brief 两阶段联网搜索
 *
 * 阶段完全由请求内容判定，不依赖会话状态：
 * - Consume: 最后一条 user 消息中存在包含结果标记的 tool_result
 * - Initiate: 工具列表恰好是一个联网搜索工具
 *
 * 第一阶段的搜索结果按 link 写入缓存，第二阶段从缓存补全内容后交给后端总结；
 * 后端失败时使用模板回答。
 */
class WebSearchOrchestrator {
public:
    static constexpr const char* kResultMarker = "Web search results for query:";

    using DateProvider = std::function<std::chrono::system_clock::time_point()>;

    WebSearchOrchestrator(ISearchProvider& searchProvider,
                          IChatBackend& backend,
                          EphemeralCache& cache,
                          const ITokenEstimator& estimator,
                          WebSearchOptions options = {},
                          DateProvider today = nullptr);

    static WebSearchPhase detect(const anthropic::MessageRequest& request);

    /**
     * @brief 执行检测到的阶段
     *
     * @param responseModel 回复中的 model 字段
     * @param backendModel  总结调用使用的后端模型
     */
    std::optional<error::AppError> handle(const anthropic::MessageRequest& request,
                                          WebSearchPhase phase,
                                          const std::string& responseModel,
                                          const std::string& backendModel,
                                          anthropic::MessageResponse& out);

    std::optional<error::AppError> initiate(const anthropic::MessageRequest& request,
                                            const std::string& responseModel,
                                            anthropic::MessageResponse& out);

    std::optional<error::AppError> consume(const anthropic::MessageRequest& request,
                                           const std::string& responseModel,
                                           const std::string& backendModel,
                                           anthropic::MessageResponse& out);

    /// 从用户文本提取查询（匹配 "web search for the query: ..." / "search for: ..."，否则整段文本）
    static std::string extractQuery(const std::string& userText);

    /// 搜索服务所需的对话历史：system 在前，其余消息展平为文本
    static std::vector<search::HistoryMessage> buildHistory(const anthropic::MessageRequest& request);

    /// 模板回答：逐条列出标题 / URL / 内容摘录，末尾附来源统计
    static std::string fallbackSummary(const std::string& query, const std::vector<EnrichedResult>& results);

    /// "Found N relevant sources from a.com, b.org. The search covered topics related to: ..."
    static std::string domainTally(const std::vector<EnrichedResult>& results);

    /// 最后一条 user 消息中带结果标记的 tool_result 文本
    static std::optional<std::string> findResultText(const anthropic::MessageRequest& request);

private:
    std::vector<EnrichedResult> enrich(const std::vector<websearch::SearchLink>& links);
    std::string summarize(const std::string& query,
                          const std::vector<EnrichedResult>& results,
                          const std::string& backendModel);

    ISearchProvider& searchProvider_;
    IChatBackend& backend_;
    EphemeralCache& cache_;
    const ITokenEstimator& estimator_;
    WebSearchOptions options_;
    DateProvider today_;
};

#endif // WEB_SEARCH_ORCHESTRATOR_H

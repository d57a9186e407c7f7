#ifndef BRIDGE_CONFIG_H
#define BRIDGE_CONFIG_H

#include <apipoint/aliyun/AliyunSearchProvider.h>
#include <apipoint/openai/OpenAiProvider.h>
#include <modelsManager/Model.h>
#include <webSearch/WebSearchOrchestrator.h>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <json/json.h>

/**
 * @brief 服务配置
 *
 * 对应 config.json 中的 custom_config 节点：
 * backend / web_search / models / default_model / router / cache /
 * streaming / thinking / tool_phrases / worker_threads
 */
struct BridgeConfig {
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    // ========== 后端 ==========
    OpenAiConfig backend;

    // ========== 联网搜索 ==========
    SearchServiceConfig webSearch;
    WebSearchOptions webSearchOptions;

    // ========== 模型 ==========
    Json::Value models{Json::arrayValue};   // custom_config.models 原样保留，由 ModelsManager 解析
    std::string defaultModel;
    bool routerConfigured = false;          // 未配置 router 时直接使用请求的模型
    RouterPolicy router;

    // ========== 缓存 ==========
    std::chrono::milliseconds cacheTtl{std::chrono::hours(1)};
    std::chrono::milliseconds cacheCleanupInterval{std::chrono::minutes(5)};

    // ========== 流式 / 思考 / 工具短句 ==========
    bool pacingEnabled = true;
    std::string thinkingMode = "heuristic";     // off / heuristic / native
    Json::Value toolPhrases{Json::objectValue};

    size_t workerThreads = 4;

    /**
     * @brief 从 custom_config 加载，缺失项使用默认值并做范围限制
     *
     * API Key 与地址未配置时回退到环境变量
     * OPENAI_API_KEY / OPENAI_BASE_URL / WEB_SEARCH_API_KEY / WEB_SEARCH_BASE_URL。
     *
     * @param env 环境变量读取函数，nullptr 表示使用进程环境
     */
    static BridgeConfig loadFromJson(const Json::Value& custom, const EnvLookup& env = nullptr);

    static std::optional<std::string> processEnv(const std::string& name);
};

#endif // BRIDGE_CONFIG_H

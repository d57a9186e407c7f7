#include <drogon/drogon.h>
#include <adapters/ThinkingExtractor.h>
#include <adapters/ToolPhraseTable.h>
#include <apipoint/aliyun/AliyunSearchProvider.h>
#include <apipoint/openai/OpenAiProvider.h>
#include <batchManager/BatchManager.h>
#include <config/BridgeConfig.h>
#include <controllers/BatchesController.h>
#include <controllers/HealthController.h>
#include <controllers/MessagesController.h>
#include <controllers/ModelsController.h>
#include <modelsManager/ModelsManager.h>
#include <services/MessageService.h>
#include <utils/BackgroundTaskQueue.h>
#include <utils/ConfigValidator.h>
#include <utils/EphemeralCache.h>
#include <utils/JsonUtils.h>
#include <utils/TokenEstimator.h>
#include <webSearch/WebSearchOrchestrator.h>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace drogon;

namespace {

// 启动前检查配置文件；返回 false 表示无法启动
bool validateConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "无法打开配置文件: " << path << std::endl;
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    Json::Value root;
    std::string errs;
    if (!jsonutil::parse(buffer.str(), root, &errs)) {
        std::cerr << "配置文件不是合法 JSON: " << errs << std::endl;
        return false;
    }

    const auto result = ConfigValidator::validate(root);
    for (const auto& warning : result.warnings) {
        std::cerr << "[配置检查] 警告: " << warning << std::endl;
    }
    for (const auto& error : result.errors) {
        std::cerr << "[配置检查] 错误: " << error << std::endl;
    }
    return result.valid;
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string configPath = argc > 1 ? argv[1] : "../config.json";
    if (!validateConfigFile(configPath)) {
        return 1;
    }
    drogon::app().loadConfigFile(configPath);
    HealthController::setStartTime(std::chrono::steady_clock::now());

    const BridgeConfig config = BridgeConfig::loadFromJson(app().getCustomConfig());
    BackgroundTaskQueue::instance().configure(config.workerThreads);

    auto models = std::make_shared<ModelsManager>();
    models->loadFromJson(config.models, config.defaultModel);

    MessageServiceOptions options;
    options.routerEnabled = config.routerConfigured;
    options.router = config.router;
    if (options.routerEnabled && options.router.defaultModel.empty()) {
        options.router.defaultModel = models->getDefaultModel();
    }
    options.pacingEnabled = config.pacingEnabled;

    if (config.backend.apiKey.empty()) {
        LOG_WARN << "[启动] 未配置后端 API Key（backend.api_key / OPENAI_API_KEY），后端调用将失败";
    }
    OpenAiProvider backend(config.backend);
    AliyunSearchProvider searchProvider(config.webSearch);
    EphemeralCache cache(config.cacheTtl, config.cacheCleanupInterval);
    CharRatioTokenEstimator estimator;

    ToolPhraseTable phrases;
    phrases.merge(config.toolPhrases);

    WebSearchOrchestrator webSearch(searchProvider, backend, cache, estimator, config.webSearchOptions);

    auto service = std::make_shared<MessageService>(*models, backend, &webSearch, estimator, phrases,
                                                    makeThinkingExtractor(config.thinkingMode), options);
    auto batches = std::make_shared<BatchManager>(
        [service](const Json::Value& params, Json::Value& message) {
            return service->runBatchItem(params, message);
        });

    app().registerController(std::make_shared<MessagesController>(service));
    app().registerController(std::make_shared<BatchesController>(batches));
    app().registerController(std::make_shared<ModelsController>(models));

    // 在事件循环开始后挂载缓存清理定时器
    app().getLoop()->queueInLoop([&cache]() {
        cache.attachLoop(app().getLoop());
    });

    LOG_INFO << "[启动] 模型数: " << models->getAllModels().size()
             << ", 默认模型: " << models->getDefaultModel()
             << ", 工作线程: " << config.workerThreads;
    drogon::app().run();

    BackgroundTaskQueue::instance().shutdown();
    cache.attachLoop(nullptr);
    return 0;
}

#include <drogon/drogon_test.h>
#include "../config/BridgeConfig.h"
#include "../utils/JsonUtils.h"
#include <map>

namespace {

BridgeConfig::EnvLookup fakeEnv(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

Json::Value parse(const std::string& text) {
    Json::Value v;
    jsonutil::parse(text, v);
    return v;
}

}

DROGON_TEST(BridgeConfig_Defaults)
{
    auto cfg = BridgeConfig::loadFromJson(Json::Value(), fakeEnv({}));
    CHECK(cfg.backend.apiKey.empty());
    CHECK(cfg.backend.baseUrl == "https://api.openai.com/v1");
    CHECK(cfg.webSearchOptions.topK == 10);
    CHECK(cfg.webSearchOptions.summaryMaxTokens == 1000);
    CHECK(!cfg.routerConfigured);
    CHECK(cfg.models.isArray());
    CHECK(cfg.models.empty());
    CHECK(cfg.cacheTtl == std::chrono::hours(1));
    CHECK(cfg.cacheCleanupInterval == std::chrono::minutes(5));
    CHECK(cfg.pacingEnabled);
    CHECK(cfg.thinkingMode == "heuristic");
    CHECK(cfg.workerThreads == 4);
}

DROGON_TEST(BridgeConfig_EnvFallback)
{
    auto cfg = BridgeConfig::loadFromJson(
        parse(R"({"backend":{"timeout_seconds":30}})"),
        fakeEnv({{"OPENAI_API_KEY", "sk-env"},
                 {"OPENAI_BASE_URL", "http://localhost:8080/v1"},
                 {"WEB_SEARCH_API_KEY", "ws-env"},
                 {"WEB_SEARCH_BASE_URL", "http://search.local/api"}}));
    CHECK(cfg.backend.apiKey == "sk-env");
    CHECK(cfg.backend.baseUrl == "http://localhost:8080/v1");
    CHECK(cfg.backend.timeoutSeconds == 30.0);
    CHECK(cfg.webSearch.apiKey == "ws-env");
    CHECK(cfg.webSearch.url == "http://search.local/api");

    auto explicitKey = BridgeConfig::loadFromJson(
        parse(R"({"backend":{"api_key":"sk-file"}})"), fakeEnv({{"OPENAI_API_KEY", "sk-env"}}));
    CHECK(explicitKey.backend.apiKey == "sk-file");
}

DROGON_TEST(BridgeConfig_ClampsAndRouter)
{
    auto cfg = BridgeConfig::loadFromJson(parse(R"({
        "default_model": "claude-3-5-sonnet-20241022",
        "web_search": {"top_k": 500, "summary_temperature": 9.5},
        "router": {"long_context": "claude-3-opus-20240229", "long_context_threshold": 1000},
        "cache": {"ttl_seconds": 0},
        "streaming": {"pacing": false},
        "thinking": {"mode": "native"},
        "worker_threads": 1000
    })"), fakeEnv({}));

    CHECK(cfg.webSearchOptions.topK == 50);
    CHECK(cfg.webSearchOptions.summaryTemperature == 2.0);
    CHECK(cfg.routerConfigured);
    CHECK(cfg.router.defaultModel == "claude-3-5-sonnet-20241022");
    REQUIRE(cfg.router.longContext.has_value());
    CHECK(*cfg.router.longContext == "claude-3-opus-20240229");
    CHECK(cfg.router.longContextThreshold == 1000);
    CHECK(!cfg.router.webSearch.has_value());
    CHECK(cfg.cacheTtl == std::chrono::seconds(1));
    CHECK(!cfg.pacingEnabled);
    CHECK(cfg.thinkingMode == "native");
    CHECK(cfg.workerThreads == 64);
}

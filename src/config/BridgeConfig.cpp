#include "BridgeConfig.h"
#include <drogon/drogon.h>
#include <algorithm>
#include <cstdlib>

namespace {

std::string stringOr(const Json::Value& obj, const char* key, const std::string& def) {
    if (obj.isObject() && obj[key].isString() && !obj[key].asString().empty()) {
        return obj[key].asString();
    }
    return def;
}

std::optional<std::string> optionalString(const Json::Value& obj, const char* key) {
    if (obj.isObject() && obj[key].isString() && !obj[key].asString().empty()) {
        return obj[key].asString();
    }
    return std::nullopt;
}

int clampInt(int value, int lo, int hi) {
    return std::max(lo, std::min(hi, value));
}

} // namespace

std::optional<std::string> BridgeConfig::processEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string(value);
}

BridgeConfig BridgeConfig::loadFromJson(const Json::Value& custom, const EnvLookup& env) {
    const EnvLookup lookup = env ? env : EnvLookup(&BridgeConfig::processEnv);
    BridgeConfig cfg;

    if (!custom.isObject()) {
        LOG_WARN << "[服务配置] custom_config 缺失或无效，使用默认配置";
    }
    const Json::Value root = custom.isObject() ? custom : Json::Value(Json::objectValue);

    // 后端
    const Json::Value& backend = root["backend"];
    cfg.backend.apiKey = stringOr(backend, "api_key", lookup("OPENAI_API_KEY").value_or(""));
    cfg.backend.baseUrl = stringOr(backend, "base_url", lookup("OPENAI_BASE_URL").value_or(cfg.backend.baseUrl));
    if (backend.isObject() && backend["timeout_seconds"].isNumeric()) {
        cfg.backend.timeoutSeconds = std::max(1.0, std::min(3600.0, backend["timeout_seconds"].asDouble()));
    }

    // 联网搜索
    const Json::Value& search = root["web_search"];
    cfg.webSearch.apiKey = stringOr(search, "api_key", lookup("WEB_SEARCH_API_KEY").value_or(""));
    cfg.webSearch.url = stringOr(search, "url", lookup("WEB_SEARCH_BASE_URL").value_or(""));
    if (search.isObject()) {
        if (search["timeout_seconds"].isNumeric()) {
            cfg.webSearch.timeoutSeconds = std::max(1.0, std::min(600.0, search["timeout_seconds"].asDouble()));
        }
        if (search["top_k"].isInt()) {
            cfg.webSearchOptions.topK = clampInt(search["top_k"].asInt(), 1, 50);
        }
        if (search["summary_max_tokens"].isInt()) {
            cfg.webSearchOptions.summaryMaxTokens = clampInt(search["summary_max_tokens"].asInt(), 1, 8192);
        }
        if (search["summary_temperature"].isNumeric()) {
            cfg.webSearchOptions.summaryTemperature =
                std::max(0.0, std::min(2.0, search["summary_temperature"].asDouble()));
        }
    }

    // 模型与路由
    if (root["models"].isArray()) {
        cfg.models = root["models"];
    }
    cfg.defaultModel = stringOr(root, "default_model", "");

    const Json::Value& router = root["router"];
    if (router.isObject()) {
        cfg.routerConfigured = true;
        cfg.router.defaultModel = stringOr(router, "default", cfg.defaultModel);
        cfg.router.longContext = optionalString(router, "long_context");
        cfg.router.webSearch = optionalString(router, "web_search");
        cfg.router.background = optionalString(router, "background");
        cfg.router.think = optionalString(router, "think");
        if (router["long_context_threshold"].isInt()) {
            cfg.router.longContextThreshold = std::max(1, router["long_context_threshold"].asInt());
        }
    }

    // 缓存
    const Json::Value& cache = root["cache"];
    if (cache.isObject()) {
        if (cache["ttl_seconds"].isInt()) {
            cfg.cacheTtl = std::chrono::seconds(clampInt(cache["ttl_seconds"].asInt(), 1, 7 * 24 * 3600));
        }
        if (cache["cleanup_interval_seconds"].isInt()) {
            cfg.cacheCleanupInterval =
                std::chrono::seconds(clampInt(cache["cleanup_interval_seconds"].asInt(), 1, 24 * 3600));
        }
    }

    // 流式节奏
    const Json::Value& streaming = root["streaming"];
    if (streaming.isObject() && streaming["pacing"].isBool()) {
        cfg.pacingEnabled = streaming["pacing"].asBool();
    }

    // 思考提取
    const Json::Value& thinking = root["thinking"];
    if (thinking.isObject()) {
        cfg.thinkingMode = stringOr(thinking, "mode", cfg.thinkingMode);
    }

    if (root["tool_phrases"].isObject()) {
        cfg.toolPhrases = root["tool_phrases"];
    }

    if (root["worker_threads"].isInt()) {
        cfg.workerThreads = static_cast<size_t>(clampInt(root["worker_threads"].asInt(), 1, 64));
    }

    LOG_INFO << "[服务配置] backend=" << cfg.backend.baseUrl
             << ", models=" << cfg.models.size()
             << ", router=" << (cfg.routerConfigured ? "on" : "off")
             << ", pacing=" << (cfg.pacingEnabled ? "on" : "off")
             << ", thinking=" << cfg.thinkingMode;
    return cfg;
}

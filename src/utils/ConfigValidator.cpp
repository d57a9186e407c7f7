
#include "ConfigValidator.h"
#include <set>

namespace {

bool isPositiveInt(const Json::Value& value) {
    return value.isInt() && value.asInt() > 0;
}

bool isValidThinkingMode(const std::string& mode) {
    return mode == "off" || mode == "heuristic" || mode == "native";
}

void addError(ConfigValidator::ValidationResult& result, const std::string& message) {
    result.valid = false;
    result.errors.push_back(message);
}

}

ConfigValidator::ValidationResult ConfigValidator::validate(const Json::Value& config) {
    ValidationResult result;

    if (!config.isObject()) {
        addError(result, "配置根节点必须是 JSON object");
        return result;
    }

    if (!config.isMember("listeners") || !config["listeners"].isArray() ||
        config["listeners"].empty()) {
        addError(result, "listeners 必须存在且为非空数组");
    }

    if (!config.isMember("custom_config") || !config["custom_config"].isObject()) {
        result.warnings.emplace_back("custom_config 缺失，将使用内置模型表与默认配置");
        return result;
    }

    const auto& custom = config["custom_config"];

    if (custom.isMember("backend")) {
        if (!custom["backend"].isObject()) {
            addError(result, "custom_config.backend 必须为 object");
        } else {
            const auto& backend = custom["backend"];
            if (backend.isMember("base_url") &&
                (!backend["base_url"].isString() || backend["base_url"].asString().find("://") == std::string::npos)) {
                addError(result, "backend.base_url 必须为 http(s):// 开头的地址");
            }
            if (backend.isMember("timeout_seconds") &&
                (!backend["timeout_seconds"].isNumeric() || backend["timeout_seconds"].asDouble() <= 0)) {
                addError(result, "backend.timeout_seconds 必须为正数");
            }
            if (!backend.isMember("api_key")) {
                result.warnings.emplace_back("backend.api_key 未配置，将读取环境变量 OPENAI_API_KEY");
            }
        }
    }

    if (custom.isMember("web_search") && custom["web_search"].isObject()) {
        const auto& search = custom["web_search"];
        if (search.isMember("top_k") && !isPositiveInt(search["top_k"])) {
            addError(result, "web_search.top_k 必须为正整数");
        }
        if (!search.isMember("url")) {
            result.warnings.emplace_back("web_search.url 未配置，将读取环境变量 WEB_SEARCH_BASE_URL");
        }
    }

    std::set<std::string> modelIds;
    if (custom.isMember("models")) {
        if (!custom["models"].isArray()) {
            addError(result, "custom_config.models 必须为数组");
        } else {
            for (Json::ArrayIndex i = 0; i < custom["models"].size(); ++i) {
                const auto& model = custom["models"][i];
                const std::string where = "models[" + std::to_string(i) + "]";
                if (!model.isObject() || !model["source_model"].isString() || !model["target_model"].isString()) {
                    addError(result, where + " 需要字符串字段 source_model 与 target_model");
                    continue;
                }
                if (model.isMember("max_tokens") && !isPositiveInt(model["max_tokens"])) {
                    addError(result, where + ".max_tokens 必须为正整数");
                }
                if (!modelIds.insert(model["source_model"].asString()).second) {
                    result.warnings.emplace_back(where + " 重复的 source_model，后者覆盖前者");
                }
            }
        }
    }

    if (custom.isMember("router") && custom["router"].isObject()) {
        const auto& router = custom["router"];
        if (router.isMember("long_context_threshold") && !isPositiveInt(router["long_context_threshold"])) {
            addError(result, "router.long_context_threshold 必须为正整数");
        }
        if (!modelIds.empty()) {
            for (const char* key : {"default", "long_context", "web_search", "background", "think"}) {
                if (router[key].isString() && !modelIds.count(router[key].asString())) {
                    result.warnings.emplace_back(std::string("router.") + key + " 指向未配置的模型: " +
                                                 router[key].asString());
                }
            }
        }
    }

    if (custom.isMember("cache") && custom["cache"].isObject()) {
        const auto& cache = custom["cache"];
        if (cache.isMember("ttl_seconds") && !isPositiveInt(cache["ttl_seconds"])) {
            addError(result, "cache.ttl_seconds 必须为正整数");
        }
        if (cache.isMember("cleanup_interval_seconds") && !isPositiveInt(cache["cleanup_interval_seconds"])) {
            addError(result, "cache.cleanup_interval_seconds 必须为正整数");
        }
    }

    if (custom.isMember("streaming") && custom["streaming"].isObject() &&
        custom["streaming"].isMember("pacing") && !custom["streaming"]["pacing"].isBool()) {
        addError(result, "streaming.pacing 必须为 bool");
    }

    if (custom.isMember("thinking") && custom["thinking"].isObject()) {
        const auto& mode = custom["thinking"]["mode"];
        if (!mode.isNull() && (!mode.isString() || !isValidThinkingMode(mode.asString()))) {
            addError(result, "custom_config.thinking.mode 非法，允许值: off/heuristic/native");
        }
    }

    if (custom.isMember("tool_phrases") && !custom["tool_phrases"].isObject()) {
        addError(result, "custom_config.tool_phrases 必须为 object");
    }

    if (custom.isMember("worker_threads") && !isPositiveInt(custom["worker_threads"])) {
        addError(result, "worker_threads 必须为正整数");
    }

    return result;
}

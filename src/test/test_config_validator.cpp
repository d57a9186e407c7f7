#include <drogon/drogon_test.h>
#include "../utils/ConfigValidator.h"
#include "../utils/JsonUtils.h"

namespace {

Json::Value parse(const std::string& text) {
    Json::Value v;
    jsonutil::parse(text, v);
    return v;
}

const char* kListeners = R"("listeners":[{"address":"0.0.0.0","port":3000}])";

bool hasMessageContaining(const std::vector<std::string>& list, const std::string& needle) {
    for (const auto& s : list) {
        if (s.find(needle) != std::string::npos) return true;
    }
    return false;
}

}

DROGON_TEST(ConfigValidator_MinimalConfigValid)
{
    auto result = ConfigValidator::validate(parse(std::string("{") + kListeners + "}"));
    CHECK(result.valid);
    CHECK(result.errors.empty());
    CHECK(!result.warnings.empty());
}

DROGON_TEST(ConfigValidator_MissingListeners)
{
    auto result = ConfigValidator::validate(parse(R"({"custom_config":{}})"));
    CHECK(!result.valid);
    CHECK(hasMessageContaining(result.errors, "listeners"));

    CHECK(!ConfigValidator::validate(Json::Value("text")).valid);
}

DROGON_TEST(ConfigValidator_BadCustomValues)
{
    auto result = ConfigValidator::validate(parse(std::string("{") + kListeners + R"(,
        "custom_config": {
            "backend": {"base_url": "api.openai.com", "timeout_seconds": -1},
            "models": [{"source_model": "a"}, {"source_model": "b", "target_model": "x", "max_tokens": 0}],
            "thinking": {"mode": {"nested": true}},
            "streaming": {"pacing": "yes"},
            "tool_phrases": [],
            "worker_threads": 0
        }})"));
    CHECK(!result.valid);
    CHECK(hasMessageContaining(result.errors, "backend.base_url"));
    CHECK(hasMessageContaining(result.errors, "backend.timeout_seconds"));
    CHECK(hasMessageContaining(result.errors, "models[0]"));
    CHECK(hasMessageContaining(result.errors, "models[1].max_tokens"));
    CHECK(hasMessageContaining(result.errors, "thinking.mode"));
    CHECK(hasMessageContaining(result.errors, "streaming.pacing"));
    CHECK(hasMessageContaining(result.errors, "tool_phrases"));
    CHECK(hasMessageContaining(result.errors, "worker_threads"));
}

DROGON_TEST(ConfigValidator_WarnsOnDuplicatesAndUnknownRoutes)
{
    auto result = ConfigValidator::validate(parse(std::string("{") + kListeners + R"(,
        "custom_config": {
            "backend": {"api_key": "sk"},
            "models": [
                {"source_model": "a", "target_model": "x"},
                {"source_model": "a", "target_model": "y"}
            ],
            "router": {"default": "a", "think": "missing"}
        }})"));
    CHECK(result.valid);
    CHECK(hasMessageContaining(result.warnings, "models[1]"));
    CHECK(hasMessageContaining(result.warnings, "router.think"));
    CHECK(!hasMessageContaining(result.warnings, "router.default"));
}

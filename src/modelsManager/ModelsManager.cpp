#include "ModelsManager.h"
#include <utils/TimeUtils.h>
#include <drogon/drogon.h>
#include <algorithm>

std::vector<ModelMapping> ModelsManager::builtinModels()
{
    return {
        {"claude-3-5-sonnet-20241022", "gpt-4o", 8192, "Claude 3.5 Sonnet mapped to GPT-4o"},
        {"claude-3-5-haiku-20241022", "gpt-4o-mini", 8192, "Claude 3.5 Haiku mapped to GPT-4o Mini"},
        {"claude-3-opus-20240229", "gpt-4-turbo", 4096, "Claude 3 Opus mapped to GPT-4 Turbo"},
        {"claude-3-sonnet-20240229", "gpt-4", 4096, "Claude 3 Sonnet mapped to GPT-4"},
        {"claude-3-haiku-20240307", "gpt-3.5-turbo", 4096, "Claude 3 Haiku mapped to GPT-3.5 Turbo"},
    };
}

void ModelsManager::loadDefaults()
{
    std::lock_guard<std::mutex> lock(mutex_);
    models_ = builtinModels();
    defaultModel_ = models_.front().sourceModelId;
    LOG_INFO << "[模型管理] 使用内置默认模型表, 共 " << models_.size() << " 个";
}

void ModelsManager::loadFromJson(const Json::Value& models, const std::string& defaultModel)
{
    if (!models.isArray() || models.empty()) {
        loadDefaults();
        if (!defaultModel.empty()) {
            std::lock_guard<std::mutex> lock(mutex_);
            defaultModel_ = defaultModel;
        }
        return;
    }

    for (const auto& item : models) {
        if (!item.isObject()) {
            LOG_WARN << "[模型管理] 跳过非对象的模型条目";
            continue;
        }
        ModelMapping mapping;
        mapping.sourceModelId = item.get("source_model", "").asString();
        mapping.targetModelId = item.get("target_model", "").asString();
        mapping.maxTokens = item.get("max_tokens", 4096).asInt();
        mapping.description = item.get("description", "").asString();
        if (mapping.sourceModelId.empty() || mapping.targetModelId.empty()) {
            LOG_WARN << "[模型管理] 跳过缺少 source_model/target_model 的条目";
            continue;
        }
        if (mapping.maxTokens <= 0) {
            LOG_WARN << "[模型管理] " << mapping.sourceModelId << " max_tokens 非法, 使用 4096";
            mapping.maxTokens = 4096;
        }
        addModel(mapping);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (models_.empty()) {
        LOG_WARN << "[模型管理] 配置中没有有效模型, 回退到内置默认表";
        models_ = builtinModels();
    }
    defaultModel_ = defaultModel.empty() ? models_.front().sourceModelId : defaultModel;
    LOG_INFO << "[模型管理] 已加载 " << models_.size() << " 个模型, 默认: " << defaultModel_;
}

void ModelsManager::addModel(const ModelMapping& mapping)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(models_.begin(), models_.end(), [&](const ModelMapping& m) {
        return m.sourceModelId == mapping.sourceModelId;
    });
    if (it != models_.end()) {
        LOG_DEBUG << "[模型管理] 覆盖已有映射: " << mapping.sourceModelId;
        *it = mapping;
    } else {
        models_.push_back(mapping);
    }
}

bool ModelsManager::removeModel(const std::string& sourceModelId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(models_.begin(), models_.end(), [&](const ModelMapping& m) {
        return m.sourceModelId == sourceModelId;
    });
    if (it == models_.end()) {
        return false;
    }
    models_.erase(it);
    return true;
}

std::optional<ModelMapping> ModelsManager::getModel(const std::string& sourceModelId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& m : models_) {
        if (m.sourceModelId == sourceModelId) {
            return m;
        }
    }
    return std::nullopt;
}

std::vector<ModelMapping> ModelsManager::getAllModels() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return models_;
}

std::vector<std::string> ModelsManager::getModelIds() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(models_.size());
    for (const auto& m : models_) {
        ids.push_back(m.sourceModelId);
    }
    return ids;
}

std::string ModelsManager::getDefaultModel() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return defaultModel_;
}

Json::Value ModelsManager::modelToJson(const ModelMapping& mapping)
{
    const std::string& id = mapping.sourceModelId;
    const std::string now = timeutil::toIso8601(std::chrono::system_clock::now());

    Json::Value model(Json::objectValue);
    model["id"] = id;
    model["type"] = "model";
    model["display_name"] = mapping.description.empty() ? id : mapping.description;
    model["created_at"] = now;
    model["updated_at"] = now;
    model["max_tokens"] = mapping.maxTokens;
    model["vision"] = id.find("vision") != std::string::npos || id.find("3-5") != std::string::npos;
    model["tools"] = true;
    model["computer_use"] = id.find("3-5") != std::string::npos;
    model["web_search"] = false;
    model["thinking"] = id.find("sonnet") != std::string::npos || id.find("opus") != std::string::npos;
    model["description"] = id + " - Claude model adapted via OpenAI";
    model["context_length"] = mapping.maxTokens;
    model["object"] = "model";
    model["owned_by"] = "anthropic";
    return model;
}

Json::Value ModelsManager::getModelsJson() const
{
    Json::Value list(Json::objectValue);
    list["object"] = "list";
    list["data"] = Json::Value(Json::arrayValue);
    for (const auto& m : getAllModels()) {
        list["data"].append(modelToJson(m));
    }
    return list;
}

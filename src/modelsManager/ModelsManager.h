#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "Model.h"

/**
 * @brief 模型注册表
 *
 * 保存 sourceModelId → ModelMapping，重复注册时后写覆盖（保持首次注册的顺序）。
 * 未配置任何模型时加载内置默认表，第一项为默认模型。
 */
class ModelsManager {
public:
    ModelsManager() = default;

    /**
     * @brief 从 custom_config 加载
     *
     * @param models custom_config.models（数组）
     * @param defaultModel custom_config.default_model（可为空）
     */
    void loadFromJson(const Json::Value& models, const std::string& defaultModel);
    void loadDefaults();

    void addModel(const ModelMapping& mapping);
    bool removeModel(const std::string& sourceModelId);

    std::optional<ModelMapping> getModel(const std::string& sourceModelId) const;
    std::vector<ModelMapping> getAllModels() const;
    std::vector<std::string> getModelIds() const;
    std::string getDefaultModel() const;

    /// GET /v1/models 列表
    Json::Value getModelsJson() const;
    static Json::Value modelToJson(const ModelMapping& mapping);

    static std::vector<ModelMapping> builtinModels();

private:
    mutable std::mutex mutex_;
    std::vector<ModelMapping> models_;
    std::string defaultModel_;
};

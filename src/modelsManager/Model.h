#pragma once

#include <optional>
#include <string>

/**
 * @brief 协议 A 模型 → 后端模型的映射
 */
struct ModelMapping {
    std::string sourceModelId;      // 客户端请求的模型名（唯一）
    std::string targetModelId;      // 后端实际使用的模型名
    int maxTokens = 4096;           // 后端允许的输出上限
    std::string description;
};

/**
 * @brief 路由策略
 *
 * 各路由值均为 sourceModelId；未设置的路由对应规则被跳过。
 */
struct RouterPolicy {
    std::string defaultModel;
    std::optional<std::string> longContext;
    int longContextThreshold = 60000;
    std::optional<std::string> webSearch;
    std::optional<std::string> background;
    std::optional<std::string> think;
};

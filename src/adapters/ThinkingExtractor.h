#ifndef THINKING_EXTRACTOR_H
#define THINKING_EXTRACTOR_H

#include <json/json.h>
#include <memory>
#include <string>

/**
 * @brief 思考内容拆分结果
 *
 * found 为 false 时 text 即原文。
 */
struct ThinkingSplit {
    bool found = false;
    std::string thinking;
    std::string text;
};

/**
 * @brief 从后端回复中分离“思考”部分的策略接口
 */
class IThinkingExtractor {
public:
    virtual ~IThinkingExtractor() = default;

    /**
     * @param text 后端回复的文本内容
     * @param backendMessage 后端 choices[0].message（可读取原生推理字段）
     */
    virtual ThinkingSplit extract(const std::string& text, const Json::Value& backendMessage) const = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief 启发式拆分
 *
 * 文本长度 > 100、命中推理关键词且按 ". " 切分后多于两句时，
 * 前 floor(n/2) 句作为 thinking，其余作为正文。
 */
class HeuristicThinkingExtractor : public IThinkingExtractor {
public:
    static constexpr size_t kMinLength = 100;

    ThinkingSplit extract(const std::string& text, const Json::Value& backendMessage) const override;
    std::string name() const override { return "heuristic"; }
};

/**
 * @brief 优先使用后端 reasoning_content 字段，缺失时退回启发式
 */
class NativeReasoningExtractor : public IThinkingExtractor {
public:
    ThinkingSplit extract(const std::string& text, const Json::Value& backendMessage) const override;
    std::string name() const override { return "native"; }

private:
    HeuristicThinkingExtractor fallback_;
};

/**
 * @brief 按配置名创建策略；"off" 或未知名称返回 nullptr
 */
std::unique_ptr<IThinkingExtractor> makeThinkingExtractor(const std::string& mode);

#endif // THINKING_EXTRACTOR_H

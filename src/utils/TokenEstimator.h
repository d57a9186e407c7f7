#ifndef TOKEN_ESTIMATOR_H
#define TOKEN_ESTIMATOR_H

#include <protocol/AnthropicTypes.h>
#include <string>

/**
 * @brief 分词计数服务接口
 *
 * 计数仅为估算，不追求与任何后端的计费一致。
 */
class ITokenEstimator {
public:
    virtual ~ITokenEstimator() = default;
    virtual int count(const std::string& text) const = 0;
};

/**
 * @brief 按字符比例估算：ceil(bytes / charsPerToken)
 */
class CharRatioTokenEstimator : public ITokenEstimator {
public:
    explicit CharRatioTokenEstimator(int charsPerToken = 4) : charsPerToken_(charsPerToken > 0 ? charsPerToken : 4) {}
    int count(const std::string& text) const override;

private:
    int charsPerToken_;
};

namespace tokens {

/**
 * @brief 路由用计数：system + 消息文本 + tool_use 输入 + tool_result 内容 + 工具定义
 */
int countRequestTokens(const anthropic::MessageRequest& request, const ITokenEstimator& estimator);

/**
 * @brief count_tokens 接口用计数：system + 文本块 + 工具定义 JSON
 */
int countInputTokens(const anthropic::MessageRequest& request, const ITokenEstimator& estimator);

} // namespace tokens

#endif // TOKEN_ESTIMATOR_H

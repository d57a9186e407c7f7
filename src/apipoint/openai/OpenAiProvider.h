#ifndef OPENAI_PROVIDER_H
#define OPENAI_PROVIDER_H

#include <apipoint/ChatBackend.h>
#include <trantor/net/EventLoopThread.h>
#include <string>
#include <vector>

/**
 * @brief OpenAI 兼容后端连接参数
 */
struct OpenAiConfig {
    std::string apiKey;
    std::string baseUrl = "https://api.openai.com/v1";
    double timeoutSeconds = 300.0;
};

/**
 * @brief OpenAI Chat Completions 后端
 *
 * baseUrl 可带路径前缀（如 https://host/v1），请求路径为 <前缀>/chat/completions。
 * HTTP 客户端运行在 Provider 自有的事件循环线程上，调用方线程同步等待结果。
 */
class OpenAiProvider : public IChatBackend {
public:
    explicit OpenAiProvider(OpenAiConfig config);
    ~OpenAiProvider() override;

    provider::ProviderResult complete(const Json::Value& request) override;
    provider::ProviderResult stream(const Json::Value& request) override;
    std::string name() const override { return "openai"; }

    /**
     * @brief 解析 SSE 响应体为 chunk 列表（跳过 [DONE] 与无法解析的行）
     */
    static std::vector<Json::Value> parseSseChunks(const std::string& body);

private:
    provider::ProviderResult send(const Json::Value& body, bool streaming);

    OpenAiConfig config_;
    std::string host_;
    std::string pathPrefix_;
    trantor::EventLoopThread clientLoop_;
};

#endif

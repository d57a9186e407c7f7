#ifndef ALIYUN_SEARCH_PROVIDER_H
#define ALIYUN_SEARCH_PROVIDER_H

#include <apipoint/SearchProvider.h>
#include <trantor/net/EventLoopThread.h>
#include <string>

struct SearchServiceConfig {
    std::string apiKey;
    std::string url;                    // 完整接口地址
    double timeoutSeconds = 60.0;
};

/**
 * @brief 阿里云 OpenSearch 联网搜索接口
 *
 * 请求体：{history, query, query_rewrite, top_k, content_type}
 * 响应体：{request_id, latency, usage:{search_count}, result:{search_result:[...]}}
 */
class AliyunSearchProvider : public ISearchProvider {
public:
    explicit AliyunSearchProvider(SearchServiceConfig config);
    ~AliyunSearchProvider() override;

    std::optional<search::SearchResponse> search(const search::SearchQuery& query) override;

    static Json::Value buildRequestBody(const search::SearchQuery& query);
    static std::optional<search::SearchResponse> parseResponse(const Json::Value& json);

private:
    SearchServiceConfig config_;
    std::string host_;
    std::string path_;
    trantor::EventLoopThread clientLoop_;
};

#endif // ALIYUN_SEARCH_PROVIDER_H

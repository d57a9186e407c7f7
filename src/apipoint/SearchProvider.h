#ifndef SEARCH_PROVIDER_H
#define SEARCH_PROVIDER_H

#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief 联网搜索服务的请求 / 结果模型
 */
namespace search {

struct SearchResult {
    std::string link;
    std::string title;
    std::string content;
    std::string snippet;
    std::optional<int> position;

    Json::Value toJson() const {
        Json::Value out(Json::objectValue);
        out["link"] = link;
        out["title"] = title;
        out["content"] = content;
        out["snippet"] = snippet;
        out["position"] = position ? Json::Value(*position) : Json::Value();
        return out;
    }

    static SearchResult fromJson(const Json::Value& v) {
        SearchResult r;
        r.link = v.get("link", "").asString();
        r.title = v.get("title", "").asString();
        r.content = v.get("content", "").asString();
        r.snippet = v.get("snippet", "").asString();
        if (v["position"].isInt()) {
            r.position = v["position"].asInt();
        }
        return r;
    }
};

struct HistoryMessage {
    std::string role;       // system / user / assistant
    std::string content;
};

struct SearchQuery {
    std::vector<HistoryMessage> history;
    std::string query;
    bool queryRewrite = true;
    int topK = 10;
    std::string contentType = "snippet";
};

struct SearchResponse {
    std::string requestId;
    double latency = 0.0;
    int searchCount = 0;
    std::vector<SearchResult> results;
};

} // namespace search

/**
 * @brief 联网搜索服务接口
 *
 * 失败（网络错误、超时、非 2xx、响应缺少结果列表）统一返回 nullopt。
 */
class ISearchProvider {
public:
    virtual ~ISearchProvider() = default;
    virtual std::optional<search::SearchResponse> search(const search::SearchQuery& query) = 0;
};

#endif // SEARCH_PROVIDER_H

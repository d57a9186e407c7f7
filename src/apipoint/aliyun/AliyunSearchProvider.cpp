#include "AliyunSearchProvider.h"
#include <drogon/drogon.h>
#include <utils/JsonUtils.h>
#include <utils/UrlUtils.h>

using namespace drogon;

AliyunSearchProvider::AliyunSearchProvider(SearchServiceConfig config)
    : config_(std::move(config)),
      clientLoop_("SearchClientLoop")
{
    auto parts = urlutil::splitUrl(config_.url);
    host_ = parts.first;
    path_ = parts.second.empty() ? "/" : parts.second;
    clientLoop_.run();
    LOG_INFO << "[联网搜索] 初始化: host=" << host_ << ", path=" << path_;
}

AliyunSearchProvider::~AliyunSearchProvider() = default;

Json::Value AliyunSearchProvider::buildRequestBody(const search::SearchQuery& query)
{
    Json::Value body(Json::objectValue);
    body["history"] = Json::Value(Json::arrayValue);
    for (const auto& h : query.history) {
        Json::Value item(Json::objectValue);
        item["role"] = h.role;
        item["content"] = h.content;
        body["history"].append(item);
    }
    body["query"] = query.query;
    body["query_rewrite"] = query.queryRewrite;
    body["top_k"] = query.topK;
    body["content_type"] = query.contentType;
    return body;
}

std::optional<search::SearchResponse> AliyunSearchProvider::parseResponse(const Json::Value& json)
{
    if (!json.isObject() || !json["result"].isObject() || !json["result"]["search_result"].isArray()) {
        return std::nullopt;
    }
    search::SearchResponse out;
    out.requestId = json.get("request_id", "").asString();
    out.latency = json.get("latency", 0.0).asDouble();
    if (json["usage"].isObject()) {
        out.searchCount = json["usage"].get("search_count", 0).asInt();
    }
    for (const auto& item : json["result"]["search_result"]) {
        if (!item.isObject()) continue;
        out.results.push_back(search::SearchResult::fromJson(item));
    }
    return out;
}

std::optional<search::SearchResponse> AliyunSearchProvider::search(const search::SearchQuery& query)
{
    if (config_.url.empty()) {
        LOG_ERROR << "[联网搜索] 未配置搜索服务地址";
        return std::nullopt;
    }

    auto client = HttpClient::newHttpClient(host_, clientLoop_.getLoop());
    if (!client) {
        LOG_ERROR << "[联网搜索] 创建 HTTP 客户端失败";
        return std::nullopt;
    }

    auto req = HttpRequest::newHttpJsonRequest(buildRequestBody(query));
    req->setMethod(Post);
    req->setPath(path_);
    if (!config_.apiKey.empty()) {
        req->addHeader("Authorization", "Bearer " + config_.apiKey);
    }

    LOG_INFO << "[联网搜索] 查询: " << query.query << ", history=" << query.history.size();

    auto [result, resp] = client->sendRequest(req, config_.timeoutSeconds);
    if (result == ReqResult::Timeout) {
        LOG_WARN << "[联网搜索] 请求超时 (" << config_.timeoutSeconds << "s)";
        return std::nullopt;
    }
    if (result != ReqResult::Ok || !resp) {
        LOG_WARN << "[联网搜索] 请求失败: " << to_string(result);
        return std::nullopt;
    }

    const std::string raw(resp->getBody());
    if (resp->statusCode() != k200OK) {
        LOG_WARN << "[联网搜索] HTTP " << static_cast<int>(resp->statusCode()) << ": " << raw.substr(0, 500);
        return std::nullopt;
    }

    Json::Value json;
    if (!jsonutil::parse(raw, json)) {
        LOG_ERROR << "[联网搜索] 响应 JSON 解析失败";
        return std::nullopt;
    }
    auto parsed = parseResponse(json);
    if (!parsed) {
        LOG_ERROR << "[联网搜索] 响应缺少 result.search_result";
        return std::nullopt;
    }
    LOG_INFO << "[联网搜索] 返回 " << parsed->results.size() << " 条结果, request_id=" << parsed->requestId;
    return parsed;
}

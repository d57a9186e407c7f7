#include "OpenAiProvider.h"
#include <drogon/drogon.h>
#include <utils/JsonUtils.h>
#include <utils/UrlUtils.h>
#include <sstream>

using namespace drogon;

OpenAiProvider::OpenAiProvider(OpenAiConfig config)
    : config_(std::move(config)),
      clientLoop_("OpenAiClientLoop")
{
    auto parts = urlutil::splitUrl(config_.baseUrl);
    host_ = parts.first;
    pathPrefix_ = parts.second;
    clientLoop_.run();
    LOG_INFO << "[OpenAi上游] 初始化: host=" << host_ << ", path=" << pathPrefix_
             << ", timeout=" << config_.timeoutSeconds << "s";
}

OpenAiProvider::~OpenAiProvider() = default;

provider::ProviderResult OpenAiProvider::complete(const Json::Value& request)
{
    Json::Value body = request;
    body["stream"] = false;
    body.removeMember("stream_options");
    return send(body, false);
}

provider::ProviderResult OpenAiProvider::stream(const Json::Value& request)
{
    Json::Value body = request;
    body["stream"] = true;
    body["stream_options"]["include_usage"] = true;
    return send(body, true);
}

provider::ProviderResult OpenAiProvider::send(const Json::Value& body, bool streaming)
{
    if (config_.apiKey.empty()) {
        return provider::ProviderResult::fail(provider::ProviderError::auth("OpenAI API key not configured"));
    }

    auto client = HttpClient::newHttpClient(host_, clientLoop_.getLoop());
    if (!client) {
        return provider::ProviderResult::fail(provider::ProviderError::network("Failed to create HTTP client"));
    }

    auto req = HttpRequest::newHttpJsonRequest(body);
    req->setMethod(Post);
    req->setPath(pathPrefix_ + "/chat/completions");
    req->addHeader("Authorization", "Bearer " + config_.apiKey);
    if (streaming) {
        req->addHeader("Accept", "text/event-stream");
    }

    LOG_DEBUG << "[OpenAi上游] 请求 model=" << body.get("model", "").asString()
              << ", stream=" << streaming;

    auto [result, resp] = client->sendRequest(req, config_.timeoutSeconds);
    if (result == ReqResult::Timeout) {
        LOG_WARN << "[OpenAi上游] 请求超时 (" << config_.timeoutSeconds << "s)";
        return provider::ProviderResult::fail(provider::ProviderError::timeout("OpenAI request timed out"));
    }
    if (result != ReqResult::Ok || !resp) {
        LOG_WARN << "[OpenAi上游] 请求失败: " << to_string(result);
        return provider::ProviderResult::fail(
            provider::ProviderError::network("OpenAI request failed: " + to_string(result)));
    }

    const std::string raw(resp->getBody());
    if (resp->statusCode() != k200OK) {
        Json::Value errJson;
        std::string message = "OpenAI API error (HTTP " + std::to_string(static_cast<int>(resp->statusCode())) + ")";
        if (jsonutil::parse(raw, errJson) && errJson.isObject() && errJson["error"].isObject()) {
            message = errJson["error"].get("message", message).asString();
        }
        LOG_WARN << "[OpenAi上游] HTTP " << static_cast<int>(resp->statusCode()) << ": " << message;
        auto err = provider::ProviderError::fromHttpStatus(static_cast<int>(resp->statusCode()), message);
        auto out = provider::ProviderResult::fail(err);
        out.rawResponse = raw;
        return out;
    }

    if (streaming) {
        auto out = provider::ProviderResult::successChunks(parseSseChunks(raw));
        LOG_DEBUG << "[OpenAi上游] 流式响应读取完成, chunks=" << out.chunks.size();
        return out;
    }

    Json::Value json;
    std::string errs;
    if (!jsonutil::parse(raw, json, &errs) || !json.isObject()) {
        provider::ProviderError err = provider::ProviderError::internal("OpenAI response JSON parse failed");
        err.httpStatusCode = static_cast<int>(resp->statusCode());
        LOG_ERROR << "[OpenAi上游] 响应解析失败: " << errs;
        return provider::ProviderResult::fail(err);
    }

    auto out = provider::ProviderResult::success(std::move(json));
    out.rawResponse = raw;
    return out;
}

std::vector<Json::Value> OpenAiProvider::parseSseChunks(const std::string& body)
{
    std::vector<Json::Value> chunks;
    std::istringstream iss(body);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.rfind("data:", 0) != 0) {
            continue;
        }
        std::string data = line.substr(5);
        const auto start = data.find_first_not_of(' ');
        data = start == std::string::npos ? "" : data.substr(start);
        if (data.empty() || data == "[DONE]") {
            continue;
        }
        Json::Value chunk;
        if (!jsonutil::parse(data, chunk) || !chunk.isObject()) {
            LOG_WARN << "[OpenAi上游] 跳过无法解析的流式行: " << data.substr(0, 120);
            continue;
        }
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

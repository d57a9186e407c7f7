#pragma once

#include <drogon/drogon.h>
#include <utils/Errors.h>
#include <string>

/**
 * @brief Controller 层通用工具函数
 *
 * 统一协议 A 的成功/失败响应构建，错误体为 {"type":"error","error":{"type","message"}}。
 *
 * 用法：
 *   ctl::sendError(callback, error::AppError::badRequest("max_tokens must be a positive integer"));
 *   ctl::sendJson(callback, responseJson);
 */
namespace ctl {

// 按 AppError 构建错误响应并回调
inline void sendError(
    std::function<void(const drogon::HttpResponsePtr&)>& callback,
    const error::AppError& err)
{
    auto resp = drogon::HttpResponse::newHttpJsonResponse(err.toJson());
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(err.httpStatus()));
    callback(resp);
}

// 构建指定状态码与类型的错误响应
inline void sendError(
    std::function<void(const drogon::HttpResponsePtr&)>& callback,
    drogon::HttpStatusCode status,
    const std::string& type,
    const std::string& message)
{
    Json::Value error;
    error["type"] = "error";
    error["error"]["type"] = type;
    error["error"]["message"] = message;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(error);
    resp->setStatusCode(status);
    callback(resp);
}

// 构建成功 JSON 响应并回调（默认 200 OK）
inline void sendJson(
    std::function<void(const drogon::HttpResponsePtr&)>& callback,
    const Json::Value& data,
    drogon::HttpStatusCode status = drogon::k200OK)
{
    auto resp = drogon::HttpResponse::newHttpJsonResponse(data);
    resp->setStatusCode(status);
    resp->setContentTypeString("application/json; charset=utf-8");
    callback(resp);
}

// 纯文本响应（JSONL 等）
inline void sendText(
    std::function<void(const drogon::HttpResponsePtr&)>& callback,
    const std::string& body,
    const std::string& contentType)
{
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(drogon::k200OK);
    resp->setContentTypeString(contentType);
    resp->setBody(body);
    callback(resp);
}

/**
 * @brief 解析请求体 JSON；失败时自动返回 invalid_request_error。
 *
 * @return true 解析成功；false 解析失败（已回调错误响应）
 */
inline bool parseJsonOrError(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>& callback,
    std::shared_ptr<Json::Value>& outJson)
{
    outJson = req->getJsonObject();
    if (!outJson) {
        ctl::sendError(callback, error::AppError::badRequest("Invalid JSON in request body"));
        return false;
    }
    return true;
}

}  // namespace ctl

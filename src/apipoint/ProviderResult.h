#ifndef PROVIDER_RESULT_H
#define PROVIDER_RESULT_H

#include <json/json.h>
#include <string>
#include <vector>
#include <utils/Errors.h>

/**
 * @brief 上游（后端模型 / 搜索服务）调用的结构化结果
 *
 * 非流式调用填充 body，流式调用填充按到达顺序排列的 chunks。
 */
namespace provider {

/**
 * @brief Provider 层错误码
 */
enum class ProviderErrorCode {
    None = 0,           // 无错误
    NetworkError,       // 网络错误
    AuthError,          // 认证错误
    RateLimited,        // 限流
    InvalidRequest,     // 无效请求
    Timeout,            // 超时
    ServiceUnavailable, // 服务不可用
    InternalError,      // 内部错误
    Unknown             // 未知错误
};

/**
 * @brief Provider 层错误信息
 */
struct ProviderError {
    ProviderErrorCode code = ProviderErrorCode::None;
    std::string message;        // 错误消息
    std::string providerCode;   // Provider 原始错误码
    int httpStatusCode = 0;     // HTTP 状态码（如果适用）

    bool hasError() const {
        return code != ProviderErrorCode::None;
    }

    static ProviderError none() {
        return ProviderError{ProviderErrorCode::None, "", "", 0};
    }

    static ProviderError network(const std::string& msg) {
        return ProviderError{ProviderErrorCode::NetworkError, msg, "", 0};
    }

    static ProviderError auth(const std::string& msg) {
        return ProviderError{ProviderErrorCode::AuthError, msg, "", 401};
    }

    static ProviderError rateLimited(const std::string& msg) {
        return ProviderError{ProviderErrorCode::RateLimited, msg, "", 429};
    }

    static ProviderError timeout(const std::string& msg) {
        return ProviderError{ProviderErrorCode::Timeout, msg, "", 504};
    }

    static ProviderError internal(const std::string& msg) {
        return ProviderError{ProviderErrorCode::InternalError, msg, "", 500};
    }

    /**
     * @brief 按上游 HTTP 状态码归类
     */
    static ProviderError fromHttpStatus(int status, const std::string& msg) {
        ProviderErrorCode code = ProviderErrorCode::Unknown;
        if (status == 401 || status == 403) code = ProviderErrorCode::AuthError;
        else if (status == 429) code = ProviderErrorCode::RateLimited;
        else if (status == 400 || status == 404 || status == 422) code = ProviderErrorCode::InvalidRequest;
        else if (status == 503) code = ProviderErrorCode::ServiceUnavailable;
        else if (status >= 500) code = ProviderErrorCode::InternalError;
        return ProviderError{code, msg, "", status};
    }

    /**
     * @brief 转为应用层错误（对客户端统一表现为 api_error 一类）
     */
    error::AppError toAppError() const {
        switch (code) {
            case ProviderErrorCode::None:
                return error::AppError();
            case ProviderErrorCode::Timeout:
                return error::AppError::timeout(message);
            case ProviderErrorCode::RateLimited:
                return error::AppError::rateLimited(message);
            default:
                return error::AppError::providerError(message, providerCode);
        }
    }
};

/**
 * @brief Provider 层返回结果
 */
struct ProviderResult {
    Json::Value body;                   // 非流式响应 JSON
    std::vector<Json::Value> chunks;    // 流式 chunk（按到达顺序）
    ProviderError error;                // 错误信息
    int statusCode = 200;               // HTTP 状态码
    std::string rawResponse;            // 原始响应（调试用）

    bool isSuccess() const {
        return !error.hasError() && statusCode == 200;
    }

    static ProviderResult success(Json::Value body) {
        ProviderResult result;
        result.body = std::move(body);
        result.statusCode = 200;
        result.error = ProviderError::none();
        return result;
    }

    static ProviderResult successChunks(std::vector<Json::Value> chunks) {
        ProviderResult result;
        result.chunks = std::move(chunks);
        result.statusCode = 200;
        result.error = ProviderError::none();
        return result;
    }

    static ProviderResult fail(const ProviderError& err) {
        ProviderResult result;
        result.error = err;
        result.statusCode = err.httpStatusCode > 0 ? err.httpStatusCode : 500;
        return result;
    }
};

} // namespace provider

#endif // PROVIDER_RESULT_H

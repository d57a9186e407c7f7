#ifndef ERRORS_H
#define ERRORS_H

#include <json/json.h>
#include <string>
#include <optional>

/**
 * @brief 统一错误模型
 *
 * 应用层错误类型，同时映射到 HTTP 状态码与协议 A 的错误类型
 * (invalid_request_error / not_found_error / api_error)。
 */

namespace error {

/**
 * @brief 错误码枚举
 */
enum class ErrorCode {
    None = 0,           // 无错误
    BadRequest,         // 400 - 请求格式错误
    Unauthorized,       // 401 - 未授权
    NotFound,           // 404 - 资源不存在
    RateLimited,        // 429 - 请求过于频繁
    Timeout,            // 504 - 上游超时
    ProviderError,      // 502 - 上游服务错误
    Internal            // 500 - 内部错误
};

inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::BadRequest: return "bad_request";
        case ErrorCode::Unauthorized: return "unauthorized";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::RateLimited: return "rate_limited";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::ProviderError: return "provider_error";
        case ErrorCode::Internal: return "internal_error";
        default: return "unknown";
    }
}

inline int errorCodeToHttpStatus(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return 200;
        case ErrorCode::BadRequest: return 400;
        case ErrorCode::Unauthorized: return 401;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::RateLimited: return 429;
        case ErrorCode::Timeout: return 504;
        case ErrorCode::ProviderError: return 502;
        case ErrorCode::Internal: return 500;
        default: return 500;
    }
}

/**
 * @brief 错误码转协议 A 的 error.type
 */
inline std::string errorCodeToApiType(ErrorCode code) {
    switch (code) {
        case ErrorCode::BadRequest: return "invalid_request_error";
        case ErrorCode::Unauthorized: return "authentication_error";
        case ErrorCode::NotFound: return "not_found_error";
        case ErrorCode::RateLimited: return "rate_limit_error";
        default: return "api_error";
    }
}

/**
 * @brief 应用错误结构
 */
struct AppError {
    ErrorCode code = ErrorCode::None;
    std::string message;
    std::string detail;
    std::string providerCode;  // 上游错误码（可选）

    AppError() = default;

    AppError(ErrorCode c, const std::string& msg, const std::string& det = "")
        : code(c), message(msg), detail(det) {}

    bool hasError() const {
        return code != ErrorCode::None;
    }

    int httpStatus() const {
        return errorCodeToHttpStatus(code);
    }

    std::string type() const {
        return errorCodeToString(code);
    }

    /**
     * @brief 协议 A 的错误类型字符串
     */
    std::string apiType() const {
        return errorCodeToApiType(code);
    }

    /**
     * @brief 协议 A 错误体：{"type":"error","error":{"type","message"}}
     */
    Json::Value toJson() const {
        Json::Value body(Json::objectValue);
        body["type"] = "error";
        body["error"]["type"] = apiType();
        body["error"]["message"] = message;
        return body;
    }

    // 工厂方法
    static AppError badRequest(const std::string& msg, const std::string& det = "") {
        return AppError(ErrorCode::BadRequest, msg, det);
    }

    static AppError unauthorized(const std::string& msg = "Unauthorized") {
        return AppError(ErrorCode::Unauthorized, msg);
    }

    static AppError notFound(const std::string& msg = "Resource not found") {
        return AppError(ErrorCode::NotFound, msg);
    }

    static AppError rateLimited(const std::string& msg = "Too many requests") {
        return AppError(ErrorCode::RateLimited, msg);
    }

    static AppError timeout(const std::string& msg = "Request timeout") {
        return AppError(ErrorCode::Timeout, msg);
    }

    static AppError providerError(const std::string& msg, const std::string& providerCode = "") {
        AppError err(ErrorCode::ProviderError, msg);
        err.providerCode = providerCode;
        return err;
    }

    static AppError internal(const std::string& msg = "Internal server error") {
        return AppError(ErrorCode::Internal, msg);
    }
};

} // namespace error

#endif // ERRORS_H

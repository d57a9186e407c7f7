#include "HealthController.h"
#include "ControllerUtils.h"
#include <utils/TimeUtils.h>
#include <drogon/drogon.h>

std::chrono::steady_clock::time_point HealthController::startTime_ = std::chrono::steady_clock::now();

void HealthController::setStartTime(std::chrono::steady_clock::time_point startTime) {
    startTime_ = startTime;
}

void HealthController::health(const drogon::HttpRequestPtr&,
                              std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    Json::Value response(Json::objectValue);
    response["status"] = "ok";
    response["timestamp"] = timeutil::toIso8601(std::chrono::system_clock::now());
    response["version"] = kVersion;

    const auto now = std::chrono::steady_clock::now();
    const auto uptimeSeconds = std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();
    response["uptime"] = static_cast<Json::Int64>(uptimeSeconds);

    ctl::sendJson(callback, response);
}

void HealthController::index(const drogon::HttpRequestPtr&,
                             std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    Json::Value response(Json::objectValue);
    response["message"] = "Messages API to Chat Completions bridge";
    response["version"] = kVersion;
    response["endpoints"]["messages"] = "/v1/messages";
    response["endpoints"]["count_tokens"] = "/v1/messages/count_tokens";
    response["endpoints"]["batches"] = "/v1/messages/batches";
    response["endpoints"]["models"] = "/v1/models";
    response["endpoints"]["health"] = "/health";
    ctl::sendJson(callback, response);
}

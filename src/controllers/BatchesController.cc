#include "BatchesController.h"
#include "ControllerUtils.h"
#include <drogon/drogon.h>

using namespace drogon;

BatchesController::BatchesController(std::shared_ptr<BatchManager> batches)
    : batches_(std::move(batches))
{
}

void BatchesController::create(const HttpRequestPtr &req, std::function<void(const HttpResponsePtr &)> &&callback)
{
    std::shared_ptr<Json::Value> jsonPtr;
    if (!ctl::parseJsonOrError(req, callback, jsonPtr)) return;

    BatchJob job;
    if (auto err = batches_->create(*jsonPtr, job)) {
        LOG_WARN << "[批处理控制器] 创建失败: " << err->message;
        ctl::sendError(callback, *err);
        return;
    }
    ctl::sendJson(callback, job.toJson());
}

void BatchesController::list(const HttpRequestPtr &, std::function<void(const HttpResponsePtr &)> &&callback)
{
    Json::Value response(Json::objectValue);
    response["object"] = "list";
    response["data"] = Json::Value(Json::arrayValue);
    const auto jobs = batches_->list();
    for (const auto& job : jobs) {
        response["data"].append(job.toJson());
    }
    response["has_more"] = false;
    response["first_id"] = jobs.empty() ? Json::Value() : Json::Value(jobs.front().id);
    response["last_id"] = jobs.empty() ? Json::Value() : Json::Value(jobs.back().id);
    ctl::sendJson(callback, response);
}

void BatchesController::get(const HttpRequestPtr &, std::function<void(const HttpResponsePtr &)> &&callback, std::string batchId)
{
    auto job = batches_->get(batchId);
    if (!job) {
        ctl::sendError(callback, error::AppError::notFound("Batch " + batchId + " not found"));
        return;
    }
    ctl::sendJson(callback, job->toJson());
}

void BatchesController::cancel(const HttpRequestPtr &, std::function<void(const HttpResponsePtr &)> &&callback, std::string batchId)
{
    BatchJob job;
    if (auto err = batches_->cancel(batchId, job)) {
        ctl::sendError(callback, *err);
        return;
    }
    ctl::sendJson(callback, job.toJson());
}

void BatchesController::results(const HttpRequestPtr &, std::function<void(const HttpResponsePtr &)> &&callback, std::string batchId)
{
    std::string jsonl;
    if (auto err = batches_->results(batchId, jsonl)) {
        ctl::sendError(callback, *err);
        return;
    }
    ctl::sendText(callback, jsonl, "application/x-jsonlines");
}

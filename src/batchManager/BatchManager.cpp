#include "BatchManager.h"
#include <utils/BackgroundTaskQueue.h>
#include <utils/IdGenerator.h>
#include <utils/JsonUtils.h>
#include <drogon/drogon.h>
#include <exception>

BatchManager::BatchManager(ItemRunner runner, Executor executor)
    : runner_(std::move(runner)),
      executor_(executor ? std::move(executor) : Executor([](const std::string& name, std::function<void()> task) {
          if (!BackgroundTaskQueue::instance().enqueue(name, std::move(task))) {
              LOG_ERROR << "[批处理] 后台队列已停机, 任务未执行: " << name;
          }
      })) {}

error::AppError BatchManager::notFound(const std::string& id) {
    return error::AppError::notFound("Batch " + id + " not found");
}

std::optional<error::AppError> BatchManager::parseRequests(const Json::Value& body, std::vector<BatchRequest>& out) {
    if (!body.isObject() || !body["requests"].isArray()) {
        return error::AppError::badRequest("requests field is required and must be an array");
    }
    const Json::Value& requests = body["requests"];
    if (requests.empty()) {
        return error::AppError::badRequest("requests must contain at least one request");
    }

    out.clear();
    for (Json::ArrayIndex i = 0; i < requests.size(); ++i) {
        const Json::Value& item = requests[i];
        const std::string where = "requests[" + std::to_string(i) + "]";
        if (!item.isObject()) {
            return error::AppError::badRequest(where + " must be an object");
        }
        BatchRequest request;
        request.customId = jsonutil::getString(item, "custom_id");
        if (request.customId.empty()) {
            return error::AppError::badRequest(where + ".custom_id must be a non-empty string");
        }
        if (item["params"].isObject()) {
            request.params = item["params"];
        } else if (item["body"].isObject()) {
            request.params = item["body"];
        } else {
            return error::AppError::badRequest(where + ".params must be an object");
        }
        out.push_back(std::move(request));
    }
    return std::nullopt;
}

std::optional<error::AppError> BatchManager::create(const Json::Value& body, BatchJob& out) {
    std::vector<BatchRequest> requests;
    if (auto err = parseRequests(body, requests)) {
        return err;
    }

    BatchJob job;
    job.id = ids::batchId();
    job.status = BatchStatus::Validating;
    job.createdAt = std::chrono::system_clock::now();
    job.expiresAt = job.createdAt + kExpiry;
    job.counts.processing = static_cast<int>(requests.size());
    job.requests = std::move(requests);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_[job.id] = job;
        order_.push_back(job.id);
        out = job;
    }
    LOG_INFO << "[批处理] 创建作业 " << job.id << ", 请求数: " << job.requests.size();

    const std::string id = job.id;
    executor_("batch:" + id, [this, id]() { process(id); });
    return std::nullopt;
}

void BatchManager::process(const std::string& id) {
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            LOG_ERROR << "[批处理] 作业不存在: " << id;
            return;
        }
        if (it->second.status == BatchStatus::Validating) {
            it->second.status = BatchStatus::InProgress;
        }
        total = it->second.requests.size();
    }

    for (size_t i = 0; i < total; ++i) {
        BatchRequest request;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            BatchJob& job = jobs_.at(id);
            request = job.requests[i];
            if (job.cancelRequested()) {
                BatchItemResult result;
                result.customId = request.customId;
                result.type = BatchResultType::Canceled;
                job.results.push_back(std::move(result));
                --job.counts.processing;
                ++job.counts.canceled;
                continue;
            }
        }

        BatchItemResult result;
        result.customId = request.customId;
        try {
            Json::Value message;
            if (auto err = runner_(request.params, message)) {
                result.type = BatchResultType::Errored;
                result.error = *err;
            } else {
                result.type = BatchResultType::Succeeded;
                result.message = std::move(message);
            }
        } catch (const std::exception& e) {
            LOG_ERROR << "[批处理] 作业 " << id << " 请求 " << request.customId << " 异常: " << e.what();
            result.type = BatchResultType::Errored;
            result.error = error::AppError::internal(e.what());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        BatchJob& job = jobs_.at(id);
        --job.counts.processing;
        if (result.type == BatchResultType::Succeeded) {
            ++job.counts.succeeded;
        } else {
            LOG_WARN << "[批处理] 作业 " << id << " 请求 " << request.customId << " 失败: "
                     << (result.error ? result.error->message : "");
            ++job.counts.errored;
        }
        job.results.push_back(std::move(result));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    BatchJob& job = jobs_.at(id);
    job.status = BatchStatus::Ended;
    job.endedAt = std::chrono::system_clock::now();
    LOG_INFO << "[批处理] 作业 " << id << " 结束: succeeded=" << job.counts.succeeded
             << ", errored=" << job.counts.errored << ", canceled=" << job.counts.canceled;
}

std::optional<BatchJob> BatchManager::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<BatchJob> BatchManager::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BatchJob> out;
    out.reserve(order_.size());
    for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
        out.push_back(jobs_.at(*it));
    }
    return out;
}

std::optional<error::AppError> BatchManager::cancel(const std::string& id, BatchJob& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return notFound(id);
    }
    BatchJob& job = it->second;
    if (job.ended()) {
        return error::AppError::badRequest("Cannot cancel a batch that has already ended");
    }
    if (!job.cancelRequested()) {
        job.cancelInitiatedAt = std::chrono::system_clock::now();
        LOG_INFO << "[批处理] 作业 " << id << " 请求取消";
    }
    job.status = BatchStatus::Canceling;
    out = job;
    return std::nullopt;
}

std::optional<error::AppError> BatchManager::results(const std::string& id, std::string& jsonl) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return notFound(id);
    }
    if (!it->second.ended()) {
        return error::AppError::badRequest("Batch results are not yet available");
    }
    jsonl = it->second.resultsJsonl();
    return std::nullopt;
}

size_t BatchManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

#ifndef BATCH_JOB_H
#define BATCH_JOB_H

#include <utils/Errors.h>
#include <json/json.h>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

enum class BatchStatus {
    Validating,
    InProgress,
    Canceling,
    Ended
};

inline std::string batchStatusToString(BatchStatus status) {
    switch (status) {
        case BatchStatus::Validating: return "validating";
        case BatchStatus::InProgress: return "in_progress";
        case BatchStatus::Canceling: return "canceling";
        case BatchStatus::Ended: return "ended";
    }
    return "unknown";
}

/**
 * @brief 请求计数
 *
 * processing + succeeded + errored + canceled 恒等于请求总数。
 */
struct RequestCounts {
    int processing = 0;
    int succeeded = 0;
    int errored = 0;
    int canceled = 0;

    int total() const { return processing + succeeded + errored + canceled; }
};

struct BatchRequest {
    std::string customId;
    Json::Value params;     // 协议 A 的 Messages 请求体
};

enum class BatchResultType {
    Succeeded,
    Errored,
    Canceled
};

struct BatchItemResult {
    std::string customId;
    BatchResultType type = BatchResultType::Succeeded;
    Json::Value message;                    // Succeeded 时的协议 A 消息
    std::optional<error::AppError> error;   // Errored 时的错误

    /// {"custom_id": ..., "result": {"type": ..., "message"|"error": ...}}
    Json::Value toJson() const;
};

struct BatchJob {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string id;
    BatchStatus status = BatchStatus::Validating;
    RequestCounts counts;
    TimePoint createdAt;
    TimePoint expiresAt;
    std::optional<TimePoint> endedAt;
    std::optional<TimePoint> cancelInitiatedAt;
    std::vector<BatchRequest> requests;
    std::vector<BatchItemResult> results;

    bool ended() const { return status == BatchStatus::Ended; }
    bool cancelRequested() const { return cancelInitiatedAt.has_value(); }

    /// 批任务元数据（不含请求与结果）
    Json::Value toJson() const;

    /// 结果按请求顺序输出为 JSONL
    std::string resultsJsonl() const;
};

#endif // BATCH_JOB_H

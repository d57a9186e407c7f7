#include "BatchJob.h"
#include <utils/JsonUtils.h>
#include <utils/TimeUtils.h>

namespace {

Json::Value optionalTime(const std::optional<BatchJob::TimePoint>& tp) {
    return tp ? Json::Value(timeutil::toIso8601(*tp)) : Json::Value();
}

} // namespace

Json::Value BatchItemResult::toJson() const {
    Json::Value out(Json::objectValue);
    out["custom_id"] = customId;
    Json::Value result(Json::objectValue);
    switch (type) {
        case BatchResultType::Succeeded:
            result["type"] = "succeeded";
            result["message"] = message;
            break;
        case BatchResultType::Errored: {
            result["type"] = "errored";
            const error::AppError err = error ? *error : error::AppError::internal("Unknown error");
            result["error"] = err.toJson();
            break;
        }
        case BatchResultType::Canceled:
            result["type"] = "canceled";
            break;
    }
    out["result"] = result;
    return out;
}

Json::Value BatchJob::toJson() const {
    Json::Value out(Json::objectValue);
    out["id"] = id;
    out["type"] = "message_batch";
    out["processing_status"] = batchStatusToString(status);
    out["request_counts"]["processing"] = counts.processing;
    out["request_counts"]["succeeded"] = counts.succeeded;
    out["request_counts"]["errored"] = counts.errored;
    out["request_counts"]["canceled"] = counts.canceled;
    out["request_counts"]["expired"] = 0;
    out["ended_at"] = optionalTime(endedAt);
    out["archived_at"] = Json::Value();
    out["cancel_initiated_at"] = optionalTime(cancelInitiatedAt);
    out["expires_at"] = timeutil::toIso8601(expiresAt);
    out["created_at"] = timeutil::toIso8601(createdAt);
    out["results_url"] = ended() ? Json::Value("/v1/messages/batches/" + id + "/results") : Json::Value();
    return out;
}

std::string BatchJob::resultsJsonl() const {
    std::string out;
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0) {
            out += "\n";
        }
        out += jsonutil::toCompactString(results[i].toJson());
    }
    return out;
}

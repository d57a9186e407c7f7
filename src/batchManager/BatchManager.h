#ifndef BATCH_MANAGER_H
#define BATCH_MANAGER_H

#include "BatchJob.h"
#include <utils/Errors.h>
#include <json/json.h>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief 批处理作业仓库
 *
 * 生命周期：validating → in_progress → ended，canceling 为协作式取消标记。
 * 每个作业由一个后台任务按顺序处理其请求；计数在锁内更新，任意快照都满足
 * processing + succeeded + errored + canceled == 请求数。执行单个请求期间不持锁。
 */
class BatchManager {
public:
    /**
     * @brief 执行单个请求的一次性调用路径
     *
     * @param params  协议 A 请求体
     * @param message 输出：成功时的协议 A 消息 JSON
     * @return 失败时的错误
     */
    using ItemRunner = std::function<std::optional<error::AppError>(const Json::Value& params, Json::Value& message)>;

    /// 提交后台任务；缺省使用 BackgroundTaskQueue
    using Executor = std::function<void(const std::string& name, std::function<void()> task)>;

    static constexpr std::chrono::hours kExpiry{24};

    explicit BatchManager(ItemRunner runner, Executor executor = nullptr);

    BatchManager(const BatchManager&) = delete;
    BatchManager& operator=(const BatchManager&) = delete;

    /**
     * @brief 校验请求体并创建作业，随即调度后台处理
     *
     * 请求体：{"requests": [{"custom_id": "...", "params": {...}}, ...]}（params 也可写作 body）
     */
    std::optional<error::AppError> create(const Json::Value& body, BatchJob& out);

    std::optional<BatchJob> get(const std::string& id) const;

    /// 全部作业，最新创建的在前
    std::vector<BatchJob> list() const;

    /// 标记取消；已结束的作业不可取消
    std::optional<error::AppError> cancel(const std::string& id, BatchJob& out);

    /// 已结束作业的 JSONL 结果；未结束时为 invalid_request_error
    std::optional<error::AppError> results(const std::string& id, std::string& jsonl) const;

    size_t size() const;

    static std::optional<error::AppError> parseRequests(const Json::Value& body, std::vector<BatchRequest>& out);

private:
    void process(const std::string& id);
    static error::AppError notFound(const std::string& id);

    ItemRunner runner_;
    Executor executor_;

    mutable std::mutex mutex_;
    std::map<std::string, BatchJob> jobs_;
    std::vector<std::string> order_;    // 创建顺序
};

#endif // BATCH_MANAGER_H

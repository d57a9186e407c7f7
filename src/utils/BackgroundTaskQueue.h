#pragma once

#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <string>
#include <vector>
#include <drogon/drogon.h>

/**
 * @brief 后台任务队列
 *
 * 固定数量的工作线程从队列中消费任务，承载流式响应的生成与批处理作业。
 * 任务体内抛出的异常在这里捕获并记录，不会终止工作线程。
 *
 * 用法:
 *   BackgroundTaskQueue::instance().configure(4);
 *   BackgroundTaskQueue::instance().enqueue("batch:" + id, [](){ ... });
 *
 * 停机:
 *   BackgroundTaskQueue::instance().shutdown();  // 等待队列排空后回收所有线程
 */
class BackgroundTaskQueue
{
public:
    static constexpr size_t kDefaultThreads = 2;

    static BackgroundTaskQueue& instance()
    {
        static BackgroundTaskQueue inst;
        return inst;
    }

    /// 设置工作线程数，仅在启动前生效
    void configure(size_t numThreads)
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (started_) {
            LOG_WARN << "[后台任务队列] 已启动, 忽略线程数配置: " << numThreads;
            return;
        }
        numThreads_ = numThreads > 0 ? numThreads : kDefaultThreads;
    }

    /// 启动工作线程（未手动调用时，首次 enqueue 自动启动）
    void start()
    {
        std::lock_guard<std::mutex> lk(mu_);
        startLocked();
    }

    /// 提交任务到队列；停机后提交的任务被丢弃并返回 false（停机不可逆）
    bool enqueue(const std::string& name, std::function<void()> task)
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            startLocked();
            if (stopping_) {
                LOG_WARN << "[后台任务队列] 已停机，忽略任务：" << name;
                return false;
            }
            tasks_.push({name, std::move(task)});
        }
        cv_.notify_one();
        LOG_DEBUG << "[后台任务队列] 任务入队：" << name;
        return true;
    }

    /// 优雅停机：等待队列排空，然后回收所有线程
    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (stopping_) return;
            stopping_ = true;
            if (!started_) return;
        }
        cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) {
                w.join();
            }
        }
        workers_.clear();
        std::lock_guard<std::mutex> lk(mu_);
        started_ = false;
        LOG_INFO << "[后台任务队列] 已停机，所有工作线程已退出";
    }

    size_t pendingCount() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return tasks_.size();
    }

    size_t threadCount() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return numThreads_;
    }

    ~BackgroundTaskQueue()
    {
        shutdown();
    }

    BackgroundTaskQueue(const BackgroundTaskQueue&) = delete;
    BackgroundTaskQueue& operator=(const BackgroundTaskQueue&) = delete;

private:
    BackgroundTaskQueue() = default;

    struct NamedTask {
        std::string name;
        std::function<void()> fn;
    };

    void startLocked()
    {
        if (started_ || stopping_) return;
        started_ = true;
        for (size_t i = 0; i < numThreads_; ++i) {
            workers_.emplace_back([this, i]() { workerLoop(i); });
        }
        LOG_INFO << "[后台任务队列] 启动 " << numThreads_ << " 个工作线程";
    }

    void workerLoop(size_t id)
    {
        LOG_DEBUG << "[后台任务队列] 工作线程 #" << id << " 已启动";
        while (true) {
            NamedTask task;
            {
                std::unique_lock<std::mutex> lk(mu_);
                cv_.wait(lk, [this]() { return stopping_ || !tasks_.empty(); });
                if (stopping_ && tasks_.empty()) {
                    break;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            try {
                LOG_DEBUG << "[后台任务队列] 线程 #" << id
                          << " 执行任务: " << task.name;
                task.fn();
            } catch (const std::exception& e) {
                LOG_ERROR << "[后台任务队列] 任务 '" << task.name
                          << "' 异常: " << e.what();
            } catch (...) {
                LOG_ERROR << "[后台任务队列] 任务 '" << task.name
                          << "' 未知异常";
            }
        }
        LOG_DEBUG << "[后台任务队列] 工作线程 #" << id << " 已退出";
    }

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::queue<NamedTask> tasks_;
    std::vector<std::thread> workers_;
    size_t numThreads_ = kDefaultThreads;
    bool started_ = false;
    bool stopping_ = false;
};

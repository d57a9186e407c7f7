#ifndef EPHEMERAL_CACHE_H
#define EPHEMERAL_CACHE_H

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <json/json.h>
#include <trantor/net/EventLoop.h>

/**
 * @brief EphemeralCache（纯内存 TTL 缓存）
 *
 * 职责：
 * - 在联网搜索的两个阶段之间暂存原始搜索结果（以 link 为 key）
 *
 * 说明：
 * - 读取时惰性过期：过期条目视为不存在并立即移除
 * - attachLoop 后在事件循环上周期清理；缓存为空时停止定时器，下次写入时重新启动
 * - 时钟可注入，便于测试
 */
class EphemeralCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr std::chrono::milliseconds kDefaultTtl = std::chrono::hours(1);
    static constexpr std::chrono::milliseconds kDefaultCleanupInterval = std::chrono::minutes(5);

    explicit EphemeralCache(std::chrono::milliseconds defaultTtl = kDefaultTtl,
                            std::chrono::milliseconds cleanupInterval = kDefaultCleanupInterval,
                            Clock clock = nullptr);
    ~EphemeralCache();

    EphemeralCache(const EphemeralCache&) = delete;
    EphemeralCache& operator=(const EphemeralCache&) = delete;

    /// 绑定事件循环以启用周期清理（nullptr 表示仅惰性过期）
    void attachLoop(trantor::EventLoop* loop);

    void set(const std::string& key, const Json::Value& value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);
    std::optional<Json::Value> get(const std::string& key);
    bool has(const std::string& key);
    bool erase(const std::string& key);

    /// 剩余存活时间；不存在或已过期返回 nullopt
    std::optional<std::chrono::milliseconds> ttl(const std::string& key);

    /// 以新 TTL（缺省为默认 TTL）重新计时；不存在返回 false
    bool refresh(const std::string& key,
                 std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    std::vector<std::string> keys();
    size_t size();
    void clear();

    /// 移除全部过期条目，返回移除数量
    size_t cleanup();

    bool sweepActive() const;

private:
    struct Entry {
        Json::Value value;
        std::chrono::steady_clock::time_point expireAt;
    };

    std::chrono::steady_clock::time_point now() const;
    size_t cleanupLocked(std::chrono::steady_clock::time_point now);
    void startSweepLocked();
    void stopSweepLocked();
    void onSweep();

    std::chrono::milliseconds defaultTtl_;
    std::chrono::milliseconds cleanupInterval_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> map_;

    trantor::EventLoop* loop_ = nullptr;
    std::optional<trantor::TimerId> timerId_;
};

#endif // EPHEMERAL_CACHE_H

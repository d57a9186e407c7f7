#include "EphemeralCache.h"

#include <drogon/drogon.h>

EphemeralCache::EphemeralCache(std::chrono::milliseconds defaultTtl,
                               std::chrono::milliseconds cleanupInterval,
                               Clock clock)
    : defaultTtl_(defaultTtl),
      cleanupInterval_(cleanupInterval),
      clock_(std::move(clock)) {}

EphemeralCache::~EphemeralCache() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopSweepLocked();
}

std::chrono::steady_clock::time_point EphemeralCache::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

void EphemeralCache::attachLoop(trantor::EventLoop* loop) {
    std::lock_guard<std::mutex> lock(mutex_);
    stopSweepLocked();
    loop_ = loop;
    if (!map_.empty()) {
        startSweepLocked();
    }
}

void EphemeralCache::set(const std::string& key, const Json::Value& value,
                         std::optional<std::chrono::milliseconds> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    map_[key] = Entry{value, now() + ttl.value_or(defaultTtl_)};
    startSweepLocked();
}

std::optional<Json::Value> EphemeralCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
        return std::nullopt;
    }
    if (now() > it->second.expireAt) {
        map_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

bool EphemeralCache::has(const std::string& key) {
    return get(key).has_value();
}

bool EphemeralCache::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.erase(key) > 0;
}

std::optional<std::chrono::milliseconds> EphemeralCache::ttl(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
        return std::nullopt;
    }
    const auto current = now();
    if (current > it->second.expireAt) {
        map_.erase(it);
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(it->second.expireAt - current);
}

bool EphemeralCache::refresh(const std::string& key, std::optional<std::chrono::milliseconds> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
        return false;
    }
    const auto current = now();
    if (current > it->second.expireAt) {
        map_.erase(it);
        return false;
    }
    it->second.expireAt = current + ttl.value_or(defaultTtl_);
    return true;
}

std::vector<std::string> EphemeralCache::keys() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanupLocked(now());
    std::vector<std::string> out;
    out.reserve(map_.size());
    for (const auto& kv : map_) {
        out.push_back(kv.first);
    }
    return out;
}

size_t EphemeralCache::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanupLocked(now());
    return map_.size();
}

void EphemeralCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    map_.clear();
    stopSweepLocked();
}

size_t EphemeralCache::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    return cleanupLocked(now());
}

bool EphemeralCache::sweepActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timerId_.has_value();
}

size_t EphemeralCache::cleanupLocked(std::chrono::steady_clock::time_point current) {
    size_t removed = 0;
    for (auto it = map_.begin(); it != map_.end();) {
        if (current > it->second.expireAt) {
            it = map_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void EphemeralCache::startSweepLocked() {
    if (!loop_ || timerId_) {
        return;
    }
    const auto interval = std::chrono::duration<double>(cleanupInterval_);
    timerId_ = loop_->runEvery(interval, [this]() { onSweep(); });
    LOG_DEBUG << "[临时缓存] 启动周期清理, 间隔 " << interval.count() << "s";
}

void EphemeralCache::stopSweepLocked() {
    if (loop_ && timerId_) {
        loop_->invalidateTimer(*timerId_);
        LOG_DEBUG << "[临时缓存] 停止周期清理";
    }
    timerId_.reset();
}

void EphemeralCache::onSweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t removed = cleanupLocked(now());
    if (removed > 0) {
        LOG_DEBUG << "[临时缓存] 清理过期条目 " << removed << " 个, 剩余 " << map_.size();
    }
    if (map_.empty()) {
        stopSweepLocked();
    }
}

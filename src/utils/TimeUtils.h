#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

/**
 * @brief 时间格式化工具（UTC）
 */
namespace timeutil {

inline std::tm toUtc(std::chrono::system_clock::time_point tp)
{
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    return tm;
}

/// ISO-8601，毫秒精度，例如 2025-06-19T08:30:00.000Z
inline std::string toIso8601(std::chrono::system_clock::time_point tp)
{
    const std::tm tm = toUtc(tp);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        tp.time_since_epoch()).count() % 1000;
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

/// 长日期，例如 June 19, 2025
inline std::string toLongDate(std::chrono::system_clock::time_point tp)
{
    static const char* kMonths[] = {
        "January", "February", "March", "April", "May", "June",
        "July", "August", "September", "October", "November", "December"};
    const std::tm tm = toUtc(tp);
    return std::string(kMonths[tm.tm_mon]) + " " + std::to_string(tm.tm_mday) + ", " +
           std::to_string(tm.tm_year + 1900);
}

inline int64_t toUnixSeconds(std::chrono::system_clock::time_point tp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace timeutil

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace urlutil {

/**
 * @brief 拆分 URL 为 {scheme://host[:port], 路径}，路径不含末尾 '/'
 */
inline std::pair<std::string, std::string> splitUrl(const std::string& input)
{
    std::string url = input;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    const auto schemePos = url.find("://");
    const size_t hostStart = schemePos == std::string::npos ? 0 : schemePos + 3;
    const auto pathPos = url.find('/', hostStart);
    if (pathPos == std::string::npos) {
        return {url, ""};
    }
    return {url.substr(0, pathPos), url.substr(pathPos)};
}

/**
 * @brief 提取主机名（不含端口与用户信息）；不是 scheme://host 形式时返回 nullopt
 */
inline std::optional<std::string> hostname(const std::string& url)
{
    const auto schemePos = url.find("://");
    if (schemePos == std::string::npos || schemePos == 0) {
        return std::nullopt;
    }
    size_t start = schemePos + 3;
    size_t end = url.find_first_of("/?#", start);
    std::string authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        return authority.substr(0, close + 1);
    }
    const auto colon = authority.find(':');
    if (colon != std::string::npos) {
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return std::nullopt;
    }
    return authority;
}

} // namespace urlutil

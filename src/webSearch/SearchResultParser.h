#ifndef SEARCH_RESULT_PARSER_H
#define SEARCH_RESULT_PARSER_H

#include <optional>
#include <string>
#include <vector>

namespace websearch {

struct SearchLink {
    std::string title;
    std::string url;
};

struct ParsedSearchResult {
    std::string queryPart;          // 数组之前的文本（已去首尾空白）
    std::vector<SearchLink> links;
};

/**
 * @brief 从工具结果文本中拆出查询与结果数组
 *
 * 定位最后一个 ']'，向前按括号深度找到与之匹配的 '['：
 * '[' 之前为查询文本，'[' ... ']' 按 JSON 数组解析为 {title,url}。
 * 找不到配对括号返回 nullopt；数组不是合法 JSON 时 links 为空。
 */
std::optional<ParsedSearchResult> parseSearchResult(const std::string& text);

/**
 * @brief 去掉 "Web search results for query:" 前缀、结尾的 "Links:" 与包裹引号
 */
std::string cleanQuery(const std::string& queryPart);

} // namespace websearch

#endif // SEARCH_RESULT_PARSER_H

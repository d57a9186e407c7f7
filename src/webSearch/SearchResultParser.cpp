#include "SearchResultParser.h"
#include <utils/JsonUtils.h>
#include <drogon/drogon.h>

namespace websearch {

namespace {

const char* kResultMarker = "Web search results for query:";

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::optional<ParsedSearchResult> parseSearchResult(const std::string& text) {
    const auto last = text.rfind(']');
    if (last == std::string::npos) {
        return std::nullopt;
    }

    int depth = 0;
    std::optional<size_t> first;
    for (size_t i = last + 1; i-- > 0;) {
        if (text[i] == ']') {
            ++depth;
        } else if (text[i] == '[') {
            --depth;
            if (depth == 0) {
                first = i;
                break;
            }
        }
    }
    if (!first) {
        return std::nullopt;
    }

    ParsedSearchResult result;
    result.queryPart = trim(text.substr(0, *first));

    Json::Value array;
    std::string errs;
    if (!jsonutil::parse(text.substr(*first, last - *first + 1), array, &errs) || !array.isArray()) {
        LOG_WARN << "[搜索结果解析] 结果数组不是合法 JSON: " << errs;
        return result;
    }
    for (const auto& item : array) {
        if (!item.isObject()) continue;
        SearchLink link;
        link.title = jsonutil::getString(item, "title");
        link.url = jsonutil::getString(item, "url");
        result.links.push_back(std::move(link));
    }
    return result;
}

std::string cleanQuery(const std::string& queryPart) {
    std::string q = trim(queryPart);
    const std::string marker = kResultMarker;
    if (q.compare(0, marker.size(), marker) == 0) {
        q = trim(q.substr(marker.size()));
    }
    const std::string links = "Links:";
    if (q.size() >= links.size() && q.compare(q.size() - links.size(), links.size(), links) == 0) {
        q = trim(q.substr(0, q.size() - links.size()));
    }
    if (q.size() >= 2 && q.front() == '"' && q.back() == '"') {
        q = q.substr(1, q.size() - 2);
    }
    return q;
}

} // namespace websearch

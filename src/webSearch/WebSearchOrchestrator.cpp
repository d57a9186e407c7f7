#include "WebSearchOrchestrator.h"
#include <adapters/ContentCodec.h>
#include <protocol/AnthropicJson.h>
#include <utils/IdGenerator.h>
#include <utils/JsonUtils.h>
#include <utils/TimeUtils.h>
#include <utils/UrlUtils.h>
#include <drogon/drogon.h>
#include <drogon/utils/Utilities.h>
#include <regex>
#include <set>
#include <sstream>

using namespace anthropic;

namespace {

const char* kSummarySystemPrompt =
    "You are a helpful assistant that analyzes search results and provides comprehensive, "
    "well-structured responses.";

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// 按 UTF-8 码点截断
std::string utf8Prefix(const std::string& text, size_t codepoints, bool& truncated) {
    size_t pos = 0;
    size_t count = 0;
    while (pos < text.size() && count < codepoints) {
        const auto lead = static_cast<unsigned char>(text[pos]);
        size_t len = 1;
        if ((lead >> 5) == 0x6) len = 2;
        else if ((lead >> 4) == 0xE) len = 3;
        else if ((lead >> 3) == 0x1E) len = 4;
        pos += len;
        ++count;
    }
    if (pos > text.size()) {
        pos = text.size();
    }
    truncated = pos < text.size();
    return text.substr(0, pos);
}

std::string base64(const std::string& raw) {
    return drogon::utils::base64Encode(reinterpret_cast<const unsigned char*>(raw.data()),
                                       static_cast<unsigned int>(raw.size()));
}

const Message* lastUserMessage(const MessageRequest& request) {
    for (auto it = request.messages.rbegin(); it != request.messages.rend(); ++it) {
        if (it->role == "user") {
            return &*it;
        }
    }
    return nullptr;
}

// tool_result 的文本：字符串原样返回，块数组拼接其中的 text
std::string toolResultText(const Json::Value& content) {
    if (content.isString()) {
        return content.asString();
    }
    std::string out;
    if (content.isArray()) {
        for (const auto& item : content) {
            if (jsonutil::getString(item, "type") == "text") {
                out += jsonutil::getString(item, "text");
            }
        }
    }
    return out;
}

} // namespace

WebSearchOrchestrator::WebSearchOrchestrator(ISearchProvider& searchProvider,
                                             IChatBackend& backend,
                                             EphemeralCache& cache,
                                             const ITokenEstimator& estimator,
                                             WebSearchOptions options,
                                             DateProvider today)
    : searchProvider_(searchProvider),
      backend_(backend),
      cache_(cache),
      estimator_(estimator),
      options_(options),
      today_(today ? std::move(today) : DateProvider([] { return std::chrono::system_clock::now(); })) {}

std::optional<std::string> WebSearchOrchestrator::findResultText(const MessageRequest& request) {
    const Message* user = lastUserMessage(request);
    if (!user) {
        return std::nullopt;
    }
    for (const auto& block : user->content) {
        const auto* result = std::get_if<ToolResultBlock>(&block);
        if (!result) continue;
        std::string text = toolResultText(result->content);
        if (text.find(kResultMarker) != std::string::npos) {
            return text;
        }
    }
    return std::nullopt;
}

WebSearchPhase WebSearchOrchestrator::detect(const MessageRequest& request) {
    if (findResultText(request)) {
        return WebSearchPhase::Consume;
    }
    if (request.tools.size() == 1 && isWebSearchTool(request.tools.front())) {
        return WebSearchPhase::Initiate;
    }
    return WebSearchPhase::None;
}

std::string WebSearchOrchestrator::extractQuery(const std::string& userText) {
    static const std::regex pattern(
        R"((?:web search for (?:the )?query:?\s*|search for:?\s*)(.+?)(?:\.|$))",
        std::regex::icase);
    std::smatch match;
    if (std::regex_search(userText, match, pattern)) {
        return trim(match[1].str());
    }
    return trim(userText);
}

std::vector<search::HistoryMessage> WebSearchOrchestrator::buildHistory(const MessageRequest& request) {
    std::vector<search::HistoryMessage> history;
    if (!request.system.empty()) {
        history.push_back({"system", request.system});
    }
    for (const auto& message : request.messages) {
        std::string content;
        for (size_t i = 0; i < message.content.size(); ++i) {
            if (i > 0) {
                content += "\n";
            }
            const auto& block = message.content[i];
            if (const auto* text = std::get_if<TextBlock>(&block)) {
                content += text->text;
            } else {
                content += jsonutil::toCompactString(toJson(block));
            }
        }
        history.push_back({message.role, content});
    }
    return history;
}

std::optional<error::AppError> WebSearchOrchestrator::handle(const MessageRequest& request,
                                                             WebSearchPhase phase,
                                                             const std::string& responseModel,
                                                             const std::string& backendModel,
                                                             MessageResponse& out) {
    switch (phase) {
        case WebSearchPhase::Initiate:
            return initiate(request, responseModel, out);
        case WebSearchPhase::Consume:
            return consume(request, responseModel, backendModel, out);
        case WebSearchPhase::None:
            break;
    }
    return error::AppError::internal("Not a web search request");
}

std::optional<error::AppError> WebSearchOrchestrator::initiate(const MessageRequest& request,
                                                               const std::string& responseModel,
                                                               MessageResponse& out) {
    std::string userText;
    if (const Message* user = lastUserMessage(request)) {
        for (const auto& block : user->content) {
            if (const auto* text = std::get_if<TextBlock>(&block)) {
                if (!userText.empty()) {
                    userText += " ";
                }
                userText += text->text;
            }
        }
    }

    search::SearchQuery query;
    query.history = buildHistory(request);
    query.query = extractQuery(userText);
    query.topK = options_.topK;
    LOG_INFO << "[联网搜索] 第一阶段, 查询: " << query.query;

    auto response = searchProvider_.search(query);
    if (!response) {
        LOG_ERROR << "[联网搜索] 搜索服务无结果, 查询: " << query.query;
        return error::AppError::providerError("Web search failed: no results from search provider");
    }

    for (const auto& result : response->results) {
        if (!result.link.empty()) {
            cache_.set(result.link, result.toJson());
        }
    }

    const std::string intro = "I'll search for information about " + query.query + ".";
    const std::string pageAge = timeutil::toLongDate(today_());

    ServerToolUseBlock toolUse;
    toolUse.id = ids::serverToolUseId();
    toolUse.name = "web_search";
    toolUse.input["query"] = query.query;

    WebSearchToolResultBlock resultBlock;
    resultBlock.toolUseId = toolUse.id;
    for (const auto& result : response->results) {
        WebSearchResult item;
        item.title = result.title;
        item.url = result.link;
        item.encryptedContent = base64(!result.content.empty() ? result.content : result.snippet);
        item.pageAge = pageAge;
        resultBlock.results.push_back(std::move(item));
    }

    out = MessageResponse{};
    out.id = ids::messageId();
    out.model = responseModel;
    out.content.emplace_back(TextBlock{intro});
    out.content.emplace_back(std::move(toolUse));
    out.content.emplace_back(std::move(resultBlock));
    out.stopReason = "end_turn";
    out.usage.inputTokens = tokens::countInputTokens(request, estimator_);
    out.usage.outputTokens = estimator_.count(intro);
    out.usage.webSearchRequests = response->searchCount > 0 ? response->searchCount : 1;

    LOG_INFO << "[联网搜索] 第一阶段完成, 结果数: " << response->results.size();
    return std::nullopt;
}

std::vector<EnrichedResult> WebSearchOrchestrator::enrich(const std::vector<websearch::SearchLink>& links) {
    std::vector<EnrichedResult> results;
    results.reserve(links.size());
    for (const auto& link : links) {
        EnrichedResult entry;
        entry.title = link.title;
        entry.url = link.url;
        if (auto cached = cache_.get(link.url)) {
            const auto stored = search::SearchResult::fromJson(*cached);
            if (!stored.title.empty()) {
                entry.title = stored.title;
            }
            entry.content = !stored.content.empty() ? stored.content : stored.snippet;
            entry.cached = true;
        }
        results.push_back(std::move(entry));
    }
    return results;
}

std::string WebSearchOrchestrator::domainTally(const std::vector<EnrichedResult>& results) {
    std::vector<std::string> domains;
    std::set<std::string> seen;
    std::string titles;
    for (size_t i = 0; i < results.size(); ++i) {
        const std::string host = urlutil::hostname(results[i].url).value_or("unknown");
        if (seen.insert(host).second) {
            domains.push_back(host);
        }
        if (i > 0) {
            titles += ", ";
        }
        titles += results[i].title;
    }
    std::string joined;
    for (size_t i = 0; i < domains.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += domains[i];
    }
    return "Found " + std::to_string(results.size()) + " relevant sources from " + joined +
           ". The search covered topics related to: " + titles + ".";
}

std::string WebSearchOrchestrator::fallbackSummary(const std::string& query,
                                                   const std::vector<EnrichedResult>& results) {
    std::ostringstream oss;
    oss << "Based on the search results for \"" << query << "\", here's what I found:\n\n";
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0) {
            oss << "\n\n";
        }
        std::string excerpt = "No content available";
        if (!results[i].content.empty()) {
            bool truncated = false;
            excerpt = utf8Prefix(results[i].content, 200, truncated) + "...";
        }
        oss << (i + 1) << ". **" << results[i].title << "**\n"
            << "   URL: " << results[i].url << "\n"
            << "   Content: " << excerpt;
    }
    oss << "\n\n**Summary:**\n" << domainTally(results);
    return oss.str();
}

std::string WebSearchOrchestrator::summarize(const std::string& query,
                                             const std::vector<EnrichedResult>& results,
                                             const std::string& backendModel) {
    std::ostringstream summaries;
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0) {
            summaries << "\n\n";
        }
        const std::string content = results[i].content.empty() ? "No content available" : results[i].content;
        bool truncated = false;
        std::string excerpt = utf8Prefix(content, 300, truncated);
        if (truncated) {
            excerpt += "...";
        }
        summaries << (i + 1) << ". **" << results[i].title << "**\n"
                  << "   URL: " << results[i].url << "\n"
                  << "   Content: " << excerpt;
    }

    const std::string prompt = "Based on the following search results for \"" + query +
                               "\", please provide a comprehensive and well-structured response:\n\n" +
                               summaries.str() +
                               "\n\nPlease analyze and synthesize the information to provide a helpful answer to the query.";

    Json::Value request(Json::objectValue);
    request["model"] = backendModel;
    Json::Value system(Json::objectValue);
    system["role"] = "system";
    system["content"] = kSummarySystemPrompt;
    Json::Value user(Json::objectValue);
    user["role"] = "user";
    user["content"] = prompt;
    request["messages"].append(system);
    request["messages"].append(user);
    request["max_tokens"] = options_.summaryMaxTokens;
    request["temperature"] = options_.summaryTemperature;

    provider::ProviderResult result = backend_.complete(request);
    if (!result.isSuccess()) {
        LOG_WARN << "[联网搜索] 总结调用失败, 使用模板回答: " << result.error.message;
        return fallbackSummary(query, results);
    }

    std::string text;
    const Json::Value& choices = result.body["choices"];
    if (choices.isArray() && !choices.empty() && choices[0].isObject() && choices[0]["message"].isObject()) {
        for (const auto& block : codec::decodeContent(choices[0]["message"]["content"])) {
            if (const auto* t = std::get_if<TextBlock>(&block)) {
                text += t->text;
            }
        }
    }
    if (text.empty()) {
        LOG_WARN << "[联网搜索] 总结结果为空, 使用模板回答";
        return fallbackSummary(query, results);
    }
    return text;
}

std::optional<error::AppError> WebSearchOrchestrator::consume(const MessageRequest& request,
                                                              const std::string& responseModel,
                                                              const std::string& backendModel,
                                                              MessageResponse& out) {
    auto resultText = findResultText(request);
    if (!resultText) {
        return error::AppError::badRequest("No search results found in tool result request");
    }

    std::string query;
    std::vector<websearch::SearchLink> links;
    if (auto parsed = websearch::parseSearchResult(*resultText)) {
        query = websearch::cleanQuery(parsed->queryPart);
        links = std::move(parsed->links);
    } else {
        LOG_WARN << "[联网搜索] 工具结果中没有结果数组";
    }
    LOG_INFO << "[联网搜索] 第二阶段, 查询: " << query << ", 链接数: " << links.size();

    const auto results = enrich(links);
    std::string answer;
    if (results.empty()) {
        answer = "I searched for \"" + query + "\" but couldn't find any relevant results.";
    } else {
        answer = summarize(query, results, backendModel);
    }

    const std::string pageAge = timeutil::toLongDate(today_());
    WebSearchToolResultBlock resultBlock;
    resultBlock.toolUseId = ids::serverToolUseId();
    for (const auto& entry : results) {
        WebSearchResult item;
        item.title = entry.title;
        item.url = entry.url;
        item.encryptedContent = base64(!entry.content.empty() ? entry.content : entry.title);
        item.pageAge = pageAge;
        resultBlock.results.push_back(std::move(item));
    }

    out = MessageResponse{};
    out.id = ids::messageId();
    out.model = responseModel;
    out.content.emplace_back(std::move(resultBlock));
    out.content.emplace_back(TextBlock{answer});
    out.stopReason = "end_turn";
    out.usage.inputTokens = tokens::countInputTokens(request, estimator_);
    out.usage.outputTokens = estimator_.count(answer);
    out.usage.webSearchRequests = 1;
    return std::nullopt;
}

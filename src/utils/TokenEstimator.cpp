#include "TokenEstimator.h"
#include <adapters/ContentCodec.h>
#include <utils/JsonUtils.h>

int CharRatioTokenEstimator::count(const std::string& text) const {
    if (text.empty()) {
        return 0;
    }
    return static_cast<int>((text.size() + charsPerToken_ - 1) / charsPerToken_);
}

namespace tokens {

using namespace anthropic;

namespace {

std::string toolText(const ToolDefinition& tool) {
    std::string text = tool.name + tool.description;
    if (tool.inputSchema) {
        text += jsonutil::toCompactString(*tool.inputSchema);
    }
    return text;
}

} // namespace

int countRequestTokens(const MessageRequest& request, const ITokenEstimator& estimator) {
    int total = estimator.count(request.system);
    for (const auto& message : request.messages) {
        for (const auto& block : message.content) {
            if (const auto* text = std::get_if<TextBlock>(&block)) {
                total += estimator.count(text->text);
            } else if (const auto* use = std::get_if<ToolUseBlock>(&block)) {
                total += estimator.count(jsonutil::toCompactString(use->input));
            } else if (const auto* result = std::get_if<ToolResultBlock>(&block)) {
                total += estimator.count(codec::stringifyToolResultContent(result->content));
            }
        }
    }
    for (const auto& tool : request.tools) {
        total += estimator.count(toolText(tool));
    }
    return total;
}

int countInputTokens(const MessageRequest& request, const ITokenEstimator& estimator) {
    int total = estimator.count(request.system);
    for (const auto& message : request.messages) {
        for (const auto& block : message.content) {
            if (const auto* text = std::get_if<TextBlock>(&block)) {
                total += estimator.count(text->text);
            }
        }
    }
    for (const auto& tool : request.tools) {
        Json::Value t(Json::objectValue);
        t["name"] = tool.name;
        if (!tool.description.empty()) t["description"] = tool.description;
        if (!tool.type.empty()) t["type"] = tool.type;
        if (tool.inputSchema) t["input_schema"] = *tool.inputSchema;
        total += estimator.count(jsonutil::toCompactString(t));
    }
    return total;
}

} // namespace tokens

#include "RequestConverter.h"
#include "ContentCodec.h"
#include <drogon/drogon.h>
#include <algorithm>

int RequestConverter::clampMaxTokens(int requested, int modelLimit) {
    int limit = std::min(modelLimit > 0 ? modelLimit : kHardMaxTokens, kHardMaxTokens);
    return std::min(requested, limit);
}

Json::Value RequestConverter::convertTool(const anthropic::ToolDefinition& tool) {
    if (!tool.inputSchema) {
        return Json::Value();
    }
    Json::Value fn(Json::objectValue);
    fn["type"] = "function";
    fn["function"]["name"] = tool.name;
    fn["function"]["description"] = tool.description;
    fn["function"]["parameters"] = *tool.inputSchema;
    return fn;
}

Json::Value RequestConverter::buildChatRequest(const anthropic::MessageRequest& request,
                                               const ModelMapping& mapping) {
    Json::Value body(Json::objectValue);
    body["model"] = mapping.targetModelId;

    Json::Value messages(Json::arrayValue);
    if (!request.system.empty()) {
        Json::Value systemMsg(Json::objectValue);
        systemMsg["role"] = "system";
        systemMsg["content"] = request.system;
        messages.append(systemMsg);
    }
    for (const auto& message : request.messages) {
        for (auto& encoded : codec::encodeMessage(message)) {
            messages.append(std::move(encoded));
        }
    }
    body["messages"] = messages;

    const int maxTokens = clampMaxTokens(request.maxTokens, mapping.maxTokens);
    if (maxTokens != request.maxTokens) {
        LOG_INFO << "[请求转换] max_tokens " << request.maxTokens << " → " << maxTokens
                 << " (模型上限 " << mapping.maxTokens << ")";
    }
    body["max_tokens"] = maxTokens;

    if (request.temperature) {
        body["temperature"] = *request.temperature;
    }
    if (request.topP) {
        body["top_p"] = *request.topP;
    }
    if (!request.stopSequences.empty()) {
        Json::Value stop(Json::arrayValue);
        for (const auto& s : request.stopSequences) {
            stop.append(s);
        }
        body["stop"] = stop;
    }

    Json::Value tools(Json::arrayValue);
    for (const auto& tool : request.tools) {
        Json::Value converted = convertTool(tool);
        if (converted.isNull()) {
            LOG_DEBUG << "[请求转换] 跳过无 input_schema 的工具: " << tool.name;
            continue;
        }
        tools.append(converted);
    }
    if (!tools.empty()) {
        body["tools"] = tools;
        body["tool_choice"] = "auto";
    }

    body["stream"] = request.stream;

    LOG_DEBUG << "[请求转换] " << request.model << " → " << mapping.targetModelId
              << ", messages=" << messages.size() << ", tools=" << tools.size();
    return body;
}

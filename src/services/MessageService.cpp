#include "MessageService.h"
#include <adapters/RequestConverter.h>
#include <adapters/ResponseConverter.h>
#include <adapters/StreamEventEmitter.h>
#include <adapters/StreamReconstructor.h>
#include <modelsManager/ModelRouter.h>
#include <protocol/AnthropicJson.h>
#include <drogon/drogon.h>

using namespace anthropic;

MessageService::MessageService(ModelsManager& models,
                               IChatBackend& backend,
                               WebSearchOrchestrator* webSearch,
                               const ITokenEstimator& estimator,
                               const ToolPhraseTable& phrases,
                               std::unique_ptr<IThinkingExtractor> thinking,
                               MessageServiceOptions options)
    : models_(models),
      backend_(backend),
      webSearch_(webSearch),
      estimator_(estimator),
      phrases_(phrases),
      thinking_(std::move(thinking)),
      options_(std::move(options)) {}

std::optional<error::AppError> MessageService::resolveModel(const MessageRequest& request,
                                                            bool route,
                                                            ResolvedModel& out) const {
    std::string modelId = request.model;
    if (route && options_.routerEnabled) {
        modelId = ModelRouter::route(request, options_.router, estimator_);
        if (modelId.empty()) {
            modelId = request.model;
        }
        if (modelId != request.model) {
            LOG_INFO << "[消息服务] 模型路由: " << request.model << " → " << modelId;
        }
    }

    auto mapping = models_.getModel(modelId);
    if (!mapping) {
        std::string available;
        for (const auto& id : models_.getModelIds()) {
            if (!available.empty()) {
                available += ", ";
            }
            available += id;
        }
        LOG_WARN << "[消息服务] 不支持的模型: " << modelId;
        return error::AppError::badRequest("Model " + modelId + " is not supported. Available models: " + available);
    }

    out.responseModel = modelId;
    out.mapping = *mapping;
    return std::nullopt;
}

const IThinkingExtractor* MessageService::thinkingFor(const MessageRequest& request) const {
    return request.thinking.declared ? thinking_.get() : nullptr;
}

std::optional<error::AppError> MessageService::createMessage(const MessageRequest& request,
                                                             MessageResponse& out) {
    ResolvedModel model;
    if (auto err = resolveModel(request, true, model)) {
        return err;
    }
    return createMessage(request, model, out);
}

std::optional<error::AppError> MessageService::createMessage(const MessageRequest& request,
                                                             const ResolvedModel& model,
                                                             MessageResponse& out) {
    if (webSearch_) {
        const WebSearchPhase phase = WebSearchOrchestrator::detect(request);
        if (phase != WebSearchPhase::None) {
            return webSearch_->handle(request, phase, model.responseModel, model.mapping.targetModelId, out);
        }
    }

    const Json::Value chatRequest = RequestConverter::buildChatRequest(request, model.mapping);
    LOG_DEBUG << "[消息服务] 调用后端 " << backend_.name() << ", 模型: " << model.mapping.targetModelId;
    provider::ProviderResult result = backend_.complete(chatRequest);
    if (!result.isSuccess()) {
        LOG_ERROR << "[消息服务] 后端调用失败: " << result.error.message;
        return result.error.toAppError();
    }
    return ResponseConverter::convert(result.body, model.responseModel, out, thinkingFor(request));
}

void MessageService::streamMessage(const MessageRequest& request,
                                   const ResolvedModel& model,
                                   IEventSink& sink) {
    auto fail = [&sink](const error::AppError& err) {
        LOG_ERROR << "[消息服务] 流式处理失败: " << err.message;
        if (sink.isValid()) {
            sink.onEvent(StreamError{err.apiType(), err.message});
        }
        sink.onClose();
    };

    if (webSearch_) {
        const WebSearchPhase phase = WebSearchOrchestrator::detect(request);
        if (phase != WebSearchPhase::None) {
            MessageResponse message;
            if (auto err = webSearch_->handle(request, phase, model.responseModel,
                                              model.mapping.targetModelId, message)) {
                fail(*err);
                return;
            }
            StreamEventEmitter emitter(sink, PacingOptions::replayDefaults(options_.pacingEnabled));
            emitter.replayMessage(message);
            sink.onClose();
            return;
        }
    }

    Json::Value chatRequest = RequestConverter::buildChatRequest(request, model.mapping);
    chatRequest["stream"] = true;
    provider::ProviderResult result = backend_.stream(chatRequest);
    if (!result.isSuccess()) {
        fail(result.error.toAppError());
        return;
    }

    StreamReconstructor reconstructor(sink, model.responseModel, phrases_,
                                      PacingOptions::toolCallDefaults(options_.pacingEnabled));
    reconstructor.run(result.chunks);
    sink.onClose();
}

std::optional<error::AppError> MessageService::countTokens(const Json::Value& body, int& inputTokens) const {
    if (!body.isObject() || !body.isMember("model") || !body.isMember("messages")) {
        return error::AppError::badRequest("Missing required fields: model and messages are required");
    }

    // count_tokens 不要求 max_tokens
    Json::Value normalized = body;
    if (!normalized.isMember("max_tokens")) {
        normalized["max_tokens"] = 1;
    }
    MessageRequest request;
    if (auto err = parseMessageRequest(normalized, request)) {
        return err;
    }
    if (!models_.getModel(request.model)) {
        return error::AppError::badRequest("Model " + request.model + " is not supported");
    }

    inputTokens = tokens::countInputTokens(request, estimator_);
    return std::nullopt;
}

std::optional<error::AppError> MessageService::runBatchItem(const Json::Value& params, Json::Value& message) {
    MessageRequest request;
    if (auto err = parseMessageRequest(params, request)) {
        return err;
    }

    auto mapping = models_.getModel(request.model);
    if (!mapping) {
        return error::AppError::badRequest("Model " + request.model + " not supported");
    }

    ResolvedModel model{request.model, *mapping};
    MessageResponse response;
    if (auto err = createMessage(request, model, response)) {
        return err;
    }
    message = toJson(response);
    return std::nullopt;
}

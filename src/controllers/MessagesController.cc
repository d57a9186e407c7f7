#include "MessagesController.h"
#include "ControllerUtils.h"
#include <controllers/sinks/MessagesSseSink.h>
#include <protocol/AnthropicJson.h>
#include <utils/BackgroundTaskQueue.h>
#include <drogon/drogon.h>

using namespace drogon;

MessagesController::MessagesController(std::shared_ptr<MessageService> service)
    : service_(std::move(service))
{
}

void MessagesController::createMessage(const HttpRequestPtr &req, std::function<void(const HttpResponsePtr &)> &&callback)
{
    LOG_INFO << "[消息控制器] 收到消息请求";
    LOG_DEBUG << "请求体：" << req->getBody();

    std::shared_ptr<Json::Value> jsonPtr;
    if (!ctl::parseJsonOrError(req, callback, jsonPtr)) return;

    anthropic::MessageRequest request;
    if (auto err = anthropic::parseMessageRequest(*jsonPtr, request)) {
        LOG_WARN << "[消息控制器] 请求校验失败: " << err->message;
        ctl::sendError(callback, *err);
        return;
    }

    ResolvedModel model;
    if (auto err = service_->resolveModel(request, true, model)) {
        ctl::sendError(callback, *err);
        return;
    }
    LOG_INFO << "[消息控制器] 模型 " << model.responseModel << " → " << model.mapping.targetModelId
             << ", stream=" << request.stream;

    if (!request.stream) {
        anthropic::MessageResponse response;
        if (auto err = service_->createMessage(request, model, response)) {
            ctl::sendError(callback, *err);
            return;
        }
        ctl::sendJson(callback, anthropic::toJson(response));
        return;
    }

    auto service = service_;
    auto resp = HttpResponse::newAsyncStreamResponse(
        [service, request, model](ResponseStreamPtr stream) mutable {
            if (!stream) {
                LOG_WARN << "[消息控制器] 流对象为空，终止处理";
                return;
            }

            auto sharedStream = std::shared_ptr<ResponseStream>(stream.release());
            const bool queued = BackgroundTaskQueue::instance().enqueue("messages_stream", [service, request, model, sharedStream]() {
                MessagesSseSink sseSink(
                    [sharedStream](const std::string& chunk) {
                        return sharedStream && sharedStream->send(chunk);
                    },
                    [sharedStream]() {
                        if (sharedStream) {
                            sharedStream->close();
                        }
                    }
                );
                service->streamMessage(request, model, sseSink);
            });
            if (!queued) {
                LOG_ERROR << "[消息控制器] 后台队列不可用，关闭流";
                sharedStream->close();
            }
        },
        true
    );

    resp->setContentTypeString("text/event-stream; charset=utf-8");
    resp->addHeader("Cache-Control", "no-cache");
    resp->addHeader("Connection", "keep-alive");
    resp->addHeader("X-Accel-Buffering", "no");
    callback(resp);
    LOG_INFO << "[消息控制器] 流式响应已开始发送";
}

void MessagesController::countTokens(const HttpRequestPtr &req, std::function<void(const HttpResponsePtr &)> &&callback)
{
    std::shared_ptr<Json::Value> jsonPtr;
    if (!ctl::parseJsonOrError(req, callback, jsonPtr)) return;

    int inputTokens = 0;
    if (auto err = service_->countTokens(*jsonPtr, inputTokens)) {
        ctl::sendError(callback, *err);
        return;
    }
    LOG_DEBUG << "[消息控制器] count_tokens: " << inputTokens;

    Json::Value response(Json::objectValue);
    response["input_tokens"] = inputTokens;
    ctl::sendJson(callback, response);
}

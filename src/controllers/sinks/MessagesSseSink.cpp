#include "MessagesSseSink.h"
#include <protocol/AnthropicJson.h>
#include <drogon/drogon.h>

MessagesSseSink::MessagesSseSink(StreamCallback streamCallback, CloseCallback closeCallback)
    : streamCallback_(std::move(streamCallback)),
      closeCallback_(std::move(closeCallback))
{
}

void MessagesSseSink::onEvent(const anthropic::StreamEvent& event) {
    if (closed_) {
        LOG_WARN << "[消息SSE] 关闭后收到事件: " << anthropic::eventName(event);
        return;
    }
    if (disconnected_) {
        return;
    }
    if (!streamCallback_ || !streamCallback_(anthropic::encodeSse(event))) {
        LOG_INFO << "[消息SSE] 客户端已断开, 停止发送";
        disconnected_ = true;
        return;
    }
    ++sentEvents_;
}

void MessagesSseSink::onClose() {
    if (!closed_) {
        closed_ = true;
        LOG_DEBUG << "[消息SSE] 正在关闭, 已发送事件: " << sentEvents_;
        if (closeCallback_) {
            closeCallback_();
        }
    }
}

bool MessagesSseSink::isValid() const {
    return !closed_ && !disconnected_;
}

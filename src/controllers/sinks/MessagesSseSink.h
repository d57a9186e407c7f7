#ifndef MESSAGES_SSE_SINK_H
#define MESSAGES_SSE_SINK_H

#include <adapters/IEventSink.h>
#include <functional>
#include <string>

/**
 * @brief Messages API SSE 输出 Sink
 *
 * 每个事件编码为 `event: <name>\ndata: <json>\n\n` 写出。
 * 发送失败（客户端断开）后 isValid() 返回 false，后续事件直接丢弃。
 */
class MessagesSseSink : public IEventSink {
public:
    using StreamCallback = std::function<bool(const std::string&)>;
    using CloseCallback = std::function<void()>;

    MessagesSseSink(StreamCallback streamCallback, CloseCallback closeCallback);
    ~MessagesSseSink() override = default;

    void onEvent(const anthropic::StreamEvent& event) override;
    void onClose() override;
    bool isValid() const override;
    std::string getSinkType() const override { return "MessagesSseSink"; }

    size_t sentEvents() const { return sentEvents_; }

private:
    StreamCallback streamCallback_;
    CloseCallback closeCallback_;
    size_t sentEvents_ = 0;
    bool disconnected_ = false;
    bool closed_ = false;
};

#endif // MESSAGES_SSE_SINK_H

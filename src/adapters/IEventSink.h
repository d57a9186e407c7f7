#ifndef IEVENT_SINK_H
#define IEVENT_SINK_H

#include <protocol/StreamEvent.h>
#include <string>
#include <vector>

/**
 * @brief 协议 A 流式事件输出通道
 *
 * 重建器 / 回放器只产生 StreamEvent，具体线上编码（SSE）由 Controller 侧的 Sink 负责。
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    /**
     * @brief 接收一个流式事件
     */
    virtual void onEvent(const anthropic::StreamEvent& event) = 0;

    /**
     * @brief 关闭输出通道，所有事件发送完毕后调用
     */
    virtual void onClose() = 0;

    /**
     * @brief 通道是否仍可用（客户端断开后返回 false）
     */
    virtual bool isValid() const { return true; }

    virtual std::string getSinkType() const = 0;
};

/**
 * @brief 丢弃所有事件
 */
class NullSink : public IEventSink {
public:
    void onEvent(const anthropic::StreamEvent& /*忽略事件参数*/) override {}
    void onClose() override {}
    std::string getSinkType() const override { return "NullSink"; }
};

/**
 * @brief 收集所有事件，用于测试
 */
class CollectorSink : public IEventSink {
public:
    void onEvent(const anthropic::StreamEvent& event) override {
        events_.push_back(event);
    }

    void onClose() override {
        closed_ = true;
    }

    std::string getSinkType() const override { return "CollectorSink"; }

    const std::vector<anthropic::StreamEvent>& getEvents() const {
        return events_;
    }

    bool isClosed() const {
        return closed_;
    }

    /**
     * @brief 事件名序列，如 message_start, content_block_start, ...
     */
    std::vector<std::string> getEventNames() const {
        std::vector<std::string> names;
        for (const auto& e : events_) {
            names.push_back(anthropic::eventName(e));
        }
        return names;
    }

    /**
     * @brief 拼接指定 index 的全部 text_delta
     */
    std::string getText(int index) const {
        std::string out;
        for (const auto& e : events_) {
            if (const auto* d = std::get_if<anthropic::ContentBlockDelta>(&e)) {
                if (d->index != index) continue;
                if (const auto* t = std::get_if<anthropic::TextDelta>(&d->delta)) {
                    out += t->text;
                }
            }
        }
        return out;
    }

    /**
     * @brief 拼接指定 index 的全部 input_json_delta
     */
    std::string getPartialJson(int index) const {
        std::string out;
        for (const auto& e : events_) {
            if (const auto* d = std::get_if<anthropic::ContentBlockDelta>(&e)) {
                if (d->index != index) continue;
                if (const auto* j = std::get_if<anthropic::InputJsonDelta>(&d->delta)) {
                    out += j->partialJson;
                }
            }
        }
        return out;
    }

    bool hasError() const {
        for (const auto& e : events_) {
            if (std::holds_alternative<anthropic::StreamError>(e)) {
                return true;
            }
        }
        return false;
    }

private:
    std::vector<anthropic::StreamEvent> events_;
    bool closed_ = false;
};

#endif // IEVENT_SINK_H

#ifndef STREAM_EVENT_EMITTER_H
#define STREAM_EVENT_EMITTER_H

#include "IEventSink.h"
#include <protocol/AnthropicTypes.h>
#include <chrono>
#include <string>
#include <vector>

/**
 * @brief 分片与节奏参数
 *
 * 节奏仅影响观感，关闭后分片规则不变、只去掉延迟。
 */
struct PacingOptions {
    bool enabled = true;
    size_t textSliceSize = 5;
    size_t jsonSliceSize = 3;
    std::chrono::milliseconds textDelay{10};
    std::chrono::milliseconds jsonDelay{15};

    /// 工具调用重建：文本 5 字符 / 10ms，参数 JSON 3 字符 / 15ms
    static PacingOptions toolCallDefaults(bool enabled = true) {
        return PacingOptions{enabled, 5, 3, std::chrono::milliseconds(10), std::chrono::milliseconds(15)};
    }

    /// 完整消息回放：文本 10 字符 / 30ms，参数 JSON 5 字符 / 20ms
    static PacingOptions replayDefaults(bool enabled = true) {
        return PacingOptions{enabled, 10, 5, std::chrono::milliseconds(30), std::chrono::milliseconds(20)};
    }
};

/**
 * @brief 按协议 A 事件语法向 Sink 写出内容块
 *
 * 客户端断开（sink 无效）后不再发送任何事件，也不再等待节奏延迟。
 */
class StreamEventEmitter {
public:
    StreamEventEmitter(IEventSink& sink, PacingOptions pacing);

    /// 发送单个事件；返回发送后 sink 是否仍有效
    bool emit(const anthropic::StreamEvent& event);

    /// content_block_start(text "") + 分片 text_delta + content_block_stop
    void emitTextBlock(int index, const std::string& text);

    /**
     * @brief content_block_start(header, input 为空) + 分片 input_json_delta + content_block_stop
     *
     * @param header ToolUseBlock 或 ServerToolUseBlock
     */
    void emitToolInputBlock(int index, const anthropic::ContentBlock& header, const Json::Value& input);

    /// content_block_start(完整块) + content_block_stop
    void emitWholeBlock(int index, const anthropic::ContentBlock& block);

    /**
     * @brief 将完整消息按块回放为合法事件序列
     */
    void replayMessage(const anthropic::MessageResponse& message);

    bool connected() const { return sink_.isValid(); }

    /**
     * @brief 按 UTF-8 码点分片，每片最多 size 个码点
     */
    static std::vector<std::string> slice(const std::string& text, size_t size);

private:
    void pause(std::chrono::milliseconds delay) const;

    IEventSink& sink_;
    PacingOptions pacing_;
};

#endif // STREAM_EVENT_EMITTER_H

#ifndef STREAM_RECONSTRUCTOR_H
#define STREAM_RECONSTRUCTOR_H

#include "IEventSink.h"
#include "StreamEventEmitter.h"
#include "ToolPhraseTable.h"
#include <protocol/AnthropicTypes.h>
#include <json/json.h>
#include <map>
#include <string>
#include <vector>

/**
 * @brief 按 index 累积的工具调用分片
 */
struct PendingToolCall {
    std::string id;
    std::string name;
    std::string arguments;
};

/**
 * @brief 将已完整读取的后端流式 chunk 序列重放为协议 A 事件序列
 *
 * 事件顺序固定：
 * message_start → [text 块 0] → [说明文本块] → [tool_use 块...] → message_delta → message_stop
 *
 * 文本按后端 chunk 粒度原样转发；工具调用在全部 chunk 消费完后统一发出。
 */
class StreamReconstructor {
public:
    StreamReconstructor(IEventSink& sink,
                        std::string model,
                        const ToolPhraseTable& phrases,
                        PacingOptions pacing = PacingOptions::toolCallDefaults());

    /**
     * @brief 处理完整的 chunk 序列并发出全部事件（不调用 sink.onClose）
     */
    void run(const std::vector<Json::Value>& chunks);

    const std::map<int, PendingToolCall>& toolCalls() const { return toolCalls_; }
    const anthropic::Usage& usage() const { return usage_; }

    /**
     * @brief 解析累积的参数串；失败时尝试提取 location 字段，否则返回固定占位
     */
    static Json::Value recoverToolInput(const std::string& arguments);

private:
    void ensureStarted();
    void consume(const Json::Value& chunk);
    void finalize();

    IEventSink& sink_;
    std::string model_;
    const ToolPhraseTable& phrases_;
    StreamEventEmitter emitter_;

    std::string messageId_;
    bool started_ = false;
    bool textOpen_ = false;
    std::string finishReason_;
    std::map<int, PendingToolCall> toolCalls_;
    anthropic::Usage usage_;
};

#endif // STREAM_RECONSTRUCTOR_H

#include "StreamEventEmitter.h"
#include <utils/JsonUtils.h>
#include <drogon/drogon.h>
#include <thread>

using namespace anthropic;

namespace {

size_t utf8SequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;
}

ContentBlock withEmptyInput(const ContentBlock& header) {
    ContentBlock copy = header;
    if (auto* use = std::get_if<ToolUseBlock>(&copy)) {
        use->input = Json::Value(Json::objectValue);
    } else if (auto* server = std::get_if<ServerToolUseBlock>(&copy)) {
        server->input = Json::Value(Json::objectValue);
    }
    return copy;
}

} // namespace

StreamEventEmitter::StreamEventEmitter(IEventSink& sink, PacingOptions pacing)
    : sink_(sink), pacing_(pacing) {}

std::vector<std::string> StreamEventEmitter::slice(const std::string& text, size_t size) {
    std::vector<std::string> out;
    if (size == 0) {
        size = 1;
    }
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = pos;
        for (size_t n = 0; n < size && end < text.size(); ++n) {
            end += utf8SequenceLength(static_cast<unsigned char>(text[end]));
        }
        if (end > text.size()) {
            end = text.size();
        }
        out.push_back(text.substr(pos, end - pos));
        pos = end;
    }
    return out;
}

void StreamEventEmitter::pause(std::chrono::milliseconds delay) const {
    if (pacing_.enabled && delay.count() > 0 && sink_.isValid()) {
        std::this_thread::sleep_for(delay);
    }
}

bool StreamEventEmitter::emit(const StreamEvent& event) {
    if (!sink_.isValid()) {
        return false;
    }
    sink_.onEvent(event);
    return sink_.isValid();
}

void StreamEventEmitter::emitTextBlock(int index, const std::string& text) {
    emit(ContentBlockStart{index, TextBlock{""}});
    for (const auto& piece : slice(text, pacing_.textSliceSize)) {
        if (!emit(ContentBlockDelta{index, TextDelta{piece}})) {
            return;
        }
        pause(pacing_.textDelay);
    }
    emit(ContentBlockStop{index});
}

void StreamEventEmitter::emitToolInputBlock(int index, const ContentBlock& header, const Json::Value& input) {
    emit(ContentBlockStart{index, withEmptyInput(header)});
    const std::string json = jsonutil::toCompactString(input);
    for (const auto& piece : slice(json, pacing_.jsonSliceSize)) {
        if (!emit(ContentBlockDelta{index, InputJsonDelta{piece}})) {
            return;
        }
        pause(pacing_.jsonDelay);
    }
    emit(ContentBlockStop{index});
}

void StreamEventEmitter::emitWholeBlock(int index, const ContentBlock& block) {
    emit(ContentBlockStart{index, block});
    emit(ContentBlockStop{index});
}

void StreamEventEmitter::replayMessage(const MessageResponse& message) {
    Usage startUsage;
    startUsage.inputTokens = message.usage.inputTokens;
    emit(MessageStart{message.id, message.model, startUsage});

    int index = 0;
    for (const auto& block : message.content) {
        if (const auto* text = std::get_if<TextBlock>(&block)) {
            emitTextBlock(index, text->text);
        } else if (const auto* use = std::get_if<ToolUseBlock>(&block)) {
            emitToolInputBlock(index, block, use->input);
        } else if (const auto* server = std::get_if<ServerToolUseBlock>(&block)) {
            emitToolInputBlock(index, block, server->input);
        } else {
            emitWholeBlock(index, block);
        }
        ++index;
    }

    emit(MessageDelta{message.stopReason, message.stopSequence, message.usage});
    emit(MessageStop{});
    LOG_DEBUG << "[流式回放] 已回放 " << message.content.size() << " 个内容块";
}

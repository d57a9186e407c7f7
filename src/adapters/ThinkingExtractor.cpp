#include "ThinkingExtractor.h"
#include <drogon/drogon.h>
#include <regex>
#include <vector>

namespace {

const std::regex& reasoningPattern() {
    static const std::regex re(
        "let me think|reasoning|consider|analysis|because|therefore|however|thus|hence",
        std::regex::icase);
    return re;
}

std::vector<std::string> splitSentences(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        const auto pos = text.find(". ", start);
        if (pos == std::string::npos) {
            out.push_back(text.substr(start));
            break;
        }
        out.push_back(text.substr(start, pos - start));
        start = pos + 2;
    }
    return out;
}

std::string joinSentences(const std::vector<std::string>& parts, size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end; ++i) {
        if (i > begin) out += ". ";
        out += parts[i];
    }
    return out;
}

bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

ThinkingSplit HeuristicThinkingExtractor::extract(const std::string& text, const Json::Value&) const {
    ThinkingSplit split;
    split.text = text;
    if (text.size() <= kMinLength || !std::regex_search(text, reasoningPattern())) {
        return split;
    }

    const auto sentences = splitSentences(text);
    if (sentences.size() <= 2) {
        return split;
    }

    const size_t half = sentences.size() / 2;
    split.found = true;
    split.thinking = joinSentences(sentences, 0, half);
    split.text = joinSentences(sentences, half, sentences.size());
    if (isBlank(split.text)) {
        split.text.clear();
    }
    return split;
}

ThinkingSplit NativeReasoningExtractor::extract(const std::string& text, const Json::Value& backendMessage) const {
    if (backendMessage.isObject() && backendMessage["reasoning_content"].isString() &&
        !backendMessage["reasoning_content"].asString().empty()) {
        ThinkingSplit split;
        split.found = true;
        split.thinking = backendMessage["reasoning_content"].asString();
        split.text = text;
        return split;
    }
    return fallback_.extract(text, backendMessage);
}

std::unique_ptr<IThinkingExtractor> makeThinkingExtractor(const std::string& mode) {
    if (mode == "heuristic") {
        return std::make_unique<HeuristicThinkingExtractor>();
    }
    if (mode == "native") {
        return std::make_unique<NativeReasoningExtractor>();
    }
    if (mode != "off") {
        LOG_WARN << "[思考提取] 未知模式 " << mode << ", 已禁用";
    }
    return nullptr;
}

#include "ToolPhraseTable.h"
#include <drogon/drogon.h>

ToolPhraseTable::ToolPhraseTable()
    : phrases_{
          {"get_weather", "I'll help you check the weather in that location."},
          {"LS", "I'll list the files in that directory for you."},
          {"Read", "I'll read that file for you."},
          {"Write", "I'll write to that file."},
          {"Bash", "I'll execute that command for you."},
      } {}

void ToolPhraseTable::merge(const Json::Value& overrides) {
    if (!overrides.isObject()) {
        return;
    }
    for (const auto& name : overrides.getMemberNames()) {
        if (!overrides[name].isString()) {
            LOG_WARN << "[工具短句] 忽略非字符串配置: " << name;
            continue;
        }
        set(name, overrides[name].asString());
    }
}

void ToolPhraseTable::set(const std::string& toolName, const std::string& phrase) {
    phrases_[toolName] = phrase;
}

std::string ToolPhraseTable::phraseFor(const std::string& toolName) const {
    auto it = phrases_.find(toolName);
    return it == phrases_.end() ? kFallbackPhrase : it->second;
}

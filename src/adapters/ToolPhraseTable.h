#ifndef TOOL_PHRASE_TABLE_H
#define TOOL_PHRASE_TABLE_H

#include <json/json.h>
#include <map>
#include <string>

/**
 * @brief 工具名 → 说明短句
 *
 * 流式重建在工具调用前插入一段说明文本，内置常用工具，可由 custom_config.tool_phrases 覆盖或补充。
 */
class ToolPhraseTable {
public:
    static constexpr const char* kFallbackPhrase = "I'll help you with that.";

    ToolPhraseTable();

    /// 合并配置中的 {"工具名": "短句"}，非字符串值忽略
    void merge(const Json::Value& overrides);
    void set(const std::string& toolName, const std::string& phrase);

    std::string phraseFor(const std::string& toolName) const;
    size_t size() const { return phrases_.size(); }

private:
    std::map<std::string, std::string> phrases_;
};

#endif // TOOL_PHRASE_TABLE_H

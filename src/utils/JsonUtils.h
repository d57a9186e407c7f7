#pragma once

#include <json/json.h>
#include <memory>
#include <sstream>
#include <string>

/**
 * @brief jsoncpp 的紧凑序列化 / 字符串解析封装
 */
namespace jsonutil {

inline std::string toCompactString(const Json::Value& value)
{
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, value);
}

/**
 * @brief 解析 JSON 字符串
 *
 * @return true 解析成功；false 时 errs 给出原因
 */
inline bool parse(const std::string& text, Json::Value& out, std::string* errs = nullptr)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string localErrs;
    const bool ok = reader->parse(text.data(), text.data() + text.size(), &out, &localErrs);
    if (!ok && errs) {
        *errs = localErrs;
    }
    return ok;
}

/**
 * @brief 读取字符串字段，缺失或类型不符时返回默认值
 */
inline std::string getString(const Json::Value& obj, const char* key, const std::string& def = "")
{
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isString()) {
        return def;
    }
    return obj[key].asString();
}

} // namespace jsonutil

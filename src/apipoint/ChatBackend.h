#ifndef CHAT_BACKEND_H
#define CHAT_BACKEND_H

#include <apipoint/ProviderResult.h>
#include <json/json.h>
#include <string>

/**
 * @brief 协议 B（Chat Completions）后端接口
 *
 * complete: 非流式调用，结果在 ProviderResult::body。
 * stream:   以 stream=true 调用并完整读取事件流，结果在 ProviderResult::chunks。
 * 两者都在调用线程上同步阻塞，超时视为失败。
 */
class IChatBackend {
public:
    virtual ~IChatBackend() = default;

    virtual provider::ProviderResult complete(const Json::Value& request) = 0;
    virtual provider::ProviderResult stream(const Json::Value& request) = 0;
    virtual std::string name() const = 0;
};

#endif // CHAT_BACKEND_H
